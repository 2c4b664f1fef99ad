//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <memory>
#include <vector>

#include "concurrency/thread_pool.hpp"

namespace imgshelf {
TEST(ThreadPoolTest, RunsEverySubmittedTask) {
  std::atomic<int> counter{0};
  {
    ThreadPool pool(4);
    EXPECT_EQ(pool.Size(), 4u);
    for (int i = 0; i < 100; ++i) {
      pool.Submit([&counter]() { counter.fetch_add(1); });
    }
  }
  // The destructor drains the queue
  EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, SingleWorkerKeepsSubmissionOrder) {
  ThreadPool                          pool(1);
  std::vector<int>                    order;
  std::vector<std::future<void>>      done;
  for (int i = 0; i < 10; ++i) {
    auto promise = std::make_shared<std::promise<void>>();
    done.push_back(promise->get_future());
    pool.Submit([&order, i, promise]() {
      order.push_back(i);
      promise->set_value();
    });
  }
  for (auto& f : done) f.get();
  EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
}

TEST(ThreadPoolTest, ZeroThreadsStillRuns) {
  ThreadPool pool(0);
  EXPECT_EQ(pool.Size(), 1u);
  auto promise = std::make_shared<std::promise<int>>();
  auto result  = promise->get_future();
  pool.Submit([promise]() { promise->set_value(7); });
  EXPECT_EQ(result.get(), 7);
}
};  // namespace imgshelf
