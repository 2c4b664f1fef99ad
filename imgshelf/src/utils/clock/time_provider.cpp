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

#include "utils/clock/time_provider.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace imgshelf {
std::atomic<std::chrono::system_clock::time_point> TimeProvider::cached_sys_time_{
    std::chrono::system_clock::now()};
std::atomic<std::chrono::steady_clock::time_point> TimeProvider::cached_steady_time_{
    std::chrono::steady_clock::now()};

void TimeProvider::Refresh() {
  cached_sys_time_    = std::chrono::system_clock::now();
  cached_steady_time_ = std::chrono::steady_clock::now();
}

auto TimeProvider::Now() -> std::chrono::system_clock::time_point {
  auto elapsed = std::chrono::steady_clock::now() - cached_steady_time_.load();
  return cached_sys_time_.load() +
         std::chrono::duration_cast<std::chrono::system_clock::duration>(elapsed);
}

auto TimeProvider::TimePointToString(const std::chrono::system_clock::time_point& tp,
                                     const char* pattern) -> std::string {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm     tm{};
  localtime_r(&t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, pattern);
  return oss.str();
}

auto TimeProvider::UnixSeconds(const std::chrono::system_clock::time_point& tp) -> int64_t {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}
};  // namespace imgshelf
