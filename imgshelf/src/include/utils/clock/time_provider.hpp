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

#pragma once

#include <atomic>
#include <chrono>
#include <string>

namespace imgshelf {
class TimeProvider {
 private:
  static std::atomic<std::chrono::system_clock::time_point> cached_sys_time_;
  static std::atomic<std::chrono::steady_clock::time_point> cached_steady_time_;

 public:
  static void Refresh();
  static auto Now() -> std::chrono::system_clock::time_point;
  /**
   * @brief Format a time point in local time with a strftime-style pattern.
   */
  static auto TimePointToString(const std::chrono::system_clock::time_point& tp,
                                const char* pattern = "%Y%m%d_%H%M%S") -> std::string;
  static auto UnixSeconds(const std::chrono::system_clock::time_point& tp) -> int64_t;
};
};  // namespace imgshelf
