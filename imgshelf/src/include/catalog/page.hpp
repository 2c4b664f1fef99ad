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

#include <cstdint>
#include <vector>

namespace imgshelf {
template <typename T>
struct Page {
  std::vector<T> content_{};
  // ceil(total / page_size), 0 for an empty result
  uint32_t       total_pages_ = 0;
  // 0-based
  uint32_t       page_number_ = 0;
  uint64_t       total_items_ = 0;

  static auto    TotalPages(uint64_t total, uint32_t page_size) -> uint32_t {
    if (page_size == 0 || total == 0) return 0;
    return static_cast<uint32_t>((total + page_size - 1) / page_size);
  }
};
};  // namespace imgshelf
