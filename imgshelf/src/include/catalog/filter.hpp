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
#include <set>
#include <string>

namespace imgshelf {
enum class SortOrder : uint8_t { CREATED_DESC = 0, CREATED_ASC = 1 };

struct Filter {
  // Terms separated by '+', any one of which must appear in the description
  std::string           query_ = "";
  // Every one of these tag names must be present on a match
  std::set<std::string> tags_{};
  SortOrder             sort_  = SortOrder::CREATED_DESC;

  auto                  HasQuery() const -> bool;
  auto                  HasTags() const -> bool { return !tags_.empty(); }
};

inline auto Filter::HasQuery() const -> bool {
  return query_.find_first_not_of(" \t\r\n+") != std::string::npos;
}
};  // namespace imgshelf
