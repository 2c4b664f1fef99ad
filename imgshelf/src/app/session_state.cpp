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

#include "app/session_state.hpp"

#include <utility>

#include "utils/string/string_utils.hpp"

namespace imgshelf {
void SessionState::RestartPaging() {
  current_page_  = 0;
  scroll_offset_ = 0.0f;
}

void SessionState::SetSearchQuery(std::string query) {
  if (query == search_query_) return;
  search_query_ = std::move(query);
  RestartPaging();
}

void SessionState::SetSelectedTags(std::set<std::string> tags) {
  std::set<std::string> normalized;
  for (const auto& tag : tags) {
    auto name = strutil::ToLower(strutil::Trim(tag));
    if (!name.empty()) normalized.insert(std::move(name));
  }
  if (normalized == selected_tags_) return;
  selected_tags_ = std::move(normalized);
  RestartPaging();
}

void SessionState::ToggleTag(const std::string& tag) {
  auto name = strutil::ToLower(strutil::Trim(tag));
  if (name.empty()) return;
  if (selected_tags_.erase(name) == 0) selected_tags_.insert(name);
  RestartPaging();
}

void SessionState::SetSortOrder(SortOrder order) {
  if (order == sort_order_) return;
  sort_order_ = order;
  RestartPaging();
}

auto SessionState::ToFilter() const -> Filter { return Filter{search_query_, selected_tags_, sort_order_}; }

void SessionState::Reset() { *this = SessionState{}; }
};  // namespace imgshelf
