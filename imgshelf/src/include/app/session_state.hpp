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

#include "catalog/filter.hpp"

namespace imgshelf {
/**
 * @brief Search state that survives navigation between screens. Owned by the application
 *        controller and handed to screens by reference.
 */
class SessionState {
 public:
  auto GetSearchQuery() const -> const std::string& { return search_query_; }
  auto GetSelectedTags() const -> const std::set<std::string>& { return selected_tags_; }
  auto GetCurrentPage() const -> uint32_t { return current_page_; }
  auto GetScrollOffset() const -> float { return scroll_offset_; }
  auto GetSortOrder() const -> SortOrder { return sort_order_; }

  // Changing what is searched for starts over at the first page
  void SetSearchQuery(std::string query);
  void SetSelectedTags(std::set<std::string> tags);
  void ToggleTag(const std::string& tag);
  void SetSortOrder(SortOrder order);

  void SetCurrentPage(uint32_t page) { current_page_ = page; }
  void SetScrollOffset(float offset) { scroll_offset_ = offset; }

  auto ToFilter() const -> Filter;
  void Reset();

 private:
  std::string           search_query_  = "";
  std::set<std::string> selected_tags_ = {};
  uint32_t              current_page_  = 0;
  float                 scroll_offset_ = 0.0f;
  SortOrder             sort_order_    = SortOrder::CREATED_DESC;

  void                  RestartPaging();
};
};  // namespace imgshelf
