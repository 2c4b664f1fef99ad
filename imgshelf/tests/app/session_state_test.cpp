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

#include <set>

#include "app/session_state.hpp"
#include "type/tag_color.hpp"

namespace imgshelf {
TEST(SessionStateTest, ChangingTheSearchRestartsPaging) {
  SessionState state;
  state.SetCurrentPage(4);
  state.SetScrollOffset(120.0f);
  state.SetSearchQuery("cat");
  EXPECT_EQ(state.GetCurrentPage(), 0u);
  EXPECT_EQ(state.GetScrollOffset(), 0.0f);

  state.SetCurrentPage(2);
  // Same query again keeps the position
  state.SetSearchQuery("cat");
  EXPECT_EQ(state.GetCurrentPage(), 2u);

  state.ToggleTag(" Animal ");
  EXPECT_EQ(state.GetCurrentPage(), 0u);
  EXPECT_EQ(state.GetSelectedTags(), (std::set<std::string>{"animal"}));

  state.SetCurrentPage(3);
  state.SetSortOrder(SortOrder::CREATED_ASC);
  EXPECT_EQ(state.GetCurrentPage(), 0u);
}

TEST(SessionStateTest, ToggleAddsAndRemoves) {
  SessionState state;
  state.ToggleTag("red");
  state.ToggleTag("blue");
  state.ToggleTag("RED");
  EXPECT_EQ(state.GetSelectedTags(), (std::set<std::string>{"blue"}));
  state.ToggleTag("   ");
  EXPECT_EQ(state.GetSelectedTags().size(), 1u);
}

TEST(SessionStateTest, BuildsFilterAndResets) {
  SessionState state;
  state.SetSearchQuery("cat+dog");
  state.SetSelectedTags({"Cute", "animal", ""});
  state.SetSortOrder(SortOrder::CREATED_ASC);

  auto filter = state.ToFilter();
  EXPECT_EQ(filter.query_, "cat+dog");
  EXPECT_EQ(filter.tags_, (std::set<std::string>{"animal", "cute"}));
  EXPECT_EQ(filter.sort_, SortOrder::CREATED_ASC);
  EXPECT_TRUE(filter.HasQuery());
  EXPECT_TRUE(filter.HasTags());

  state.Reset();
  EXPECT_TRUE(state.GetSearchQuery().empty());
  EXPECT_TRUE(state.GetSelectedTags().empty());
  EXPECT_EQ(state.GetSortOrder(), SortOrder::CREATED_DESC);
  EXPECT_FALSE(state.ToFilter().HasQuery());
}

TEST(SessionStateTest, BlankQueriesAreNotQueries) {
  Filter filter;
  filter.query_ = " + + ";
  EXPECT_FALSE(filter.HasQuery());
  filter.query_ = "a";
  EXPECT_TRUE(filter.HasQuery());
}

TEST(TagColorTest, EveryColorHasAStyleAndRoundTripsByName) {
  std::set<std::string> names;
  for (auto color : AllTagColors()) {
    const auto name = TagColorToString(color);
    EXPECT_EQ(TagColorFromString(name), color);
    EXPECT_FALSE(StyleForTagColor(color).display_name_.empty());
    names.insert(name);
  }
  EXPECT_EQ(names.size(), AllTagColors().size());
}

TEST(TagColorTest, UnknownNamesFallBackToBlue) {
  EXPECT_EQ(TagColorFromString("chartreuse"), TagColor::BLUE);
  EXPECT_EQ(TagColorFromString(""), kDefaultTagColor);
  EXPECT_EQ(TagColorFromString("Red"), TagColor::RED);
  EXPECT_EQ(TagColorToString(TagColor::TEAL), "teal");
  const auto& red = StyleForTagColor(TagColor::RED);
  EXPECT_EQ(red.display_name_, "Red");
  EXPECT_GT(red.r_, red.g_);
}
};  // namespace imgshelf
