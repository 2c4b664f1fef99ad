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

#include <algorithm>
#include <string>
#include <vector>

#include "utils/string/string_utils.hpp"

namespace imgshelf {
TEST(StringUtilsTest, NaturalOrderComparesDigitRunsByValue) {
  std::vector<std::string> names = {"img2.png", "img10.png", "img1.png"};
  std::sort(names.begin(), names.end(), strutil::NaturalLess);
  EXPECT_EQ(names, (std::vector<std::string>{"img1.png", "img2.png", "img10.png"}));
}

TEST(StringUtilsTest, NaturalOrderIgnoresCaseAndHandlesMixedRuns) {
  EXPECT_TRUE(strutil::NaturalLess("IMG_2.jpg", "img_10.jpg"));
  EXPECT_TRUE(strutil::NaturalLess("a9b", "a10a"));
  EXPECT_TRUE(strutil::NaturalLess("scan", "scan1"));
  EXPECT_FALSE(strutil::NaturalLess("photo20", "photo3"));
  EXPECT_FALSE(strutil::NaturalLess("same", "same"));
}

TEST(StringUtilsTest, NaturalOrderIsStrictForEquivalentNames) {
  // Zero padding and case must not make two distinct names equivalent
  const bool a = strutil::NaturalLess("img01", "img1");
  const bool b = strutil::NaturalLess("img1", "img01");
  EXPECT_NE(a, b);
  EXPECT_NE(strutil::NaturalLess("A.png", "a.png"), strutil::NaturalLess("a.png", "A.png"));
}

TEST(StringUtilsTest, SplitTrimmedDropsEmptyTokens) {
  EXPECT_EQ(strutil::SplitTrimmed(" cat + dog ++ bird ", '+'),
            (std::vector<std::string>{"cat", "dog", "bird"}));
  EXPECT_TRUE(strutil::SplitTrimmed(" + ", '+').empty());
  EXPECT_EQ(strutil::SplitTrimmed("single", '+'), (std::vector<std::string>{"single"}));
}

TEST(StringUtilsTest, LowerAndTrim) {
  EXPECT_EQ(strutil::ToLower("Red"), "red");
  EXPECT_EQ(strutil::Trim("\t  spaced out \n"), "spaced out");
  EXPECT_EQ(strutil::Trim("   "), "");
}
};  // namespace imgshelf
