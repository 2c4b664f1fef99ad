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

#include "type/tag_color.hpp"

#include <algorithm>
#include <cctype>

namespace imgshelf {
namespace {
struct TagColorEntry {
  TagColor         color_;
  std::string_view name_;
  TagColorStyle    style_;
};

constexpr std::array<TagColorEntry, 9> kTagColorTable = {{
    {TagColor::RED, "red", {"Red", 0xE5, 0x48, 0x4D}},
    {TagColor::GREEN, "green", {"Green", 0x46, 0xA7, 0x58}},
    {TagColor::BLUE, "blue", {"Blue", 0x00, 0x90, 0xFF}},
    {TagColor::ORANGE, "orange", {"Orange", 0xF7, 0x6B, 0x15}},
    {TagColor::PURPLE, "purple", {"Purple", 0x8E, 0x4E, 0xC6}},
    {TagColor::PINK, "pink", {"Pink", 0xD6, 0x40, 0x9F}},
    {TagColor::INDIGO, "indigo", {"Indigo", 0x3E, 0x63, 0xDD}},
    {TagColor::TEAL, "teal", {"Teal", 0x12, 0xA5, 0x94}},
    {TagColor::GRAY, "gray", {"Gray", 0x8B, 0x8D, 0x98}},
}};

auto FindEntry(TagColor color) -> const TagColorEntry& {
  for (const auto& entry : kTagColorTable) {
    if (entry.color_ == color) return entry;
  }
  // Enum values outside the table fall back to the default entry
  return kTagColorTable[static_cast<size_t>(kDefaultTagColor)];
}
}  // namespace

auto TagColorToString(TagColor color) -> std::string { return std::string(FindEntry(color).name_); }

auto TagColorFromString(std::string_view name) -> TagColor {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const auto& entry : kTagColorTable) {
    if (entry.name_ == lowered) return entry.color_;
  }
  return kDefaultTagColor;
}

auto StyleForTagColor(TagColor color) -> const TagColorStyle& { return FindEntry(color).style_; }

auto AllTagColors() -> const std::array<TagColor, 9>& {
  static const std::array<TagColor, 9> colors = {
      TagColor::RED,    TagColor::GREEN,  TagColor::BLUE, TagColor::ORANGE, TagColor::PURPLE,
      TagColor::PINK,   TagColor::INDIGO, TagColor::TEAL, TagColor::GRAY};
  return colors;
}
};  // namespace imgshelf
