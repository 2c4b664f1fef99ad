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

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace imgshelf {
enum class TagColor : uint8_t { RED, GREEN, BLUE, ORANGE, PURPLE, PINK, INDIGO, TEAL, GRAY };

// Presentation attributes of a palette entry. Kept free of any UI toolkit type.
struct TagColorStyle {
  std::string_view display_name_;
  uint8_t          r_;
  uint8_t          g_;
  uint8_t          b_;
};

static constexpr TagColor kDefaultTagColor = TagColor::BLUE;

auto TagColorToString(TagColor color) -> std::string;
/**
 * @brief Parse a stored color name. Unknown names map to the default color.
 */
auto TagColorFromString(std::string_view name) -> TagColor;
auto StyleForTagColor(TagColor color) -> const TagColorStyle&;
auto AllTagColors() -> const std::array<TagColor, 9>&;
};  // namespace imgshelf
