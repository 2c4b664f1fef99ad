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

#include <string>
#include <string_view>
#include <vector>

namespace strutil {
auto ToLower(std::string_view str) -> std::string;
auto Trim(std::string_view str) -> std::string;

/**
 * @brief Split on a delimiter, trimming every token and dropping the empty ones.
 */
auto SplitTrimmed(std::string_view str, char delim) -> std::vector<std::string>;

/**
 * @brief Natural ordering: runs of digits compare by numeric value, everything else compares
 *        case-insensitively, so "img2" sorts before "img10".
 */
auto NaturalLess(std::string_view lhs, std::string_view rhs) -> bool;
};  // namespace strutil
