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

#include "utils/string/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace strutil {
namespace {
auto IsDigit(char c) -> bool { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
auto IsSpace(char c) -> bool { return std::isspace(static_cast<unsigned char>(c)) != 0; }
auto Lower(char c) -> char {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}
}  // namespace

auto ToLower(std::string_view str) -> std::string {
  std::string lowered(str);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), Lower);
  return lowered;
}

auto Trim(std::string_view str) -> std::string {
  size_t begin = 0;
  size_t end   = str.size();
  while (begin < end && IsSpace(str[begin])) ++begin;
  while (end > begin && IsSpace(str[end - 1])) --end;
  return std::string(str.substr(begin, end - begin));
}

auto SplitTrimmed(std::string_view str, char delim) -> std::vector<std::string> {
  std::vector<std::string> tokens;
  size_t                   start = 0;
  while (start <= str.size()) {
    size_t pos = str.find(delim, start);
    if (pos == std::string_view::npos) pos = str.size();
    auto token = Trim(str.substr(start, pos - start));
    if (!token.empty()) tokens.push_back(std::move(token));
    start = pos + 1;
  }
  return tokens;
}

auto NaturalLess(std::string_view lhs, std::string_view rhs) -> bool {
  size_t i = 0;
  size_t j = 0;
  while (i < lhs.size() && j < rhs.size()) {
    if (IsDigit(lhs[i]) && IsDigit(rhs[j])) {
      // Compare digit runs by value: skip leading zeros, then length, then digits
      size_t si = i;
      size_t sj = j;
      while (si < lhs.size() && lhs[si] == '0') ++si;
      while (sj < rhs.size() && rhs[sj] == '0') ++sj;
      size_t ei = si;
      size_t ej = sj;
      while (ei < lhs.size() && IsDigit(lhs[ei])) ++ei;
      while (ej < rhs.size() && IsDigit(rhs[ej])) ++ej;

      size_t len_l = ei - si;
      size_t len_r = ej - sj;
      if (len_l != len_r) return len_l < len_r;
      int cmp = lhs.substr(si, len_l).compare(rhs.substr(sj, len_r));
      if (cmp != 0) return cmp < 0;
      // Same value, fewer leading zeros first
      if ((ei - i) != (ej - j)) return (ei - i) < (ej - j);
      i = ei;
      j = ej;
      continue;
    }
    char a = Lower(lhs[i]);
    char b = Lower(rhs[j]);
    if (a != b) return a < b;
    ++i;
    ++j;
  }
  if ((lhs.size() - i) != (rhs.size() - j)) return (lhs.size() - i) < (rhs.size() - j);
  // Case-insensitively equal, fall back to byte order for a strict weak ordering
  return lhs < rhs;
}
};  // namespace strutil
