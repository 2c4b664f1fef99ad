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

#include "storage/mapper/tag/tag_mapper.hpp"

#include <stdexcept>
#include <utility>
#include <variant>

namespace imgshelf {
auto TagMapper::FromRawData(std::vector<duckorm::VarTypes>&& data) -> TagMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for tags");
  }
  auto id    = std::get_if<int64_t>(&data[0]);
  auto name  = std::get_if<std::string>(&data[1]);
  auto color = std::get_if<std::string>(&data[2]);
  if (id == nullptr || name == nullptr || color == nullptr) {
    throw std::runtime_error("Encounting unmatching types when parsing the data from the DB");
  }
  return {*id, std::move(*name), std::move(*color)};
}

auto ImageTagMapper::FromRawData(std::vector<duckorm::VarTypes>&& data) -> ImageTagMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for image_tags");
  }
  auto image_id = std::get_if<int64_t>(&data[0]);
  auto tag_id   = std::get_if<int64_t>(&data[1]);
  if (image_id == nullptr || tag_id == nullptr) {
    throw std::runtime_error("Encounting unmatching types when parsing the data from the DB");
  }
  return {*image_id, *tag_id};
}
};  // namespace imgshelf
