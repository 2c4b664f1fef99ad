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

#include "storage/mapper/image/image_mapper.hpp"

#include <stdexcept>
#include <utility>
#include <variant>

namespace imgshelf {
auto ImageMapper::FromRawData(std::vector<duckorm::VarTypes>&& data) -> ImageMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for images");
  }
  auto id             = std::get_if<int64_t>(&data[0]);
  auto path           = std::get_if<std::string>(&data[1]);
  auto thumbnail_path = std::get_if<std::string>(&data[2]);
  auto description    = std::get_if<std::string>(&data[3]);
  auto created_at     = std::get_if<std::string>(&data[4]);
  auto is_folder      = std::get_if<bool>(&data[5]);
  auto is_prepared    = std::get_if<bool>(&data[6]);

  if (id == nullptr || path == nullptr || thumbnail_path == nullptr || description == nullptr ||
      created_at == nullptr || is_folder == nullptr || is_prepared == nullptr) {
    throw std::runtime_error("Encounting unmatching types when parsing the data from the DB");
  }
  return {*id,
          std::move(*path),
          std::move(*thumbnail_path),
          std::move(*description),
          std::move(*created_at),
          *is_folder,
          *is_prepared};
}
};  // namespace imgshelf
