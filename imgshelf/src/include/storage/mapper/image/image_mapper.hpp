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
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"
#include "type/type.hpp"

namespace imgshelf {
// images(id BIGINT PRIMARY KEY, path TEXT, thumbnail_path TEXT, description TEXT,
//        created_at TIMESTAMP, is_folder BOOLEAN, is_prepared BOOLEAN)
struct ImageMapperParams {
  image_id_t  id;
  std::string path;
  std::string thumbnail_path;
  std::string description;
  std::string created_at;
  bool        is_folder;
  bool        is_prepared;
};

class ImageMapper : public MapperInterface<ImageMapper, ImageMapperParams, image_id_t>,
                    public FieldReflectable<ImageMapper> {
 private:
  static constexpr uint32_t                                         field_count_      = 7;
  static constexpr const char*                                      table_name_       = "images";
  static constexpr const char*                                      prime_key_clause_ = "id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, field_count_> field_descs_      = {
      FIELD(ImageMapperParams, id, INT64),
      FIELD(ImageMapperParams, path, VARCHAR),
      FIELD(ImageMapperParams, thumbnail_path, VARCHAR),
      FIELD(ImageMapperParams, description, VARCHAR),
      FIELD(ImageMapperParams, created_at, TIMESTAMP),
      FIELD(ImageMapperParams, is_folder, BOOLEAN),
      FIELD(ImageMapperParams, is_prepared, BOOLEAN)};
  // id and created_at come from the column defaults
  static constexpr std::array<duckorm::DuckFieldDesc, 5> insert_field_descs_ = {
      FIELD(ImageMapperParams, path, VARCHAR), FIELD(ImageMapperParams, thumbnail_path, VARCHAR),
      FIELD(ImageMapperParams, description, VARCHAR),
      FIELD(ImageMapperParams, is_folder, BOOLEAN),
      FIELD(ImageMapperParams, is_prepared, BOOLEAN)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> ImageMapperParams;
  friend struct FieldReflectable<ImageMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace imgshelf
