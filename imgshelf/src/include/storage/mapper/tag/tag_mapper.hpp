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
// tags(id BIGINT PRIMARY KEY, name TEXT UNIQUE, color TEXT)
struct TagMapperParams {
  tag_id_t    id;
  std::string name;
  std::string color;
};

class TagMapper : public MapperInterface<TagMapper, TagMapperParams, tag_id_t>,
                  public FieldReflectable<TagMapper> {
 private:
  static constexpr uint32_t                                         field_count_      = 3;
  static constexpr const char*                                      table_name_       = "tags";
  static constexpr const char*                                      prime_key_clause_ = "id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, field_count_> field_descs_      = {
      FIELD(TagMapperParams, id, INT64), FIELD(TagMapperParams, name, VARCHAR),
      FIELD(TagMapperParams, color, VARCHAR)};
  static constexpr std::array<duckorm::DuckFieldDesc, 2> insert_field_descs_ = {
      FIELD(TagMapperParams, name, VARCHAR), FIELD(TagMapperParams, color, VARCHAR)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> TagMapperParams;
  friend struct FieldReflectable<TagMapper>;
  using MapperInterface::MapperInterface;
};

// image_tags(image_id BIGINT, tag_id BIGINT, PRIMARY KEY(image_id, tag_id))
struct ImageTagMapperParams {
  image_id_t image_id;
  tag_id_t   tag_id;
};

class ImageTagMapper : public MapperInterface<ImageTagMapper, ImageTagMapperParams, image_id_t>,
                       public FieldReflectable<ImageTagMapper> {
 private:
  static constexpr uint32_t    field_count_      = 2;
  static constexpr const char* table_name_       = "image_tags";
  // Keyed by image: removing an id drops every association of that image
  static constexpr const char* prime_key_clause_ = "image_id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, field_count_> field_descs_ = {
      FIELD(ImageTagMapperParams, image_id, INT64), FIELD(ImageTagMapperParams, tag_id, INT64)};
  static constexpr std::array<duckorm::DuckFieldDesc, field_count_> insert_field_descs_ =
      field_descs_;

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> ImageTagMapperParams;
  friend struct FieldReflectable<ImageTagMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace imgshelf
