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

#include <duckdb.h>

#include <optional>
#include <vector>

#include "catalog/image_dto.hpp"
#include "storage/mapper/image/image_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace imgshelf {
class ImageService : public ServiceInterface<ImageService, ImageDTO, ImageMapperParams,
                                             ImageMapper, image_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  // Column list matching ImageMapper, for hand-written queries over "images i"
  static constexpr const char* kSelectColumns =
      "i.id, i.path, i.thumbnail_path, i.description, "
      "strftime(i.created_at, '%Y-%m-%d %H:%M:%S'), i.is_folder, i.is_prepared";

  static auto ToParams(const ImageDTO& source) -> ImageMapperParams;
  // Tags are not stored on the row and come back empty
  static auto FromParams(ImageMapperParams&& param) -> ImageDTO;

  auto        GetImageById(const image_id_t id) -> std::optional<ImageDTO>;
  auto        GetUnprepared() -> std::vector<ImageDTO>;
  // Placeholders whose row was inserted more than `age_seconds` ago
  auto        GetUnpreparedOlderThan(int64_t age_seconds) -> std::vector<ImageDTO>;
};
};  // namespace imgshelf
