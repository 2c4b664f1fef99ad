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

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "catalog/image_dto.hpp"
#include "storage/mapper/tag/tag_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace imgshelf {
class TagService
    : public ServiceInterface<TagService, TagDTO, TagMapperParams, TagMapper, tag_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const TagDTO& source) -> TagMapperParams;
  static auto FromParams(TagMapperParams&& param) -> TagDTO;

  // `name` is matched as given, callers lowercase it first
  auto        GetTagByName(const std::string& name) -> std::optional<TagDTO>;
  auto        GetTagById(const tag_id_t id) -> std::optional<TagDTO>;
  auto        GetAllTags() -> std::vector<TagDTO>;

  /**
   * @brief One join over image_tags and tags for all the given images.
   *
   * @param ids
   * @return std::map<image_id_t, std::set<TagDTO>> images without tags are absent
   */
  auto        GetTagsForImages(const std::vector<image_id_t>& ids)
      -> std::map<image_id_t, std::set<TagDTO>>;
};

class ImageTagService
    : public ServiceInterface<ImageTagService, std::pair<image_id_t, tag_id_t>,
                              ImageTagMapperParams, ImageTagMapper, image_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const std::pair<image_id_t, tag_id_t>& source) -> ImageTagMapperParams {
    return {source.first, source.second};
  }
  static auto FromParams(ImageTagMapperParams&& param) -> std::pair<image_id_t, tag_id_t> {
    return {param.image_id, param.tag_id};
  }

  // Duplicate pairs are ignored
  void        Link(image_id_t image_id, tag_id_t tag_id);
  auto        UnlinkAllExcept(image_id_t image_id, const std::set<tag_id_t>& keep) -> idx_t;
};
};  // namespace imgshelf
