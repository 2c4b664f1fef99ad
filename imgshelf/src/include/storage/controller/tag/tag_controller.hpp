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

#include <map>
#include <mutex>
#include <set>
#include <vector>

#include "catalog/image_dto.hpp"
#include "storage/controller/controller_types.hpp"
#include "storage/service/tag/tag_service.hpp"
#include "type/type.hpp"

namespace imgshelf {
/**
 * @brief Keeps the image <-> tag relation consistent and owns the tag vocabulary.
 */
class TagController {
 private:
  ConnectionGuard guard_;
  TagService      tag_service_;
  ImageTagService link_service_;
  std::mutex      conn_mtx_;

  auto            ResolveOrCreateUnlocked(const TagDTO& desired) -> TagDTO;

 public:
  explicit TagController(ConnectionGuard&& guard);

  /**
   * @brief Look a tag up by its lowercased name and create it with the given color if absent.
   *        The color of an existing tag is left alone.
   *
   * @param desired
   * @return TagDTO the stored tag
   */
  auto ResolveOrCreate(const TagDTO& desired) -> TagDTO;

  /**
   * @brief Make the tag set of an image exactly `desired`. Tags are resolved first, then the
   *        associations are replaced in a single transaction, so a failure leaves the previous
   *        set intact. Blank names are skipped; if nothing remains the current set is kept.
   */
  void ReconcileImageTags(image_id_t image_id, const std::vector<TagDTO>& desired);

  auto HydrateTags(const std::vector<image_id_t>& ids) -> std::map<image_id_t, std::set<TagDTO>>;
  auto GetTagsOf(image_id_t image_id) -> std::set<TagDTO>;

  auto ListTags() -> std::vector<TagDTO>;
  auto CreateTag(const TagDTO& tag) -> TagDTO;
  auto UpdateTag(tag_id_t id, const TagDTO& update) -> TagDTO;
  // Drops the tag and its associations. Images are untouched.
  void DeleteTag(tag_id_t id);
};
};  // namespace imgshelf
