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

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "catalog/filter.hpp"
#include "catalog/image_dto.hpp"
#include "catalog/page.hpp"
#include "storage/controller/controller_types.hpp"
#include "storage/controller/tag/tag_controller.hpp"
#include "storage/service/image/image_service.hpp"
#include "type/type.hpp"

namespace imgshelf {
/**
 * @brief Relational side of the catalog: image rows, their search surface and deletion.
 */
class ImageController {
 private:
  ConnectionGuard                guard_;
  ImageService                   service_;
  std::shared_ptr<TagController> tags_;
  std::mutex                     conn_mtx_;

  auto                           Hydrate(std::vector<ImageDTO>&& rows) -> std::vector<ImageDTO>;

 public:
  ImageController(ConnectionGuard&& guard, std::shared_ptr<TagController> tags);

  /**
   * @brief Insert a row with empty paths and is_prepared = false.
   *
   * @param description
   * @return image_id_t id to name the artifact directory after
   */
  auto InsertPlaceholder(const std::string& description) -> image_id_t;

  /**
   * @brief Apply a sparse update. Tags, when given and non-empty, are reconciled before the row
   *        itself is written.
   *
   * @throws CatalogException NOT_FOUND when the id does not exist
   */
  auto UpdateFromDTO(image_id_t id, const ImageUpdateDTO& update) -> ImageDTO;

  /**
   * @brief Prepared images matching the filter, one page of them, tags hydrated.
   *
   * @param filter
   * @param page 0-based
   * @param page_size
   * @return Page<ImageDTO>
   */
  auto FindAll(const Filter& filter, uint32_t page, uint32_t page_size) -> Page<ImageDTO>;

  // Any row, prepared or not
  auto FindById(image_id_t id) -> std::optional<ImageDTO>;

  /**
   * @brief Delete the row and its tag associations. Missing ids are not an error.
   *
   * @return true if a row was removed
   */
  auto Delete(image_id_t id) -> bool;

  auto ListUnprepared() -> std::vector<ImageDTO>;
  auto ListUnpreparedOlderThan(int64_t age_seconds) -> std::vector<ImageDTO>;
};
};  // namespace imgshelf
