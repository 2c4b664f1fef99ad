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

#include "storage/service/image/image_service.hpp"

#include <format>
#include <string>
#include <utility>
#include <vector>

namespace imgshelf {
auto ImageService::ToParams(const ImageDTO& source) -> ImageMapperParams {
  return {source.id_,          source.path_,      source.thumbnail_path_, source.description_,
          source.created_at_, source.is_folder_, source.is_prepared_};
}

auto ImageService::FromParams(ImageMapperParams&& param) -> ImageDTO {
  ImageDTO dto;
  dto.id_             = param.id;
  dto.path_           = std::move(param.path);
  dto.thumbnail_path_ = std::move(param.thumbnail_path);
  dto.description_    = std::move(param.description);
  dto.created_at_     = std::move(param.created_at);
  dto.is_folder_      = param.is_folder;
  dto.is_prepared_    = param.is_prepared;
  return dto;
}

auto ImageService::GetImageById(const image_id_t id) -> std::optional<ImageDTO> {
  auto result = GetByPredicate(std::format("id={}", id));
  if (result.empty()) return std::nullopt;
  return std::move(result.front());
}

auto ImageService::GetUnprepared() -> std::vector<ImageDTO> {
  return GetByQuery(std::format("SELECT {} FROM images i WHERE i.is_prepared = false "
                                "ORDER BY i.created_at, i.id;",
                                kSelectColumns));
}

auto ImageService::GetUnpreparedOlderThan(int64_t age_seconds) -> std::vector<ImageDTO> {
  std::vector<duckorm::DuckParam> params = {age_seconds};
  return GetByQuery(std::format("SELECT {} FROM images i WHERE i.is_prepared = false AND "
                                "i.created_at < CAST(now() AS TIMESTAMP) - "
                                "to_seconds(CAST(? AS BIGINT)) ORDER BY i.created_at, i.id;",
                                kSelectColumns),
                    params);
}
};  // namespace imgshelf
