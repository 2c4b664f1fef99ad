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

#include "storage/service/tag/tag_service.hpp"

#include <array>
#include <format>
#include <sstream>
#include <string>
#include <variant>

#include "storage/mapper/duckorm/duckdb_orm.hpp"

namespace imgshelf {
namespace {
// (image_id, tag_id, name, color) rows of the hydration join, read by position
constexpr std::array<duckorm::DuckFieldDesc, 4> kTaggedRowFields = {
    duckorm::DuckFieldDesc{"image_id", duckorm::DuckDBType::INT64, 0},
    duckorm::DuckFieldDesc{"tag_id", duckorm::DuckDBType::INT64, 0},
    duckorm::DuckFieldDesc{"name", duckorm::DuckDBType::VARCHAR, 0},
    duckorm::DuckFieldDesc{"color", duckorm::DuckDBType::VARCHAR, 0}};

auto Placeholders(size_t count) -> std::string {
  std::ostringstream oss;
  for (size_t i = 0; i < count; ++i) {
    oss << (i == 0 ? "?" : ", ?");
  }
  return oss.str();
}
}  // namespace

auto TagService::ToParams(const TagDTO& source) -> TagMapperParams {
  return {source.id_, source.name_, TagColorToString(source.color_)};
}

auto TagService::FromParams(TagMapperParams&& param) -> TagDTO {
  return {param.id, std::move(param.name), TagColorFromString(param.color)};
}

auto TagService::GetTagByName(const std::string& name) -> std::optional<TagDTO> {
  std::vector<duckorm::DuckParam> params = {name};
  auto                            result = GetByPredicate("name = ?", params);
  if (result.empty()) return std::nullopt;
  return std::move(result.front());
}

auto TagService::GetTagById(const tag_id_t id) -> std::optional<TagDTO> {
  auto result = GetByPredicate(std::format("id={}", id));
  if (result.empty()) return std::nullopt;
  return std::move(result.front());
}

auto TagService::GetAllTags() -> std::vector<TagDTO> {
  return GetByQuery("SELECT id, name, color FROM tags ORDER BY name;");
}

auto TagService::GetTagsForImages(const std::vector<image_id_t>& ids)
    -> std::map<image_id_t, std::set<TagDTO>> {
  std::map<image_id_t, std::set<TagDTO>> tags_by_image;
  if (ids.empty()) return tags_by_image;

  std::vector<duckorm::DuckParam> params(ids.begin(), ids.end());
  std::string sql = std::format(
      "SELECT it.image_id, t.id, t.name, t.color FROM image_tags it "
      "JOIN tags t ON t.id = it.tag_id WHERE it.image_id IN ({}) ORDER BY it.image_id, t.name;",
      Placeholders(ids.size()));
  auto rows = duckorm::select_by_query(Connection(), kTaggedRowFields, sql, params);
  for (auto& row : rows) {
    auto image_id = std::get<int64_t>(row[0]);
    tags_by_image[image_id].insert(TagDTO{std::get<int64_t>(row[1]),
                                          std::move(std::get<std::string>(row[2])),
                                          TagColorFromString(std::get<std::string>(row[3]))});
  }
  return tags_by_image;
}

void ImageTagService::Link(image_id_t image_id, tag_id_t tag_id) {
  std::vector<duckorm::DuckParam> params = {image_id, tag_id};
  duckorm::execute(Connection(),
                   "INSERT INTO image_tags (image_id, tag_id) VALUES (?, ?) ON CONFLICT DO NOTHING;",
                   params);
}

auto ImageTagService::UnlinkAllExcept(image_id_t image_id, const std::set<tag_id_t>& keep)
    -> idx_t {
  std::vector<duckorm::DuckParam> params = {image_id};
  if (keep.empty()) {
    return RemoveByClause("image_id = ?", params);
  }
  params.insert(params.end(), keep.begin(), keep.end());
  return RemoveByClause(std::format("image_id = ? AND tag_id NOT IN ({})", Placeholders(keep.size())),
                        params);
}
};  // namespace imgshelf
