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

#include "storage/controller/image/image_controller.hpp"

#include <format>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "catalog/catalog_error.hpp"
#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "utils/string/string_utils.hpp"

namespace imgshelf {
namespace {
struct WhereClause {
  std::string                     sql_;
  std::vector<duckorm::DuckParam> params_;
};

auto Placeholders(size_t count) -> std::string {
  std::ostringstream oss;
  for (size_t i = 0; i < count; ++i) {
    oss << (i == 0 ? "?" : ", ?");
  }
  return oss.str();
}

/**
 * @brief Translate a filter into a WHERE clause over "images i". Description terms are OR-ed,
 *        tags are intersected, and the two groups are AND-ed together.
 */
auto BuildWhere(const Filter& filter) -> WhereClause {
  WhereClause where{"i.is_prepared = true", {}};

  if (filter.HasQuery()) {
    auto               terms = strutil::SplitTrimmed(filter.query_, '+');
    std::ostringstream any_term;
    for (size_t i = 0; i < terms.size(); ++i) {
      any_term << (i == 0 ? "" : " OR ") << "contains(lower(i.description), ?)";
      where.params_.emplace_back(strutil::ToLower(terms[i]));
    }
    where.sql_ += std::format(" AND ({})", any_term.str());
  }

  if (filter.HasTags()) {
    std::set<std::string> names;
    for (const auto& tag : filter.tags_) {
      auto name = strutil::ToLower(strutil::Trim(tag));
      if (!name.empty()) names.insert(std::move(name));
    }
    if (!names.empty()) {
      where.sql_ += std::format(
          " AND i.id IN (SELECT it.image_id FROM image_tags it JOIN tags t ON t.id = it.tag_id "
          "WHERE t.name IN ({}) GROUP BY it.image_id HAVING COUNT(DISTINCT t.name) = ?)",
          Placeholders(names.size()));
      where.params_.insert(where.params_.end(), names.begin(), names.end());
      where.params_.emplace_back(static_cast<int64_t>(names.size()));
    }
  }
  return where;
}
}  // namespace

ImageController::ImageController(ConnectionGuard&& guard, std::shared_ptr<TagController> tags)
    : guard_(std::move(guard)), service_(guard_.conn_), tags_(std::move(tags)) {}

auto ImageController::Hydrate(std::vector<ImageDTO>&& rows) -> std::vector<ImageDTO> {
  std::vector<image_id_t> ids;
  ids.reserve(rows.size());
  for (const auto& row : rows) ids.push_back(row.id_);

  auto tags_by_image = tags_->HydrateTags(ids);
  for (auto& row : rows) {
    auto it = tags_by_image.find(row.id_);
    if (it != tags_by_image.end()) row.tags_ = std::move(it->second);
  }
  return std::move(rows);
}

auto ImageController::InsertPlaceholder(const std::string& description) -> image_id_t {
  std::lock_guard<std::mutex> lock(conn_mtx_);
  ImageDTO                    placeholder;
  placeholder.description_ = description;
  placeholder.is_prepared_ = false;
  return service_.InsertReturningId(placeholder);
}

auto ImageController::UpdateFromDTO(image_id_t id, const ImageUpdateDTO& update) -> ImageDTO {
  if (!FindById(id)) {
    throw CatalogException(CatalogErrorCode::NOT_FOUND, std::format("Image {} not found", id));
  }

  if (update.tags_.has_value() && !update.tags_->empty()) {
    tags_->ReconcileImageTags(id, *update.tags_);
  }

  ImageDTO                      values;
  std::vector<std::string_view> columns = {"is_folder", "is_prepared"};
  values.is_folder_                     = update.is_folder_;
  values.is_prepared_                   = update.is_prepared_;
  if (update.path_.has_value() && !update.path_->empty()) {
    values.path_ = *update.path_;
    columns.push_back("path");
  }
  if (update.thumbnail_path_.has_value() && !update.thumbnail_path_->empty()) {
    values.thumbnail_path_ = *update.thumbnail_path_;
    columns.push_back("thumbnail_path");
  }
  if (update.description_.has_value() && !update.description_->empty()) {
    values.description_ = *update.description_;
    columns.push_back("description");
  }

  idx_t changed = 0;
  {
    std::lock_guard<std::mutex> lock(conn_mtx_);
    changed = service_.UpdateColumns(values, id, columns);
  }
  if (changed == 0) {
    // Deleted while the tags were being written
    throw CatalogException(CatalogErrorCode::NOT_FOUND, std::format("Image {} not found", id));
  }

  auto updated = FindById(id);
  if (!updated) {
    throw CatalogException(CatalogErrorCode::NOT_FOUND, std::format("Image {} not found", id));
  }
  return *updated;
}

auto ImageController::FindAll(const Filter& filter, uint32_t page, uint32_t page_size)
    -> Page<ImageDTO> {
  if (page_size == 0) {
    throw CatalogException(CatalogErrorCode::INVALID_ARGUMENT, "Page size must be positive");
  }
  auto        where     = BuildWhere(filter);
  const char* direction = filter.sort_ == SortOrder::CREATED_ASC ? "ASC" : "DESC";

  Page<ImageDTO>        result;
  std::vector<ImageDTO> rows;
  {
    std::lock_guard<std::mutex> lock(conn_mtx_);
    int64_t                     total = duckorm::query_int64(
        guard_.conn_, std::format("SELECT COUNT(*) FROM images i WHERE {};", where.sql_),
        where.params_);

    auto params = where.params_;
    params.emplace_back(static_cast<int64_t>(page_size));
    params.emplace_back(static_cast<int64_t>(page) * static_cast<int64_t>(page_size));
    rows = service_.GetByQuery(
        std::format("SELECT {} FROM images i WHERE {} ORDER BY i.created_at {}, i.id {} "
                    "LIMIT ? OFFSET ?;",
                    ImageService::kSelectColumns, where.sql_, direction, direction),
        params);

    result.total_items_ = static_cast<uint64_t>(total);
  }
  result.total_pages_ = Page<ImageDTO>::TotalPages(result.total_items_, page_size);
  result.page_number_ = page;
  result.content_     = Hydrate(std::move(rows));
  return result;
}

auto ImageController::FindById(image_id_t id) -> std::optional<ImageDTO> {
  std::optional<ImageDTO> found;
  {
    std::lock_guard<std::mutex> lock(conn_mtx_);
    found = service_.GetImageById(id);
  }
  if (found) found->tags_ = tags_->GetTagsOf(id);
  return found;
}

auto ImageController::Delete(image_id_t id) -> bool {
  std::lock_guard<std::mutex>     lock(conn_mtx_);
  std::vector<duckorm::DuckParam> params = {id};
  TransactionGuard                tx(guard_.conn_);
  duckorm::remove(guard_.conn_, "image_tags", "image_id = ?", params);
  idx_t removed = service_.RemoveById(id);
  tx.Commit();
  return removed > 0;
}

auto ImageController::ListUnprepared() -> std::vector<ImageDTO> {
  std::lock_guard<std::mutex> lock(conn_mtx_);
  return service_.GetUnprepared();
}

auto ImageController::ListUnpreparedOlderThan(int64_t age_seconds) -> std::vector<ImageDTO> {
  std::lock_guard<std::mutex> lock(conn_mtx_);
  return service_.GetUnpreparedOlderThan(age_seconds);
}
};  // namespace imgshelf
