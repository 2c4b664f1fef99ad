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

#include "storage/controller/tag/tag_controller.hpp"

#include <format>
#include <string>
#include <vector>

#include "catalog/catalog_error.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "utils/log/log_registry.hpp"
#include "utils/string/string_utils.hpp"

namespace imgshelf {
namespace {
auto NormalizeTagName(const std::string& name) -> std::string {
  return strutil::ToLower(strutil::Trim(name));
}
}  // namespace

TagController::TagController(ConnectionGuard&& guard)
    : guard_(std::move(guard)), tag_service_(guard_.conn_), link_service_(guard_.conn_) {}

auto TagController::ResolveOrCreateUnlocked(const TagDTO& desired) -> TagDTO {
  std::string name = NormalizeTagName(desired.name_);
  if (name.empty()) {
    throw CatalogException(CatalogErrorCode::INVALID_ARGUMENT, "Tag name cannot be empty");
  }
  if (auto existing = tag_service_.GetTagByName(name)) return *existing;

  TagDTO created{0, name, desired.color_};
  try {
    created.id_ = tag_service_.InsertReturningId(created);
  } catch (const duckorm::DuckDBException& e) {
    if (!e.IsConstraintViolation()) throw;
    // Someone else created it in between
    LogRegistry::DB()->debug("Tag '{}' created concurrently, resolving again", name);
    if (auto existing = tag_service_.GetTagByName(name)) return *existing;
    throw;
  }
  return created;
}

auto TagController::ResolveOrCreate(const TagDTO& desired) -> TagDTO {
  std::lock_guard<std::mutex> lock(conn_mtx_);
  return ResolveOrCreateUnlocked(desired);
}

void TagController::ReconcileImageTags(image_id_t image_id, const std::vector<TagDTO>& desired) {
  std::lock_guard<std::mutex> lock(conn_mtx_);
  std::set<tag_id_t>          wanted;
  for (const auto& tag : desired) {
    if (NormalizeTagName(tag.name_).empty()) continue;
    wanted.insert(ResolveOrCreateUnlocked(tag).id_);
  }
  if (wanted.empty()) {
    // Only blank names: same as an absent tag set
    LogRegistry::DB()->debug("No usable tag names for image {}, keeping its tags", image_id);
    return;
  }

  TransactionGuard tx(guard_.conn_);
  link_service_.UnlinkAllExcept(image_id, wanted);
  for (tag_id_t tag_id : wanted) {
    link_service_.Link(image_id, tag_id);
  }
  tx.Commit();
}

auto TagController::HydrateTags(const std::vector<image_id_t>& ids)
    -> std::map<image_id_t, std::set<TagDTO>> {
  std::lock_guard<std::mutex> lock(conn_mtx_);
  return tag_service_.GetTagsForImages(ids);
}

auto TagController::GetTagsOf(image_id_t image_id) -> std::set<TagDTO> {
  auto hydrated = HydrateTags({image_id});
  auto it       = hydrated.find(image_id);
  return it == hydrated.end() ? std::set<TagDTO>{} : std::move(it->second);
}

auto TagController::ListTags() -> std::vector<TagDTO> {
  std::lock_guard<std::mutex> lock(conn_mtx_);
  return tag_service_.GetAllTags();
}

auto TagController::CreateTag(const TagDTO& tag) -> TagDTO {
  std::lock_guard<std::mutex> lock(conn_mtx_);
  std::string                 name = NormalizeTagName(tag.name_);
  if (!name.empty() && tag_service_.GetTagByName(name)) {
    throw CatalogException(CatalogErrorCode::INVALID_ARGUMENT,
                           std::format("Tag '{}' already exists", name));
  }
  return ResolveOrCreateUnlocked(tag);
}

auto TagController::UpdateTag(tag_id_t id, const TagDTO& update) -> TagDTO {
  std::lock_guard<std::mutex> lock(conn_mtx_);
  auto                        current = tag_service_.GetTagById(id);
  if (!current) {
    throw CatalogException(CatalogErrorCode::NOT_FOUND, std::format("Tag {} not found", id));
  }

  TagDTO                        updated = *current;
  std::vector<std::string_view> columns = {"color"};
  updated.color_                        = update.color_;

  std::string name                      = NormalizeTagName(update.name_);
  // Rewriting the unique column with an unchanged value trips the constraint check
  if (!name.empty() && name != current->name_) {
    auto clash = tag_service_.GetTagByName(name);
    if (clash && clash->id_ != id) {
      throw CatalogException(CatalogErrorCode::INVALID_ARGUMENT,
                             std::format("Tag '{}' already exists", name));
    }
    updated.name_ = name;
    columns.push_back("name");
  }
  tag_service_.UpdateColumns(updated, id, columns);
  return updated;
}

void TagController::DeleteTag(tag_id_t id) {
  std::lock_guard<std::mutex>     lock(conn_mtx_);
  std::vector<duckorm::DuckParam> params = {id};
  TransactionGuard                tx(guard_.conn_);
  link_service_.RemoveByClause("tag_id = ?", params);
  tag_service_.RemoveById(id);
  tx.Commit();
}
};  // namespace imgshelf
