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

#include "app/catalog_service.hpp"

#include <format>
#include <string_view>

#include "catalog/catalog_error.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "utils/log/log_registry.hpp"

namespace imgshelf {
namespace {
/**
 * @brief Turn the exception in flight into one CatalogException prefixed with what was being
 *        done. Must be called from inside a catch block.
 */
[[noreturn]] void RethrowAsCatalogError(std::string_view action) {
  CatalogErrorCode code = CatalogErrorCode::UNKNOWN;
  std::string      cause;
  try {
    throw;
  } catch (const CatalogException& e) {
    code  = e.Code();
    cause = e.what();
  } catch (const CodecError& e) {
    switch (e.GetKind()) {
      case CodecError::Kind::DECODE:
        code = CatalogErrorCode::DECODE_FAILED;
        break;
      case CodecError::Kind::ENCODE:
        code = CatalogErrorCode::ENCODE_FAILED;
        break;
      case CodecError::Kind::IO:
        code = CatalogErrorCode::FILESYSTEM;
        break;
    }
    cause = e.what();
  } catch (const duckorm::DuckDBException& e) {
    code  = CatalogErrorCode::DATABASE;
    cause = e.what();
  } catch (const std::filesystem::filesystem_error& e) {
    code  = CatalogErrorCode::FILESYSTEM;
    cause = e.what();
  } catch (const std::exception& e) {
    cause = e.what();
  }
  auto message = std::format("{}: {}", action, cause);
  LogRegistry::Catalog()->error("{} [{}]", message, CatalogErrorCodeName(code));
  throw CatalogException(code, message);
}
};  // namespace

CatalogService::CatalogService(const std::filesystem::path&      app_dir,
                               std::shared_ptr<SettingsProvider> settings, size_t import_workers)
    : app_dir_(app_dir), settings_(std::move(settings)) {
  try {
    std::filesystem::create_directories(app_dir_);
    db_     = std::make_unique<DBController>(app_dir_ / "catalog.db");
    tags_   = std::make_shared<TagController>(db_->GetConnectionGuard());
    images_ = std::make_unique<ImageController>(db_->GetConnectionGuard(), tags_);
    store_  = std::make_unique<ArtifactStore>(app_dir_, settings_, import_workers);
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to open catalog");
  }
  LogRegistry::Catalog()->info("Catalog opened at {}", app_dir_.string());
}

auto CatalogService::Finalize(image_id_t id, const image_path_t& path,
                              const image_path_t& thumbnail, const std::vector<TagDTO>& tags,
                              bool is_folder) -> ImageDTO {
  ImageUpdateDTO update;
  update.path_           = path.string();
  update.thumbnail_path_ = thumbnail.string();
  if (!tags.empty()) update.tags_ = tags;
  update.is_folder_   = is_folder;
  update.is_prepared_ = true;
  try {
    return images_->UpdateFromDTO(id, update);
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to finalize registration");
  }
}

auto CatalogService::RegisterImage(const std::string& description, const std::vector<TagDTO>& tags,
                                   const DecodedImage& image) -> image_id_t {
  image_id_t id = 0;
  try {
    id = images_->InsertPlaceholder(description);
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to register image");
  }

  SavedArtifact saved;
  try {
    saved = store_->SaveImage(id, image);
  } catch (const std::exception&) {
    // The placeholder stays unprepared
    RethrowAsCatalogError("Failed to save file");
  }

  Finalize(id, saved.path_, saved.thumbnail_path_, tags, false);
  LogRegistry::Catalog()->info("Registered image {}", id);
  return id;
}

auto CatalogService::RegisterImageFromFile(const std::string&         description,
                                           const std::vector<TagDTO>& tags,
                                           const image_path_t&        source) -> image_id_t {
  DecodedImage decoded;
  try {
    decoded = codec::DecodeFile(source);
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to read image");
  }
  return RegisterImage(description, tags, decoded);
}

auto CatalogService::RegisterImageFromBytes(const std::string&         description,
                                            const std::vector<TagDTO>& tags,
                                            std::span<const uint8_t>   bytes) -> image_id_t {
  DecodedImage decoded;
  try {
    decoded = codec::Decode(bytes);
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to read image");
  }
  return RegisterImage(description, tags, decoded);
}

auto CatalogService::RegisterImageFromRawRGBA(const std::string&         description,
                                              const std::vector<TagDTO>& tags, int width,
                                              int height, std::span<const uint8_t> rgba)
    -> image_id_t {
  DecodedImage decoded;
  try {
    decoded = codec::FromRawRGBA(width, height, rgba);
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to read clipboard image");
  }
  return RegisterImage(description, tags, decoded);
}

auto CatalogService::RegisterFolder(const std::string& description, const std::vector<TagDTO>& tags,
                                    const image_path_t&              folder,
                                    std::shared_ptr<FolderImportJob> job) -> RegisterFolderResult {
  image_id_t id = 0;
  try {
    id = images_->InsertPlaceholder(description);
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to register folder");
  }

  SavedFolder saved;
  try {
    saved = store_->SaveFolder(id, folder, std::move(job));
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to save folder");
  }

  Finalize(id, saved.folder_path_, saved.folder_thumbnail_, tags, true);
  LogRegistry::Catalog()->info("Registered folder {} with {} images", id, saved.files_.size());
  return {id, static_cast<uint32_t>(saved.files_.size()), saved.canceled_};
}

auto CatalogService::UpdateImage(image_id_t id, const ImageUpdateDTO& update) -> ImageDTO {
  try {
    return images_->UpdateFromDTO(id, update);
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to update image");
  }
}

auto CatalogService::EditImage(image_id_t id, const std::string& description,
                               const std::vector<TagDTO>& tags) -> ImageDTO {
  auto current = FindById(id);
  if (!current.has_value()) {
    throw CatalogException(CatalogErrorCode::NOT_FOUND,
                           std::format("Failed to update image: no image with id {}", id));
  }
  auto update         = ImageUpdateDTO::KeepingFlagsOf(*current);
  update.description_ = description;
  update.tags_        = tags;
  return UpdateImage(id, update);
}

void CatalogService::DeleteImage(const DeleteRequest& request) {
  if (request.context_ == DeleteContext::FROM_FOLDER) {
    // The id must name the folder entry that owns the file, never a child view id
    std::optional<ImageDTO> folder;
    try {
      folder = images_->FindById(request.image_id_);
    } catch (const std::exception&) {
      RethrowAsCatalogError("Failed to delete file");
    }
    const auto owner = std::filesystem::path(request.path_).parent_path().lexically_normal();
    if (!folder.has_value() || !folder->is_folder_ ||
        std::filesystem::path(folder->path_).lexically_normal() != owner) {
      auto message = std::format("Failed to delete file: {} is not part of folder entry {}",
                                 request.path_, request.image_id_);
      LogRegistry::Catalog()->error("{}", message);
      throw CatalogException(CatalogErrorCode::INVALID_ARGUMENT, message);
    }

    bool folder_removed = false;
    try {
      folder_removed = store_->Delete(request.path_, DeleteContext::FROM_FOLDER);
    } catch (const std::exception&) {
      RethrowAsCatalogError("Failed to delete file");
    }
    if (folder_removed) {
      try {
        images_->Delete(request.image_id_);
      } catch (const std::exception&) {
        RethrowAsCatalogError("Failed to delete image");
      }
      LogRegistry::Catalog()->info("Folder entry {} removed with its last image", request.image_id_);
    }
    return;
  }

  std::string path = request.path_;
  try {
    if (path.empty()) {
      auto row = images_->FindById(request.image_id_);
      if (row.has_value()) path = row->path_;
    }
    if (!images_->Delete(request.image_id_)) {
      LogRegistry::Catalog()->debug("Image {} was already gone from the catalog",
                                    request.image_id_);
    }
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to delete image");
  }

  // The row is gone at this point; a failure here orphans files but is still reported
  try {
    if (path.empty()) {
      store_->RemoveEntry(request.image_id_);
    } else {
      store_->Delete(path, request.context_);
    }
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to delete files");
  }
}

auto CatalogService::Search(const Filter& filter, uint32_t page, uint32_t page_size)
    -> Page<ImageDTO> {
  try {
    return images_->FindAll(filter, page, page_size);
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to search images");
  }
}

auto CatalogService::FindById(image_id_t id) -> std::optional<ImageDTO> {
  try {
    return images_->FindById(id);
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to load image");
  }
}

auto CatalogService::ExpandFolder(const ImageDTO& folder) -> std::vector<ImageDTO> {
  return store_->ExpandFolder(folder);
}

auto CatalogService::ListTags() -> std::vector<TagDTO> {
  try {
    return tags_->ListTags();
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to load tags");
  }
}

auto CatalogService::CreateTag(const TagDTO& tag) -> TagDTO {
  try {
    return tags_->CreateTag(tag);
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to create tag");
  }
}

auto CatalogService::UpdateTag(tag_id_t id, const TagDTO& update) -> TagDTO {
  try {
    return tags_->UpdateTag(id, update);
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to update tag");
  }
}

void CatalogService::DeleteTag(tag_id_t id) {
  try {
    tags_->DeleteTag(id);
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to delete tag");
  }
}

auto CatalogService::ListIncompleteRegistrations() -> std::vector<ImageDTO> {
  try {
    return images_->ListUnprepared();
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to list incomplete registrations");
  }
}

auto CatalogService::PurgeIncompleteRegistrations(int64_t age_seconds) -> size_t {
  std::vector<ImageDTO> stale;
  try {
    stale = images_->ListUnpreparedOlderThan(age_seconds);
  } catch (const std::exception&) {
    RethrowAsCatalogError("Failed to list incomplete registrations");
  }

  size_t purged = 0;
  for (const auto& entry : stale) {
    try {
      store_->RemoveEntry(entry.id_);
    } catch (const CatalogException& e) {
      LogRegistry::Catalog()->error("Keeping incomplete entry {}: {}", entry.id_, e.what());
      continue;
    }
    try {
      if (images_->Delete(entry.id_)) ++purged;
    } catch (const std::exception&) {
      RethrowAsCatalogError("Failed to purge incomplete registrations");
    }
  }
  LogRegistry::Catalog()->info("Purged {} of {} incomplete registrations", purged, stale.size());
  return purged;
}

auto CatalogService::RegisterImageAsync(std::string description, std::vector<TagDTO> tags,
                                        DecodedImage image) -> std::future<image_id_t> {
  return Enqueue([this, description = std::move(description), tags = std::move(tags),
                  image = std::move(image)]() { return RegisterImage(description, tags, image); });
}

auto CatalogService::RegisterFolderAsync(std::string description, std::vector<TagDTO> tags,
                                         image_path_t folder, std::shared_ptr<FolderImportJob> job)
    -> std::future<RegisterFolderResult> {
  return Enqueue([this, description = std::move(description), tags = std::move(tags),
                  folder = std::move(folder), job = std::move(job)]() {
    return RegisterFolder(description, tags, folder, job);
  });
}

auto CatalogService::UpdateImageAsync(image_id_t id, ImageUpdateDTO update)
    -> std::future<ImageDTO> {
  return Enqueue([this, id, update = std::move(update)]() { return UpdateImage(id, update); });
}

auto CatalogService::DeleteImageAsync(DeleteRequest request) -> std::future<void> {
  return Enqueue([this, request = std::move(request)]() { DeleteImage(request); });
}

auto CatalogService::SearchAsync(Filter filter, uint32_t page, uint32_t page_size)
    -> std::future<Page<ImageDTO>> {
  return Enqueue([this, filter = std::move(filter), page, page_size]() {
    return Search(filter, page, page_size);
  });
}
};  // namespace imgshelf
