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

#include "storage/artifact/artifact_store.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <future>
#include <system_error>

#include "catalog/catalog_error.hpp"
#include "storage/artifact/folder_meta.hpp"
#include "type/supported_file_type.hpp"
#include "utils/log/log_registry.hpp"
#include "utils/string/string_utils.hpp"

namespace imgshelf {
namespace {
auto FromCodecError(const CodecError& e) -> CatalogException {
  switch (e.GetKind()) {
    case CodecError::Kind::DECODE:
      return {CatalogErrorCode::DECODE_FAILED, e.what()};
    case CodecError::Kind::ENCODE:
      return {CatalogErrorCode::ENCODE_FAILED, e.what()};
    case CodecError::Kind::IO:
    default:
      return {CatalogErrorCode::FILESYSTEM, e.what()};
  }
}

[[noreturn]] void RethrowAsStoreError(std::exception_ptr error) {
  try {
    std::rethrow_exception(error);
  } catch (const CatalogException&) {
    throw;
  } catch (const CodecError& e) {
    throw FromCodecError(e);
  } catch (const fs::filesystem_error& e) {
    throw CatalogException(CatalogErrorCode::FILESYSTEM, e.what());
  } catch (const std::exception& e) {
    throw CatalogException(CatalogErrorCode::UNKNOWN, e.what());
  }
}

auto IsStrictlyWithin(const fs::path& target, const fs::path& root) -> bool {
  auto [root_it, target_it] = std::mismatch(root.begin(), root.end(), target.begin(), target.end());
  return root_it == root.end() && target_it != target.end();
}

auto DirectoryName(const fs::path& dir) -> std::string {
  auto normal = dir.lexically_normal();
  if (normal.filename().empty()) normal = normal.parent_path();
  return normal.filename().string();
}

struct FileOutcome {
  bool          completed_ = false;
  SavedArtifact saved_;
};
};  // namespace

ArtifactStore::ArtifactStore(const image_path_t& app_dir, std::shared_ptr<SettingsProvider> settings,
                             size_t workers)
    : images_root_(app_dir / kImagesDirectoryName), settings_(std::move(settings)), pool_(workers) {
  std::error_code ec;
  fs::create_directories(images_root_, ec);
  if (ec) {
    throw CatalogException(CatalogErrorCode::FILESYSTEM,
                           std::format("Cannot create images root {}: {}", images_root_.string(),
                                       ec.message()));
  }
}

auto ArtifactStore::EntryDirectory(image_id_t id) const -> image_path_t {
  return images_root_ / std::to_string(id);
}

auto ArtifactStore::SaveImage(image_id_t id, const DecodedImage& image) -> SavedArtifact {
  const auto dir = EntryDirectory(id);
  try {
    fs::create_directories(dir);
    const auto    format = codec::EffectiveOutputFormat(image.format_);
    SavedArtifact saved{dir / std::format("image_{}.{}", id, FileExtensionFor(format)),
                        dir / std::format("thumb_image_{}.png", id)};
    // Levels are read per save so a settings change applies right away
    codec::WriteImage(image.pixels_, saved.path_, format, settings_->ImageCompression());
    codec::WriteThumbnail(image.pixels_, saved.thumbnail_path_, settings_->ThumbnailCompression());
    LogRegistry::Storage()->info("Saved image {} to {}", id, saved.path_.string());
    return saved;
  } catch (const CodecError& e) {
    DiscardEntryDirectory(dir);
    throw FromCodecError(e);
  } catch (const fs::filesystem_error& e) {
    DiscardEntryDirectory(dir);
    throw CatalogException(CatalogErrorCode::FILESYSTEM, e.what());
  }
}

auto ArtifactStore::SaveFolder(image_id_t id, const image_path_t& source,
                               std::shared_ptr<FolderImportJob> job) -> SavedFolder {
  std::error_code ec;
  if (!fs::is_directory(source, ec)) {
    throw CatalogException(CatalogErrorCode::FILESYSTEM,
                           std::format("Not a directory: {}", source.string()));
  }

  std::vector<image_path_t> files;
  try {
    for (const auto& entry : fs::directory_iterator(source)) {
      if (is_supported_file(entry.path())) files.push_back(entry.path());
    }
  } catch (const fs::filesystem_error& e) {
    throw CatalogException(CatalogErrorCode::FILESYSTEM, e.what());
  }
  if (files.empty()) {
    throw CatalogException(CatalogErrorCode::EMPTY_FOLDER,
                           std::format("No supported images found in {}", source.string()));
  }
  std::sort(files.begin(), files.end(), [](const image_path_t& a, const image_path_t& b) {
    return strutil::NaturalLess(a.filename().string(), b.filename().string());
  });

  const auto dir = EntryDirectory(id);
  fs::create_directories(dir, ec);
  if (ec) {
    throw CatalogException(CatalogErrorCode::FILESYSTEM,
                           std::format("Cannot create {}: {}", dir.string(), ec.message()));
  }

  const compression_t image_level = settings_->ImageCompression();
  const compression_t thumb_level = settings_->ThumbnailCompression();

  // Indices are bound here, in natural order, whatever order the workers finish in
  std::vector<std::future<FileOutcome>> outcomes;
  outcomes.reserve(files.size());
  for (folder_index_t index = 0; index < files.size(); ++index) {
    auto promise = std::make_shared<std::promise<FileOutcome>>();
    outcomes.push_back(promise->get_future());
    pool_.Submit([promise, file = files[index], index, id, dir, job, image_level, thumb_level]() {
      if (job && job->IsCancelled()) {
        promise->set_value(FileOutcome{});
        return;
      }
      try {
        auto       decoded = codec::DecodeFile(file);
        const auto format  = codec::EffectiveOutputFormat(decoded.format_);
        FileOutcome outcome{
            true,
            {dir / std::format("image_{}_{}.{}", id, index, FileExtensionFor(format)),
             dir / std::format("thumb_image_{}_{}.png", id, index)}};
        codec::WriteImage(decoded.pixels_, outcome.saved_.path_, format, image_level);
        codec::WriteThumbnail(decoded.pixels_, outcome.saved_.thumbnail_path_, thumb_level);
        promise->set_value(std::move(outcome));
      } catch (...) {
        promise->set_exception(std::current_exception());
      }
    });
  }

  SavedFolder        result{dir, dir / kFolderThumbnailName, {}, false};
  std::exception_ptr first_error;
  folder_index_t     next_index = 0;
  const auto         total      = static_cast<uint32_t>(files.size());
  // Every future is drained before anything is cleaned up, workers may still be writing
  for (folder_index_t index = 0; index < total; ++index) {
    try {
      auto outcome = outcomes[index].get();
      if (outcome.completed_) {
        result.files_.push_back(std::move(outcome.saved_));
        next_index = index + 1;
      } else {
        result.canceled_ = true;
      }
    } catch (const std::exception& e) {
      LogRegistry::Storage()->error("Failed to import {}: {}", files[index].string(), e.what());
      if (!first_error) first_error = std::current_exception();
    }
    if (job && job->on_progress_) job->on_progress_(index + 1, total);
  }

  if (first_error) {
    DiscardEntryDirectory(dir);
    RethrowAsStoreError(first_error);
  }
  if (result.files_.empty()) {
    DiscardEntryDirectory(dir);
    throw CatalogException(CatalogErrorCode::CANCELED,
                           std::format("Import of {} canceled before any image was saved",
                                       source.string()));
  }

  try {
    fs::copy_file(result.files_.front().thumbnail_path_, result.folder_thumbnail_,
                  fs::copy_options::overwrite_existing);
    WriteFolderMeta(dir, FolderMeta{static_cast<uint32_t>(result.files_.size()), next_index,
                                    result.folder_thumbnail_.string()});
  } catch (const fs::filesystem_error& e) {
    DiscardEntryDirectory(dir);
    throw CatalogException(CatalogErrorCode::FILESYSTEM, e.what());
  } catch (const CatalogException&) {
    DiscardEntryDirectory(dir);
    throw;
  }

  if (result.canceled_) {
    LogRegistry::Storage()->warn("Import of {} canceled, kept {} of {} images", source.string(),
                                 result.files_.size(), total);
  } else {
    LogRegistry::Storage()->info("Imported {} images from {} into {}", total, source.string(),
                                 dir.string());
  }
  return result;
}

auto ArtifactStore::ExpandFolder(const ImageDTO& folder) const -> std::vector<ImageDTO> {
  std::vector<ImageDTO> children;
  const image_path_t    folder_path{folder.path_};
  std::error_code       ec;
  if (folder.path_.empty() || !fs::is_directory(folder_path, ec)) {
    LogRegistry::Storage()->debug("Nothing to expand at '{}'", folder.path_);
    return children;
  }

  const auto files = ListQualifyingImages(folder_path);
  children.reserve(files.size());
  for (size_t index = 0; index < files.size(); ++index) {
    ImageDTO child;
    child.id_             = static_cast<image_id_t>(index);
    child.path_           = files[index].string();
    child.thumbnail_path_ = ThumbnailPathFor(files[index]).string();
    child.description_    = folder.description_;
    child.tags_           = folder.tags_;
    child.created_at_     = folder.created_at_;
    child.is_folder_      = false;
    child.is_prepared_    = folder.is_prepared_;
    children.push_back(std::move(child));
  }
  return children;
}

auto ArtifactStore::Delete(const image_path_t& path, DeleteContext context) -> bool {
  if (path.empty()) {
    throw CatalogException(CatalogErrorCode::INVALID_ARGUMENT, "Cannot delete an empty path");
  }
  try {
    switch (context) {
      case DeleteContext::FROM_FOLDER: {
        RemoveFileIfPresent(path);
        RemoveFileIfPresent(ThumbnailPathFor(path));
        const auto      folder = path.parent_path();
        std::error_code ec;
        if (fs::is_directory(folder, ec) && CountQualifyingImages(folder) > 0) {
          RefreshFolderAfterRemoval(folder);
          return false;
        }
        RemoveFolderGuarded(folder);
        return true;
      }
      case DeleteContext::IMAGE:
        RemoveFileIfPresent(path);
        RemoveFileIfPresent(ThumbnailPathFor(path));
        RemoveFolderGuarded(path.parent_path());
        return false;
      case DeleteContext::FOLDER:
        RemoveFolderGuarded(path);
        return false;
    }
  } catch (const fs::filesystem_error& e) {
    throw CatalogException(CatalogErrorCode::FILESYSTEM, e.what());
  }
  return false;
}

void ArtifactStore::RemoveEntry(image_id_t id) {
  try {
    RemoveFolderGuarded(EntryDirectory(id));
  } catch (const fs::filesystem_error& e) {
    throw CatalogException(CatalogErrorCode::FILESYSTEM, e.what());
  }
}

void ArtifactStore::RemoveFolderGuarded(const image_path_t& folder) {
  // The name check comes first and does not depend on where the root lives
  if (folder.empty() || DirectoryName(folder) == kImagesDirectoryName) {
    throw CatalogException(CatalogErrorCode::FILESYSTEM,
                           std::format("Refusing to delete the images root ({})", folder.string()));
  }
  const auto root   = fs::weakly_canonical(images_root_);
  const auto target = fs::weakly_canonical(folder);
  if (!IsStrictlyWithin(target, root)) {
    throw CatalogException(CatalogErrorCode::FILESYSTEM,
                           std::format("Refusing to delete {} outside of {}", target.string(),
                                       root.string()));
  }

  std::error_code ec;
  if (!fs::exists(target, ec)) {
    LogRegistry::Storage()->warn("Folder does not exist: {}", target.string());
    return;
  }
  fs::remove_all(target, ec);
  if (ec) {
    throw CatalogException(CatalogErrorCode::FILESYSTEM,
                           std::format("Failed to delete folder {}: {}", target.string(),
                                       ec.message()));
  }
  LogRegistry::Storage()->info("Deleted folder: {}", target.string());
}

void ArtifactStore::RemoveFileIfPresent(const image_path_t& file) {
  std::error_code ec;
  const bool      removed = fs::remove(file, ec);
  if (ec) {
    throw CatalogException(CatalogErrorCode::FILESYSTEM,
                           std::format("Failed to delete {}: {}", file.string(), ec.message()));
  }
  if (removed) {
    LogRegistry::Storage()->info("Deleted file: {}", file.string());
  } else {
    LogRegistry::Storage()->debug("File does not exist: {}", file.string());
  }
}

void ArtifactStore::RefreshFolderAfterRemoval(const image_path_t& folder) {
  const auto remaining = ListQualifyingImages(folder);
  auto       meta      = ReadFolderMeta(folder).value_or(
      FolderMeta{0, static_cast<uint32_t>(remaining.size()), ""});
  meta.image_count_      = static_cast<uint32_t>(remaining.size());

  const auto folder_thumb = folder / kFolderThumbnailName;
  const auto first_thumb  = ThumbnailPathFor(remaining.front());
  std::error_code ec;
  if (fs::exists(first_thumb, ec)) {
    fs::copy_file(first_thumb, folder_thumb, fs::copy_options::overwrite_existing);
  }
  meta.folder_thumb_ = folder_thumb.string();
  WriteFolderMeta(folder, meta);
}

void ArtifactStore::DiscardEntryDirectory(const image_path_t& dir) noexcept {
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) {
    LogRegistry::Storage()->error("Could not clean up {}: {}", dir.string(), ec.message());
  }
}

auto ArtifactStore::ThumbnailPathFor(const image_path_t& file) -> image_path_t {
  const auto name = file.filename().string();
  if (name.starts_with("image_")) {
    return file.parent_path() / std::format("{}{}.png", kThumbnailPrefix, file.stem().string());
  }
  return file.parent_path() / (kThumbnailPrefix + name);
}

auto ArtifactStore::ListQualifyingImages(const image_path_t& folder) -> std::vector<image_path_t> {
  std::vector<image_path_t> images;
  std::error_code           ec;
  for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (name.starts_with(kThumbnailPrefix) || name == kFolderMetaFileName) continue;
    if (is_supported_file(it->path())) images.push_back(it->path());
  }
  std::sort(images.begin(), images.end(), [](const image_path_t& a, const image_path_t& b) {
    return strutil::NaturalLess(a.filename().string(), b.filename().string());
  });
  return images;
}

auto ArtifactStore::CountQualifyingImages(const image_path_t& folder) -> size_t {
  return ListQualifyingImages(folder).size();
}
};  // namespace imgshelf
