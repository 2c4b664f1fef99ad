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

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "app/settings_provider.hpp"
#include "catalog/image_dto.hpp"
#include "concurrency/thread_pool.hpp"
#include "io/image/image_codec.hpp"
#include "type/type.hpp"

namespace imgshelf {
// What a delete request refers to, as known by the caller
enum class DeleteContext : uint8_t {
  // Top-level single image entry
  IMAGE,
  // Top-level folder entry
  FOLDER,
  // One file of an expanded folder view
  FROM_FOLDER
};

struct SavedArtifact {
  image_path_t path_;
  image_path_t thumbnail_path_;
};

struct SavedFolder {
  image_path_t               folder_path_;
  image_path_t               folder_thumbnail_;
  // Completed files in index order
  std::vector<SavedArtifact> files_;
  bool                       canceled_ = false;
};

class FolderImportJob {
 public:
  using ProgressCallback = std::function<void(uint32_t done, uint32_t total)>;

  std::atomic<bool> canceled_{false};
  // Invoked on the importing thread, once per file in index order
  ProgressCallback  on_progress_{};

  auto              IsCancelled() const -> bool { return canceled_.load(); }
  void              Cancel() { canceled_.store(true); }
};

/**
 * @brief Owns <app_dir>/images. Every catalog entry gets a directory named after its id holding
 *        the originals, their PNG thumbnails and, for folders, thumb_folder.png and meta.json.
 */
class ArtifactStore {
 private:
  image_path_t                      images_root_;
  std::shared_ptr<SettingsProvider> settings_;
  ThreadPool                        pool_;

  void RemoveFolderGuarded(const image_path_t& folder);
  void RemoveFileIfPresent(const image_path_t& file);
  void RefreshFolderAfterRemoval(const image_path_t& folder);
  void DiscardEntryDirectory(const image_path_t& dir) noexcept;

 public:
  static constexpr const char* kThumbnailPrefix      = "thumb_";
  static constexpr const char* kFolderThumbnailName  = "thumb_folder.png";
  static constexpr const char* kImagesDirectoryName  = "images";

  ArtifactStore(const image_path_t& app_dir, std::shared_ptr<SettingsProvider> settings,
                size_t workers = 4);

  auto ImagesRoot() const -> const image_path_t& { return images_root_; }
  auto EntryDirectory(image_id_t id) const -> image_path_t;

  /**
   * @brief Write image_<id>.<ext> at full resolution and thumb_image_<id>.png. The extension
   *        follows the decoded format. A failed save leaves no directory behind.
   *
   * @throws CatalogException ENCODE_FAILED or FILESYSTEM
   */
  auto SaveImage(image_id_t id, const DecodedImage& image) -> SavedArtifact;

  /**
   * @brief Import the image files directly inside source. Files are ordered naturally by name and
   *        get consecutive 0-based indices before any work is dispatched; each one is decoded
   *        from its content, re-encoded and thumbnailed on the pool.
   *
   * @param id
   * @param source
   * @param job optional cancellation flag and progress callback
   * @return SavedFolder
   * @throws CatalogException EMPTY_FOLDER, CANCELED (nothing completed), DECODE_FAILED,
   *         ENCODE_FAILED, FILESYSTEM
   */
  auto SaveFolder(image_id_t id, const image_path_t& source,
                  std::shared_ptr<FolderImportJob> job = nullptr) -> SavedFolder;

  /**
   * @brief View records for the files of a folder entry, id being the position in natural order.
   *        Nothing is written to the catalog.
   */
  auto ExpandFolder(const ImageDTO& folder) const -> std::vector<ImageDTO>;

  /**
   * @brief Apply the deletion policy for the given context. Missing files and folders count as
   *        already deleted.
   *
   * @param path image file for IMAGE and FROM_FOLDER, the entry directory for FOLDER
   * @param context
   * @return true if the containing folder was removed because its last image went away
   *         (FROM_FOLDER only)
   * @throws CatalogException FILESYSTEM on permission failures or an attempt to remove the root
   */
  auto Delete(const image_path_t& path, DeleteContext context) -> bool;

  // Remove the whole directory of an entry, e.g. a placeholder that never got paths
  void RemoveEntry(image_id_t id);

  static auto ThumbnailPathFor(const image_path_t& file) -> image_path_t;
  static auto ListQualifyingImages(const image_path_t& folder) -> std::vector<image_path_t>;
  static auto CountQualifyingImages(const image_path_t& folder) -> size_t;
};
};  // namespace imgshelf
