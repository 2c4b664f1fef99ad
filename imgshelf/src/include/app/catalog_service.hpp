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
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include "app/settings_provider.hpp"
#include "catalog/filter.hpp"
#include "catalog/image_dto.hpp"
#include "catalog/page.hpp"
#include "concurrency/thread_pool.hpp"
#include "io/image/image_codec.hpp"
#include "storage/artifact/artifact_store.hpp"
#include "storage/controller/db_controller.hpp"
#include "storage/controller/image/image_controller.hpp"
#include "storage/controller/tag/tag_controller.hpp"
#include "type/type.hpp"

namespace imgshelf {
struct RegisterFolderResult {
  image_id_t image_id_        = 0;
  uint32_t   files_processed_ = 0;
  bool       canceled_        = false;
};

struct DeleteRequest {
  // For FROM_FOLDER, the id of the folder entry the file belongs to
  image_id_t    image_id_ = 0;
  // May be empty for top-level entries, the stored path is used then
  std::string   path_     = "";
  DeleteContext context_  = DeleteContext::IMAGE;
};

/**
 * @brief Entry point of the catalog. Registration runs in two phases: a placeholder row hands out
 *        the id, the artifacts are written under that id, then the row is finalized with the
 *        paths, the tags and is_prepared = true. A failure in between leaves an unprepared row,
 *        which search never returns and which PurgeIncompleteRegistrations can clean up.
 *
 *        Every failure reaches the caller as a single CatalogException whose message can be shown
 *        as is, e.g. "Failed to save file: <cause>".
 */
class CatalogService {
 public:
  CatalogService(const std::filesystem::path& app_dir, std::shared_ptr<SettingsProvider> settings,
                 size_t import_workers = 4);

  CatalogService(const CatalogService&)            = delete;
  CatalogService& operator=(const CatalogService&) = delete;

  auto RegisterImage(const std::string& description, const std::vector<TagDTO>& tags,
                     const DecodedImage& image) -> image_id_t;
  auto RegisterImageFromFile(const std::string& description, const std::vector<TagDTO>& tags,
                             const image_path_t& source) -> image_id_t;
  auto RegisterImageFromBytes(const std::string& description, const std::vector<TagDTO>& tags,
                              std::span<const uint8_t> bytes) -> image_id_t;
  // Clipboard captures, stored as PNG
  auto RegisterImageFromRawRGBA(const std::string& description, const std::vector<TagDTO>& tags,
                                int width, int height, std::span<const uint8_t> rgba)
      -> image_id_t;

  auto RegisterFolder(const std::string& description, const std::vector<TagDTO>& tags,
                      const image_path_t& folder, std::shared_ptr<FolderImportJob> job = nullptr)
      -> RegisterFolderResult;

  auto UpdateImage(image_id_t id, const ImageUpdateDTO& update) -> ImageDTO;

  /**
   * @brief Change description and tags of an entry while keeping its flags as stored.
   *
   * @throws CatalogException NOT_FOUND
   */
  auto EditImage(image_id_t id, const std::string& description, const std::vector<TagDTO>& tags)
      -> ImageDTO;

  /**
   * @brief Remove the catalog row and the artifacts the context points at. Deleting something
   *        already gone succeeds. When the last file of a folder goes, the folder entry goes too.
   */
  void DeleteImage(const DeleteRequest& request);

  auto Search(const Filter& filter, uint32_t page, uint32_t page_size) -> Page<ImageDTO>;
  auto FindById(image_id_t id) -> std::optional<ImageDTO>;
  auto ExpandFolder(const ImageDTO& folder) -> std::vector<ImageDTO>;

  auto ListTags() -> std::vector<TagDTO>;
  auto CreateTag(const TagDTO& tag) -> TagDTO;
  auto UpdateTag(tag_id_t id, const TagDTO& update) -> TagDTO;
  void DeleteTag(tag_id_t id);

  auto ListIncompleteRegistrations() -> std::vector<ImageDTO>;

  /**
   * @brief Drop unprepared rows older than age_seconds together with whatever their directories
   *        hold. Entries whose files cannot be removed are kept for a later pass.
   *
   * @return size_t number of rows removed
   */
  auto PurgeIncompleteRegistrations(int64_t age_seconds) -> size_t;

  // Serialized on one catalog worker thread
  auto RegisterImageAsync(std::string description, std::vector<TagDTO> tags, DecodedImage image)
      -> std::future<image_id_t>;
  auto RegisterFolderAsync(std::string description, std::vector<TagDTO> tags, image_path_t folder,
                           std::shared_ptr<FolderImportJob> job = nullptr)
      -> std::future<RegisterFolderResult>;
  auto UpdateImageAsync(image_id_t id, ImageUpdateDTO update) -> std::future<ImageDTO>;
  auto DeleteImageAsync(DeleteRequest request) -> std::future<void>;
  auto SearchAsync(Filter filter, uint32_t page, uint32_t page_size)
      -> std::future<Page<ImageDTO>>;

  auto GetAppDir() const -> const std::filesystem::path& { return app_dir_; }
  auto GetArtifactStore() const -> const ArtifactStore& { return *store_; }
  auto GetDBController() -> DBController& { return *db_; }

 private:
  auto Finalize(image_id_t id, const image_path_t& path, const image_path_t& thumbnail,
                const std::vector<TagDTO>& tags, bool is_folder) -> ImageDTO;

  template <typename Fn>
  auto Enqueue(Fn fn) -> std::future<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;
    auto task    = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    auto future  = task->get_future();
    worker_.Submit([task]() { (*task)(); });
    return future;
  }

  std::filesystem::path             app_dir_;
  std::shared_ptr<SettingsProvider> settings_;
  // Declared before the controllers, whose connections must close first
  std::unique_ptr<DBController>     db_;
  std::shared_ptr<TagController>    tags_;
  std::unique_ptr<ImageController>  images_;
  std::unique_ptr<ArtifactStore>    store_;
  // Last, so queued calls finish while everything above is alive
  ThreadPool                        worker_{1};
};
};  // namespace imgshelf
