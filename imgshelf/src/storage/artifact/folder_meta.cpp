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

#include "storage/artifact/folder_meta.hpp"

#include <format>
#include <fstream>

#include "catalog/catalog_error.hpp"
#include "utils/log/log_registry.hpp"

namespace imgshelf {
auto ReadFolderMeta(const image_path_t& folder) -> std::optional<FolderMeta> {
  std::ifstream file(folder / kFolderMetaFileName);
  if (!file.is_open()) return std::nullopt;
  try {
    nlohmann::json metadata;
    file >> metadata;
    return metadata.get<FolderMeta>();
  } catch (const nlohmann::json::exception& e) {
    LogRegistry::Storage()->warn("Ignoring malformed {} in {}: {}", kFolderMetaFileName,
                                 folder.string(), e.what());
    return std::nullopt;
  }
}

void WriteFolderMeta(const image_path_t& folder, const FolderMeta& meta) {
  nlohmann::json metadata = meta;
  std::ofstream  file(folder / kFolderMetaFileName, std::ios::trunc);
  if (!file.is_open()) {
    throw CatalogException(CatalogErrorCode::FILESYSTEM,
                           std::format("Failed to open {} for writing",
                                       (folder / kFolderMetaFileName).string()));
  }
  file << metadata.dump(2);
  if (!file.good()) {
    throw CatalogException(CatalogErrorCode::FILESYSTEM,
                           std::format("Failed to write {}", (folder / kFolderMetaFileName).string()));
  }
}
};  // namespace imgshelf
