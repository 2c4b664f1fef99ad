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
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "type/type.hpp"

namespace imgshelf {
// meta.json of a folder entry
struct FolderMeta {
  uint32_t    image_count_  = 0;
  // One past the highest index handed out so far
  uint32_t    next_index_   = 0;
  std::string folder_thumb_ = "";
};

inline void to_json(nlohmann::json& j, const FolderMeta& meta) {
  j = nlohmann::json{{"image_count", meta.image_count_},
                     {"next_index", meta.next_index_},
                     {"folder_thumb", meta.folder_thumb_}};
}

inline void from_json(const nlohmann::json& j, FolderMeta& meta) {
  j.at("image_count").get_to(meta.image_count_);
  j.at("next_index").get_to(meta.next_index_);
  j.at("folder_thumb").get_to(meta.folder_thumb_);
}

static constexpr const char* kFolderMetaFileName = "meta.json";

/**
 * @brief Read <folder>/meta.json. Absent or malformed files give nullopt.
 */
auto ReadFolderMeta(const image_path_t& folder) -> std::optional<FolderMeta>;
void WriteFolderMeta(const image_path_t& folder, const FolderMeta& meta);
};  // namespace imgshelf
