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

#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "type/tag_color.hpp"
#include "type/type.hpp"

namespace imgshelf {
struct TagDTO {
  tag_id_t    id_    = 0;
  std::string name_  = "";
  TagColor    color_ = kDefaultTagColor;

  // Set semantics are keyed on the lowercased name
  auto operator<(const TagDTO& other) const -> bool { return name_ < other.name_; }
  auto operator==(const TagDTO& other) const -> bool {
    return std::tie(id_, name_, color_) == std::tie(other.id_, other.name_, other.color_);
  }
};

struct ImageDTO {
  image_id_t       id_             = 0;
  std::string      path_           = "";
  std::string      thumbnail_path_ = "";
  std::string      description_    = "";
  std::set<TagDTO> tags_{};
  // "YYYY-MM-DD HH:MM:SS", as stored
  std::string      created_at_     = "";
  bool             is_folder_      = false;
  bool             is_prepared_    = false;

  auto             HasTag(const std::string& name) const -> bool {
    for (const auto& tag : tags_) {
      if (tag.name_ == name) return true;
    }
    return false;
  }
};

/**
 * @brief Sparse update of an image row. Absent or empty text fields and an absent or empty tag
 *        list leave the stored values alone. The two flags are always written.
 */
struct ImageUpdateDTO {
  std::optional<std::string>         path_{};
  std::optional<std::string>         thumbnail_path_{};
  std::optional<std::string>         description_{};
  std::optional<std::vector<TagDTO>> tags_{};
  bool                               is_folder_   = false;
  bool                               is_prepared_ = false;

  // An update that carries over the current flags and changes nothing else
  static auto KeepingFlagsOf(const ImageDTO& current) -> ImageUpdateDTO {
    ImageUpdateDTO update;
    update.is_folder_   = current.is_folder_;
    update.is_prepared_ = current.is_prepared_;
    return update;
  }
};
};  // namespace imgshelf
