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
#include <shared_mutex>
#include <string>

#include "app/settings_provider.hpp"
#include "type/type.hpp"

namespace imgshelf {
struct AppConfig {
  std::string   theme_             = "dark";
  std::string   language_          = "en";
  uint32_t      items_per_page_    = 35;
  compression_t thumb_compression_ = 9;
  compression_t image_compression_ = 5;
};

/**
 * @brief Settings backed by <config_dir>/config.json. A missing or unreadable file yields the
 *        defaults.
 */
class SettingsService final : public SettingsProvider {
 public:
  explicit SettingsService(const std::filesystem::path& config_dir);

  void Load();
  void Save() const;

  auto ThumbnailCompression() const -> compression_t override;
  auto ImageCompression() const -> compression_t override;

  auto GetConfig() const -> AppConfig;
  void SetConfig(const AppConfig& config);
  void SetThumbnailCompression(compression_t level);
  void SetImageCompression(compression_t level);
  void SetItemsPerPage(uint32_t items);

  auto GetConfigPath() const -> const std::filesystem::path& { return config_path_; }

 private:
  std::filesystem::path     config_path_;
  AppConfig                 config_;
  mutable std::shared_mutex mtx_;
};
};  // namespace imgshelf
