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

#include "app/settings_service.hpp"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "utils/log/log_registry.hpp"

namespace imgshelf {
namespace {
auto ClampLevel(compression_t level) -> compression_t { return std::clamp(level, 0, 9); }
}  // namespace

void to_json(nlohmann::json& j, const AppConfig& config) {
  j = nlohmann::json{{"theme", config.theme_},
                     {"language", config.language_},
                     {"items_per_page", config.items_per_page_},
                     {"thumb_compression", config.thumb_compression_},
                     {"image_compression", config.image_compression_}};
}

void from_json(const nlohmann::json& j, AppConfig& config) {
  AppConfig defaults;
  config.theme_             = j.value("theme", defaults.theme_);
  config.language_          = j.value("language", defaults.language_);
  config.items_per_page_    = j.value("items_per_page", defaults.items_per_page_);
  // Both levels are optional in the file
  config.thumb_compression_ = ClampLevel(j.value("thumb_compression", defaults.thumb_compression_));
  config.image_compression_ = ClampLevel(j.value("image_compression", defaults.image_compression_));
  if (config.items_per_page_ == 0) config.items_per_page_ = defaults.items_per_page_;
}

SettingsService::SettingsService(const std::filesystem::path& config_dir)
    : config_path_(config_dir / "config.json") {
  Load();
}

void SettingsService::Load() {
  AppConfig     loaded;
  std::ifstream file(config_path_);
  if (!file.is_open()) {
    LogRegistry::Catalog()->info("No config at {}, using defaults", config_path_.string());
  } else {
    try {
      nlohmann::json metadata;
      file >> metadata;
      loaded = metadata.get<AppConfig>();
    } catch (const nlohmann::json::exception& e) {
      LogRegistry::Catalog()->error("Failed to load {}: {}. Using default config.",
                                    config_path_.string(), e.what());
      loaded = AppConfig{};
    }
  }
  std::unique_lock<std::shared_mutex> lock(mtx_);
  config_ = loaded;
}

void SettingsService::Save() const {
  nlohmann::json metadata;
  {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    metadata = config_;
  }
  if (config_path_.has_parent_path()) {
    std::filesystem::create_directories(config_path_.parent_path());
  }
  std::ofstream file(config_path_);
  if (!file.is_open()) {
    throw std::runtime_error("[ERROR] SettingsService: Failed to open config file for writing");
  }
  file << metadata.dump(4);
  file.close();
  LogRegistry::Catalog()->debug("Config saved to {}", config_path_.string());
}

auto SettingsService::ThumbnailCompression() const -> compression_t {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  return config_.thumb_compression_;
}

auto SettingsService::ImageCompression() const -> compression_t {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  return config_.image_compression_;
}

auto SettingsService::GetConfig() const -> AppConfig {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  return config_;
}

void SettingsService::SetConfig(const AppConfig& config) {
  std::unique_lock<std::shared_mutex> lock(mtx_);
  config_                    = config;
  config_.thumb_compression_ = ClampLevel(config.thumb_compression_);
  config_.image_compression_ = ClampLevel(config.image_compression_);
}

void SettingsService::SetThumbnailCompression(compression_t level) {
  std::unique_lock<std::shared_mutex> lock(mtx_);
  config_.thumb_compression_ = ClampLevel(level);
}

void SettingsService::SetImageCompression(compression_t level) {
  std::unique_lock<std::shared_mutex> lock(mtx_);
  config_.image_compression_ = ClampLevel(level);
}

void SettingsService::SetItemsPerPage(uint32_t items) {
  std::unique_lock<std::shared_mutex> lock(mtx_);
  if (items > 0) config_.items_per_page_ = items;
}
};  // namespace imgshelf
