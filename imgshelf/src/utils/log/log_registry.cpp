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

#include "utils/log/log_registry.hpp"

#include <array>
#include <vector>

namespace imgshelf {
namespace {
constexpr std::array<const char*, 4> kSubsystems = {"catalog", "storage", "codec", "db"};
}

auto LogRegistry::MakeLogger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
  if (!console_sink_) {
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(kLogFormat);
  }
  std::vector<spdlog::sink_ptr> sinks{console_sink_};
  if (file_sink_) sinks.push_back(file_sink_);

  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->flush_on(spdlog::level::warn);
  return logger;
}

void LogRegistry::Init(const std::filesystem::path& log_dir, spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (initialized_) {
    spdlog::warn("[LogRegistry] Already initialized, ignoring second Init()");
    return;
  }

  std::filesystem::create_directories(log_dir);
  file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      (log_dir / "imgshelf.log").string(), kMaxFileBytes, kMaxFiles);
  file_sink_->set_pattern(kLogFormat);

  for (const char* name : kSubsystems) {
    // Replace console-only loggers handed out before Init()
    spdlog::drop(name);
    auto logger = MakeLogger(name);
    logger->set_level(level);
    spdlog::register_logger(logger);
  }
  initialized_ = true;
}

auto LogRegistry::Get(const std::string& name) -> std::shared_ptr<spdlog::logger> {
  std::lock_guard<std::mutex> lock(mtx_);
  auto                        logger = spdlog::get(name);
  if (logger) return logger;

  logger = MakeLogger(name);
  spdlog::register_logger(logger);
  return logger;
}

auto LogRegistry::IsInitialized() -> bool {
  std::lock_guard<std::mutex> lock(mtx_);
  return initialized_;
}
};  // namespace imgshelf
