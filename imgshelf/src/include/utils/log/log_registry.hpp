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

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace imgshelf {
class LogRegistry {
 public:
  /**
   * @brief Attach console and rotating file sinks to every subsystem logger. A second call is
   *        ignored.
   *
   * @param log_dir directory receiving imgshelf.log, created if missing
   */
  static void Init(const std::filesystem::path& log_dir,
                   spdlog::level::level_enum    level = spdlog::level::info);

  // Loggers requested before Init() are console-only
  static auto Get(const std::string& name) -> std::shared_ptr<spdlog::logger>;

  static auto Catalog() -> std::shared_ptr<spdlog::logger> { return Get("catalog"); }
  static auto Storage() -> std::shared_ptr<spdlog::logger> { return Get("storage"); }
  static auto Codec() -> std::shared_ptr<spdlog::logger> { return Get("codec"); }
  static auto DB() -> std::shared_ptr<spdlog::logger> { return Get("db"); }

  static auto IsInitialized() -> bool;

 private:
  static constexpr const char* kLogFormat    = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
  static constexpr size_t      kMaxFileBytes = 5 * 1024 * 1024;
  static constexpr size_t      kMaxFiles     = 3;

  static inline bool           initialized_  = false;
  static inline std::mutex     mtx_;

  static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt>  console_sink_;
  static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_;

  static auto MakeLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;
};
};  // namespace imgshelf
