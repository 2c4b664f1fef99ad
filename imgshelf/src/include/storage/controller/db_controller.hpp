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

#include <duckdb.h>

#include <filesystem>
#include <optional>
#include <string>

#include "controller_types.hpp"
#include "type/type.hpp"

namespace imgshelf {
/**
 * @brief Owns the catalog database file for the lifetime of the process and keeps its schema
 *        current.
 */
class DBController {
 private:
  duckdb_database            db_ = nullptr;

  file_path_t                db_path_;

  bool                       existed_;

  std::optional<file_path_t> last_backup_;

  auto                       BackupDatabase() -> file_path_t;

 public:
  explicit DBController(const file_path_t& db_path);
  ~DBController();

  DBController(const DBController&)            = delete;
  DBController& operator=(const DBController&) = delete;

  /**
   * @brief Apply pending migrations. An existing file is copied aside first.
   */
  void InitializeDB();

  // Revert the newest `steps` migrations
  auto RollbackMigrations(size_t steps) -> size_t;

  auto GetConnectionGuard() -> ConnectionGuard;
  auto GetDBPath() const -> const file_path_t& { return db_path_; }
  auto GetLastBackupPath() const -> const std::optional<file_path_t>& { return last_backup_; }
};
};  // namespace imgshelf
