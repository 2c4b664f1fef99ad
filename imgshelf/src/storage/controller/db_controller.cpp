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

#include "storage/controller/db_controller.hpp"

#include <duckdb.h>

#include <filesystem>
#include <format>
#include <stdexcept>

#include "storage/controller/migration/migrator.hpp"
#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/log/log_registry.hpp"

namespace imgshelf {
/**
 * @brief Construct a new DBController::DBController object
 *
 * @param db_path
 */
DBController::DBController(const file_path_t& db_path)
    : db_path_(db_path), existed_(std::filesystem::exists(db_path)) {
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }
  char* open_error = nullptr;
  if (duckdb_open_ext(db_path_.string().c_str(), &db_, nullptr, &open_error) != DuckDBSuccess) {
    std::string msg = open_error ? open_error : "unknown error";
    if (open_error) duckdb_free(open_error);
    throw std::runtime_error(
        std::format("[ERROR] DBController: Cannot open {}: {}", db_path_.string(), msg));
  }
  InitializeDB();
}

/**
 * @brief Destroy the DBController::DBController object
 *
 */
DBController::~DBController() { duckdb_close(&db_); }

/**
 * @brief Get a connection guard for the database.
 *
 * @return ConnectionGuard
 */
auto DBController::GetConnectionGuard() -> ConnectionGuard {
  ConnectionGuard guard{nullptr};

  if (duckdb_connect(db_, &guard.conn_) != DuckDBSuccess) {
    throw std::runtime_error("[ERROR] DBController: DB cannot be connected");
  }

  return guard;
}

void DBController::InitializeDB() {
  auto     guard = GetConnectionGuard();
  Migrator migrator(guard.conn_);

  auto     pending = migrator.Pending();
  if (pending.empty()) {
    LogRegistry::DB()->debug("Schema of {} is up to date", db_path_.string());
    return;
  }

  if (existed_) {
    LogRegistry::DB()->info("{} pending migration(s) for existing database {}", pending.size(),
                            db_path_.string());
    last_backup_ = BackupDatabase();
  }
  migrator.Up();
  existed_ = true;
}

auto DBController::RollbackMigrations(size_t steps) -> size_t {
  auto     guard = GetConnectionGuard();
  Migrator migrator(guard.conn_);
  return migrator.Down(steps);
}

/**
 * @brief Flush the write-ahead log and copy the database file next to itself.
 *
 * @return file_path_t
 */
auto DBController::BackupDatabase() -> file_path_t {
  {
    auto guard = GetConnectionGuard();
    duckorm::execute_script(guard.conn_, "CHECKPOINT;");
  }
  file_path_t backup = db_path_;
  backup += std::format(".backup_{}", TimeProvider::TimePointToString(TimeProvider::Now()));

  std::error_code ec;
  std::filesystem::copy_file(db_path_, backup, std::filesystem::copy_options::overwrite_existing,
                             ec);
  if (ec) {
    throw std::runtime_error(std::format("[ERROR] DBController: Backup of {} failed: {}",
                                         db_path_.string(), ec.message()));
  }
  LogRegistry::DB()->info("Database backed up to {}", backup.string());
  return backup;
}
};  // namespace imgshelf
