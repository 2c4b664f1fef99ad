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

#include "storage/controller/migration/migrator.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <string>
#include <variant>

#include "storage/controller/controller_types.hpp"
#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "utils/log/log_registry.hpp"

namespace imgshelf {
namespace {
constexpr std::array<duckorm::DuckFieldDesc, 1> kNameField = {
    duckorm::DuckFieldDesc{"name", duckorm::DuckDBType::VARCHAR, 0}};
}

auto Migrator::Migrations() -> const std::vector<Migration>& {
  // Order matters: later steps alter tables created by earlier ones
  static const std::vector<Migration> migrations = {
      {"m0001_create_images_table",
       "CREATE SEQUENCE IF NOT EXISTS images_id_seq START 1;"
       "CREATE TABLE images ("
       "id BIGINT PRIMARY KEY DEFAULT nextval('images_id_seq'), "
       "path TEXT NOT NULL DEFAULT '', "
       "thumbnail_path TEXT NOT NULL DEFAULT '', "
       "description TEXT NOT NULL DEFAULT '', "
       "created_at TIMESTAMP NOT NULL DEFAULT CAST(now() AS TIMESTAMP));",
       "DROP TABLE images; DROP SEQUENCE images_id_seq;"},
      {"m0002_create_tags_table",
       "CREATE SEQUENCE IF NOT EXISTS tags_id_seq START 1;"
       "CREATE TABLE tags ("
       "id BIGINT PRIMARY KEY DEFAULT nextval('tags_id_seq'), "
       "name TEXT NOT NULL UNIQUE);",
       "DROP TABLE tags; DROP SEQUENCE tags_id_seq;"},
      // Associations are removed explicitly when either side goes away
      {"m0003_create_image_tags_table",
       "CREATE TABLE image_tags ("
       "image_id BIGINT NOT NULL, "
       "tag_id BIGINT NOT NULL, "
       "PRIMARY KEY (image_id, tag_id));",
       "DROP TABLE image_tags;"},
      // Rows that predate the flag were written in one step and are complete
      {"m0004_add_image_is_prepared",
       "ALTER TABLE images ADD COLUMN is_prepared BOOLEAN DEFAULT false;"
       "UPDATE images SET is_prepared = true;",
       "ALTER TABLE images DROP COLUMN is_prepared;"},
      {"m0005_add_tag_color", "ALTER TABLE tags ADD COLUMN color TEXT DEFAULT 'blue';",
       "ALTER TABLE tags DROP COLUMN color;"},
      {"m0006_add_image_is_folder",
       "ALTER TABLE images ADD COLUMN is_folder BOOLEAN DEFAULT false;",
       "ALTER TABLE images DROP COLUMN is_folder;"},
  };
  return migrations;
}

Migrator::Migrator(duckdb_connection& conn) : conn_(conn) { EnsureHistoryTable(); }

void Migrator::EnsureHistoryTable() {
  duckorm::execute_script(conn_,
                          "CREATE TABLE IF NOT EXISTS schema_migrations ("
                          "name TEXT PRIMARY KEY, "
                          "applied_at TIMESTAMP NOT NULL DEFAULT CAST(now() AS TIMESTAMP));");
}

auto Migrator::Applied() -> std::vector<std::string> {
  auto rows = duckorm::select_by_query(conn_, kNameField,
                                       "SELECT name FROM schema_migrations ORDER BY name;");
  std::vector<std::string> names;
  names.reserve(rows.size());
  for (auto& row : rows) {
    names.push_back(std::move(std::get<std::string>(row[0])));
  }
  return names;
}

auto Migrator::Pending() -> std::vector<std::string> {
  auto                     applied = Applied();
  std::vector<std::string> pending;
  for (const auto& migration : Migrations()) {
    if (std::find(applied.begin(), applied.end(), migration.name_) == applied.end()) {
      pending.emplace_back(migration.name_);
    }
  }
  return pending;
}

auto Migrator::Up() -> size_t {
  auto   pending = Pending();
  size_t count   = 0;
  for (const auto& migration : Migrations()) {
    if (std::find(pending.begin(), pending.end(), migration.name_) == pending.end()) continue;

    TransactionGuard                tx(conn_);
    std::vector<duckorm::DuckParam> params = {std::string(migration.name_)};
    try {
      duckorm::execute_script(conn_, migration.up_);
      duckorm::execute(conn_, "INSERT INTO schema_migrations (name) VALUES (?);", params);
      tx.Commit();
    } catch (const std::exception& e) {
      LogRegistry::DB()->error("Migration {} failed: {}", migration.name_, e.what());
      throw;
    }
    LogRegistry::DB()->info("Applied migration {}", migration.name_);
    ++count;
  }
  return count;
}

auto Migrator::Down(size_t steps) -> size_t {
  auto   applied = Applied();
  size_t count   = 0;
  const auto& migrations = Migrations();
  for (auto it = migrations.rbegin(); it != migrations.rend() && count < steps; ++it) {
    if (std::find(applied.begin(), applied.end(), it->name_) == applied.end()) continue;

    TransactionGuard                tx(conn_);
    std::vector<duckorm::DuckParam> params = {std::string(it->name_)};
    try {
      duckorm::execute_script(conn_, it->down_);
      duckorm::execute(conn_, "DELETE FROM schema_migrations WHERE name = ?;", params);
      tx.Commit();
    } catch (const std::exception& e) {
      LogRegistry::DB()->error("Rollback of migration {} failed: {}", it->name_, e.what());
      throw;
    }
    LogRegistry::DB()->info("Reverted migration {}", it->name_);
    ++count;
  }
  return count;
}
};  // namespace imgshelf
