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

#include <string>
#include <vector>

namespace imgshelf {
struct Migration {
  const char* name_;
  const char* up_;
  const char* down_;
};

/**
 * @brief Applies the catalog schema as an ordered list of reversible migrations, recording each
 *        applied step in schema_migrations.
 */
class Migrator {
 public:
  explicit Migrator(duckdb_connection& conn);

  static auto Migrations() -> const std::vector<Migration>&;

  auto        Applied() -> std::vector<std::string>;
  auto        Pending() -> std::vector<std::string>;

  /**
   * @brief Apply every pending migration in order, each in its own transaction.
   *
   * @return size_t number of migrations applied
   */
  auto        Up() -> size_t;

  /**
   * @brief Revert the most recently applied migrations, newest first.
   *
   * @param steps
   * @return size_t number of migrations reverted
   */
  auto        Down(size_t steps = 1) -> size_t;

 private:
  duckdb_connection& conn_;

  void               EnsureHistoryTable();
};
};  // namespace imgshelf
