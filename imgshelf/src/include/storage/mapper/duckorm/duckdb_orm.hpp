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

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "duckdb_types.hpp"

namespace duckorm {
using Row = std::vector<VarTypes>;

void insert(duckdb_connection& conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields);

/**
 * @brief Insert a row and hand back the value of `returning_column`, typically a sequence-backed
 *        primary key.
 */
auto insert_returning(duckdb_connection& conn, const char* table, const void* obj,
                      std::span<const DuckFieldDesc> fields, const char* returning_column)
    -> int64_t;

/**
 * @brief UPDATE ... SET <fields> WHERE <where_clause>. Placeholders in the where clause are bound
 *        from `where_params` after the field values.
 *
 * @return idx_t number of rows changed
 */
auto update(duckdb_connection& conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields, const char* where_clause,
            std::span<const DuckParam> where_params = {}) -> idx_t;

auto remove(duckdb_connection& conn, const char* table, const char* where_clause,
            std::span<const DuckParam> where_params = {}) -> idx_t;

auto select(duckdb_connection& conn, const std::string& table,
            std::span<const DuckFieldDesc> fields, const char* where_clause,
            std::span<const DuckParam> where_params = {}) -> std::vector<Row>;

// The query must yield the columns described by `fields`, in that order
auto select_by_query(duckdb_connection& conn, std::span<const DuckFieldDesc> fields,
                     const std::string& sql, std::span<const DuckParam> params = {})
    -> std::vector<Row>;

auto execute(duckdb_connection& conn, const std::string& sql,
             std::span<const DuckParam> params = {}) -> idx_t;

// Multiple statements, no parameters. Used for DDL.
void execute_script(duckdb_connection& conn, const std::string& sql);

/**
 * @brief First column of the first row as an integer, 0 for an empty result or NULL.
 */
auto query_int64(duckdb_connection& conn, const std::string& sql,
                 std::span<const DuckParam> params = {}) -> int64_t;
}  // namespace duckorm
