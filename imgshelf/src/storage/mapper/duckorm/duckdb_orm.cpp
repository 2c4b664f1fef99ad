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

#include "storage/mapper/duckorm/duckdb_orm.hpp"

#include <duckdb.h>

#include <cstdint>
#include <format>
#include <sstream>
#include <string>
#include <vector>

namespace duckorm {
namespace {
auto ReadField(const void* obj, const DuckFieldDesc& field) -> DuckParam {
  const char* ptr = reinterpret_cast<const char*>(obj) + field.offset;
  switch (field.type) {
    case DuckDBType::INT32:
      return *reinterpret_cast<const int32_t*>(ptr);
    case DuckDBType::INT64:
      return *reinterpret_cast<const int64_t*>(ptr);
    case DuckDBType::UINT32:
      return *reinterpret_cast<const uint32_t*>(ptr);
    case DuckDBType::UINT64:
      return *reinterpret_cast<const uint64_t*>(ptr);
    case DuckDBType::DOUBLE:
      return *reinterpret_cast<const double*>(ptr);
    case DuckDBType::BOOLEAN:
      return *reinterpret_cast<const bool*>(ptr);
    case DuckDBType::TIMESTAMP:
    case DuckDBType::VARCHAR:
      return *reinterpret_cast<const std::string*>(ptr);
    default:
      throw DuckDBException(std::format("Unsupported DuckFieldType for field {}", field.name));
  }
}

auto ReadString(duckdb_result& result, idx_t col, idx_t row) -> std::string {
  char* value = duckdb_value_varchar(&result, col, row);
  if (value == nullptr) return {};
  std::string copy(value);
  duckdb_free(value);
  return copy;
}

auto ReadCell(duckdb_result& result, const DuckFieldDesc& field, idx_t col, idx_t row)
    -> VarTypes {
  const bool is_null = duckdb_value_is_null(&result, col, row);
  switch (field.type) {
    case DuckDBType::INT32:
      return is_null ? int32_t{0} : duckdb_value_int32(&result, col, row);
    case DuckDBType::INT64:
      return is_null ? int64_t{0} : duckdb_value_int64(&result, col, row);
    case DuckDBType::UINT32:
      return is_null ? uint32_t{0} : duckdb_value_uint32(&result, col, row);
    case DuckDBType::UINT64:
      return is_null ? uint64_t{0} : duckdb_value_uint64(&result, col, row);
    case DuckDBType::DOUBLE:
      return is_null ? 0.0 : duckdb_value_double(&result, col, row);
    case DuckDBType::BOOLEAN:
      return is_null ? false : duckdb_value_boolean(&result, col, row);
    case DuckDBType::TIMESTAMP:
    case DuckDBType::VARCHAR:
      return is_null ? std::string{} : ReadString(result, col, row);
    default:
      throw DuckDBException(std::format("Unsupported DuckFieldType for column {}", field.name));
  }
}

auto CollectRows(duckdb_result& result, std::span<const DuckFieldDesc> fields)
    -> std::vector<Row> {
  if (duckdb_column_count(&result) != fields.size()) {
    throw DuckDBException("Column count mismatch in select query");
  }
  std::vector<Row> rows;
  idx_t            row_count = duckdb_row_count(&result);
  rows.resize(row_count);
  for (idx_t i = 0; i < row_count; ++i) {
    rows[i].reserve(fields.size());
    for (size_t j = 0; j < fields.size(); ++j) {
      rows[i].push_back(ReadCell(result, fields[j], j, i));
    }
  }
  return rows;
}

auto ColumnList(std::span<const DuckFieldDesc> fields) -> std::string {
  std::ostringstream sql;
  for (size_t i = 0; i < fields.size(); ++i) {
    if (fields[i].type == DuckDBType::TIMESTAMP) {
      sql << "strftime(" << fields[i].name << ", '%Y-%m-%d %H:%M:%S') AS " << fields[i].name;
    } else {
      sql << fields[i].name;
    }
    if (i < fields.size() - 1) sql << ", ";
  }
  return sql.str();
}

auto InsertSql(const char* table, std::span<const DuckFieldDesc> fields) -> std::string {
  std::ostringstream sql;
  sql << "INSERT INTO " << table << " (";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << fields[i].name;
    if (i < fields.size() - 1) sql << ", ";
  }
  sql << ") VALUES (";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << "?";
    if (i < fields.size() - 1) sql << ", ";
  }
  sql << ")";
  return sql.str();
}

void BindFields(PreparedStatement& stmt, const void* obj, std::span<const DuckFieldDesc> fields) {
  for (size_t i = 0; i < fields.size(); ++i) {
    stmt.Bind(i + 1, ReadField(obj, fields[i]));
  }
}
}  // namespace

void insert(duckdb_connection& conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields) {
  PreparedStatement stmt(conn, InsertSql(table, fields) + ";");
  BindFields(stmt, obj, fields);
  stmt.Execute();
}

auto insert_returning(duckdb_connection& conn, const char* table, const void* obj,
                      std::span<const DuckFieldDesc> fields, const char* returning_column)
    -> int64_t {
  PreparedStatement stmt(conn,
                         std::format("{} RETURNING {};", InsertSql(table, fields), returning_column));
  BindFields(stmt, obj, fields);
  auto& result = stmt.Execute();
  if (duckdb_row_count(&result) == 0) {
    throw DuckDBException(std::format("INSERT INTO {} returned no row", table));
  }
  return duckdb_value_int64(&result, 0, 0);
}

auto update(duckdb_connection& conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields, const char* where_clause,
            std::span<const DuckParam> where_params) -> idx_t {
  if (fields.empty()) return 0;
  std::ostringstream sql;
  sql << "UPDATE " << table << " SET ";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << fields[i].name << " = ?";
    if (i < fields.size() - 1) sql << ", ";
  }
  sql << " WHERE " << where_clause << ";";

  PreparedStatement stmt(conn, sql.str());
  BindFields(stmt, obj, fields);
  stmt.BindAll(where_params, fields.size() + 1);
  stmt.Execute();
  return stmt.RowsChanged();
}

auto remove(duckdb_connection& conn, const char* table, const char* where_clause,
            std::span<const DuckParam> where_params) -> idx_t {
  PreparedStatement stmt(conn, std::format("DELETE FROM {} WHERE {};", table, where_clause));
  stmt.BindAll(where_params);
  stmt.Execute();
  return stmt.RowsChanged();
}

auto select(duckdb_connection& conn, const std::string& table,
            std::span<const DuckFieldDesc> fields, const char* where_clause,
            std::span<const DuckParam> where_params) -> std::vector<Row> {
  std::string sql =
      std::format("SELECT {} FROM {} WHERE {};", ColumnList(fields), table, where_clause);
  return select_by_query(conn, fields, sql, where_params);
}

auto select_by_query(duckdb_connection& conn, std::span<const DuckFieldDesc> fields,
                     const std::string& sql, std::span<const DuckParam> params)
    -> std::vector<Row> {
  PreparedStatement stmt(conn, sql);
  stmt.BindAll(params);
  return CollectRows(stmt.Execute(), fields);
}

auto execute(duckdb_connection& conn, const std::string& sql, std::span<const DuckParam> params)
    -> idx_t {
  PreparedStatement stmt(conn, sql);
  stmt.BindAll(params);
  stmt.Execute();
  return stmt.RowsChanged();
}

void execute_script(duckdb_connection& conn, const std::string& sql) {
  duckdb_result result;
  if (duckdb_query(conn, sql.c_str(), &result) != DuckDBSuccess) {
    const char*       err  = duckdb_result_error(&result);
    std::string       msg  = err ? err : "Unknown DuckDB error";
    duckdb_error_type type = duckdb_result_error_type(&result);
    duckdb_destroy_result(&result);
    throw DuckDBException(msg, type);
  }
  duckdb_destroy_result(&result);
}

auto query_int64(duckdb_connection& conn, const std::string& sql,
                 std::span<const DuckParam> params) -> int64_t {
  PreparedStatement stmt(conn, sql);
  stmt.BindAll(params);
  auto& result = stmt.Execute();
  if (duckdb_row_count(&result) == 0 || duckdb_column_count(&result) == 0) return 0;
  if (duckdb_value_is_null(&result, 0, 0)) return 0;
  return duckdb_value_int64(&result, 0, 0);
}
};  // namespace duckorm
