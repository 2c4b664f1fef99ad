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

#include "storage/mapper/duckorm/duckdb_types.hpp"

#include <duckdb.h>

#include <cstring>
#include <format>
#include <type_traits>
#include <variant>
#include <stdexcept>

namespace duckorm {
void PreparedStatement::RecycleResult() {
  if (has_result_) {
    duckdb_destroy_result(&result_);
    has_result_ = false;
  }
}

PreparedStatement::PreparedStatement(duckdb_connection& con, const std::string& prepare_query)
    : con_(con) {
  std::memset(&result_, 0, sizeof(result_));
  if (duckdb_prepare(con_, prepare_query.c_str(), &stmt_) != DuckDBSuccess) {
    const char* err = duckdb_prepare_error(stmt_);
    std::string msg = "Failed to prepare statement";
    if (err && std::strlen(err) > 0) {
      msg += ": ";
      msg += err;
    }
    duckdb_destroy_prepare(&stmt_);
    throw DuckDBException(msg);
  }
}

PreparedStatement::~PreparedStatement() {
  RecycleResult();
  if (stmt_) duckdb_destroy_prepare(&stmt_);
}

void PreparedStatement::Bind(idx_t index, const DuckParam& param) {
  duckdb_state state = std::visit(
      [this, index](const auto& value) -> duckdb_state {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return duckdb_bind_null(stmt_, index);
        } else if constexpr (std::is_same_v<T, int32_t>) {
          return duckdb_bind_int32(stmt_, index, value);
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return duckdb_bind_int64(stmt_, index, value);
        } else if constexpr (std::is_same_v<T, uint32_t>) {
          return duckdb_bind_uint32(stmt_, index, value);
        } else if constexpr (std::is_same_v<T, uint64_t>) {
          return duckdb_bind_uint64(stmt_, index, value);
        } else if constexpr (std::is_same_v<T, double>) {
          return duckdb_bind_double(stmt_, index, value);
        } else if constexpr (std::is_same_v<T, bool>) {
          return duckdb_bind_boolean(stmt_, index, value);
        } else {
          return duckdb_bind_varchar(stmt_, index, value.c_str());
        }
      },
      param);
  if (state != DuckDBSuccess) {
    throw DuckDBException(std::format("Failed to bind parameter {}", index));
  }
}

void PreparedStatement::BindAll(std::span<const DuckParam> params, idx_t first_index) {
  for (size_t i = 0; i < params.size(); ++i) {
    Bind(first_index + i, params[i]);
  }
}

auto PreparedStatement::Execute() -> duckdb_result& {
  RecycleResult();
  duckdb_state state = duckdb_execute_prepared(stmt_, &result_);
  has_result_        = true;
  if (state != DuckDBSuccess) {
    const char*       err  = duckdb_result_error(&result_);
    duckdb_error_type type = duckdb_result_error_type(&result_);
    std::string       msg  = err ? err : "Unknown DuckDB error";
    throw DuckDBException(msg, type);
  }
  return result_;
}

auto PreparedStatement::RowsChanged() -> idx_t {
  return has_result_ ? duckdb_rows_changed(&result_) : 0;
}
}  // namespace duckorm
