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

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>

namespace duckorm {
enum class DuckDBType : uint8_t {
  INT32,
  INT64,
  UINT32,
  UINT64,
  DOUBLE,
  VARCHAR,
  BOOLEAN,
  TIMESTAMP,
};

// Value bound to a '?' placeholder. monostate binds NULL.
using DuckParam = std::variant<std::monostate, int32_t, int64_t, uint32_t, uint64_t, double, bool,
                               std::string>;

using VarTypes  = std::variant<int32_t, int64_t, uint32_t, uint64_t, double, bool, std::string>;

class DuckDBException : public std::runtime_error {
 public:
  DuckDBException(const std::string& message, duckdb_error_type type = DUCKDB_ERROR_INVALID)
      : std::runtime_error(message), type_(type) {}

  auto ErrorType() const -> duckdb_error_type { return type_; }
  auto IsConstraintViolation() const -> bool { return type_ == DUCKDB_ERROR_CONSTRAINT; }

 private:
  duckdb_error_type type_;
};

/**
 * @brief Owns a prepared statement and the result of its last execution.
 */
class PreparedStatement {
 private:
  duckdb_result             result_;
  duckdb_prepared_statement stmt_        = nullptr;
  duckdb_connection&        con_;
  bool                      has_result_ = false;

  void                      RecycleResult();

 public:
  PreparedStatement(duckdb_connection& con, const std::string& prepare_query);
  ~PreparedStatement();

  PreparedStatement(const PreparedStatement&)            = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;

  void Bind(idx_t index, const DuckParam& param);
  void BindAll(std::span<const DuckParam> params, idx_t first_index = 1);
  auto Execute() -> duckdb_result&;
  auto Result() -> duckdb_result& { return result_; }
  auto RowsChanged() -> idx_t;
};

struct DuckFieldDesc {
  const char* name;
  DuckDBType  type;
  size_t      offset;
};

#define FIELD(type, field, field_type) \
  duckorm::DuckFieldDesc { #field, duckorm::DuckDBType::field_type, offsetof(type, field) }
};  // namespace duckorm
