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

#include "storage/controller/controller_types.hpp"

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "utils/log/log_registry.hpp"

namespace imgshelf {
ConnectionGuard::ConnectionGuard(duckdb_connection conn) : conn_(conn) {}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept : conn_(other.conn_) {
  other.conn_ = nullptr;
}

ConnectionGuard::~ConnectionGuard() {
  if (conn_) duckdb_disconnect(&conn_);
}

TransactionGuard::TransactionGuard(duckdb_connection& conn) : conn_(conn) {
  duckorm::execute_script(conn_, "BEGIN TRANSACTION;");
}

TransactionGuard::~TransactionGuard() {
  if (finished_) return;
  duckdb_result result;
  if (duckdb_query(conn_, "ROLLBACK;", &result) != DuckDBSuccess) {
    const char* err = duckdb_result_error(&result);
    LogRegistry::DB()->error("Rollback failed: {}", err ? err : "unknown error");
  }
  duckdb_destroy_result(&result);
}

void TransactionGuard::Commit() {
  // A failed COMMIT already aborts the transaction
  finished_ = true;
  duckorm::execute_script(conn_, "COMMIT;");
}
}  // namespace imgshelf
