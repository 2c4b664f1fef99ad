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

namespace imgshelf {
class ConnectionGuard {
 public:
  duckdb_connection conn_;

  ConnectionGuard(duckdb_connection conn);
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ConnectionGuard(const ConnectionGuard&)            = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
  ~ConnectionGuard();
};

/**
 * @brief BEGIN on construction, ROLLBACK on destruction unless Commit() was called.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(duckdb_connection& conn);
  TransactionGuard(const TransactionGuard&)            = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;
  ~TransactionGuard();

  void Commit();

 private:
  duckdb_connection& conn_;
  bool               finished_ = false;
};
}  // namespace imgshelf
