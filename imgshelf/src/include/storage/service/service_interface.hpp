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
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "storage/mapper/mapper_interface.hpp"

namespace imgshelf {
template <typename Derived, typename InternalType, typename Mappable, typename Mapper, typename ID>
class ServiceInterface {
 private:
  duckdb_connection&                    conn_;
  MapperInterface<Mapper, Mappable, ID> mapper_;

 protected:
  auto Connection() -> duckdb_connection& { return conn_; }

 public:
  ServiceInterface(duckdb_connection& conn) : conn_(conn), mapper_(conn) {}
  void Insert(const InternalType& obj) { mapper_.Insert(Derived::ToParams(obj)); }
  auto InsertReturningId(const InternalType& obj) -> ID {
    return mapper_.InsertReturningId(Derived::ToParams(obj));
  }

  /**
   * @brief Get the objects by a SQL predicate (WHERE clause)
   *
   * @param predicate
   * @param params values for the '?' placeholders
   * @return std::vector<InternalType>
   */
  auto GetByPredicate(const std::string& predicate, std::span<const duckorm::DuckParam> params = {})
      -> std::vector<InternalType> {
    std::vector<Mappable>     param_results = mapper_.Get(predicate, params);
    std::vector<InternalType> results;
    results.reserve(param_results.size());
    for (auto& param : param_results) {
      results.emplace_back(Derived::FromParams(std::move(param)));
    }
    return results;
  }

  /**
   * @brief Get the objects by a full SQL query. The query must select the mapper's columns in
   *        the mapper's order.
   *
   * @param query
   * @param params
   * @return std::vector<InternalType>
   */
  auto GetByQuery(const std::string& query, std::span<const duckorm::DuckParam> params = {})
      -> std::vector<InternalType> {
    std::vector<Mappable>     param_results = mapper_.GetByQuery(query, params);
    std::vector<InternalType> results;
    results.reserve(param_results.size());
    for (auto& param : param_results) {
      results.emplace_back(Derived::FromParams(std::move(param)));
    }
    return results;
  }

  auto RemoveById(const ID remove_id) -> idx_t { return mapper_.Remove(remove_id); }
  auto RemoveByClause(const std::string& clause, std::span<const duckorm::DuckParam> params = {})
      -> idx_t {
    return mapper_.RemoveByClause(clause, params);
  }
  auto UpdateColumns(const InternalType& obj, const ID update_id,
                     const std::vector<std::string_view>& columns) -> idx_t {
    return mapper_.UpdateColumns(update_id, Derived::ToParams(obj), columns);
  }
};
}  // namespace imgshelf
