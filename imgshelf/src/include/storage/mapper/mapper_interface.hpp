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

#include <algorithm>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace imgshelf {
template <typename Derived, typename Mappable, typename ID>
class MapperInterface {
 public:
  duckdb_connection& conn_;

  MapperInterface(duckdb_connection& conn) : conn_(conn) {}

  /**
   * @brief Insert a new record into the table, columns with defaults are left to the database
   *
   * @param obj
   */
  void Insert(const Mappable& obj) {
    duckorm::insert(conn_, Derived::TableName(), &obj, Derived::InsertFieldDesc());
  }

  /**
   * @brief Insert a new record and return its generated primary key
   *
   * @param obj
   * @return ID
   */
  auto InsertReturningId(const Mappable& obj) -> ID {
    return static_cast<ID>(duckorm::insert_returning(conn_, Derived::TableName(), &obj,
                                                     Derived::InsertFieldDesc(), "id"));
  }

  /**
   * @brief Remove a record from the table by its primary key
   *
   * @param remove_id
   * @return number of rows removed
   */
  auto Remove(const ID remove_id) -> idx_t {
    std::string remove_clause = std::format(Derived::PrimeKeyClause(), remove_id);
    return duckorm::remove(conn_, Derived::TableName(), remove_clause.c_str());
  }

  /**
   * @brief Remove records from the table by a custom SQL predicate
   *
   * @param predicate
   * @param params values for the '?' placeholders in the predicate
   */
  auto RemoveByClause(const std::string& predicate, std::span<const duckorm::DuckParam> params = {})
      -> idx_t {
    return duckorm::remove(conn_, Derived::TableName(), predicate.c_str(), params);
  }

  /**
   * @brief Get records from the table by a custom SQL predicate
   *
   * @param where_clause
   * @return std::vector<Mappable>
   */
  auto Get(const std::string& where_clause, std::span<const duckorm::DuckParam> params = {})
      -> std::vector<Mappable> {
    auto raw = duckorm::select(conn_, Derived::TableName(), Derived::FieldDesc(),
                               where_clause.c_str(), params);
    std::vector<Mappable> result;
    result.reserve(raw.size());
    for (auto& row : raw) {
      result.emplace_back(Derived::FromRawData(std::move(row)));
    }
    return result;
  }

  auto GetByQuery(const std::string& query, std::span<const duckorm::DuckParam> params = {})
      -> std::vector<Mappable> {
    auto raw = duckorm::select_by_query(conn_, Derived::FieldDesc(), query, params);
    std::vector<Mappable> result;
    result.reserve(raw.size());
    for (auto& row : raw) {
      result.emplace_back(Derived::FromRawData(std::move(row)));
    }
    return result;
  }

  /**
   * @brief Update the named columns of a record, leaving every other column untouched
   *
   * @param target_id
   * @param updated
   * @param columns
   * @return number of rows changed, 0 if the id does not exist
   */
  auto UpdateColumns(const ID target_id, const Mappable& updated,
                     const std::vector<std::string_view>& columns) -> idx_t {
    std::vector<duckorm::DuckFieldDesc> selected;
    for (const auto& desc : Derived::FieldDesc()) {
      if (std::find(columns.begin(), columns.end(), std::string_view(desc.name)) !=
          columns.end()) {
        selected.push_back(desc);
      }
    }
    std::string where_clause = std::format(Derived::PrimeKeyClause(), target_id);
    return duckorm::update(conn_, Derived::TableName(), &updated, selected, where_clause.c_str());
  }
};

template <typename Derived>
struct FieldReflectable {
 public:
  using FieldArrayType = std::span<const duckorm::DuckFieldDesc>;
  static constexpr FieldArrayType FieldDesc() { return Derived::field_descs_; }
  static constexpr FieldArrayType InsertFieldDesc() { return Derived::insert_field_descs_; }
  static constexpr uint32_t       FieldCount() { return Derived::field_count_; }
  static constexpr const char*    TableName() { return Derived::table_name_; }
  static constexpr const char*    PrimeKeyClause() { return Derived::prime_key_clause_; }
};
};  // namespace imgshelf
