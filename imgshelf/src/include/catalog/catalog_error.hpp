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

#include <cstdint>
#include <stdexcept>
#include <string>

namespace imgshelf {
enum class CatalogErrorCode : uint8_t {
  UNKNOWN = 0,
  DECODE_FAILED,
  ENCODE_FAILED,
  FILESYSTEM,
  NOT_FOUND,
  EMPTY_FOLDER,
  DATABASE,
  INVALID_ARGUMENT,
  CANCELED
};

auto CatalogErrorCodeName(CatalogErrorCode code) -> const char*;

class CatalogException : public std::runtime_error {
 public:
  CatalogException(CatalogErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  auto Code() const -> CatalogErrorCode { return code_; }

 private:
  CatalogErrorCode code_;
};
};  // namespace imgshelf
