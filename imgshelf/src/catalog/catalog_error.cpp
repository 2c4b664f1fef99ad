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

#include "catalog/catalog_error.hpp"

namespace imgshelf {
auto CatalogErrorCodeName(CatalogErrorCode code) -> const char* {
  switch (code) {
    case CatalogErrorCode::DECODE_FAILED:
      return "decode failed";
    case CatalogErrorCode::ENCODE_FAILED:
      return "encode failed";
    case CatalogErrorCode::FILESYSTEM:
      return "filesystem error";
    case CatalogErrorCode::NOT_FOUND:
      return "not found";
    case CatalogErrorCode::EMPTY_FOLDER:
      return "empty folder";
    case CatalogErrorCode::DATABASE:
      return "database error";
    case CatalogErrorCode::INVALID_ARGUMENT:
      return "invalid argument";
    case CatalogErrorCode::CANCELED:
      return "canceled";
    default:
      return "unknown error";
  }
}
};  // namespace imgshelf
