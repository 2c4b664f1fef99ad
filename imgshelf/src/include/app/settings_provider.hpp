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

#include "type/type.hpp"

namespace imgshelf {
/**
 * @brief Compression levels consulted on every save, so a change applies to the next one.
 */
class SettingsProvider {
 public:
  virtual ~SettingsProvider()                          = default;

  virtual auto ThumbnailCompression() const -> compression_t = 0;
  virtual auto ImageCompression() const -> compression_t     = 0;
};
};  // namespace imgshelf
