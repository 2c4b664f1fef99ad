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
#include <filesystem>

namespace imgshelf {
#define image_path_t    std::filesystem::path
#define file_path_t     std::filesystem::path

// Catalog row ids, assigned by the database
#define image_id_t      int64_t
#define tag_id_t        int64_t

// Natural-sort position of a file inside an imported folder, starting at 0
#define folder_index_t  uint32_t

// Compression level shared by all output formats, 0 (fastest) to 9 (smallest)
#define compression_t   int
};  // namespace imgshelf
