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
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace imgshelf {
enum class ImageFormat : uint8_t { PNG = 0, JPEG, GIF, WEBP, BMP, TIFF };

/**
 * @brief Sniff the container format from the leading magic bytes. Unrecognized content is
 *        reported as PNG, the format every catalog artifact can be written in.
 *
 * @param bytes
 * @return ImageFormat
 */
auto DetectImageFormat(std::span<const uint8_t> bytes) -> ImageFormat;

// Same as DetectImageFormat, but reports unrecognized content instead of defaulting
auto SniffImageFormat(std::span<const uint8_t> bytes) -> std::optional<ImageFormat>;

/**
 * @brief Offset of the first signature of `format` found past the start of the buffer.
 */
auto FindSignature(std::span<const uint8_t> bytes, ImageFormat format, size_t from = 1)
    -> std::optional<size_t>;

// Extension without the leading dot, e.g. "jpg"
auto FileExtensionFor(ImageFormat format) -> std::string_view;
auto FormatName(ImageFormat format) -> std::string_view;
auto FormatFromExtension(std::string_view ext) -> std::optional<ImageFormat>;
};  // namespace imgshelf
