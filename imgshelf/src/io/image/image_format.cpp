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

#include "io/image/image_format.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>

namespace imgshelf {
namespace {
constexpr std::array<uint8_t, 3> kJpegSoi    = {0xFF, 0xD8, 0xFF};
constexpr std::array<uint8_t, 8> kPngMagic   = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
constexpr std::array<uint8_t, 4> kGifMagic   = {'G', 'I', 'F', '8'};
constexpr std::array<uint8_t, 4> kTiffLE     = {'I', 'I', 0x2A, 0x00};
constexpr std::array<uint8_t, 4> kTiffBE     = {'M', 'M', 0x00, 0x2A};
constexpr std::array<uint8_t, 4> kRiffMagic  = {'R', 'I', 'F', 'F'};
constexpr std::array<uint8_t, 4> kWebpMagic  = {'W', 'E', 'B', 'P'};
constexpr std::array<uint8_t, 2> kBmpMagic   = {'B', 'M'};

template <size_t N>
auto MatchAt(std::span<const uint8_t> bytes, size_t offset, const std::array<uint8_t, N>& magic)
    -> bool {
  if (offset + N > bytes.size()) return false;
  return std::memcmp(bytes.data() + offset, magic.data(), N) == 0;
}

auto MatchesFormatAt(std::span<const uint8_t> bytes, size_t offset, ImageFormat format) -> bool {
  switch (format) {
    case ImageFormat::JPEG:
      return MatchAt(bytes, offset, kJpegSoi);
    case ImageFormat::PNG:
      return MatchAt(bytes, offset, kPngMagic);
    case ImageFormat::GIF:
      return MatchAt(bytes, offset, kGifMagic);
    case ImageFormat::TIFF:
      return MatchAt(bytes, offset, kTiffLE) || MatchAt(bytes, offset, kTiffBE);
    case ImageFormat::WEBP:
      return MatchAt(bytes, offset, kRiffMagic) && MatchAt(bytes, offset + 8, kWebpMagic);
    case ImageFormat::BMP:
      // "BM" alone is too weak to trust in the middle of a buffer; require a sane header size
      if (!MatchAt(bytes, offset, kBmpMagic) || offset + 18 > bytes.size()) return false;
      return bytes[offset + 14] == 12 || bytes[offset + 14] == 40 || bytes[offset + 14] == 56 ||
             bytes[offset + 14] == 108 || bytes[offset + 14] == 124;
  }
  return false;
}
}  // namespace

auto SniffImageFormat(std::span<const uint8_t> bytes) -> std::optional<ImageFormat> {
  for (auto format : {ImageFormat::PNG, ImageFormat::JPEG, ImageFormat::GIF, ImageFormat::WEBP,
                      ImageFormat::TIFF, ImageFormat::BMP}) {
    if (MatchesFormatAt(bytes, 0, format)) return format;
  }
  return std::nullopt;
}

auto DetectImageFormat(std::span<const uint8_t> bytes) -> ImageFormat {
  return SniffImageFormat(bytes).value_or(ImageFormat::PNG);
}

auto FindSignature(std::span<const uint8_t> bytes, ImageFormat format, size_t from)
    -> std::optional<size_t> {
  for (size_t offset = from; offset < bytes.size(); ++offset) {
    if (MatchesFormatAt(bytes, offset, format)) return offset;
  }
  return std::nullopt;
}

auto FileExtensionFor(ImageFormat format) -> std::string_view {
  switch (format) {
    case ImageFormat::JPEG:
      return "jpg";
    case ImageFormat::GIF:
      return "gif";
    case ImageFormat::WEBP:
      return "webp";
    case ImageFormat::BMP:
      return "bmp";
    case ImageFormat::TIFF:
      return "tiff";
    case ImageFormat::PNG:
    default:
      return "png";
  }
}

auto FormatName(ImageFormat format) -> std::string_view {
  switch (format) {
    case ImageFormat::JPEG:
      return "JPEG";
    case ImageFormat::GIF:
      return "GIF";
    case ImageFormat::WEBP:
      return "WebP";
    case ImageFormat::BMP:
      return "BMP";
    case ImageFormat::TIFF:
      return "TIFF";
    case ImageFormat::PNG:
    default:
      return "PNG";
  }
}

auto FormatFromExtension(std::string_view ext) -> std::optional<ImageFormat> {
  std::string lowered(ext);
  if (!lowered.empty() && lowered.front() == '.') lowered.erase(0, 1);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "png") return ImageFormat::PNG;
  if (lowered == "jpg" || lowered == "jpeg") return ImageFormat::JPEG;
  if (lowered == "gif") return ImageFormat::GIF;
  if (lowered == "webp") return ImageFormat::WEBP;
  if (lowered == "bmp") return ImageFormat::BMP;
  if (lowered == "tif" || lowered == "tiff") return ImageFormat::TIFF;
  return std::nullopt;
}
};  // namespace imgshelf
