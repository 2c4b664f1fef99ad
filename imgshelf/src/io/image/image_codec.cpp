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

#include "io/image/image_codec.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <fstream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <optional>
#include <string>

#include "utils/log/log_registry.hpp"

namespace imgshelf {
namespace codec {
namespace {
constexpr std::array<int, 3> kFallbackReadModes = {cv::IMREAD_ANYDEPTH | cv::IMREAD_ANYCOLOR,
                                                   cv::IMREAD_COLOR, cv::IMREAD_GRAYSCALE};
// Signature hits tried per format before moving on
constexpr int                kMaxRepairAttempts = 8;

auto TryDecode(std::span<const uint8_t> bytes, int flags) -> cv::Mat {
  if (bytes.empty()) return {};
  // imdecode only reads from the buffer
  cv::Mat buf(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<uint8_t*>(bytes.data()));
  try {
    return cv::imdecode(buf, flags);
  } catch (const cv::Exception& e) {
    LogRegistry::Codec()->debug("imdecode rejected buffer (flags {}): {}", flags, e.what());
    return {};
  }
}

auto DecodeLenient(std::span<const uint8_t> bytes) -> std::optional<DecodedImage> {
  auto format = SniffImageFormat(bytes).value_or(ImageFormat::PNG);

  cv::Mat img = TryDecode(bytes, cv::IMREAD_UNCHANGED);
  if (!img.empty()) return DecodedImage{img, format};

  for (int mode : kFallbackReadModes) {
    img = TryDecode(bytes, mode);
    if (!img.empty()) return DecodedImage{img, format};
  }

  // A JPEG stream cut short before its EOI marker
  if (format == ImageFormat::JPEG && bytes.size() > 4 &&
      !(bytes[bytes.size() - 2] == 0xFF && bytes[bytes.size() - 1] == 0xD9)) {
    std::vector<uint8_t> terminated(bytes.begin(), bytes.end());
    terminated.push_back(0xFF);
    terminated.push_back(0xD9);
    img = TryDecode(terminated, cv::IMREAD_UNCHANGED);
    if (!img.empty()) return DecodedImage{img, format};
  }
  return std::nullopt;
}

auto ExpandGrayAlpha(const cv::Mat& img) -> cv::Mat {
  std::vector<cv::Mat> planes;
  cv::split(img, planes);
  cv::Mat bgr;
  cv::cvtColor(planes[0], bgr, cv::COLOR_GRAY2BGR);
  std::vector<cv::Mat> bgr_planes;
  cv::split(bgr, bgr_planes);
  bgr_planes.push_back(planes[1]);
  cv::Mat bgra;
  cv::merge(bgr_planes, bgra);
  return bgra;
}

auto ToBGRA8(const cv::Mat& img) -> cv::Mat {
  cv::Mat u8;
  if (img.depth() == CV_32F || img.depth() == CV_64F) {
    img.convertTo(u8, CV_MAKETYPE(CV_8U, img.channels()), 255.0);
  } else if (img.depth() == CV_16U) {
    img.convertTo(u8, CV_MAKETYPE(CV_8U, img.channels()), 1.0 / 257.0);
  } else {
    img.convertTo(u8, CV_MAKETYPE(CV_8U, img.channels()));
  }

  cv::Mat bgra;
  switch (u8.channels()) {
    case 1:
      cv::cvtColor(u8, bgra, cv::COLOR_GRAY2BGRA);
      break;
    case 2:
      bgra = ExpandGrayAlpha(u8);
      break;
    case 3:
      cv::cvtColor(u8, bgra, cv::COLOR_BGR2BGRA);
      break;
    case 4:
      bgra = u8;
      break;
    default:
      throw CodecError(CodecError::Kind::ENCODE,
                       std::format("Unsupported channel count {}", u8.channels()));
  }
  return bgra;
}

auto To8Bit(const cv::Mat& img) -> cv::Mat {
  if (img.depth() != CV_16U) return img;
  cv::Mat u8;
  img.convertTo(u8, CV_MAKETYPE(CV_8U, img.channels()), 1.0 / 257.0);
  return u8;
}

auto DropAlpha(const cv::Mat& img) -> cv::Mat {
  if (img.channels() != 4) return img;
  cv::Mat bgr;
  cv::cvtColor(img, bgr, cv::COLOR_BGRA2BGR);
  return bgr;
}

auto PrepareForFormat(const cv::Mat& img, ImageFormat format) -> cv::Mat {
  cv::Mat out;
  switch (DetectColorLayout(img)) {
    case ColorLayout::UNKNOWN:
      out = ToBGRA8(img);
      break;
    case ColorLayout::GRAYA8:
    case ColorLayout::GRAYA16:
      // Writers take 1, 3 or 4 channels
      out = ExpandGrayAlpha(img);
      break;
    default:
      out = img;
      break;
  }

  switch (format) {
    case ImageFormat::JPEG:
    case ImageFormat::BMP:
      return DropAlpha(To8Bit(out));
    case ImageFormat::WEBP:
    case ImageFormat::GIF:
      return To8Bit(out);
    case ImageFormat::PNG:
    case ImageFormat::TIFF:
    default:
      return out;
  }
}

auto WriteParams(ImageFormat format, CompressionBucket bucket) -> std::vector<int> {
  const int idx = static_cast<int>(bucket);
  switch (format) {
    case ImageFormat::PNG: {
      constexpr std::array<int, 3> levels = {1, 6, 9};
      return {cv::IMWRITE_PNG_COMPRESSION, levels[idx]};
    }
    case ImageFormat::JPEG: {
      constexpr std::array<int, 3> quality = {95, 85, 75};
      return {cv::IMWRITE_JPEG_QUALITY, quality[idx]};
    }
    case ImageFormat::WEBP: {
      constexpr std::array<int, 3> quality = {95, 85, 75};
      return {cv::IMWRITE_WEBP_QUALITY, quality[idx]};
    }
    case ImageFormat::TIFF: {
      // libtiff codes: none, LZW, Adobe deflate
      constexpr std::array<int, 3> schemes = {1, 5, 8};
      return {cv::IMWRITE_TIFF_COMPRESSION, schemes[idx]};
    }
    default:
      return {};
  }
}

auto DotExtension(ImageFormat format) -> std::string {
  return "." + std::string(FileExtensionFor(format));
}
}  // namespace

auto Decode(std::span<const uint8_t> bytes) -> DecodedImage {
  if (bytes.empty()) {
    throw CodecError(CodecError::Kind::DECODE, "Image data is empty");
  }
  if (auto decoded = DecodeLenient(bytes)) return std::move(*decoded);

  // Data prefixed with garbage: retry from every signature found past the start
  for (auto format : {ImageFormat::JPEG, ImageFormat::PNG, ImageFormat::GIF, ImageFormat::WEBP,
                      ImageFormat::TIFF, ImageFormat::BMP}) {
    auto offset = FindSignature(bytes, format, 1);
    for (int attempt = 0; offset.has_value() && attempt < kMaxRepairAttempts; ++attempt) {
      if (auto decoded = DecodeLenient(bytes.subspan(*offset))) {
        LogRegistry::Codec()->warn("Recovered {} image from corrupted header at offset {}",
                                   FormatName(format), *offset);
        return std::move(*decoded);
      }
      offset = FindSignature(bytes, format, *offset + 1);
    }
  }
  throw CodecError(CodecError::Kind::DECODE,
                   std::format("Unable to decode {} bytes as any supported image format",
                               bytes.size()));
}

auto ReadFileBytes(const image_path_t& path) -> std::vector<uint8_t> {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw CodecError(CodecError::Kind::IO, std::format("Cannot open {}", path.string()));
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw CodecError(CodecError::Kind::IO, std::format("Failed reading {}", path.string()));
  }
  return bytes;
}

auto DecodeFile(const image_path_t& path) -> DecodedImage {
  auto bytes = ReadFileBytes(path);
  try {
    return Decode(bytes);
  } catch (const CodecError& e) {
    throw CodecError(e.GetKind(), std::format("{}: {}", path.filename().string(), e.what()));
  }
}

auto FromRawRGBA(int width, int height, std::span<const uint8_t> rgba) -> DecodedImage {
  if (width <= 0 || height <= 0 ||
      rgba.size() != static_cast<size_t>(width) * static_cast<size_t>(height) * 4) {
    throw CodecError(CodecError::Kind::DECODE,
                     std::format("Raw RGBA buffer of {} bytes does not match {}x{}", rgba.size(),
                                 width, height));
  }
  cv::Mat view(height, width, CV_8UC4, const_cast<uint8_t*>(rgba.data()));
  cv::Mat bgra;
  cv::cvtColor(view, bgra, cv::COLOR_RGBA2BGRA);
  return {bgra, ImageFormat::PNG};
}

auto DetectColorLayout(const cv::Mat& img) -> ColorLayout {
  const int  channels = img.channels();
  const bool is_8     = img.depth() == CV_8U;
  const bool is_16    = img.depth() == CV_16U;
  if (!is_8 && !is_16) return ColorLayout::UNKNOWN;
  switch (channels) {
    case 1:
      return is_8 ? ColorLayout::GRAY8 : ColorLayout::GRAY16;
    case 2:
      return is_8 ? ColorLayout::GRAYA8 : ColorLayout::GRAYA16;
    case 3:
      return is_8 ? ColorLayout::RGB8 : ColorLayout::RGB16;
    case 4:
      return is_8 ? ColorLayout::RGBA8 : ColorLayout::RGBA16;
    default:
      return ColorLayout::UNKNOWN;
  }
}

auto BucketForLevel(compression_t level) -> CompressionBucket {
  level = std::clamp(level, 0, 9);
  if (level <= 3) return CompressionBucket::FAST;
  if (level <= 6) return CompressionBucket::DEFAULT;
  return CompressionBucket::BEST;
}

auto ComputeFitDimensions(int width, int height, int max_width, int max_height) -> cv::Size {
  if (width <= 0 || height <= 0 || max_width <= 0 || max_height <= 0) {
    throw CodecError(CodecError::Kind::ENCODE,
                     std::format("Invalid resize request {}x{} into {}x{}", width, height,
                                 max_width, max_height));
  }
  if (width <= max_width && height <= max_height) return {width, height};

  const double scale = std::min(static_cast<double>(max_width) / width,
                                static_cast<double>(max_height) / height);
  const int    dst_w = std::max(1, static_cast<int>(std::lround(width * scale)));
  const int    dst_h = std::max(1, static_cast<int>(std::lround(height * scale)));
  return {dst_w, dst_h};
}

auto ResizePreservingAspectRatio(const cv::Mat& src, int max_width, int max_height) -> cv::Mat {
  cv::Size target = ComputeFitDimensions(src.cols, src.rows, max_width, max_height);
  if (target.width == src.cols && target.height == src.rows) return src;

  cv::Mat resized;
  cv::resize(src, resized, target, 0.0, 0.0, InterpolationFor(target));
  return resized;
}

auto InterpolationFor(const cv::Size& target) -> int {
  return (target.width <= kCheapFilterEdge || target.height <= kCheapFilterEdge)
             ? cv::INTER_LINEAR
             : cv::INTER_LANCZOS4;
}

auto CanWrite(ImageFormat format) -> bool { return cv::haveImageWriter(DotExtension(format)); }

auto EffectiveOutputFormat(ImageFormat format) -> ImageFormat {
  return CanWrite(format) ? format : ImageFormat::PNG;
}

auto Encode(const cv::Mat& img, ImageFormat format, compression_t level) -> std::vector<uint8_t> {
  if (img.empty()) {
    throw CodecError(CodecError::Kind::ENCODE, "Cannot encode an empty image");
  }
  if (!CanWrite(format)) {
    throw CodecError(CodecError::Kind::ENCODE,
                     std::format("No {} encoder available", FormatName(format)));
  }

  cv::Mat              prepared = PrepareForFormat(img, format);
  std::vector<uint8_t> out;
  try {
    if (!cv::imencode(DotExtension(format), prepared, out,
                      WriteParams(format, BucketForLevel(level)))) {
      throw CodecError(CodecError::Kind::ENCODE,
                       std::format("{} encoder rejected the image", FormatName(format)));
    }
  } catch (const cv::Exception& e) {
    throw CodecError(CodecError::Kind::ENCODE,
                     std::format("{} encoding failed: {}", FormatName(format), e.what()));
  }
  return out;
}

void WriteImage(const cv::Mat& img, const image_path_t& path, ImageFormat format,
                compression_t level) {
  auto          bytes = Encode(img, format, level);
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw CodecError(CodecError::Kind::IO, std::format("Cannot open {} for writing", path.string()));
  }
  file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!file.good()) {
    throw CodecError(CodecError::Kind::IO, std::format("Failed writing {}", path.string()));
  }
}

void WriteThumbnail(const cv::Mat& img, const image_path_t& path, compression_t level) {
  WriteImage(ResizePreservingAspectRatio(img, kThumbnailMaxWidth, kThumbnailMaxHeight), path,
             ImageFormat::PNG, level);
}
};  // namespace codec
};  // namespace imgshelf
