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
#include <opencv2/core.hpp>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "io/image/image_format.hpp"
#include "type/type.hpp"

namespace imgshelf {
class CodecError : public std::runtime_error {
 public:
  enum class Kind : uint8_t { DECODE, ENCODE, IO };

  CodecError(Kind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}
  auto GetKind() const -> Kind { return kind_; }

 private:
  Kind kind_;
};

enum class ColorLayout : uint8_t {
  GRAY8,
  GRAYA8,
  RGB8,
  RGBA8,
  GRAY16,
  GRAYA16,
  RGB16,
  RGBA16,
  UNKNOWN
};

struct DecodedImage {
  // BGR(A) channel order, as OpenCV hands it out
  cv::Mat     pixels_;
  ImageFormat format_ = ImageFormat::PNG;

  auto        Width() const -> int { return pixels_.cols; }
  auto        Height() const -> int { return pixels_.rows; }
};

enum class CompressionBucket : uint8_t { FAST, DEFAULT, BEST };

namespace codec {
static constexpr int kThumbnailMaxWidth  = 500;
static constexpr int kThumbnailMaxHeight = 500;
// Outputs this small are resized with a bilinear filter, larger ones with Lanczos
static constexpr int kCheapFilterEdge    = 200;

/**
 * @brief Decode an encoded buffer, trying progressively more lenient strategies before giving up:
 *        a plain decode, alternate read modes and a terminated JPEG stream, then a re-decode
 *        from every known format signature found past a corrupted prefix.
 *
 * @param bytes
 * @return DecodedImage the pixels and the format the data was actually decoded as
 * @throws CodecError if none of the strategies produce an image
 */
auto Decode(std::span<const uint8_t> bytes) -> DecodedImage;
auto DecodeFile(const image_path_t& path) -> DecodedImage;

/**
 * @brief Wrap raw RGBA8 pixels (row-major, tightly packed), e.g. a clipboard capture. The result
 *        is tagged as PNG.
 */
auto FromRawRGBA(int width, int height, std::span<const uint8_t> rgba) -> DecodedImage;

auto ReadFileBytes(const image_path_t& path) -> std::vector<uint8_t>;

auto DetectColorLayout(const cv::Mat& img) -> ColorLayout;

auto BucketForLevel(compression_t level) -> CompressionBucket;

/**
 * @brief Target size that fits (w, h) inside the bounding box with the aspect ratio kept.
 *        Images that already fit come back unchanged, nothing is ever upscaled.
 */
auto ComputeFitDimensions(int width, int height, int max_width, int max_height) -> cv::Size;
auto ResizePreservingAspectRatio(const cv::Mat& src, int max_width, int max_height) -> cv::Mat;
// Bilinear when either output edge is small, Lanczos otherwise
auto InterpolationFor(const cv::Size& target) -> int;

auto CanWrite(ImageFormat format) -> bool;
// The format an original is actually stored in, PNG where no writer is available
auto EffectiveOutputFormat(ImageFormat format) -> ImageFormat;

/**
 * @brief Encode keeping the channel layout and bit depth of the source where the target format
 *        can hold it.
 *
 * @param img
 * @param format
 * @param level 0-9, mapped onto fast/default/best
 * @return std::vector<uint8_t>
 */
auto Encode(const cv::Mat& img, ImageFormat format, compression_t level) -> std::vector<uint8_t>;
void WriteImage(const cv::Mat& img, const image_path_t& path, ImageFormat format,
                compression_t level);
void WriteThumbnail(const cv::Mat& img, const image_path_t& path, compression_t level);
};  // namespace codec
};  // namespace imgshelf
