#include "respress/compression-config.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

#include "respress/encoding.hpp"
#include "respress/features.hpp"

#ifdef RESPRESS_ENABLE_ZSTD
#include <zstd.h>
#endif

namespace respress {

void CompressionConfig::validate() const {
  if (encoderChunkSize == 0) {
    throw std::invalid_argument("Invalid encoder chunk size");
  }
  for (auto it = preferredFormats.begin(); it != preferredFormats.end(); ++it) {
    if (*it == Encoding::none) {
      throw std::invalid_argument("identity cannot be listed in preferredFormats");
    }
    if (!IsEncodingEnabled(*it)) {
      throw std::invalid_argument(
          std::format("Unsupported encoding {} in preferredFormats (not compiled in)", GetEncodingStr(*it)));
    }
    if (std::find(preferredFormats.begin(), it, *it) != it) {
      throw std::invalid_argument(std::format("Duplicated encoding {} in preferredFormats", GetEncodingStr(*it)));
    }
  }
  if (std::ranges::any_of(flushContentTypes, [](const auto &contentType) { return contentType.empty(); })) {
    throw std::invalid_argument("Empty content type in flushContentTypes");
  }
  if (std::ranges::any_of(flushHeaderNames, [](const auto &name) { return name.empty(); })) {
    throw std::invalid_argument("Empty header name in flushHeaderNames");
  }

  if constexpr (zlibEnabled()) {
    if (zlib.level != Zlib::kDefaultLevel && (zlib.level < Zlib::kMinLevel || zlib.level > Zlib::kMaxLevel)) {
      throw std::invalid_argument(std::format("Invalid ZLIB compression level {}", zlib.level));
    }
  }

#ifdef RESPRESS_ENABLE_ZSTD
  if (zstd.compressionLevel < ZSTD_minCLevel() || zstd.compressionLevel > ZSTD_maxCLevel()) {
    throw std::invalid_argument(std::format("Invalid ZSTD compression level {}", zstd.compressionLevel));
  }
  if (zstd.windowLog != 0) {
    const ZSTD_bounds bounds = ZSTD_cParam_getBounds(ZSTD_c_windowLog);
    if (zstd.windowLog < bounds.lowerBound || zstd.windowLog > bounds.upperBound) {
      throw std::invalid_argument(std::format("Invalid ZSTD window log {}", zstd.windowLog));
    }
  }
#endif

  if constexpr (brotliEnabled()) {
    if (brotli.quality < Brotli::kMinQuality || brotli.quality > Brotli::kMaxQuality) {
      throw std::invalid_argument(std::format("Invalid Brotli quality {}", brotli.quality));
    }
    if (brotli.window < Brotli::kMinWindow || brotli.window > Brotli::kMaxWindow) {
      throw std::invalid_argument(std::format("Invalid Brotli window {}", brotli.window));
    }
  }
}

}  // namespace respress
