#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "respress/encoding.hpp"
#include "respress/fixedcapacityvector.hpp"
#include "respress/http-constants.hpp"

#ifdef RESPRESS_ENABLE_ZLIB
#include <zlib.h>
#endif

#ifdef RESPRESS_ENABLE_BROTLI
#include <brotli/encode.h>
#endif

namespace respress {

// Default minimum body size for compression (about one Ethernet MTU worth of payload).
inline constexpr std::size_t kDefaultMinCompressBytes = 860UL;

// NOTE: Each codec is optional at build time. A codec that is not compiled in is never negotiated, and listing it in
// preferredFormats is a configuration error.
struct CompressionConfig {
  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;

  // Enabled codecs, ordered by server preference (used as tie-break between equal client q-values).
  // If empty, all codecs compiled in are enabled, in enumeration order of Encoding (zstd, br, gzip).
  FixedCapacityVector<Encoding, kNbContentEncodings> preferredFormats;

  // If true, adds/merges a Vary: Accept-Encoding header whenever the negotiation evaluated a supported codec.
  bool addVaryHeader{true};

  // Content-Type prefixes (media type, case-insensitive) for which every emitted chunk is flushed.
  std::vector<std::string> flushContentTypes{std::string(http::ContentTypeTextEventStream),
                                             std::string(http::ContentTypeApplicationGrpcWeb)};

  // Request or response header names whose value "no" (case-insensitive) forces flushing of every emitted chunk.
  std::vector<std::string> flushHeaderNames{std::string(http::XAccelBuffering)};

  struct Zlib {
#ifdef RESPRESS_ENABLE_ZLIB
    static constexpr int8_t kDefaultLevel = Z_DEFAULT_COMPRESSION;
    static constexpr int8_t kMinLevel = Z_BEST_SPEED;
    static constexpr int8_t kMaxLevel = Z_BEST_COMPRESSION;
#else
    static constexpr int8_t kDefaultLevel = 0;
    static constexpr int8_t kMinLevel = 0;
    static constexpr int8_t kMaxLevel = 0;
#endif
    int8_t level = kDefaultLevel;
  } zlib;

  struct Zstd {
    static constexpr int8_t kDefaultLevel = 3;
    int8_t compressionLevel = kDefaultLevel;
    // 0 means zstd default.
    int8_t windowLog = 0;
  } zstd;

  struct Brotli {
#ifdef RESPRESS_ENABLE_BROTLI
    static constexpr int8_t kDefaultQuality = BROTLI_DEFAULT_QUALITY;
    static constexpr int8_t kDefaultWindow = BROTLI_DEFAULT_WINDOW;
    static constexpr int8_t kMinQuality = BROTLI_MIN_QUALITY;
    static constexpr int8_t kMaxQuality = BROTLI_MAX_QUALITY;
    static constexpr int8_t kMinWindow = BROTLI_MIN_WINDOW_BITS;
    static constexpr int8_t kMaxWindow = BROTLI_MAX_WINDOW_BITS;
#else
    static constexpr int8_t kDefaultQuality = 0;
    static constexpr int8_t kDefaultWindow = 0;
    static constexpr int8_t kMinQuality = 0;
    static constexpr int8_t kMaxQuality = 0;
    static constexpr int8_t kMinWindow = 0;
    static constexpr int8_t kMaxWindow = 0;
#endif
    int8_t quality = kDefaultQuality;
    int8_t window = kDefaultWindow;
  } brotli;

  // Only responses whose (uncompressed) size is >= this threshold are compressed.
  // For streaming responses (unknown size), bytes are buffered (never more than minBytes - 1) until the threshold
  // is reached, at which point compression begins; a body ending below the threshold is sent as is.
  std::size_t minBytes{kDefaultMinCompressBytes};

  // Growth step of the encoder output buffers.
  // Prefer a large size if you expect big chunks in average, prefer a small size if you want to limit memory
  // overhead per response.
  std::size_t encoderChunkSize{16UL * 1024UL};
};

}  // namespace respress
