#pragma once

#include <zlib.h>

#include <cstdint>

namespace respress {

// Owns a z_stream configured for the gzip wrapper (RFC 1952).
struct ZStreamRAII {
  enum class Mode : int8_t { deflate, inflate };

  // Initialize a z_stream for gzip compression (mode deflate, with 'level') or decompression (mode inflate).
  // Throws std::runtime_error on failure.
  explicit ZStreamRAII(Mode mode, int8_t level = Z_DEFAULT_COMPRESSION);

  ZStreamRAII(const ZStreamRAII&) = delete;
  ZStreamRAII(ZStreamRAII&&) noexcept = delete;
  ZStreamRAII& operator=(const ZStreamRAII&) = delete;
  ZStreamRAII& operator=(ZStreamRAII&&) noexcept = delete;

  ~ZStreamRAII();

  z_stream stream{};

 private:
  Mode _mode;
};

}  // namespace respress
