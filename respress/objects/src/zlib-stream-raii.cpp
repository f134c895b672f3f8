#include "respress/zlib-stream-raii.hpp"

#include <zconf.h>
#include <zlib.h>

#include <cstdint>
#include <format>
#include <stdexcept>

#include "respress/log.hpp"

namespace respress {

namespace {
// 15 bits of window, +16 selects the gzip header and trailer instead of the raw zlib ones.
constexpr int kGzipWindowBits = MAX_WBITS + 16;
constexpr int kMemLevel = 8;
}  // namespace

ZStreamRAII::ZStreamRAII(Mode mode, int8_t level) : _mode(mode) {
  if (mode == Mode::inflate) {
    const auto ret = inflateInit2(&stream, kGzipWindowBits);
    if (ret != Z_OK) {
      throw std::runtime_error(std::format("Error from inflateInit2 - error {}", ret));
    }
  } else {
    const auto ret = deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
      throw std::runtime_error(std::format("Error from deflateInit2 - error {}", ret));
    }
  }
}

ZStreamRAII::~ZStreamRAII() {
  if (_mode == Mode::inflate) {
    const auto ret = inflateEnd(&stream);
    if (ret != Z_OK) {
      log::error("zlib: inflateEnd returned {} (ignored)", ret);
    }
  } else {
    // Z_DATA_ERROR only means the stream was released before being finished (cancelled response).
    const auto ret = deflateEnd(&stream);
    if (ret != Z_OK && ret != Z_DATA_ERROR) {
      log::error("zlib: deflateEnd returned {} (ignored)", ret);
    }
  }
}

}  // namespace respress
