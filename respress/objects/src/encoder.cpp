#include "respress/encoder.hpp"

#include <format>
#include <memory>
#include <stdexcept>
#include <string_view>

#include "respress/compression-config.hpp"
#include "respress/encoding.hpp"

#ifdef RESPRESS_ENABLE_BROTLI
#include "respress/brotli-encoder.hpp"
#endif
#ifdef RESPRESS_ENABLE_ZLIB
#include "respress/zlib-encoder.hpp"
#endif
#ifdef RESPRESS_ENABLE_ZSTD
#include "respress/zstd-encoder.hpp"
#endif

namespace respress {

std::string_view EncoderContext::encodeChunk(std::string_view chunk) {
  if (chunk.empty()) {
    // Nothing to feed: some codecs report an error when called without input nor flush request.
    if (_finished) [[unlikely]] {
      throw std::logic_error(std::format("{} encoder used after finish", GetEncodingStr(_encoding)));
    }
    _buf.clear();
    return _buf;
  }
  return run(chunk, Operation::Process);
}

std::string_view EncoderContext::flush() { return run({}, Operation::Flush); }

std::string_view EncoderContext::finish() { return run({}, Operation::Finish); }

std::string_view EncoderContext::run(std::string_view data, Operation operation) {
  if (_finished) [[unlikely]] {
    throw std::logic_error(std::format("{} encoder used after finish", GetEncodingStr(_encoding)));
  }
  if (operation == Operation::Finish) {
    _finished = true;
  }
  _buf.clear();
  compress(data, operation);
  return _buf;
}

std::unique_ptr<EncoderContext> MakeEncoderContext(Encoding encoding, const CompressionConfig &config) {
  switch (encoding) {
#ifdef RESPRESS_ENABLE_ZSTD
    case Encoding::zstd:
      return std::make_unique<ZstdEncoderContext>(config.zstd, config.encoderChunkSize);
#endif
#ifdef RESPRESS_ENABLE_BROTLI
    case Encoding::br:
      return std::make_unique<BrotliEncoderContext>(config.brotli, config.encoderChunkSize);
#endif
#ifdef RESPRESS_ENABLE_ZLIB
    case Encoding::gzip:
      return std::make_unique<ZlibEncoderContext>(config.zlib, config.encoderChunkSize);
#endif
    default:
      break;
  }
  throw std::invalid_argument(std::format("No encoder available for '{}'", GetEncodingStr(encoding)));
}

}  // namespace respress
