#include "respress/zlib-encoder.hpp"

#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <format>
#include <stdexcept>
#include <string_view>

#include "respress/compression-config.hpp"
#include "respress/encoding.hpp"

namespace respress {

ZlibEncoderContext::ZlibEncoderContext(const CompressionConfig::Zlib &cfg, std::size_t encoderChunkSize)
    : EncoderContext(Encoding::gzip, encoderChunkSize), _zs(ZStreamRAII::Mode::deflate, cfg.level) {}

void ZlibEncoderContext::compress(std::string_view data, Operation operation) {
  _zs.stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
  _zs.stream.avail_in = static_cast<uInt>(data.size());

  int flush = Z_NO_FLUSH;
  if (operation == Operation::Flush) {
    flush = Z_SYNC_FLUSH;
  } else if (operation == Operation::Finish) {
    flush = Z_FINISH;
  }
  do {
    _buf.ensureAvailableCapacityExponential(_chunkSize);

    const auto availableCapacity = _buf.availableCapacity();

    _zs.stream.next_out = reinterpret_cast<unsigned char *>(_buf.data() + _buf.size());
    _zs.stream.avail_out = static_cast<decltype(_zs.stream.avail_out)>(availableCapacity);

    // Z_BUF_ERROR is not fatal: it only reports that no progress was possible (repeated flush without new input).
    const auto ret = deflate(&_zs.stream, flush);
    if (ret == Z_STREAM_ERROR) [[unlikely]] {
      throw std::runtime_error(std::format("Zlib streaming error {}", ret));
    }

    _buf.addSize(availableCapacity - _zs.stream.avail_out);

    if (ret == Z_STREAM_END) {
      break;
    }
  } while (_zs.stream.avail_out == 0 || _zs.stream.avail_in > 0);
}

}  // namespace respress
