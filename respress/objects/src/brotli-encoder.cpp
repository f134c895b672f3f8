#include "respress/brotli-encoder.hpp"

#include <brotli/encode.h>
#include <brotli/types.h>

#include <cstddef>
#include <cstdint>
#include <new>
#include <stdexcept>
#include <string_view>

#include "respress/compression-config.hpp"
#include "respress/encoding.hpp"

namespace respress {

BrotliEncoderContext::BrotliEncoderContext(const CompressionConfig::Brotli &cfg, std::size_t encoderChunkSize)
    : EncoderContext(Encoding::br, encoderChunkSize),
      _state(BrotliEncoderCreateInstance(nullptr, nullptr, nullptr), &BrotliEncoderDestroyInstance) {
  if (!_state) {
    throw std::bad_alloc();
  }
  if (BrotliEncoderSetParameter(_state.get(), BROTLI_PARAM_QUALITY, static_cast<uint32_t>(cfg.quality)) ==
      BROTLI_FALSE) {
    throw std::invalid_argument("Brotli set quality failed");
  }
  if (BrotliEncoderSetParameter(_state.get(), BROTLI_PARAM_LGWIN, static_cast<uint32_t>(cfg.window)) ==
      BROTLI_FALSE) {
    throw std::invalid_argument("Brotli set window failed");
  }
}

void BrotliEncoderContext::compress(std::string_view data, Operation operation) {
  const uint8_t *nextIn = reinterpret_cast<const uint8_t *>(data.data());
  std::size_t availIn = data.size();

  BrotliEncoderOperation op = BROTLI_OPERATION_PROCESS;
  if (operation == Operation::Flush) {
    op = BROTLI_OPERATION_FLUSH;
  } else if (operation == Operation::Finish) {
    op = BROTLI_OPERATION_FINISH;
  }

  for (;;) {
    _buf.ensureAvailableCapacityExponential(_chunkSize);

    uint8_t *nextOut = reinterpret_cast<uint8_t *>(_buf.data() + _buf.size());
    std::size_t availOut = _buf.availableCapacity();

    if (BrotliEncoderCompressStream(_state.get(), op, &availIn, &nextIn, &availOut, &nextOut, nullptr) ==
        BROTLI_FALSE) [[unlikely]] {
      throw std::runtime_error("BrotliEncoderCompressStream failed");
    }
    _buf.setSize(_buf.capacity() - availOut);

    switch (op) {
      case BROTLI_OPERATION_FINISH:
        if (BrotliEncoderIsFinished(_state.get()) == BROTLI_TRUE) {
          return;
        }
        break;
      case BROTLI_OPERATION_FLUSH:
        // A flush is complete once the input is consumed and the encoder holds no more pending output.
        if (availIn == 0 && BrotliEncoderHasMoreOutput(_state.get()) == BROTLI_FALSE) {
          return;
        }
        break;
      default:
        // Processing may keep output inside the encoder, it will be emitted by a later flush or finish.
        if (availIn == 0) {
          return;
        }
        break;
    }
  }
}

}  // namespace respress
