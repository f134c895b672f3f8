#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "respress/compression-config.hpp"
#include "respress/encoding.hpp"
#include "respress/raw-chars.hpp"

// =============================================================================
// respress Codec Adapter
// =============================================================================
// EncoderContext is the uniform streaming contract over one compression codec instance (gzip, brotli, zstd).
// It owns both the native codec state and its own output buffer, so that contexts of different responses never
// share memory and can live on different threads.
//
// Contracts
// ---------
//   encodeChunk(chunk): compress 'chunk'. The codec may buffer internally, so the output may be empty.
//   flush():            emit all output currently buffered by the codec without ending the stream. Data emitted so
//                       far (including this flush) can be decoded by a streaming decoder.
//   finish():           end the stream, emitting the final bytes (including footer / checksum). The context is
//                       unusable afterwards: any further call throws std::logic_error.
// Returned views remain valid until the next call on the same context.
//
// Error Handling: construction throws std::bad_alloc / std::invalid_argument / std::runtime_error on codec
// initialization failures, streaming calls throw std::runtime_error on codec failures. After an exception the context
// must be discarded.
//
// Thread Safety: a context is not thread-safe and must be confined to a single response.
//
// Extension Points: adding a new codec only requires a new Encoding value and a matching EncoderContext subclass
// created by MakeEncoderContext().
// =============================================================================

namespace respress {

class EncoderContext {
 public:
  virtual ~EncoderContext() = default;

  [[nodiscard]] std::string_view encodeChunk(std::string_view chunk);

  [[nodiscard]] std::string_view flush();

  [[nodiscard]] std::string_view finish();

  [[nodiscard]] bool finished() const noexcept { return _finished; }

  [[nodiscard]] Encoding encoding() const noexcept { return _encoding; }

 protected:
  enum class Operation : std::uint8_t { Process, Flush, Finish };

  EncoderContext(Encoding encoding, std::size_t encoderChunkSize) : _chunkSize(encoderChunkSize), _encoding(encoding) {}

  // Run the native codec on 'data' with the given operation, appending all produced bytes to '_buf'.
  virtual void compress(std::string_view data, Operation operation) = 0;

  RawChars _buf;
  std::size_t _chunkSize;

 private:
  std::string_view run(std::string_view data, Operation operation);

  Encoding _encoding;
  bool _finished{false};
};

// Creates a streaming context for the given codec configured from 'config'.
// Throws std::invalid_argument if 'encoding' is Encoding::none or a codec not compiled in.
std::unique_ptr<EncoderContext> MakeEncoderContext(Encoding encoding, const CompressionConfig &config);

}  // namespace respress
