#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "respress/body-frame.hpp"
#include "respress/compression-config.hpp"
#include "respress/compression-decision.hpp"
#include "respress/encoder.hpp"
#include "respress/encoding.hpp"
#include "respress/http-body.hpp"
#include "respress/http-headers.hpp"
#include "respress/raw-chars.hpp"

namespace respress {

// Body transformer: wraps the inner body of a response and emits it compressed or unchanged according to a
// CompressionDecision.
//
// Modes:
//   Buffering   : compression selected but total length unknown. Chunks are accumulated (strictly below
//                 minBytes) until either the threshold is reached (-> Compressing) or the inner body ends
//                 (-> Passthrough, the headers must then be reverted to identity).
//   Compressing : chunks are pushed into the codec, final bytes are emitted at end of body.
//   Passthrough : chunks are forwarded unchanged.
//   Finished    : End was returned (or the body was cancelled), every poll returns End.
//   Failed      : an upstream or codec error was returned, every poll returns the same error.
// Trailers of the inner body are forwarded once, after the last data frame.
class CompressionBody final : public HttpBody {
 public:
  enum class Mode : std::uint8_t { Buffering, Compressing, Passthrough, Finished, Failed };

  // A null 'inner' body is an empty body.
  CompressionBody(std::unique_ptr<HttpBody> inner, const CompressionDecision &decision,
                  std::shared_ptr<const CompressionConfig> config);

  CompressionBody(const CompressionBody &) = delete;
  CompressionBody(CompressionBody &&) noexcept = default;
  CompressionBody &operator=(const CompressionBody &) = delete;
  CompressionBody &operator=(CompressionBody &&) noexcept = default;

  ~CompressionBody() override = default;

  BodyFrame pollFrame() override;

  // Releases the codec, the buffered bytes and the inner body. Subsequent polls return End.
  void cancel() noexcept;

  [[nodiscard]] Mode mode() const noexcept { return _mode; }

  // Number of bytes currently held while Buffering.
  [[nodiscard]] std::size_t bufferedSize() const noexcept { return _buffer.size(); }

  // Allocated size of the buffer, never more than minBytes - 1.
  [[nodiscard]] std::size_t bufferCapacity() const noexcept { return _buffer.capacity(); }

  // Set once Buffering resolved to Passthrough, to the exact size of the (uncompressed) body.
  [[nodiscard]] std::optional<std::size_t> identityFallbackSize() const noexcept { return _identityFallbackSize; }

 private:
  // Returns the frame to emit for an incoming data chunk, or std::nullopt if nothing is to be emitted yet.
  std::optional<BodyFrame> onData(BodyFrame &frame);

  BodyFrame onEndOfBody();

  BodyFrame nextTerminalFrame();

  BodyFrame fail(BodyError::Kind kind, std::string_view message);

  void ensureEncoder();

  void release() noexcept;

  std::unique_ptr<HttpBody> _inner;
  std::shared_ptr<const CompressionConfig> _config;
  std::unique_ptr<EncoderContext> _encoder;
  RawChars _buffer;
  std::optional<HttpHeaders> _pendingTrailers;
  std::optional<std::size_t> _identityFallbackSize;
  BodyError _error;
  Encoding _encoding;
  Mode _mode;
  bool _forceFlush;
  bool _innerDone{false};
};

constexpr std::string_view ModeStr(CompressionBody::Mode mode) {
  switch (mode) {
    case CompressionBody::Mode::Buffering:
      return "buffering";
    case CompressionBody::Mode::Compressing:
      return "compressing";
    case CompressionBody::Mode::Passthrough:
      return "passthrough";
    case CompressionBody::Mode::Finished:
      return "finished";
    case CompressionBody::Mode::Failed:
      return "failed";
    default:
      return "unknown";
  }
}

}  // namespace respress
