#include "respress/compression-body.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "respress/body-frame.hpp"
#include "respress/compression-config.hpp"
#include "respress/compression-decision.hpp"
#include "respress/encoder.hpp"
#include "respress/encoding.hpp"
#include "respress/http-body.hpp"
#include "respress/log.hpp"
#include "respress/raw-chars.hpp"

namespace respress {

namespace {

CompressionBody::Mode InitialMode(const CompressionDecision &decision, const CompressionConfig &config) {
  if (!decision.compress()) {
    return CompressionBody::Mode::Passthrough;
  }
  if (decision.knownLength || config.minBytes == 0) {
    return CompressionBody::Mode::Compressing;
  }
  return CompressionBody::Mode::Buffering;
}

}  // namespace

CompressionBody::CompressionBody(std::unique_ptr<HttpBody> inner, const CompressionDecision &decision,
                                 std::shared_ptr<const CompressionConfig> config)
    : _inner(std::move(inner)),
      _config(std::move(config)),
      _encoding(decision.encoding),
      _mode(InitialMode(decision, *_config)),
      _forceFlush(decision.forceFlush) {}

BodyFrame CompressionBody::pollFrame() {
  switch (_mode) {
    case Mode::Finished:
      return BodyFrame::End();
    case Mode::Failed:
      return BodyFrame::Error(_error);
    default:
      break;
  }
  if (_innerDone) {
    return nextTerminalFrame();
  }
  for (;;) {
    BodyFrame frame = _inner ? _inner->pollFrame() : BodyFrame::End();
    switch (frame.kind()) {
      case BodyFrame::Kind::Pending:
        return frame;
      case BodyFrame::Kind::Error:
        return fail(BodyError::Kind::Upstream, frame.error().message);
      case BodyFrame::Kind::Data: {
        if (frame.data().empty()) {
          continue;
        }
        auto out = onData(frame);
        if (out) {
          return std::move(*out);
        }
        break;
      }
      case BodyFrame::Kind::Trailers:
        // Trailers mark the end of the data: the inner body is not polled anymore.
        _pendingTrailers.emplace(frame.takeTrailers());
        return onEndOfBody();
      default:
        return onEndOfBody();
    }
  }
}

std::optional<BodyFrame> CompressionBody::onData(BodyFrame &frame) {
  const bool flush = _forceFlush || frame.flush();
  if (_mode == Mode::Passthrough) {
    return BodyFrame::Data(frame.takeData(), flush);
  }
  const std::string_view chunk = frame.data();
  RawChars out;
  try {
    if (_mode == Mode::Buffering) {
      const std::size_t newSize = _buffer.size() + chunk.size();
      if (newSize < _config->minBytes) {
        if (_buffer.capacity() < newSize) {
          // Geometric growth capped at the largest size the buffer can reach (minBytes - 1).
          _buffer.reserve(std::min(_config->minBytes - 1, std::max(newSize, 2 * _buffer.capacity())));
        }
        _buffer.unchecked_append(chunk);
        return std::nullopt;
      }
      log::trace("compression: threshold reached with {} buffered bytes, committing to {}", _buffer.size(),
                 GetEncodingStr(_encoding));
      _mode = Mode::Compressing;
      ensureEncoder();
      // Returned views are only valid until the next codec call, so copy each of them.
      out.append(_encoder->encodeChunk(_buffer));
      _buffer.release();
    } else {
      ensureEncoder();
    }
    out.append(_encoder->encodeChunk(chunk));
    if (flush) {
      out.append(_encoder->flush());
    }
  } catch (const std::exception &ex) {
    return fail(BodyError::Kind::Codec, ex.what());
  }
  if (out.empty()) {
    return std::nullopt;
  }
  return BodyFrame::Data(std::move(out), flush);
}

BodyFrame CompressionBody::onEndOfBody() {
  _innerDone = true;
  switch (_mode) {
    case Mode::Buffering: {
      // End of body below the threshold: the response is sent uncompressed.
      log::trace("compression: body of {} bytes below threshold, sent as identity", _buffer.size());
      _mode = Mode::Passthrough;
      _identityFallbackSize = _buffer.size();
      if (!_buffer.empty()) {
        return BodyFrame::Data(std::exchange(_buffer, RawChars{}), _forceFlush);
      }
      break;
    }
    case Mode::Compressing: {
      RawChars out;
      try {
        ensureEncoder();
        out.append(_encoder->finish());
      } catch (const std::exception &ex) {
        return fail(BodyError::Kind::Codec, ex.what());
      }
      _encoder.reset();
      if (!out.empty()) {
        return BodyFrame::Data(std::move(out), _forceFlush);
      }
      break;
    }
    default:
      break;
  }
  return nextTerminalFrame();
}

BodyFrame CompressionBody::nextTerminalFrame() {
  if (_pendingTrailers) {
    BodyFrame frame = BodyFrame::Trailers(std::move(*_pendingTrailers));
    _pendingTrailers.reset();
    return frame;
  }
  release();
  _mode = Mode::Finished;
  return BodyFrame::End();
}

BodyFrame CompressionBody::fail(BodyError::Kind kind, std::string_view message) {
  release();
  _pendingTrailers.reset();
  _mode = Mode::Failed;
  _error = BodyError{kind, std::string(message)};
  log::error("compression: {} error on {} body: {}", kind == BodyError::Kind::Codec ? "codec" : "upstream",
             GetEncodingStr(_encoding), _error.message);
  return BodyFrame::Error(_error);
}

void CompressionBody::ensureEncoder() {
  if (!_encoder) {
    _encoder = MakeEncoderContext(_encoding, *_config);
  }
}

void CompressionBody::release() noexcept {
  _encoder.reset();
  _buffer.release();
  _inner.reset();
}

void CompressionBody::cancel() noexcept {
  if (_mode == Mode::Finished || _mode == Mode::Failed) {
    return;
  }
  log::debug("compression: body cancelled while {}", ModeStr(_mode));
  release();
  _pendingTrailers.reset();
  _mode = Mode::Finished;
}

}  // namespace respress
