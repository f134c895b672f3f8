#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "respress/http-headers.hpp"
#include "respress/raw-chars.hpp"

namespace respress {

// Error carried in-band by a body stream.
struct BodyError {
  enum class Kind : std::uint8_t {
    Upstream,  // the inner body failed
    Codec,     // the compression codec failed (initialization, push, flush or finish)
  };

  Kind kind{Kind::Upstream};
  std::string message;
};

// Result of one poll step of a body.
//  - Data:     a chunk of body bytes. 'flush()' asks the transport to deliver everything queued so far immediately.
//  - Trailers: the trailer fields, always after the last Data frame.
//  - Pending:  no output available yet (waiting for input, or the producer is throttled); poll again later.
//  - End:      the body is complete, all subsequent polls return End as well.
//  - Error:    the body failed, no further data will be produced.
class BodyFrame {
 public:
  enum class Kind : std::uint8_t { Data, Trailers, Pending, End, Error };

  static BodyFrame Data(RawChars data, bool flush = false) {
    BodyFrame frame(Kind::Data);
    frame._data = std::move(data);
    frame._flush = flush;
    return frame;
  }

  static BodyFrame Data(std::string_view data, bool flush = false) { return Data(RawChars(data), flush); }

  static BodyFrame Trailers(HttpHeaders trailers) {
    BodyFrame frame(Kind::Trailers);
    frame._trailers = std::move(trailers);
    return frame;
  }

  static BodyFrame Pending() noexcept { return BodyFrame(Kind::Pending); }

  static BodyFrame End() noexcept { return BodyFrame(Kind::End); }

  static BodyFrame Error(BodyError error) {
    BodyFrame frame(Kind::Error);
    frame._error = std::move(error);
    return frame;
  }

  static BodyFrame Error(BodyError::Kind kind, std::string_view message) {
    return Error(BodyError{kind, std::string(message)});
  }

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  [[nodiscard]] bool isData() const noexcept { return _kind == Kind::Data; }
  [[nodiscard]] bool isTrailers() const noexcept { return _kind == Kind::Trailers; }
  [[nodiscard]] bool isPending() const noexcept { return _kind == Kind::Pending; }
  [[nodiscard]] bool isEnd() const noexcept { return _kind == Kind::End; }
  [[nodiscard]] bool isError() const noexcept { return _kind == Kind::Error; }

  // Body bytes of a Data frame (empty for other kinds).
  [[nodiscard]] std::string_view data() const noexcept { return _data; }

  // Steal the body bytes of a Data frame.
  [[nodiscard]] RawChars takeData() noexcept { return std::move(_data); }

  // Whether the transport should flush after this Data frame.
  [[nodiscard]] bool flush() const noexcept { return _flush; }

  [[nodiscard]] const HttpHeaders &trailers() const noexcept { return _trailers; }

  [[nodiscard]] HttpHeaders takeTrailers() noexcept { return std::move(_trailers); }

  [[nodiscard]] const BodyError &error() const noexcept { return _error; }

 private:
  explicit BodyFrame(Kind kind) noexcept : _kind(kind) {}

  Kind _kind;
  bool _flush{false};
  RawChars _data;
  HttpHeaders _trailers;
  BodyError _error;
};

}  // namespace respress
