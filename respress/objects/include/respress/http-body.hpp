#pragma once

#include <deque>
#include <optional>
#include <string_view>

#include "respress/body-frame.hpp"
#include "respress/http-headers.hpp"
#include "respress/raw-chars.hpp"

namespace respress {

// A response body as produced by the hosting service: a lazy, finite, non-restartable sequence of data chunks,
// optionally followed by one trailer set.
// Single reader contract: pollFrame() is called by one consumer at a time. Implementations return Pending when no
// chunk is available yet and End once exhausted (then forever).
class HttpBody {
 public:
  virtual ~HttpBody() = default;

  virtual BodyFrame pollFrame() = 0;
};

// Body made of a single in-memory chunk, optionally followed by trailers.
class StringBody final : public HttpBody {
 public:
  explicit StringBody(std::string_view data) : _data(data) {}

  StringBody(std::string_view data, HttpHeaders trailers);

  BodyFrame pollFrame() override;

 private:
  RawChars _data;
  std::optional<HttpHeaders> _trailers;
  bool _dataSent{false};
};

// Body fed incrementally by its producer.
// Chunks pushed with write() are returned in order; once drained, pollFrame() returns Pending until close() is
// called. fail() injects an error after already queued chunks.
class ChunkedBody final : public HttpBody {
 public:
  // Queue a data chunk. Ignored (returns false) after close() or fail().
  bool write(std::string_view data);

  // Mark the end of the body, with optional trailers. Further calls are ignored.
  void close(std::optional<HttpHeaders> trailers = std::nullopt);

  // Terminate the body with an error. Further calls are ignored.
  void fail(std::string_view message);

  [[nodiscard]] bool closed() const noexcept { return _closed; }

  BodyFrame pollFrame() override;

 private:
  std::deque<BodyFrame> _frames;
  bool _closed{false};
};

}  // namespace respress
