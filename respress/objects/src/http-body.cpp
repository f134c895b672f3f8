#include "respress/http-body.hpp"

#include <optional>
#include <string_view>
#include <utility>

#include "respress/body-frame.hpp"
#include "respress/http-headers.hpp"
#include "respress/log.hpp"

namespace respress {

StringBody::StringBody(std::string_view data, HttpHeaders trailers) : _data(data), _trailers(std::move(trailers)) {}

BodyFrame StringBody::pollFrame() {
  if (!_dataSent) {
    _dataSent = true;
    if (!_data.empty()) {
      return BodyFrame::Data(std::move(_data));
    }
  }
  if (_trailers) {
    auto trailers = std::move(*_trailers);
    _trailers.reset();
    return BodyFrame::Trailers(std::move(trailers));
  }
  return BodyFrame::End();
}

bool ChunkedBody::write(std::string_view data) {
  if (_closed) {
    log::warn("ChunkedBody: write of {} bytes ignored after close", data.size());
    return false;
  }
  if (!data.empty()) {
    _frames.push_back(BodyFrame::Data(data));
  }
  return true;
}

void ChunkedBody::close(std::optional<HttpHeaders> trailers) {
  if (_closed) {
    return;
  }
  _closed = true;
  if (trailers) {
    _frames.push_back(BodyFrame::Trailers(std::move(*trailers)));
  }
  _frames.push_back(BodyFrame::End());
}

void ChunkedBody::fail(std::string_view message) {
  if (_closed) {
    return;
  }
  _closed = true;
  _frames.push_back(BodyFrame::Error(BodyError::Kind::Upstream, message));
}

BodyFrame ChunkedBody::pollFrame() {
  if (_frames.empty()) {
    return _closed ? BodyFrame::End() : BodyFrame::Pending();
  }
  auto &front = _frames.front();
  if (front.isEnd() || front.isError()) {
    // Terminal frames stay queued so that later polls keep returning them.
    return front.isEnd() ? BodyFrame::End() : BodyFrame::Error(front.error());
  }
  BodyFrame frame = std::move(front);
  _frames.pop_front();
  return frame;
}

}  // namespace respress
