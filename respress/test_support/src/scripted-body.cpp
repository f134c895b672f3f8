#include "respress/scripted-body.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "respress/body-frame.hpp"
#include "respress/http-body.hpp"
#include "respress/http-headers.hpp"

namespace respress::test {

ScriptedBody::ScriptedBody(std::vector<BodyFrame> frames, std::shared_ptr<ScriptState> state)
    : _frames(std::move(frames)), _state(std::move(state)) {}

ScriptedBody::~ScriptedBody() {
  if (_state) {
    _state->destroyed = true;
  }
}

BodyFrame ScriptedBody::pollFrame() {
  if (_state) {
    ++_state->nbPolls;
  }
  if (_pos == _frames.size()) {
    return BodyFrame::End();
  }
  return std::move(_frames[_pos++]);
}

std::unique_ptr<ScriptedBody> MakeChunkedBody(const std::vector<std::string> &chunks,
                                              std::optional<HttpHeaders> trailers,
                                              std::shared_ptr<ScriptState> state) {
  std::vector<BodyFrame> frames;
  frames.reserve(chunks.size() + 1U);
  for (const auto &chunk : chunks) {
    frames.push_back(BodyFrame::Data(std::string_view(chunk)));
  }
  if (trailers) {
    frames.push_back(BodyFrame::Trailers(std::move(*trailers)));
  }
  return std::make_unique<ScriptedBody>(std::move(frames), std::move(state));
}

std::vector<std::string> SplitPayload(std::string_view payload, std::size_t chunkSize) {
  std::vector<std::string> chunks;
  while (!payload.empty()) {
    const auto len = std::min(chunkSize, payload.size());
    chunks.emplace_back(payload.substr(0, len));
    payload.remove_prefix(len);
  }
  return chunks;
}

DrainResult Drain(const std::function<BodyFrame()> &poll, std::size_t maxPolls) {
  DrainResult result;
  for (std::size_t nbPolls = 0; nbPolls < maxPolls; ++nbPolls) {
    BodyFrame frame = poll();
    switch (frame.kind()) {
      case BodyFrame::Kind::Data:
        if (result.nbTrailers != 0) {
          result.dataAfterTrailers = true;
        }
        result.data.append(frame.data());
        result.chunks.emplace_back(frame.data());
        result.flushes.push_back(frame.flush());
        break;
      case BodyFrame::Kind::Trailers:
        ++result.nbTrailers;
        result.trailers = frame.takeTrailers();
        break;
      case BodyFrame::Kind::Pending:
        ++result.nbPending;
        break;
      case BodyFrame::Kind::End:
        result.ended = true;
        return result;
      case BodyFrame::Kind::Error:
        result.error = frame.error();
        return result;
    }
  }
  throw std::runtime_error("Body did not terminate");
}

DrainResult Drain(HttpBody &body, std::size_t maxPolls) {
  return Drain([&body] { return body.pollFrame(); }, maxPolls);
}

}  // namespace respress::test
