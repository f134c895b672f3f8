#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "respress/body-frame.hpp"
#include "respress/http-body.hpp"
#include "respress/http-headers.hpp"

namespace respress::test {

// Observable state of a ScriptedBody, shared with the test once the body has been handed over.
struct ScriptState {
  std::size_t nbPolls{};
  bool destroyed{};
};

// Body returning a fixed sequence of frames, then End forever.
class ScriptedBody final : public HttpBody {
 public:
  explicit ScriptedBody(std::vector<BodyFrame> frames, std::shared_ptr<ScriptState> state = {});

  ScriptedBody(const ScriptedBody &) = delete;
  ScriptedBody &operator=(const ScriptedBody &) = delete;

  ~ScriptedBody() override;

  BodyFrame pollFrame() override;

 private:
  std::vector<BodyFrame> _frames;
  std::shared_ptr<ScriptState> _state;
  std::size_t _pos{};
};

// Scripted body made of the given data chunks, optionally followed by trailers.
std::unique_ptr<ScriptedBody> MakeChunkedBody(const std::vector<std::string> &chunks,
                                              std::optional<HttpHeaders> trailers = std::nullopt,
                                              std::shared_ptr<ScriptState> state = {});

// Splits 'payload' into chunks of at most 'chunkSize' bytes.
std::vector<std::string> SplitPayload(std::string_view payload, std::size_t chunkSize);

// Everything observed while polling a body to completion.
struct DrainResult {
  std::string data;                  // concatenation of all data frames
  std::vector<std::string> chunks;   // individual data frames
  std::vector<bool> flushes;         // flush flag of each data frame
  std::optional<HttpHeaders> trailers;
  std::size_t nbTrailers{};
  std::size_t nbPending{};
  std::optional<BodyError> error;
  bool ended{};
  bool dataAfterTrailers{};
};

// Polls until End or Error. Throws std::runtime_error if the body is still running after 'maxPolls' polls.
DrainResult Drain(const std::function<BodyFrame()> &poll, std::size_t maxPolls = 1UL << 20);

DrainResult Drain(HttpBody &body, std::size_t maxPolls = 1UL << 20);

}  // namespace respress::test
