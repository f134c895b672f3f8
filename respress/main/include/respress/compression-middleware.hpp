#pragma once

#include <memory>
#include <optional>
#include <string>

#include "respress/accept-encoding-negotiation.hpp"
#include "respress/body-frame.hpp"
#include "respress/compression-body.hpp"
#include "respress/compression-config.hpp"
#include "respress/compression-decision.hpp"
#include "respress/http-constants.hpp"
#include "respress/http-headers.hpp"
#include "respress/http-response.hpp"

namespace respress {

// A response after the compression layer: rewritten headers and transformed body.
//
// Headers are only final once headersCommitted() returns true. While the body is still buffering an unknown
// length body below the compression threshold, the outcome (compressed or identity) is not decided yet; the
// transport must poll until the first non-Pending frame before serializing the headers.
class CompressedResponse {
 public:
  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] const HttpHeaders &headers() const noexcept { return _headers; }

  [[nodiscard]] const CompressionDecision &decision() const noexcept { return _decision; }

  [[nodiscard]] bool headersCommitted() const noexcept {
    return _body.mode() != CompressionBody::Mode::Buffering;
  }

  [[nodiscard]] CompressionBody::Mode mode() const noexcept { return _body.mode(); }

  // Next frame of the transformed body.
  BodyFrame poll();

  // Aborts the body: releases all resources, subsequent polls return End.
  void cancel() noexcept { _body.cancel(); }

 private:
  friend class CompressionMiddleware;

  CompressedResponse(http::StatusCode status, HttpHeaders headers, const CompressionDecision &decision,
                     CompressionBody body, std::optional<std::string> removedAcceptRanges);

  HttpHeaders _headers;
  CompressionBody _body;
  CompressionDecision _decision;
  // Accept-Ranges value removed at wrap time, restored if the body falls back to identity.
  std::optional<std::string> _removedAcceptRanges;
  http::StatusCode _status;
  bool _headersReverted{false};
};

// Response compression layer. Immutable after construction, can be shared by several threads.
class CompressionMiddleware {
 public:
  // Throws std::invalid_argument if 'config' is invalid.
  explicit CompressionMiddleware(CompressionConfig config = {});

  // Negotiates the encoding of 'response' for a request with 'requestHeaders', rewrites its headers and wraps its
  // body. Never throws on header contents.
  [[nodiscard]] CompressedResponse wrap(const HttpHeaders &requestHeaders, HttpResponse response) const;

  [[nodiscard]] const CompressionConfig &config() const noexcept { return *_config; }

  [[nodiscard]] const EncodingSelector &encodingSelector() const noexcept { return _selector; }

 private:
  std::shared_ptr<const CompressionConfig> _config;
  EncodingSelector _selector;
};

}  // namespace respress
