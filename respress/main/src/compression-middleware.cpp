#include "respress/compression-middleware.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "respress/body-frame.hpp"
#include "respress/compression-body.hpp"
#include "respress/compression-config.hpp"
#include "respress/compression-decision.hpp"
#include "respress/encoding-negotiator.hpp"
#include "respress/header-rewriter.hpp"
#include "respress/http-constants.hpp"
#include "respress/http-headers.hpp"
#include "respress/http-response.hpp"
#include "respress/log.hpp"

namespace respress {

CompressedResponse::CompressedResponse(http::StatusCode status, HttpHeaders headers,
                                       const CompressionDecision &decision, CompressionBody body,
                                       std::optional<std::string> removedAcceptRanges)
    : _headers(std::move(headers)),
      _body(std::move(body)),
      _decision(decision),
      _removedAcceptRanges(std::move(removedAcceptRanges)),
      _status(status) {}

BodyFrame CompressedResponse::poll() {
  BodyFrame frame = _body.pollFrame();
  if (!_headersReverted) {
    if (_body.identityFallbackSize()) {
      RevertCompressionHeaders(_headers, _removedAcceptRanges);
      _headersReverted = true;
      _removedAcceptRanges.reset();
    }
  }
  return frame;
}

CompressionMiddleware::CompressionMiddleware(CompressionConfig config) {
  config.validate();
  _config = std::make_shared<const CompressionConfig>(std::move(config));
  _selector = EncodingSelector(*_config);
  log::debug("compression: {} codec(s) enabled, min size {} bytes", _selector.preferenceOrdered().size(),
             _config->minBytes);
}

CompressedResponse CompressionMiddleware::wrap(const HttpHeaders &requestHeaders, HttpResponse response) const {
  const CompressionDecision decision = NegotiateCompression(requestHeaders, response.headers, *_config, _selector);
  std::optional<std::string> removedAcceptRanges;
  if (decision.compress() && !decision.knownLength) {
    const auto acceptRanges = response.headers.headerValue(http::AcceptRanges);
    if (acceptRanges) {
      removedAcceptRanges.emplace(*acceptRanges);
    }
  }
  ApplyCompressionHeaders(response.headers, decision);
  CompressionBody body(std::move(response.body), decision, _config);
  return {response.status, std::move(response.headers), decision, std::move(body), std::move(removedAcceptRanges)};
}

}  // namespace respress
