#include "respress/encoding-negotiator.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "respress/accept-encoding-negotiation.hpp"
#include "respress/compression-config.hpp"
#include "respress/compression-decision.hpp"
#include "respress/content-type-classifier.hpp"
#include "respress/encoding.hpp"
#include "respress/http-constants.hpp"
#include "respress/http-headers.hpp"
#include "respress/log.hpp"
#include "respress/string-equal-ignore-case.hpp"
#include "respress/string-trim.hpp"

namespace respress {

namespace {

bool HasFlushHeader(const HttpHeaders &headers, const CompressionConfig &config) {
  for (const auto &name : config.flushHeaderNames) {
    const auto value = headers.headerValue(name);
    if (value && CaseInsensitiveEqual(TrimOws(*value), http::no)) {
      return true;
    }
  }
  return false;
}

CompressionDecision Decide(const HttpHeaders &requestHeaders, const HttpHeaders &responseHeaders,
                           const CompressionConfig &config, const EncodingSelector &selector) {
  CompressionDecision decision;
  const std::string_view contentType = responseHeaders.headerValueOrEmpty(http::ContentType);

  decision.forceFlush = HasFlushHeader(requestHeaders, config) || HasFlushHeader(responseHeaders, config) ||
                        IsFlushContentType(contentType, config);

  const auto contentLength = responseHeaders.headerValue(http::ContentLength);
  const auto length = contentLength ? ParseContentLength(*contentLength) : std::nullopt;
  decision.knownLength = length.has_value();

  if (responseHeaders.contains(http::ContentEncoding)) {
    decision.skipReason = CompressionDecision::SkipReason::ContentEncodingPresent;
    return decision;
  }
  if (responseHeaders.contains(http::ContentRange)) {
    decision.skipReason = CompressionDecision::SkipReason::ContentRangePresent;
    return decision;
  }
  if (IsCompressionExcludedContentType(contentType)) {
    decision.skipReason = CompressionDecision::SkipReason::ExcludedContentType;
    return decision;
  }

  const std::string acceptEncoding = requestHeaders.combinedValue(http::AcceptEncoding);
  const Encoding chosen = selector.negotiateAcceptEncoding(acceptEncoding);
  if (chosen == Encoding::none) {
    decision.skipReason = CompressionDecision::SkipReason::NoAcceptableEncoding;
    return decision;
  }

  // From here, the representation depends on Accept-Encoding.
  decision.addVary = config.addVaryHeader;

  if (length && *length < config.minBytes) {
    decision.skipReason = CompressionDecision::SkipReason::BelowMinSize;
    return decision;
  }

  decision.encoding = chosen;
  decision.skipReason = CompressionDecision::SkipReason::None;
  return decision;
}

}  // namespace

std::optional<std::uint64_t> ParseContentLength(std::string_view value) noexcept {
  value = TrimOws(value);
  if (value.empty() || value.front() < '0' || value.front() > '9') {
    return std::nullopt;
  }
  std::uint64_t length = 0;
  const char *end = value.data() + value.size();
  const auto [ptr, errc] = std::from_chars(value.data(), end, length);
  if (errc != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return length;
}

CompressionDecision NegotiateCompression(const HttpHeaders &requestHeaders, const HttpHeaders &responseHeaders,
                                         const CompressionConfig &config, const EncodingSelector &selector) {
  const CompressionDecision decision = Decide(requestHeaders, responseHeaders, config, selector);
  if (decision.compress()) {
    log::debug("compression: selected {} (flush: {}, known length: {})", GetEncodingStr(decision.encoding),
               decision.forceFlush, decision.knownLength);
  } else {
    log::debug("compression: skipped, {} (flush: {})", SkipReasonStr(decision.skipReason), decision.forceFlush);
  }
  return decision;
}

}  // namespace respress
