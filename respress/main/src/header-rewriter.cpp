#include "respress/header-rewriter.hpp"

#include <optional>
#include <ranges>
#include <string_view>

#include "respress/compression-decision.hpp"
#include "respress/encoding.hpp"
#include "respress/http-constants.hpp"
#include "respress/http-headers.hpp"
#include "respress/string-equal-ignore-case.hpp"
#include "respress/string-trim.hpp"

namespace respress {

namespace {

bool VaryCoversAcceptEncoding(std::string_view varyValue) {
  for (auto part : varyValue | std::views::split(',')) {
    const std::string_view token = TrimOws(std::string_view(part.begin(), part.end()));
    if (token == http::wildcard || CaseInsensitiveEqual(token, http::AcceptEncoding)) {
      return true;
    }
  }
  return false;
}

}  // namespace

void MergeVaryAcceptEncoding(HttpHeaders &headers) {
  for (const auto &field : headers) {
    if (CaseInsensitiveEqual(field.name, http::Vary) && VaryCoversAcceptEncoding(field.value)) {
      return;
    }
  }
  headers.appendHeaderValue(http::Vary, http::AcceptEncoding);
}

void ApplyCompressionHeaders(HttpHeaders &headers, const CompressionDecision &decision) {
  if (decision.compress()) {
    headers.header(http::ContentEncoding, GetEncodingStr(decision.encoding));
    headers.removeHeader(http::ContentLength);
    headers.removeHeader(http::AcceptRanges);
  }
  if (decision.addVary) {
    MergeVaryAcceptEncoding(headers);
  }
}

void RevertCompressionHeaders(HttpHeaders &headers, std::optional<std::string_view> acceptRanges) {
  headers.removeHeader(http::ContentEncoding);
  if (acceptRanges) {
    headers.header(http::AcceptRanges, *acceptRanges);
  }
}

}  // namespace respress
