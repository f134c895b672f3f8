#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "respress/accept-encoding-negotiation.hpp"
#include "respress/compression-config.hpp"
#include "respress/compression-decision.hpp"
#include "respress/http-headers.hpp"

namespace respress {

// Parse a Content-Length value. Returns std::nullopt if it is not a plain decimal number.
[[nodiscard]] std::optional<std::uint64_t> ParseContentLength(std::string_view value) noexcept;

// Compute the compression decision of a response from the request and (inner) response headers.
// Never fails: malformed header entries are individually ignored, the worst outcome is Skip.
// Rules, in order:
//  1. Content-Encoding already set -> Skip
//  2. Content-Range present -> Skip
//  3. Excluded Content-Type (see IsCompressionExcludedContentType) -> Skip
//  4. No acceptable enabled codec in Accept-Encoding -> Skip
//  5. Numeric Content-Length below config.minBytes -> Skip (Vary still requested)
//  6. Otherwise compress with the codec chosen by 'selector'
// The flush flag is computed independently of the outcome.
[[nodiscard]] CompressionDecision NegotiateCompression(const HttpHeaders &requestHeaders,
                                                       const HttpHeaders &responseHeaders,
                                                       const CompressionConfig &config,
                                                       const EncodingSelector &selector);

}  // namespace respress
