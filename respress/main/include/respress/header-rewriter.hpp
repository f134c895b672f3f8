#pragma once

#include <optional>
#include <string_view>

#include "respress/compression-decision.hpp"
#include "respress/http-headers.hpp"

namespace respress {

// Adds Accept-Encoding to Vary, unless a Vary field already lists it (case-insensitively) or '*'.
// The token is appended to the first Vary field with ", ", or a new Vary field is created.
void MergeVaryAcceptEncoding(HttpHeaders &headers);

// Applies the header mutations of 'decision':
//  - compress: set Content-Encoding, remove Content-Length and Accept-Ranges
//  - Vary: Accept-Encoding merged when decision.addVary (in both cases)
void ApplyCompressionHeaders(HttpHeaders &headers, const CompressionDecision &decision);

// Delayed commit fallback, when a buffered body of unknown length ends below the compression threshold:
// removes Content-Encoding and restores the Accept-Ranges value removed by ApplyCompressionHeaders, if any.
// The length framing of the inner response (no Content-Length) is left as is. Vary is kept.
void RevertCompressionHeaders(HttpHeaders &headers, std::optional<std::string_view> acceptRanges);

}  // namespace respress
