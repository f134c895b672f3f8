#pragma once

#include <string_view>

#include "respress/compression-config.hpp"

namespace respress {

// Media type part of a Content-Type value: parameters (after ';') and surrounding whitespace removed.
// "text/html; charset=utf-8" -> "text/html"
[[nodiscard]] std::string_view MediaType(std::string_view contentType) noexcept;

// Returns true for content types that are never compressed because they are already compressed or framed:
//  - image/* except image/svg+xml
//  - application/grpc* except application/grpc-web*
// Comparison is case-insensitive and ignores parameters. An empty content type is not excluded.
[[nodiscard]] bool IsCompressionExcludedContentType(std::string_view contentType) noexcept;

// Returns true if the media type starts with one of config.flushContentTypes (case-insensitive).
[[nodiscard]] bool IsFlushContentType(std::string_view contentType, const CompressionConfig &config) noexcept;

}  // namespace respress
