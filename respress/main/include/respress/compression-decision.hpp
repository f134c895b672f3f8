#pragma once

#include <cstdint>
#include <string_view>

#include "respress/encoding.hpp"

namespace respress {

// Per-response outcome of the negotiation, computed once before the body is read.
struct CompressionDecision {
  enum class SkipReason : std::uint8_t {
    None,  // compression selected
    ContentEncodingPresent,
    ContentRangePresent,
    ExcludedContentType,
    NoAcceptableEncoding,
    BelowMinSize,
  };

  [[nodiscard]] bool compress() const noexcept { return encoding != Encoding::none; }

  bool operator==(const CompressionDecision &) const noexcept = default;

  // Encoding::none means Skip.
  Encoding encoding{Encoding::none};
  SkipReason skipReason{SkipReason::NoAcceptableEncoding};
  // Every emitted data frame is flushed, compressed or not.
  bool forceFlush{false};
  // Vary: Accept-Encoding should be merged in the response headers.
  bool addVary{false};
  // A numeric Content-Length was present in the response headers.
  bool knownLength{false};
};

constexpr std::string_view SkipReasonStr(CompressionDecision::SkipReason reason) {
  switch (reason) {
    case CompressionDecision::SkipReason::None:
      return "none";
    case CompressionDecision::SkipReason::ContentEncodingPresent:
      return "content-encoding present";
    case CompressionDecision::SkipReason::ContentRangePresent:
      return "content-range present";
    case CompressionDecision::SkipReason::ExcludedContentType:
      return "excluded content-type";
    case CompressionDecision::SkipReason::NoAcceptableEncoding:
      return "no acceptable encoding";
    case CompressionDecision::SkipReason::BelowMinSize:
      return "below min size";
    default:
      return "unknown";
  }
}

}  // namespace respress
