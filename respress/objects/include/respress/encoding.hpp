#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>

#include "respress/features.hpp"
#include "respress/http-constants.hpp"

namespace respress {

// Ordered from most to least preferred: this is the server preference used as tie-break
// when no preferredFormats are configured.
enum class Encoding : std::uint8_t {
  zstd,
  br,
  gzip,
  none,  // should be last
};

inline constexpr std::underlying_type_t<Encoding> kNbContentEncodings =
    static_cast<std::underlying_type_t<Encoding>>(Encoding::none) + 1;

// Number of real compression codecs (all values before Encoding::none).
inline constexpr std::underlying_type_t<Encoding> kNbCodecs = kNbContentEncodings - 1;

// Get string representation of encoding for use in HTTP headers.
constexpr std::string_view GetEncodingStr(Encoding enc) {
  constexpr std::string_view kEncodingStrs[kNbContentEncodings] = {
      http::zstd,
      http::br,
      http::gzip,
      http::identity,
  };
  if (static_cast<std::underlying_type_t<Encoding>>(enc) >= kNbContentEncodings) [[unlikely]] {
    return "unknown";
  }
  return kEncodingStrs[static_cast<std::underlying_type_t<Encoding>>(enc)];
}

// Check if encoding is compiled in this build.
constexpr bool IsEncodingEnabled(Encoding enc) {
  constexpr bool kEncodingEnabled[kNbContentEncodings] = {
      zstdEnabled(),
      brotliEnabled(),
      zlibEnabled(),
      true,
  };
  if (static_cast<std::underlying_type_t<Encoding>>(enc) >= kNbContentEncodings) [[unlikely]] {
    return false;
  }
  return kEncodingEnabled[static_cast<std::underlying_type_t<Encoding>>(enc)];
}

}  // namespace respress
