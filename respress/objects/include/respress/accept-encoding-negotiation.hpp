#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "respress/compression-config.hpp"
#include "respress/encoding.hpp"
#include "respress/fixedcapacityvector.hpp"

namespace respress {

// One entry of an Accept-Encoding list.
struct AcceptEncodingEntry {
  // Canonical coding token: "zstd", "br", "gzip", "identity" or "*" (aliases are resolved).
  std::string_view coding;
  double quality{1.0};

  bool operator==(const AcceptEncodingEntry &) const noexcept = default;
};

// Parse an Accept-Encoding header value per RFC 9110 section 12.5.3.
//  - Split on commas; each token may have optional parameters separated by ';'
//  - Case-insensitive token matching, 'x-gzip' is read as gzip and 'brotli' as br
//  - q parameter in [0, 1] (values above 1 are clamped), default 1.0
//  - Entries with unknown codings, empty names or an unparseable q value are dropped individually
// Returned codings point to static storage, they do not reference 'acceptEncoding'.
[[nodiscard]] std::vector<AcceptEncodingEntry> ParseAcceptEncoding(std::string_view acceptEncoding);

class EncodingSelector {
 public:
  // All codecs compiled in, in enumeration order.
  EncodingSelector();

  explicit EncodingSelector(const CompressionConfig &compressionConfig);

  // Select the best enabled codec for the given Accept-Encoding value.
  //  - Ignore encodings with q=0 (explicit q=0 also wins over '*')
  //  - Prefer highest q; tie -> server preference (based on ordered values 'preferredFormats')
  //  - Wildcard '*' applies its q to any enabled codec not explicitly listed
  //  - identity never selects a codec
  // Returns Encoding::none if no enabled codec is acceptable.
  [[nodiscard]] Encoding negotiateAcceptEncoding(std::string_view acceptEncoding) const;

  // Enabled codecs, most preferred first.
  [[nodiscard]] std::span<const Encoding> preferenceOrdered() const noexcept {
    return {_preferenceOrdered.data(), _preferenceOrdered.size()};
  }

 private:
  void initDefault();

  FixedCapacityVector<Encoding, kNbContentEncodings, amc::vec::UncheckedGrowingPolicy> _preferenceOrdered;
  // -1 for codecs that are not enabled.
  int8_t _serverPrefIndex[kNbContentEncodings];
};

}  // namespace respress
