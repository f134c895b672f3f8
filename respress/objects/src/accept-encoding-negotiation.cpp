#include "respress/accept-encoding-negotiation.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <ranges>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

#include "respress/compression-config.hpp"
#include "respress/encoding.hpp"
#include "respress/http-constants.hpp"
#include "respress/string-equal-ignore-case.hpp"
#include "respress/string-trim.hpp"

namespace respress {
namespace {

struct KnownCoding {
  std::string_view name;
  std::string_view canonical;
};

constexpr std::array kKnownCodings = {
    KnownCoding{http::zstd, http::zstd},       KnownCoding{http::br, http::br},
    KnownCoding{http::brotli, http::br},       KnownCoding{http::gzip, http::gzip},
    KnownCoding{http::xgzip, http::gzip},      KnownCoding{http::identity, http::identity},
    KnownCoding{http::wildcard, http::wildcard},
};

constexpr std::string_view CanonicalCoding(std::string_view name) {
  for (const auto &known : kKnownCodings) {
    if (CaseInsensitiveEqual(name, known.name)) {
      return known.canonical;
    }
  }
  return {};
}

// Parse the parameters of an entry (portion after the first ';').
// Returns false if a q parameter is present but invalid. Other parameters are ignored.
bool ParseQuality(std::string_view params, double &quality) {
  for (auto part : params | std::views::split(';')) {
    std::string_view param(part.begin(), part.end());
    const auto eqPos = param.find('=');
    if (eqPos == std::string_view::npos || !CaseInsensitiveEqual(TrimOws(param.substr(0, eqPos)), "q")) {
      continue;
    }
    const std::string_view val = TrimOws(param.substr(eqPos + 1));
    if (val.empty()) {
      return false;
    }
    const char *begin = val.data();
    const char *end = begin + val.size();
    double qualityValue = 0.0;
    const auto fcRes = std::from_chars(begin, end, qualityValue);
    if (fcRes.ec != std::errc() || fcRes.ptr != end || std::isnan(qualityValue)) {
      return false;
    }
    quality = std::clamp(qualityValue, 0.0, 1.0);
  }
  return true;
}

}  // namespace

std::vector<AcceptEncodingEntry> ParseAcceptEncoding(std::string_view acceptEncoding) {
  std::vector<AcceptEncodingEntry> entries;
  for (auto part : acceptEncoding | std::views::split(',')) {
    const std::string_view raw = TrimOws(std::string_view(part.begin(), part.end()));
    if (raw.empty()) {
      continue;
    }
    const auto scPos = raw.find(';');
    const std::string_view name = TrimOws(raw.substr(0, scPos));
    const std::string_view coding = CanonicalCoding(name);
    if (coding.empty()) {
      continue;
    }
    AcceptEncodingEntry entry{coding, 1.0};
    if (scPos != std::string_view::npos && !ParseQuality(raw.substr(scPos + 1), entry.quality)) {
      continue;
    }
    entries.push_back(entry);
  }
  return entries;
}

EncodingSelector::EncodingSelector() { initDefault(); }

void EncodingSelector::initDefault() {
  std::ranges::fill(_serverPrefIndex, -1);
  int8_t next = 0;
  for (std::underlying_type_t<Encoding> pos = 0; pos < kNbCodecs; ++pos) {
    const auto enc = static_cast<Encoding>(pos);
    if (IsEncodingEnabled(enc)) {
      _serverPrefIndex[pos] = next++;
      _preferenceOrdered.push_back(enc);
    }
  }
}

EncodingSelector::EncodingSelector(const CompressionConfig &compressionConfig) {
  if (compressionConfig.preferredFormats.empty()) {
    initDefault();
    return;
  }
  std::ranges::fill(_serverPrefIndex, -1);
  int8_t next = 0;
  for (Encoding enc : compressionConfig.preferredFormats) {
    if (enc == Encoding::none || !IsEncodingEnabled(enc)) {
      continue;
    }
    const auto idx = static_cast<std::underlying_type_t<Encoding>>(enc);
    if (_serverPrefIndex[idx] == -1) {  // dedupe
      _serverPrefIndex[idx] = next++;
      _preferenceOrdered.push_back(enc);
    }
  }
  // Codecs absent from preferredFormats are disabled.
}

Encoding EncodingSelector::negotiateAcceptEncoding(std::string_view acceptEncoding) const {
  Encoding chosen = Encoding::none;
  if (TrimOws(acceptEncoding).empty() || _preferenceOrdered.empty()) {
    return chosen;
  }

  const auto entries = ParseAcceptEncoding(acceptEncoding);

  // Quality of each codec (first explicit occurrence wins), negative if not listed.
  double explicitQ[kNbCodecs];
  std::ranges::fill(explicitQ, -1.0);
  double wildcardQ = -1.0;
  for (const auto &entry : entries) {
    if (entry.coding == http::wildcard) {
      if (wildcardQ < 0.0) {
        wildcardQ = entry.quality;
      }
      continue;
    }
    for (std::underlying_type_t<Encoding> pos = 0; pos < kNbCodecs; ++pos) {
      if (entry.coding == GetEncodingStr(static_cast<Encoding>(pos))) {
        if (explicitQ[pos] < 0.0) {
          explicitQ[pos] = entry.quality;
        }
        break;
      }
    }
  }

  double bestQ = 0.0;
  int bestServerPreferenceIndex = std::numeric_limits<int>::max();
  for (Encoding enc : _preferenceOrdered) {
    const auto idx = static_cast<std::underlying_type_t<Encoding>>(enc);
    const double quality = explicitQ[idx] >= 0.0 ? explicitQ[idx] : wildcardQ;
    if (quality <= 0.0) {
      continue;  // q=0 means "not acceptable"
    }
    if (quality > bestQ || (quality == bestQ && _serverPrefIndex[idx] < bestServerPreferenceIndex)) {
      bestQ = quality;
      bestServerPreferenceIndex = _serverPrefIndex[idx];
      chosen = enc;
    }
  }
  return chosen;
}

}  // namespace respress
