#include "respress/content-type-classifier.hpp"

#include <algorithm>
#include <string_view>

#include "respress/compression-config.hpp"
#include "respress/http-constants.hpp"
#include "respress/string-equal-ignore-case.hpp"
#include "respress/string-trim.hpp"

namespace respress {

std::string_view MediaType(std::string_view contentType) noexcept {
  const auto semiColonPos = contentType.find(';');
  if (semiColonPos != std::string_view::npos) {
    contentType.remove_suffix(contentType.size() - semiColonPos);
  }
  return TrimOws(contentType);
}

bool IsCompressionExcludedContentType(std::string_view contentType) noexcept {
  const std::string_view mediaType = MediaType(contentType);
  if (StartsWithCaseInsensitive(mediaType, http::ContentTypeImagePrefix)) {
    return !StartsWithCaseInsensitive(mediaType, http::ContentTypeImageSvg);
  }
  if (StartsWithCaseInsensitive(mediaType, http::ContentTypeApplicationGrpc)) {
    return !StartsWithCaseInsensitive(mediaType, http::ContentTypeApplicationGrpcWeb);
  }
  return false;
}

bool IsFlushContentType(std::string_view contentType, const CompressionConfig &config) noexcept {
  const std::string_view mediaType = MediaType(contentType);
  if (mediaType.empty()) {
    return false;
  }
  return std::ranges::any_of(config.flushContentTypes, [mediaType](std::string_view flushType) {
    return StartsWithCaseInsensitive(mediaType, flushType);
  });
}

}  // namespace respress
