#pragma once

#include <memory>

#include "respress/http-body.hpp"
#include "respress/http-constants.hpp"
#include "respress/http-headers.hpp"

namespace respress {

// Response as produced by the inner service, before compression.
// A null body is treated as an empty body.
struct HttpResponse {
  http::StatusCode status{http::StatusCodeOK};
  HttpHeaders headers;
  std::unique_ptr<HttpBody> body;
};

}  // namespace respress
