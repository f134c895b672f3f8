#pragma once

#include <cstdint>
#include <string_view>

namespace respress::http {

// HTTP header field names are case-insensitive (RFC 9110 §5.1). They are stored here in their
// conventional canonical form for emission; lookups must stay case-insensitive.

using StatusCode = std::uint16_t;

inline constexpr StatusCode StatusCodeOK = 200;

// Standard Header Field Names
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view AcceptRanges = "Accept-Ranges";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentRange = "Content-Range";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Vary = "Vary";

// Reverse-proxy buffering control (nginx convention): "no" asks for immediate delivery.
inline constexpr std::string_view XAccelBuffering = "X-Accel-Buffering";


// Content codings
inline constexpr std::string_view identity = "identity";
inline constexpr std::string_view gzip = "gzip";
inline constexpr std::string_view xgzip = "x-gzip";  // RFC 9110 §8.4.1.3 alias of gzip
inline constexpr std::string_view zstd = "zstd";     // RFC 8878
inline constexpr std::string_view br = "br";         // RFC 7932 (Brotli)
inline constexpr std::string_view brotli = "brotli";  // non-standard alias sent by some clients

// Common header values (lowercase tokens, compared case-insensitively)
inline constexpr std::string_view no = "no";
inline constexpr std::string_view wildcard = "*";

// Content types
inline constexpr std::string_view ContentTypeTextEventStream = "text/event-stream";
inline constexpr std::string_view ContentTypeApplicationGrpc = "application/grpc";
inline constexpr std::string_view ContentTypeApplicationGrpcWeb = "application/grpc-web";
inline constexpr std::string_view ContentTypeImagePrefix = "image/";
inline constexpr std::string_view ContentTypeImageSvg = "image/svg+xml";

}  // namespace respress::http
