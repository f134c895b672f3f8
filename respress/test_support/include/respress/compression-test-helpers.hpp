#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "respress/encoding.hpp"

namespace respress::test {

// Decompress a complete stream of the given codec.
// Throws std::runtime_error if the data is invalid or if the stream is not terminated.
std::string Decompress(Encoding encoding, std::string_view compressed);

// Decompress all bytes decodable from a possibly unterminated stream (for instance up to the last flush point).
// Throws std::runtime_error if the data is invalid.
std::string DecompressAvailable(Encoding encoding, std::string_view compressed);

constexpr bool HasZstdMagic(std::string_view body) {
  // zstd frame magic little endian 0x28 B5 2F FD
  return body.size() >= 4 && static_cast<unsigned char>(body[0]) == 0x28 &&
         static_cast<unsigned char>(body[1]) == 0xB5 && static_cast<unsigned char>(body[2]) == 0x2F &&
         static_cast<unsigned char>(body[3]) == 0xFD;
}

constexpr bool HasGzipMagic(std::string_view body) {
  return body.size() >= 2 && static_cast<unsigned char>(body[0]) == 0x1F &&
         static_cast<unsigned char>(body[1]) == 0x8B;
}

// Compressible text-like payload of exactly 'size' bytes.
std::string MakePatternedPayload(std::size_t size);

// Incompressible payload of exactly 'size' bytes (fixed seed, deterministic).
std::string MakeRandomPayload(std::size_t size);

}  // namespace respress::test
