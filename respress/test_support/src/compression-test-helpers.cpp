#include "respress/compression-test-helpers.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>

#include "respress/encoding.hpp"

#ifdef RESPRESS_ENABLE_ZLIB
#include <zlib.h>

#include "respress/zlib-stream-raii.hpp"
#endif

#ifdef RESPRESS_ENABLE_BROTLI
#include <brotli/decode.h>

#include <memory>
#include <new>
#endif

#ifdef RESPRESS_ENABLE_ZSTD
#include <zstd.h>

#include <memory>
#include <new>
#endif

namespace respress::test {

namespace {

constexpr std::size_t kOutChunkSize = 16UL * 1024UL;

#ifdef RESPRESS_ENABLE_ZLIB
bool GzipDecompress(std::string_view compressed, std::string &out) {
  ZStreamRAII zs(ZStreamRAII::Mode::inflate);
  zs.stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
  zs.stream.avail_in = static_cast<uInt>(compressed.size());
  for (;;) {
    const auto oldSize = out.size();
    out.resize(oldSize + kOutChunkSize);
    zs.stream.next_out = reinterpret_cast<Bytef *>(out.data() + oldSize);
    zs.stream.avail_out = static_cast<uInt>(kOutChunkSize);
    const auto ret = inflate(&zs.stream, Z_NO_FLUSH);
    out.resize(oldSize + (kOutChunkSize - zs.stream.avail_out));
    if (ret == Z_STREAM_END) {
      return true;
    }
    if (ret == Z_BUF_ERROR || (ret == Z_OK && zs.stream.avail_in == 0 && zs.stream.avail_out != 0)) {
      return false;  // all available input consumed, stream not terminated
    }
    if (ret != Z_OK) {
      throw std::runtime_error(std::format("inflate error {}", ret));
    }
  }
}
#endif

#ifdef RESPRESS_ENABLE_BROTLI
bool BrotliDecompress(std::string_view compressed, std::string &out) {
  std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)> state(
      BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance);
  if (!state) {
    throw std::bad_alloc();
  }
  const auto *nextIn = reinterpret_cast<const uint8_t *>(compressed.data());
  std::size_t availIn = compressed.size();
  for (;;) {
    const auto oldSize = out.size();
    out.resize(oldSize + kOutChunkSize);
    auto *nextOut = reinterpret_cast<uint8_t *>(out.data() + oldSize);
    std::size_t availOut = kOutChunkSize;
    const auto res = BrotliDecoderDecompressStream(state.get(), &availIn, &nextIn, &availOut, &nextOut, nullptr);
    out.resize(oldSize + (kOutChunkSize - availOut));
    switch (res) {
      case BROTLI_DECODER_RESULT_SUCCESS:
        return true;
      case BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT:
        return false;
      case BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT:
        break;
      default:
        throw std::runtime_error(std::format("BrotliDecoderDecompressStream failed with error code {}",
                                             static_cast<int>(BrotliDecoderGetErrorCode(state.get()))));
    }
  }
}
#endif

#ifdef RESPRESS_ENABLE_ZSTD
bool ZstdDecompress(std::string_view compressed, std::string &out) {
  std::unique_ptr<ZSTD_DStream, decltype(&ZSTD_freeDStream)> stream(ZSTD_createDStream(), &ZSTD_freeDStream);
  if (!stream) {
    throw std::bad_alloc();
  }
  ZSTD_inBuffer in{compressed.data(), compressed.size(), 0};
  std::size_t lastRet = 1;
  for (;;) {
    const auto oldSize = out.size();
    out.resize(oldSize + kOutChunkSize);
    ZSTD_outBuffer output{out.data() + oldSize, kOutChunkSize, 0};
    lastRet = ZSTD_decompressStream(stream.get(), &output, &in);
    if (ZSTD_isError(lastRet) != 0U) {
      throw std::runtime_error(std::format("ZSTD_decompressStream failed with error {}", ZSTD_getErrorName(lastRet)));
    }
    out.resize(oldSize + output.pos);
    if (in.pos == in.size && output.pos < output.size) {
      break;
    }
  }
  // 0 means a frame was completely decoded and flushed.
  return lastRet == 0;
}
#endif

bool DecompressImpl(Encoding encoding, std::string_view compressed, std::string &out) {
  switch (encoding) {
#ifdef RESPRESS_ENABLE_ZLIB
    case Encoding::gzip:
      return GzipDecompress(compressed, out);
#endif
#ifdef RESPRESS_ENABLE_BROTLI
    case Encoding::br:
      return BrotliDecompress(compressed, out);
#endif
#ifdef RESPRESS_ENABLE_ZSTD
    case Encoding::zstd:
      return ZstdDecompress(compressed, out);
#endif
    default:
      throw std::invalid_argument(std::format("No decoder available for '{}'", GetEncodingStr(encoding)));
  }
}

}  // namespace

std::string Decompress(Encoding encoding, std::string_view compressed) {
  std::string out;
  if (!DecompressImpl(encoding, compressed, out)) {
    throw std::runtime_error(std::format("Truncated {} stream", GetEncodingStr(encoding)));
  }
  return out;
}

std::string DecompressAvailable(Encoding encoding, std::string_view compressed) {
  std::string out;
  static_cast<void>(DecompressImpl(encoding, compressed, out));
  return out;
}

std::string MakePatternedPayload(std::size_t size) {
  static constexpr std::string_view kWords[] = {"alpha ", "beta ", "gamma ", "delta ", "epsilon\n", "zeta, "};
  std::string payload;
  payload.reserve(size);
  for (std::size_t pos = 0; payload.size() < size; ++pos) {
    payload.append(kWords[(pos * 7U + pos / 5U) % std::size(kWords)]);
  }
  payload.resize(size);
  return payload;
}

std::string MakeRandomPayload(std::size_t size) {
  std::string payload(size, '\0');
  std::mt19937_64 rng{123456789ULL};
  std::uniform_int_distribution<int> dist(0, 255);
  for (auto &ch : payload) {
    ch = static_cast<char>(dist(rng));
  }
  return payload;
}

}  // namespace respress::test
