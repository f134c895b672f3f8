#pragma once

#include <cstddef>
#include <string_view>

#include "respress/compression-config.hpp"
#include "respress/encoder.hpp"
#include "respress/zlib-stream-raii.hpp"

namespace respress {

// Streaming gzip compressor.
class ZlibEncoderContext final : public EncoderContext {
 public:
  ZlibEncoderContext(const CompressionConfig::Zlib &cfg, std::size_t encoderChunkSize);

 private:
  void compress(std::string_view data, Operation operation) override;

  ZStreamRAII _zs;
};

}  // namespace respress
