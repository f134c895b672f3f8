#pragma once

#include <brotli/encode.h>

#include <cstddef>
#include <memory>
#include <string_view>

#include "respress/compression-config.hpp"
#include "respress/encoder.hpp"

namespace respress {

class BrotliEncoderContext final : public EncoderContext {
 public:
  BrotliEncoderContext(const CompressionConfig::Brotli &cfg, std::size_t encoderChunkSize);

 private:
  void compress(std::string_view data, Operation operation) override;

  std::unique_ptr<BrotliEncoderState, void (*)(BrotliEncoderState *)> _state;
};

}  // namespace respress
