#pragma once

#include <zstd.h>

#include <cstddef>
#include <memory>
#include <string_view>

#include "respress/compression-config.hpp"
#include "respress/encoder.hpp"

namespace respress {

namespace details {

struct ZstdContextRAII {
  // Throws std::bad_alloc if the context cannot be created, std::invalid_argument if a parameter is rejected.
  ZstdContextRAII(int level, int windowLog);

  std::unique_ptr<ZSTD_CCtx, void (*)(ZSTD_CCtx *)> ctx;
};

}  // namespace details

class ZstdEncoderContext final : public EncoderContext {
 public:
  ZstdEncoderContext(const CompressionConfig::Zstd &cfg, std::size_t encoderChunkSize);

 private:
  void compress(std::string_view data, Operation operation) override;

  details::ZstdContextRAII _zs;
};

}  // namespace respress
