#include "respress/zstd-encoder.hpp"

#include <zstd.h>

#include <cstddef>
#include <format>
#include <new>
#include <stdexcept>
#include <string_view>

#include "respress/compression-config.hpp"
#include "respress/encoding.hpp"

namespace respress {

namespace details {

namespace {
void ZSTD_freeWrapper(ZSTD_CCtx *pCtx) { (void)ZSTD_freeCCtx(pCtx); }

void SetParameter(ZSTD_CCtx *pCtx, ZSTD_cParameter param, int value, std::string_view name) {
  const std::size_t ret = ZSTD_CCtx_setParameter(pCtx, param, value);
  if (ZSTD_isError(ret) != 0U) [[unlikely]] {
    throw std::invalid_argument(std::format("zstd: invalid {} {}: {}", name, value, ZSTD_getErrorName(ret)));
  }
}
}  // namespace

ZstdContextRAII::ZstdContextRAII(int level, int windowLog) : ctx(ZSTD_createCCtx(), &ZSTD_freeWrapper) {
  if (!ctx) [[unlikely]] {
    throw std::bad_alloc();
  }
  SetParameter(ctx.get(), ZSTD_c_compressionLevel, level, "compression level");
  if (windowLog > 0) {
    SetParameter(ctx.get(), ZSTD_c_windowLog, windowLog, "window log");
  }
}

}  // namespace details

ZstdEncoderContext::ZstdEncoderContext(const CompressionConfig::Zstd &cfg, std::size_t encoderChunkSize)
    : EncoderContext(Encoding::zstd, encoderChunkSize), _zs(cfg.compressionLevel, cfg.windowLog) {}

void ZstdEncoderContext::compress(std::string_view data, Operation operation) {
  ZSTD_inBuffer inBuf{data.data(), data.size(), 0};

  ZSTD_EndDirective mode = ZSTD_e_continue;
  if (operation == Operation::Flush) {
    mode = ZSTD_e_flush;
  } else if (operation == Operation::Finish) {
    mode = ZSTD_e_end;
  }

  for (;;) {
    _buf.ensureAvailableCapacityExponential(_chunkSize);

    // Output window starting at the current end of _buf: ZSTD_outBuffer.pos is relative to dst, so always 0 here.
    ZSTD_outBuffer outBuf{_buf.data() + _buf.size(), _buf.availableCapacity(), 0};

    const std::size_t ret = ZSTD_compressStream2(_zs.ctx.get(), &outBuf, &inBuf, mode);
    if (ZSTD_isError(ret) != 0U) [[unlikely]] {
      throw std::runtime_error(std::format("ZSTD_compressStream2 error: {}", ZSTD_getErrorName(ret)));
    }

    _buf.addSize(outBuf.pos);

    if (mode == ZSTD_e_continue) {
      if (inBuf.pos == inBuf.size) {
        break;
      }
    } else if (ret == 0) {
      // flush / end: 0 means nothing remains buffered inside the context.
      break;
    }
  }
}

}  // namespace respress
