// =============================================================================
// srf - Compression Adapter Implementation
// =============================================================================

#include "srf/io/compression_adapter.h"

#include <algorithm>
#include <string>

#include <fmt/format.h>
#include <zstd.h>

#include "srf/common/logger.h"

namespace srf::io {

namespace {

/// @brief Upper bound for the initial output allocation taken from a frame's
///        declared content size.
constexpr std::size_t kMaxInitialOutputSize = 64 * 1024 * 1024;

void setParameter(ZSTD_CCtx* cctx, ZSTD_cParameter param, int value, std::string_view label) {
    const std::size_t rc = ZSTD_CCtx_setParameter(cctx, param, value);
    if (ZSTD_isError(rc)) {
        throw UsageError(fmt::format("zstd rejected {}={}: {}", label, value, ZSTD_getErrorName(rc)));
    }
}

std::size_t initialOutputSize(ByteSpan frame) {
    const unsigned long long declared = ZSTD_getFrameContentSize(frame.data(), frame.size());
    if (declared == ZSTD_CONTENTSIZE_ERROR || declared == ZSTD_CONTENTSIZE_UNKNOWN) {
        return ZSTD_DStreamOutSize();
    }
    return static_cast<std::size_t>(
        std::clamp<unsigned long long>(declared, 1, kMaxInitialOutputSize));
}

}  // namespace

// =============================================================================
// ZstdAdapter Implementation
// =============================================================================

void ZstdAdapter::CCtxDeleter::operator()(ZSTD_CCtx_s* ctx) const noexcept {
    ZSTD_freeCCtx(ctx);
}

void ZstdAdapter::DCtxDeleter::operator()(ZSTD_DCtx_s* ctx) const noexcept {
    ZSTD_freeDCtx(ctx);
}

ZstdAdapter::ZstdAdapter(CompressionConfig config)
    : config_(config), cctx_(ZSTD_createCCtx()), dctx_(ZSTD_createDCtx()) {
    unwrapOrThrow(config_.validate());

    if (!cctx_ || !dctx_) {
        throw CompressionError(ErrorCode::kCompressionFailed, "Failed to create zstd context");
    }

    setParameter(cctx_.get(), ZSTD_c_compressionLevel, config_.level, "compression level");
    setParameter(cctx_.get(), ZSTD_c_checksumFlag, config_.checksum ? 1 : 0, "checksum flag");
    if (config_.workers > 0) {
        // Fails on a zstd build without multithreading support
        setParameter(cctx_.get(), ZSTD_c_nbWorkers, config_.workers, "worker count");
    }

    SRF_LOG_DEBUG("zstd adapter created: level={}, workers={}, checksum={}",
                  config_.level, config_.workers, config_.checksum);
}

ZstdAdapter::~ZstdAdapter() = default;

ZstdAdapter::ZstdAdapter(ZstdAdapter&&) noexcept = default;
ZstdAdapter& ZstdAdapter::operator=(ZstdAdapter&&) noexcept = default;

Result<ByteBuffer> ZstdAdapter::compress(ByteSpan data) {
    if (const std::size_t rc = ZSTD_CCtx_reset(cctx_.get(), ZSTD_reset_session_only);
        ZSTD_isError(rc)) {
        return makeError<ByteBuffer>(
            ErrorCode::kCompressionFailed,
            "Zstd context reset failed: " + std::string(ZSTD_getErrorName(rc)));
    }

    ByteBuffer compressed(ZSTD_compressBound(data.size()));
    const std::size_t compressedSize = ZSTD_compress2(
        cctx_.get(),
        compressed.data(), compressed.size(),
        data.data(), data.size());

    if (ZSTD_isError(compressedSize)) {
        return makeError<ByteBuffer>(
            ErrorCode::kCompressionFailed,
            "Zstd compression failed: " + std::string(ZSTD_getErrorName(compressedSize)));
    }

    compressed.resize(compressedSize);
    return compressed;
}

Result<ByteBuffer> ZstdAdapter::decompress(ByteSpan frame) {
    if (frame.empty()) {
        return ByteBuffer{};
    }

    if (const std::size_t rc = ZSTD_DCtx_reset(dctx_.get(), ZSTD_reset_session_only);
        ZSTD_isError(rc)) {
        return makeError<ByteBuffer>(
            ErrorCode::kCorruptFrame,
            "Zstd context reset failed: " + std::string(ZSTD_getErrorName(rc)));
    }

    ByteBuffer output(initialOutputSize(frame));
    ZSTD_inBuffer input{frame.data(), frame.size(), 0};
    std::size_t produced = 0;

    // Handles several concatenated frames; each completed frame returns 0.
    while (true) {
        if (produced == output.size()) {
            output.resize(output.size() + std::max(output.size(), ZSTD_DStreamOutSize()));
        }

        ZSTD_outBuffer out{output.data(), output.size(), produced};
        const std::size_t rc = ZSTD_decompressStream(dctx_.get(), &out, &input);
        if (ZSTD_isError(rc)) {
            return makeError<ByteBuffer>(
                ErrorCode::kCorruptFrame,
                "Zstd decompression failed: " + std::string(ZSTD_getErrorName(rc)));
        }
        produced = out.pos;

        const bool inputDone = input.pos == input.size;
        if (inputDone && rc == 0) {
            break;
        }
        if (inputDone && out.pos < out.size) {
            return makeError<ByteBuffer>(ErrorCode::kCorruptFrame, "Zstd frame is incomplete");
        }
    }

    output.resize(produced);
    return output;
}

std::unique_ptr<CompressionAdapter> makeDefaultAdapter(CompressionConfig config) {
    return std::make_unique<ZstdAdapter>(config);
}

}  // namespace srf::io
