// =============================================================================
// srf - Compression Adapter
// =============================================================================
// Boundary between the record codec and the compression engine.
//
// This module provides:
// - CompressionAdapter: abstract compress/decompress interface
// - ZstdAdapter: zstd implementation with explicit per-instance settings
//
// The codec only decides *when* to compress (metadata always, body on
// request); the adapter decides *how*. Frames are opaque to the codec.
//
// Usage:
//   ZstdAdapter zstd(CompressionConfig{});
//   auto frame = zstd.compress(bytes);
//   auto plain = zstd.decompress(*frame);
// =============================================================================

#ifndef SRF_IO_COMPRESSION_ADAPTER_H
#define SRF_IO_COMPRESSION_ADAPTER_H

#include <memory>
#include <string_view>

#include "srf/common/config.h"
#include "srf/common/error.h"
#include "srf/common/types.h"

// Forward declarations to keep zstd.h out of public headers
struct ZSTD_CCtx_s;
struct ZSTD_DCtx_s;

namespace srf::io {

// =============================================================================
// CompressionAdapter Interface
// =============================================================================

/// @brief Opaque frame compression service used by the record codec.
/// @note Implementations must be deterministic and side-effect-free on
///       success. Instances are not required to be thread-safe.
class CompressionAdapter {
public:
    virtual ~CompressionAdapter() = default;

    /// @brief Compress bytes into a self-contained frame.
    /// @return Frame bytes, or kCompressionFailed.
    [[nodiscard]] virtual Result<ByteBuffer> compress(ByteSpan data) = 0;

    /// @brief Decompress one or more concatenated frames.
    /// @return Decompressed bytes, or kCorruptFrame on malformed input.
    /// @note An empty input decompresses to an empty output.
    [[nodiscard]] virtual Result<ByteBuffer> decompress(ByteSpan frame) = 0;

    /// @brief Short engine name for diagnostics.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

protected:
    CompressionAdapter() = default;
    CompressionAdapter(const CompressionAdapter&) = default;
    CompressionAdapter& operator=(const CompressionAdapter&) = default;
};

// =============================================================================
// ZstdAdapter
// =============================================================================

/// @brief zstd-backed compression adapter.
/// @note Owns one compression and one decompression context, reused across
///       calls. Single-threaded unless CompressionConfig::workers > 0.
class ZstdAdapter final : public CompressionAdapter {
public:
    /// @brief Construct with explicit settings.
    /// @throws UsageError if the configuration is invalid or rejected by zstd.
    /// @throws CompressionError if the zstd contexts cannot be created.
    explicit ZstdAdapter(CompressionConfig config = {});

    ~ZstdAdapter() override;

    // Non-copyable, movable
    ZstdAdapter(const ZstdAdapter&) = delete;
    ZstdAdapter& operator=(const ZstdAdapter&) = delete;
    ZstdAdapter(ZstdAdapter&&) noexcept;
    ZstdAdapter& operator=(ZstdAdapter&&) noexcept;

    [[nodiscard]] Result<ByteBuffer> compress(ByteSpan data) override;

    [[nodiscard]] Result<ByteBuffer> decompress(ByteSpan frame) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "zstd"; }

    /// @brief Get the adapter settings.
    [[nodiscard]] const CompressionConfig& config() const noexcept { return config_; }

private:
    struct CCtxDeleter {
        void operator()(ZSTD_CCtx_s* ctx) const noexcept;
    };
    struct DCtxDeleter {
        void operator()(ZSTD_DCtx_s* ctx) const noexcept;
    };

    CompressionConfig config_;
    std::unique_ptr<ZSTD_CCtx_s, CCtxDeleter> cctx_;
    std::unique_ptr<ZSTD_DCtx_s, DCtxDeleter> dctx_;
};

/// @brief Create the default adapter (zstd, single-threaded).
[[nodiscard]] std::unique_ptr<CompressionAdapter> makeDefaultAdapter(CompressionConfig config = {});

}  // namespace srf::io

#endif  // SRF_IO_COMPRESSION_ADAPTER_H
