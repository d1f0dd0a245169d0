// =============================================================================
// srf - Codec Configuration
// =============================================================================
// Static configuration for the record codec and its compression adapter.
//
// This module provides:
// - CompressionConfig: zstd level, worker count and frame checksum flag
// - CodecConfig: compression settings plus stream-navigation scratch size
//
// Compression concurrency is part of the adapter's configuration, passed to
// its constructor, never process-wide state. The defaults keep the engine
// single-threaded.
// =============================================================================

#ifndef SRF_COMMON_CONFIG_H
#define SRF_COMMON_CONFIG_H

#include <cstddef>
#include <cstdint>

#include "srf/common/error.h"

namespace srf {

// =============================================================================
// Constants
// =============================================================================

/// @brief Default zstd compression level.
inline constexpr int kDefaultCompressionLevel = 3;

/// @brief Minimum accepted compression level.
inline constexpr int kMinCompressionLevel = 1;

/// @brief Maximum accepted compression level.
inline constexpr int kMaxCompressionLevel = 22;

/// @brief Default number of zstd worker threads (0 = single-threaded).
inline constexpr int kDefaultCompressionWorkers = 0;

/// @brief Maximum accepted number of zstd worker threads.
inline constexpr int kMaxCompressionWorkers = 64;

/// @brief Default scratch buffer used to discard skipped payload bytes.
inline constexpr std::size_t kDefaultSkipBufferSize = 64 * 1024;

/// @brief Minimum scratch buffer size.
inline constexpr std::size_t kMinSkipBufferSize = 512;

/// @brief Maximum scratch buffer size.
inline constexpr std::size_t kMaxSkipBufferSize = 16 * 1024 * 1024;

// =============================================================================
// CompressionConfig
// =============================================================================

/// @brief Settings for the zstd compression adapter.
struct CompressionConfig {
    /// @brief zstd compression level.
    int level = kDefaultCompressionLevel;

    /// @brief zstd worker threads; 0 compresses on the calling thread.
    int workers = kDefaultCompressionWorkers;

    /// @brief Append a content checksum to every frame.
    bool checksum = true;

    /// @brief Validate the configuration.
    /// @return VoidResult with kInvalidArgument on an out-of-range value.
    [[nodiscard]] VoidResult validate() const;

    [[nodiscard]] constexpr bool operator==(const CompressionConfig& other) const noexcept = default;
};

// =============================================================================
// CodecConfig
// =============================================================================

/// @brief Settings for a RecordCodec instance.
struct CodecConfig {
    /// @brief Compression adapter settings.
    CompressionConfig compression;

    /// @brief Size of the scratch buffer used when skipping records.
    std::size_t skipBufferSize = kDefaultSkipBufferSize;

    /// @brief Validate the configuration.
    [[nodiscard]] VoidResult validate() const;

    [[nodiscard]] constexpr bool operator==(const CodecConfig& other) const noexcept = default;
};

}  // namespace srf

#endif  // SRF_COMMON_CONFIG_H
