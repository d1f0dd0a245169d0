// =============================================================================
// srf - Stream I/O Helpers
// =============================================================================
// Exact-length reads, bounded discards and little-endian field packing over
// std::istream / std::ostream.
//
// Every read helper either consumes exactly the requested number of bytes or
// reports why it could not:
// - kTruncated: the stream ended before the requested length
// - kIOError:   the stream reported a hard failure (badbit)
// =============================================================================

#ifndef SRF_IO_STREAM_IO_H
#define SRF_IO_STREAM_IO_H

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <istream>
#include <ostream>
#include <span>
#include <string_view>
#include <type_traits>

#include "srf/common/error.h"
#include "srf/common/types.h"

namespace srf::io {

// =============================================================================
// Little-Endian Packing
// =============================================================================

/// @brief Store an unsigned integer in little-endian byte order.
template <typename T>
void storeLE(std::uint8_t* dst, T value) noexcept {
    static_assert(std::is_unsigned_v<T>, "Type must be an unsigned integer");
    if constexpr (std::endian::native == std::endian::big) {
        if constexpr (sizeof(T) == 2) {
            value = static_cast<T>(__builtin_bswap16(value));
        } else if constexpr (sizeof(T) == 4) {
            value = static_cast<T>(__builtin_bswap32(value));
        } else if constexpr (sizeof(T) == 8) {
            value = static_cast<T>(__builtin_bswap64(value));
        }
    }
    std::memcpy(dst, &value, sizeof(T));
}

/// @brief Load an unsigned integer stored in little-endian byte order.
template <typename T>
[[nodiscard]] T loadLE(const std::uint8_t* src) noexcept {
    static_assert(std::is_unsigned_v<T>, "Type must be an unsigned integer");
    T value;
    std::memcpy(&value, src, sizeof(T));
    if constexpr (std::endian::native == std::endian::big) {
        if constexpr (sizeof(T) == 2) {
            value = static_cast<T>(__builtin_bswap16(value));
        } else if constexpr (sizeof(T) == 4) {
            value = static_cast<T>(__builtin_bswap32(value));
        } else if constexpr (sizeof(T) == 8) {
            value = static_cast<T>(__builtin_bswap64(value));
        }
    }
    return value;
}

// =============================================================================
// Stream Reads
// =============================================================================

/// @brief Read up to out.size() bytes, looping over short reads.
/// @return Number of bytes read; less than out.size() only at end of input
///         or on a stream failure.
/// @note Never throws, even when the stream has an exceptions() mask; end of
///       input and failures are left in the stream state.
[[nodiscard]] std::size_t readUpTo(std::istream& in, std::span<std::uint8_t> out);

/// @brief Read exactly out.size() bytes.
/// @param what Name of the field being read, used in error messages.
[[nodiscard]] VoidResult readExact(std::istream& in,
                                   std::span<std::uint8_t> out,
                                   std::string_view what);

/// @brief Read exactly size bytes into a new buffer.
[[nodiscard]] Result<ByteBuffer> readBuffer(std::istream& in,
                                            std::uint64_t size,
                                            std::string_view what);

/// @brief Consume and drop exactly size bytes through a scratch buffer.
/// @note Loops until the full count has been consumed; a stream that returns
///       fewer bytes than asked in one call is not mistaken for a full skip.
[[nodiscard]] VoidResult discardExact(std::istream& in,
                                      std::uint64_t size,
                                      std::span<std::uint8_t> scratch,
                                      std::string_view what);

// =============================================================================
// Stream Writes
// =============================================================================

/// @brief Write all bytes to the stream.
/// @note A std::ios_base::failure raised by an exceptions() mask is reported
///       as kIOError.
[[nodiscard]] VoidResult writeBytes(std::ostream& out, ByteSpan data, std::string_view what);

}  // namespace srf::io

#endif  // SRF_IO_STREAM_IO_H
