// =============================================================================
// srf - Record Format Definitions
// =============================================================================
// Binary format definitions for SRF record streams.
//
// This module defines:
// - Magic tag constant ("SRF0")
// - RecordHeader structure (20 bytes on the wire)
// - Type/flags word bit definitions and helper functions
//
// Stream Layout:
// +----------------+
// |    Record 0    |
// +----------------+
// |    Record 1    |
// +----------------+
// |      ...       |
// +----------------+
//
// Record Layout (all integers little-endian):
// +--------+------------+------------+------------+----------+----------+
// | magic  | type+flags | metaLength | bodyLength | metadata |   body   |
// | 4 B    | uint32     | uint32     | uint64     | metaLen  | bodyLen  |
// +--------+------------+------------+------------+----------+----------+
//
// Metadata, when present, is always a compressed frame of JSON text. The body
// is a compressed frame iff the compressed flag is set, raw bytes otherwise.
// Records concatenate with no separator, index or footer.
// =============================================================================

#ifndef SRF_FORMAT_SRF_FORMAT_H
#define SRF_FORMAT_SRF_FORMAT_H

#include <array>
#include <cstddef>
#include <cstdint>

#include "srf/common/types.h"

namespace srf::format {

// =============================================================================
// Magic Constants
// =============================================================================

/// @brief Record magic tag: ASCII "SRF0".
inline constexpr std::array<std::uint8_t, 4> kMagicBytes = {'S', 'R', 'F', '0'};

// =============================================================================
// Type/Flags Word Bit Definitions
// =============================================================================

/// @brief Bit definitions for the 32-bit type/flags header word.
namespace flags {

/// @brief Bits 0-7: record type.
inline constexpr std::uint32_t kTypeMask = 0xFFU;

/// @brief Bits 8-30: reserved, always written as zero.
inline constexpr std::uint32_t kReservedMask = 0x7FFFFF00U;

/// @brief Bits 16-22: reserved bits validated on read.
/// @note Readers accept the remaining reserved bits for compatibility with
///       existing streams; writers never set any of them.
inline constexpr std::uint32_t kCheckedReservedMask = 0x7FU << 16;

/// @brief Bit 31: body is a compressed frame.
inline constexpr std::uint32_t kCompressed = 1U << 31;

}  // namespace flags

// =============================================================================
// Flag Helper Functions
// =============================================================================

/// @brief Build the type/flags word.
/// @param type Record type.
/// @param compressed Whether the body is stored compressed.
[[nodiscard]] constexpr std::uint32_t encodeTypeFlags(RecordType type, bool compressed) noexcept {
    std::uint32_t word = static_cast<std::uint32_t>(type) & flags::kTypeMask;
    if (compressed) word |= flags::kCompressed;
    return word;
}

/// @brief Extract the record type from the type/flags word.
[[nodiscard]] constexpr RecordType decodeRecordType(std::uint32_t word) noexcept {
    return static_cast<RecordType>(word & flags::kTypeMask);
}

/// @brief Check if the compressed flag is set.
[[nodiscard]] constexpr bool isBodyCompressed(std::uint32_t word) noexcept {
    return (word & flags::kCompressed) != 0;
}

/// @brief Check if any validated reserved bit is set.
[[nodiscard]] constexpr bool hasReservedBits(std::uint32_t word) noexcept {
    return (word & flags::kCheckedReservedMask) != 0;
}

// =============================================================================
// RecordHeader Structure
// =============================================================================

/// @brief Decoded record header.
///
/// Layout:
/// - magic (4 bytes): "SRF0"
/// - typeFlags (uint32): type bits 0-7, compressed bit 31
/// - metaLength (uint32): compressed metadata size, 0 = no metadata
/// - bodyLength (uint64): body size as stored on the wire
struct RecordHeader {
    /// @brief Record type.
    RecordType type = 0;

    /// @brief Body is a compressed frame.
    bool compressed = false;

    /// @brief Byte length of the metadata frame (0 = none).
    std::uint32_t metaLength = 0;

    /// @brief Byte length of the body as stored.
    std::uint64_t bodyLength = 0;

    /// @brief Fixed on-wire header size.
    static constexpr std::size_t kSize =
        kMagicBytes.size() +      // 4
        sizeof(std::uint32_t) +   // type+flags: 4
        sizeof(metaLength) +      // 4
        sizeof(bodyLength);       // 8
    // Total: 20 bytes

    /// @brief Check if the record carries metadata.
    [[nodiscard]] constexpr bool hasMeta() const noexcept { return metaLength > 0; }

    [[nodiscard]] constexpr bool operator==(const RecordHeader& other) const noexcept = default;
};

static_assert(RecordHeader::kSize == 20, "RecordHeader must be 20 bytes on the wire");

// =============================================================================
// Validation Functions
// =============================================================================

/// @brief Validate magic bytes.
/// @param magic Array of 4 bytes read from the stream.
[[nodiscard]] inline bool validateMagic(const std::array<std::uint8_t, 4>& magic) noexcept {
    return magic == kMagicBytes;
}

}  // namespace srf::format

#endif  // SRF_FORMAT_SRF_FORMAT_H
