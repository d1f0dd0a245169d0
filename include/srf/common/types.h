// =============================================================================
// srf - Common Type Definitions
// =============================================================================
// Core type definitions shared across the record library.
//
// This module defines:
// - RecordType: 8-bit record type tag
// - Base record type constants (binary, text, JSON)
// - ByteBuffer / ByteSpan aliases for payload storage
// - DatasetWindow: positional operation window
//
// Naming Conventions:
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef SRF_COMMON_TYPES_H
#define SRF_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace srf {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Record type tag.
/// @note The wire field is 8 bits wide; the public type is restricted to the
///       same domain so a type can never be truncated on write.
using RecordType = std::uint8_t;

/// @brief Owned byte sequence (record body, metadata, compressed frame).
using ByteBuffer = std::vector<std::uint8_t>;

/// @brief Non-owning view over bytes.
using ByteSpan = std::span<const std::uint8_t>;

// =============================================================================
// Base Record Types
// =============================================================================

/// @brief Opaque binary payload.
inline constexpr RecordType kTypeBinary = 1;

/// @brief UTF-8 text payload.
inline constexpr RecordType kTypeText = 2;

/// @brief JSON document payload.
inline constexpr RecordType kTypeJson = 3;

// =============================================================================
// Dataset Window
// =============================================================================

/// @brief Window of records selected by a positional operation.
/// @note Signed fields so that negative caller input can be rejected rather
///       than wrapping around.
struct DatasetWindow {
    /// @brief Zero-based index of the first record to take.
    std::int64_t start = 0;

    /// @brief Number of records to take (must be >= 1).
    std::int64_t count = 1;

    /// @brief Accept fewer records than requested when the stream ends early.
    bool allowPrematureEnd = false;
};

}  // namespace srf

#endif  // SRF_COMMON_TYPES_H
