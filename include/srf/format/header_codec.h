// =============================================================================
// srf - Record Header Codec
// =============================================================================
// Encodes and decodes the fixed 20-byte record header.
//
// Decoding distinguishes a clean end of input from a damaged boundary:
// - no byte available where a header starts  -> kEndOfStream
// - 1..19 header bytes available             -> kTruncated
// - magic other than "SRF0"                  -> kInvalidHeader
// - any of bits 16-22 of type/flags set      -> kInvalidReservedBits
// =============================================================================

#ifndef SRF_FORMAT_HEADER_CODEC_H
#define SRF_FORMAT_HEADER_CODEC_H

#include <array>
#include <cstdint>
#include <istream>
#include <ostream>

#include "srf/common/error.h"
#include "srf/format/srf_format.h"

namespace srf::format {

/// @brief Encoded header bytes.
using HeaderBytes = std::array<std::uint8_t, RecordHeader::kSize>;

/// @brief Serialize a header into its wire representation.
/// @note Reserved bits are always zero.
[[nodiscard]] HeaderBytes serializeHeader(const RecordHeader& header) noexcept;

/// @brief Parse a header from its wire representation.
[[nodiscard]] Result<RecordHeader> parseHeader(const HeaderBytes& bytes);

/// @brief Read and validate the next record header from a stream.
[[nodiscard]] Result<RecordHeader> decodeHeader(std::istream& in);

/// @brief Write a record header to a stream.
[[nodiscard]] VoidResult encodeHeader(std::ostream& out, const RecordHeader& header);

}  // namespace srf::format

#endif  // SRF_FORMAT_HEADER_CODEC_H
