// =============================================================================
// srf - Stream Navigator
// =============================================================================
// Advances a stream past whole records without decoding their payload.
//
// Skipping reads the 20-byte header, then discards exactly
// metaLength + bodyLength bytes through a bounded scratch buffer. The
// compression adapter is never involved, so a record with a damaged frame
// can still be skipped.
//
// Boundary semantics match RecordCodec::read():
// - kEndOfStream only when the stream ends exactly where a header would start
// - kTruncated when the header or payload is cut short
// =============================================================================

#ifndef SRF_FORMAT_STREAM_NAVIGATOR_H
#define SRF_FORMAT_STREAM_NAVIGATOR_H

#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>

#include "srf/common/config.h"
#include "srf/common/error.h"
#include "srf/format/srf_format.h"

namespace srf::format {

/// @brief Skip one record.
/// @param scratch Non-empty buffer used to drain the payload.
/// @return The skipped record's header.
[[nodiscard]] Result<RecordHeader> skipRecord(std::istream& in, std::span<std::uint8_t> scratch);

/// @brief Skip exactly n records.
/// @return n on success, or the first error encountered.
[[nodiscard]] Result<std::uint64_t> skipRecords(std::istream& in,
                                                std::uint64_t n,
                                                std::size_t scratchSize = kDefaultSkipBufferSize);

}  // namespace srf::format

#endif  // SRF_FORMAT_STREAM_NAVIGATOR_H
