// =============================================================================
// srf - Positional Operations
// =============================================================================
// Count, Extract and Copy over a forward-only record stream.
//
// Extract and Copy share one pass over the stream:
//   Skipping(start) -> Collecting(count) -> Done
// Skipped records are drained through the stream navigator without touching
// the compression engine; collected records are fully decoded.
//
// Window rules:
// - start < 0 fails with kInvalidStartOffset, count < 1 with kInvalidCount,
//   both before any byte is read.
// - A clean end of stream during either phase is an error (kEndOfStream)
//   unless allowPrematureEnd is set, in which case the records gathered so
//   far are the result.
// - Any other error aborts the operation; allowPrematureEnd never hides it.
// =============================================================================

#ifndef SRF_FORMAT_POSITIONAL_H
#define SRF_FORMAT_POSITIONAL_H

#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>

#include "srf/common/error.h"
#include "srf/common/types.h"
#include "srf/format/record.h"
#include "srf/format/record_codec.h"

namespace srf::format {

// =============================================================================
// Count
// =============================================================================

/// @brief Count the records remaining in the stream.
/// @note Every record is fully decoded, so a corrupt frame anywhere fails
///       the count.
[[nodiscard]] Result<std::int64_t> count(std::istream& in, RecordCodec& codec);

/// @brief Count with a default codec.
[[nodiscard]] Result<std::int64_t> count(std::istream& in);

// =============================================================================
// Extract
// =============================================================================

/// @brief Decode the records selected by a window.
[[nodiscard]] Result<std::vector<Record>> extract(std::istream& in,
                                                  const DatasetWindow& window,
                                                  RecordCodec& codec);

/// @brief Extract with a default codec.
[[nodiscard]] Result<std::vector<Record>> extract(std::istream& in, const DatasetWindow& window);

// =============================================================================
// Copy
// =============================================================================

/// @brief Re-emit the records selected by a window to another stream.
/// @param recompress Store the copied bodies as compressed frames.
/// @return Number of records written.
/// @note Records are written as they are read; on failure the records
///       already written stay in dst.
[[nodiscard]] Result<std::int64_t> copy(std::istream& src,
                                        std::ostream& dst,
                                        const DatasetWindow& window,
                                        bool recompress,
                                        RecordCodec& codec);

/// @brief Copy with a default codec.
[[nodiscard]] Result<std::int64_t> copy(std::istream& src,
                                        std::ostream& dst,
                                        const DatasetWindow& window,
                                        bool recompress);

}  // namespace srf::format

#endif  // SRF_FORMAT_POSITIONAL_H
