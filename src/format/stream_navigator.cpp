// =============================================================================
// srf - Stream Navigator Implementation
// =============================================================================

#include "srf/format/stream_navigator.h"

#include <utility>

#include "srf/common/logger.h"
#include "srf/format/header_codec.h"
#include "srf/io/stream_io.h"

namespace srf::format {

Result<RecordHeader> skipRecord(std::istream& in, std::span<std::uint8_t> scratch) {
    auto header = decodeHeader(in);
    if (!header) {
        return header;
    }

    if (auto result = io::discardExact(in, header->metaLength, scratch, "record metadata");
        !result) {
        return std::unexpected(std::move(result.error()));
    }
    if (auto result = io::discardExact(in, header->bodyLength, scratch, "record body"); !result) {
        return std::unexpected(std::move(result.error()));
    }
    return header;
}

Result<std::uint64_t> skipRecords(std::istream& in, std::uint64_t n, std::size_t scratchSize) {
    if (scratchSize == 0) {
        return makeError<std::uint64_t>(ErrorCode::kInvalidArgument,
                                        "Skip scratch buffer size must be non-zero");
    }
    if (n == 0) {
        return std::uint64_t{0};
    }

    ByteBuffer scratch(scratchSize);
    for (std::uint64_t skipped = 0; skipped < n; ++skipped) {
        if (auto header = skipRecord(in, scratch); !header) {
            return std::unexpected(std::move(header.error()));
        }
    }

    SRF_LOG_DEBUG("Skipped {} records", n);
    return n;
}

}  // namespace srf::format
