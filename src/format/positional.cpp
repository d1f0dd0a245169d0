// =============================================================================
// srf - Positional Operations Implementation
// =============================================================================

#include "srf/format/positional.h"

#include <istream>
#include <optional>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "srf/common/logger.h"
#include "srf/format/stream_navigator.h"

namespace srf::format {

namespace {

/// @brief Position of the next record, if the stream can report one.
std::optional<std::uint64_t> streamOffset(std::istream& in) {
    if (!in.good()) {
        return std::nullopt;
    }
    const auto pos = in.tellg();
    if (pos == std::istream::pos_type(-1)) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(static_cast<std::streamoff>(pos));
}

/// @brief Attach the zero-based record index and its stream offset to an error message.
Error atRecord(const Error& error, std::int64_t index, std::optional<std::uint64_t> offset) {
    ErrorContext context;
    context.withRecord(static_cast<std::uint64_t>(index));
    if (offset) {
        context.withOffset(*offset);
    }
    return Error{error.code(), fmt::format("{} ({})", error.message(), context.format())};
}

VoidResult validateWindow(const DatasetWindow& window) {
    if (window.start < 0) {
        return makeVoidError(ErrorCode::kInvalidStartOffset,
                             fmt::format("Start offset must be >= 0, got {}", window.start));
    }
    if (window.count < 1) {
        return makeVoidError(ErrorCode::kInvalidCount,
                             fmt::format("Record count must be >= 1, got {}", window.count));
    }
    return makeVoidSuccess();
}

/// @brief Run the skip/collect pass over a window.
/// @param sink Called with every collected record; a failure aborts the pass.
/// @return Number of records handed to sink.
template <typename Sink>
Result<std::int64_t> walkWindow(std::istream& in,
                                const DatasetWindow& window,
                                RecordCodec& codec,
                                std::string_view operation,
                                Sink&& sink) {
    if (auto valid = validateWindow(window); !valid) {
        return std::unexpected(std::move(valid.error()));
    }

    SRF_LOG_DEBUG("{}: start={}, count={}, allowPrematureEnd={}",
                  operation, window.start, window.count, window.allowPrematureEnd);

    // Skipping
    ByteBuffer scratch;
    if (window.start > 0) {
        scratch.resize(codec.config().skipBufferSize);
    }
    for (std::int64_t index = 0; index < window.start; ++index) {
        const auto offset = streamOffset(in);
        auto header = skipRecord(in, scratch);
        if (header) {
            continue;
        }
        if (header.error().isEndOfStream() && window.allowPrematureEnd) {
            SRF_LOG_WARNING("{}: stream ended after {} of {} skipped records",
                            operation, index, window.start);
            return std::int64_t{0};
        }
        return std::unexpected(atRecord(header.error(), index, offset));
    }

    // Collecting
    std::int64_t collected = 0;
    while (collected < window.count) {
        const std::int64_t index = window.start + collected;
        const auto offset = streamOffset(in);
        auto record = codec.read(in);
        if (!record) {
            if (record.error().isEndOfStream() && window.allowPrematureEnd) {
                SRF_LOG_WARNING("{}: stream ended after {} of {} requested records",
                                operation, collected, window.count);
                break;
            }
            return std::unexpected(atRecord(record.error(), index, offset));
        }
        if (auto result = sink(std::move(*record)); !result) {
            return std::unexpected(atRecord(result.error(), index, offset));
        }
        ++collected;
    }

    SRF_LOG_DEBUG("{}: collected {} records", operation, collected);
    return collected;
}

}  // namespace

// =============================================================================
// Count
// =============================================================================

Result<std::int64_t> count(std::istream& in, RecordCodec& codec) {
    std::int64_t total = 0;
    while (true) {
        const auto offset = streamOffset(in);
        auto record = codec.read(in);
        if (!record) {
            if (record.error().isEndOfStream()) {
                break;
            }
            return std::unexpected(atRecord(record.error(), total, offset));
        }
        ++total;
    }

    SRF_LOG_DEBUG("count: {} records", total);
    return total;
}

Result<std::int64_t> count(std::istream& in) {
    RecordCodec codec;
    return count(in, codec);
}

// =============================================================================
// Extract
// =============================================================================

Result<std::vector<Record>> extract(std::istream& in,
                                    const DatasetWindow& window,
                                    RecordCodec& codec) {
    std::vector<Record> records;
    auto collected = walkWindow(in, window, codec, "extract", [&records](Record&& record) {
        records.push_back(std::move(record));
        return makeVoidSuccess();
    });
    if (!collected) {
        return std::unexpected(std::move(collected.error()));
    }
    return records;
}

Result<std::vector<Record>> extract(std::istream& in, const DatasetWindow& window) {
    RecordCodec codec;
    return extract(in, window, codec);
}

// =============================================================================
// Copy
// =============================================================================

Result<std::int64_t> copy(std::istream& src,
                          std::ostream& dst,
                          const DatasetWindow& window,
                          bool recompress,
                          RecordCodec& codec) {
    return walkWindow(src, window, codec, "copy", [&](Record&& record) {
        return codec.write(dst, record, recompress);
    });
}

Result<std::int64_t> copy(std::istream& src,
                          std::ostream& dst,
                          const DatasetWindow& window,
                          bool recompress) {
    RecordCodec codec;
    return copy(src, dst, window, recompress, codec);
}

}  // namespace srf::format
