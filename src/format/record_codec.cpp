// =============================================================================
// srf - Record Codec Implementation
// =============================================================================

#include "srf/format/record_codec.h"

#include <limits>
#include <utility>

#include <fmt/format.h>

#include "srf/format/header_codec.h"
#include "srf/io/stream_io.h"

namespace srf::format {

namespace {

ByteSpan asBytes(std::string_view text) noexcept {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}  // namespace

// =============================================================================
// Raw Writes
// =============================================================================

VoidResult writeRawRecord(std::ostream& out,
                          RecordType type,
                          ByteSpan rawMeta,
                          ByteSpan rawBody,
                          bool bodyCompressed) {
    if (rawMeta.size() > std::numeric_limits<std::uint32_t>::max()) {
        return makeVoidError(
            ErrorCode::kInvalidArgument,
            fmt::format("Metadata frame of {} bytes exceeds the 32-bit length field", rawMeta.size()));
    }

    RecordHeader header;
    header.type = type;
    header.compressed = bodyCompressed;
    header.metaLength = static_cast<std::uint32_t>(rawMeta.size());
    header.bodyLength = rawBody.size();

    if (auto result = encodeHeader(out, header); !result) {
        return result;
    }
    if (auto result = io::writeBytes(out, rawMeta, "record metadata"); !result) {
        return result;
    }
    return io::writeBytes(out, rawBody, "record body");
}

// =============================================================================
// RecordCodec Implementation
// =============================================================================

RecordCodec::RecordCodec() : RecordCodec(CodecConfig{}) {}

RecordCodec::RecordCodec(CodecConfig config)
    : RecordCodec(io::makeDefaultAdapter(config.compression), config) {}

RecordCodec::RecordCodec(std::unique_ptr<io::CompressionAdapter> adapter, CodecConfig config)
    : adapter_(std::move(adapter)), config_(config) {
    if (!adapter_) {
        throw UsageError("RecordCodec requires a compression adapter");
    }
    unwrapOrThrow(config_.validate());
}

RecordCodec::~RecordCodec() = default;

RecordCodec::RecordCodec(RecordCodec&&) noexcept = default;
RecordCodec& RecordCodec::operator=(RecordCodec&&) noexcept = default;

Result<Record> RecordCodec::read(std::istream& in) {
    auto header = decodeHeader(in);
    if (!header) {
        return std::unexpected(std::move(header.error()));
    }

    Record record;
    record.type = header->type;

    // Metadata is always a compressed frame, independent of the body flag
    if (header->hasMeta()) {
        auto rawMeta = io::readBuffer(in, header->metaLength, "record metadata");
        if (!rawMeta) {
            return std::unexpected(std::move(rawMeta.error()));
        }
        auto meta = adapter_->decompress(*rawMeta);
        if (!meta) {
            return std::unexpected(std::move(meta.error()));
        }
        record.meta = std::move(*meta);
    }

    auto rawBody = io::readBuffer(in, header->bodyLength, "record body");
    if (!rawBody) {
        return std::unexpected(std::move(rawBody.error()));
    }

    if (header->compressed) {
        auto body = adapter_->decompress(*rawBody);
        if (!body) {
            return std::unexpected(std::move(body.error()));
        }
        record.body = std::move(*body);
    } else {
        record.body = std::move(*rawBody);
    }

    return record;
}

Result<std::vector<Record>> RecordCodec::readAll(std::istream& in) {
    std::vector<Record> records;
    while (true) {
        auto record = read(in);
        if (!record) {
            if (record.error().isEndOfStream()) {
                break;
            }
            return std::unexpected(std::move(record.error()));
        }
        records.push_back(std::move(*record));
    }
    return records;
}

VoidResult RecordCodec::write(std::ostream& out,
                              RecordType type,
                              ByteSpan body,
                              const std::optional<Json::Value>& meta,
                              bool compressBody) {
    ByteBuffer metaText;
    if (meta.has_value()) {
        auto serialized = serializeJson(*meta);
        if (!serialized) {
            return std::unexpected(std::move(serialized.error()));
        }
        metaText = std::move(*serialized);
    }
    return writeEncoded(out, type, metaText, body, compressBody);
}

VoidResult RecordCodec::writeString(std::ostream& out,
                                    RecordType type,
                                    std::string_view text,
                                    const std::optional<Json::Value>& meta,
                                    bool compressBody) {
    return write(out, type, asBytes(text), meta, compressBody);
}

VoidResult RecordCodec::write(std::ostream& out, const Record& record, bool compressBody) {
    return writeEncoded(out, record.type, record.meta, record.body, compressBody);
}

VoidResult RecordCodec::writeEncoded(std::ostream& out,
                                     RecordType type,
                                     ByteSpan metaText,
                                     ByteSpan body,
                                     bool compressBody) {
    ByteBuffer rawMeta;
    if (!metaText.empty()) {
        auto compressed = adapter_->compress(metaText);
        if (!compressed) {
            return std::unexpected(std::move(compressed.error()));
        }
        rawMeta = std::move(*compressed);
    }

    if (!compressBody) {
        return writeRawRecord(out, type, rawMeta, body, false);
    }

    auto rawBody = adapter_->compress(body);
    if (!rawBody) {
        return std::unexpected(std::move(rawBody.error()));
    }
    return writeRawRecord(out, type, rawMeta, *rawBody, true);
}

}  // namespace srf::format
