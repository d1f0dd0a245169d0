// =============================================================================
// srf - Record Codec
// =============================================================================
// Reads and writes complete SRF records over standard streams.
//
// This module provides:
// - RecordCodec: record read/write bound to a compression adapter
// - writeRawRecord: header + pre-encoded payload emission
//
// Compression rules:
// - Metadata, when present, is always stored as a compressed frame.
// - The body is compressed only when the caller asks for it; the header's
//   compressed flag records the choice.
//
// Usage:
//   RecordCodec codec;
//   codec.writeString(out, kTypeText, "hello", std::nullopt, false);
//   auto record = codec.read(in);
//   while (record) { ...; record = codec.read(in); }
//   if (!record.error().isEndOfStream()) { /* damaged stream */ }
// =============================================================================

#ifndef SRF_FORMAT_RECORD_CODEC_H
#define SRF_FORMAT_RECORD_CODEC_H

#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

#include <json/json.h>

#include "srf/common/config.h"
#include "srf/common/error.h"
#include "srf/common/types.h"
#include "srf/format/record.h"
#include "srf/io/compression_adapter.h"

namespace srf::format {

// =============================================================================
// Raw Writes
// =============================================================================

/// @brief Write a record whose payload is already encoded.
/// @param rawMeta Compressed metadata frame, or empty for no metadata.
/// @param rawBody Body bytes; a compressed frame iff bodyCompressed is true.
/// @note Payload compression state is not re-validated: passing plain bytes
///       while claiming compression produces a record that fails to decode.
[[nodiscard]] VoidResult writeRawRecord(std::ostream& out,
                                        RecordType type,
                                        ByteSpan rawMeta,
                                        ByteSpan rawBody,
                                        bool bodyCompressed);

// =============================================================================
// RecordCodec Class
// =============================================================================

/// @brief Record reader/writer bound to one compression adapter.
/// @note Not thread-safe: the adapter reuses its compression contexts.
class RecordCodec {
public:
    /// @brief Construct with default settings (zstd, single-threaded).
    RecordCodec();

    /// @brief Construct a zstd-backed codec with explicit settings.
    /// @throws UsageError if the configuration is invalid.
    explicit RecordCodec(CodecConfig config);

    /// @brief Construct with a caller-supplied compression adapter.
    /// @throws UsageError if adapter is null or the configuration is invalid.
    explicit RecordCodec(std::unique_ptr<io::CompressionAdapter> adapter,
                         CodecConfig config = {});

    ~RecordCodec();

    // Non-copyable, movable
    RecordCodec(const RecordCodec&) = delete;
    RecordCodec& operator=(const RecordCodec&) = delete;
    RecordCodec(RecordCodec&&) noexcept;
    RecordCodec& operator=(RecordCodec&&) noexcept;

    // =========================================================================
    // Reading
    // =========================================================================

    /// @brief Read the next record.
    /// @return The record, kEndOfStream at a clean boundary, or the first
    ///         header/payload/decompression error.
    [[nodiscard]] Result<Record> read(std::istream& in);

    /// @brief Read every remaining record until a clean end of input.
    [[nodiscard]] Result<std::vector<Record>> readAll(std::istream& in);

    // =========================================================================
    // Writing
    // =========================================================================

    /// @brief Write a record from its parts.
    /// @param meta Metadata object, serialized to JSON and always compressed.
    /// @param compressBody Store the body as a compressed frame.
    [[nodiscard]] VoidResult write(std::ostream& out,
                                   RecordType type,
                                   ByteSpan body,
                                   const std::optional<Json::Value>& meta,
                                   bool compressBody);

    /// @brief Write a text record.
    [[nodiscard]] VoidResult writeString(std::ostream& out,
                                         RecordType type,
                                         std::string_view text,
                                         const std::optional<Json::Value>& meta,
                                         bool compressBody);

    /// @brief Re-emit a decoded record.
    /// @note The record's metadata text is recompressed as-is.
    [[nodiscard]] VoidResult write(std::ostream& out, const Record& record, bool compressBody);

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] io::CompressionAdapter& adapter() noexcept { return *adapter_; }

    [[nodiscard]] const CodecConfig& config() const noexcept { return config_; }

private:
    /// @brief Compress metadata/body as required and emit the record.
    [[nodiscard]] VoidResult writeEncoded(std::ostream& out,
                                          RecordType type,
                                          ByteSpan metaText,
                                          ByteSpan body,
                                          bool compressBody);

    std::unique_ptr<io::CompressionAdapter> adapter_;
    CodecConfig config_;
};

}  // namespace srf::format

#endif  // SRF_FORMAT_RECORD_CODEC_H
