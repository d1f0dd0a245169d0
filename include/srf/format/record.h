// =============================================================================
// srf - Record Value Type
// =============================================================================
// The logical record carried by an SRF stream, plus JSON helpers for its
// metadata and body.
//
// A Record is a plain value: a type tag, optional metadata (JSON text, stored
// uncompressed here) and the body bytes. It owns its buffers and has no
// identity beyond the read or write call that produced it.
// =============================================================================

#ifndef SRF_FORMAT_RECORD_H
#define SRF_FORMAT_RECORD_H

#include <optional>
#include <string>
#include <string_view>

#include <json/json.h>

#include "srf/common/error.h"
#include "srf/common/types.h"

namespace srf::format {

// =============================================================================
// Record Structure
// =============================================================================

/// @brief One logical record: type tag, optional metadata, body.
struct Record {
    /// @brief Record type (see kTypeBinary, kTypeText, kTypeJson).
    RecordType type = 0;

    /// @brief Metadata JSON text; empty when the record has no metadata.
    ByteBuffer meta;

    /// @brief Body bytes (decompressed).
    ByteBuffer body;

    /// @brief Check if metadata exists.
    [[nodiscard]] bool hasMeta() const noexcept { return !meta.empty(); }

    /// @brief View the metadata as text.
    [[nodiscard]] std::string_view metaText() const noexcept {
        return {reinterpret_cast<const char*>(meta.data()), meta.size()};
    }

    /// @brief View the body as text.
    [[nodiscard]] std::string_view text() const noexcept {
        return {reinterpret_cast<const char*>(body.data()), body.size()};
    }

    [[nodiscard]] bool operator==(const Record& other) const noexcept = default;
};

// =============================================================================
// JSON Helpers
// =============================================================================

/// @brief Serialize a JSON value to compact text bytes.
[[nodiscard]] Result<ByteBuffer> serializeJson(const Json::Value& value);

/// @brief Parse JSON text.
[[nodiscard]] Result<Json::Value> parseJson(std::string_view text);

/// @brief Decode record metadata.
/// @return std::nullopt if the record has no metadata, kJsonError if the
///         metadata is not valid JSON.
[[nodiscard]] Result<std::optional<Json::Value>> unpackMeta(const Record& record);

/// @brief Decode a JSON body.
[[nodiscard]] Result<Json::Value> decodeJson(const Record& record);

}  // namespace srf::format

#endif  // SRF_FORMAT_RECORD_H
