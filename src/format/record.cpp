// =============================================================================
// srf - Record Value Type Implementation
// =============================================================================

#include "srf/format/record.h"

#include <memory>

namespace srf::format {

Result<ByteBuffer> serializeJson(const Json::Value& value) {
    // Json::writeString can throw on values it cannot represent
    auto text = tryExecute([&value]() {
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        return Json::writeString(writer, value);
    });
    if (!text) {
        return makeError<ByteBuffer>(ErrorCode::kJsonError,
                                     "Failed to serialize JSON: " + text.error().message());
    }
    return ByteBuffer(text->begin(), text->end());
}

Result<Json::Value> parseJson(std::string_view text) {
    Json::CharReaderBuilder readerBuilder;
    readerBuilder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(readerBuilder.newCharReader());

    Json::Value root;
    std::string parseErrors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &parseErrors)) {
        return makeError<Json::Value>(ErrorCode::kJsonError,
                                      "Failed to parse JSON: " + parseErrors);
    }
    return root;
}

Result<std::optional<Json::Value>> unpackMeta(const Record& record) {
    if (!record.hasMeta()) {
        return std::optional<Json::Value>{};
    }
    auto meta = parseJson(record.metaText());
    if (!meta) {
        return std::unexpected(meta.error());
    }
    return std::optional<Json::Value>{std::move(*meta)};
}

Result<Json::Value> decodeJson(const Record& record) {
    return parseJson(record.text());
}

}  // namespace srf::format
