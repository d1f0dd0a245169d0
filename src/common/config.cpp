// =============================================================================
// srf - Codec Configuration Implementation
// =============================================================================

#include "srf/common/config.h"

#include <string>

namespace srf {

VoidResult CompressionConfig::validate() const {
    if (level < kMinCompressionLevel || level > kMaxCompressionLevel) {
        return makeVoidError(
            ErrorCode::kInvalidArgument,
            "Compression level must be between " + std::to_string(kMinCompressionLevel) +
            " and " + std::to_string(kMaxCompressionLevel) + ", got " + std::to_string(level));
    }

    if (workers < 0 || workers > kMaxCompressionWorkers) {
        return makeVoidError(
            ErrorCode::kInvalidArgument,
            "Compression workers must be between 0 and " +
            std::to_string(kMaxCompressionWorkers) + ", got " + std::to_string(workers));
    }

    return makeVoidSuccess();
}

VoidResult CodecConfig::validate() const {
    if (auto result = compression.validate(); !result) {
        return result;
    }

    if (skipBufferSize < kMinSkipBufferSize || skipBufferSize > kMaxSkipBufferSize) {
        return makeVoidError(
            ErrorCode::kInvalidArgument,
            "Skip buffer size must be between " + std::to_string(kMinSkipBufferSize) +
            " and " + std::to_string(kMaxSkipBufferSize) + " bytes");
    }

    return makeVoidSuccess();
}

}  // namespace srf
