// =============================================================================
// srf - Record Header Codec Implementation
// =============================================================================

#include "srf/format/header_codec.h"

#include <algorithm>
#include <array>
#include <span>

#include <fmt/format.h>

#include "srf/io/stream_io.h"

namespace srf::format {

namespace {

// Field offsets within the header.
constexpr std::size_t kOffsetMagic = 0;
constexpr std::size_t kOffsetTypeFlags = 4;
constexpr std::size_t kOffsetMetaLength = 8;
constexpr std::size_t kOffsetBodyLength = 12;

constexpr std::size_t kMagicSize = kMagicBytes.size();

std::array<std::uint8_t, kMagicSize> magicOf(const HeaderBytes& bytes) noexcept {
    std::array<std::uint8_t, kMagicSize> magic{};
    std::copy_n(bytes.begin() + kOffsetMagic, kMagicSize, magic.begin());
    return magic;
}

Result<RecordHeader> invalidMagic(const std::array<std::uint8_t, kMagicSize>& magic) {
    return makeError<RecordHeader>(
        ErrorCode::kInvalidHeader,
        fmt::format("Invalid record magic: {:02x} {:02x} {:02x} {:02x}",
                    magic[0], magic[1], magic[2], magic[3]));
}

}  // namespace

HeaderBytes serializeHeader(const RecordHeader& header) noexcept {
    HeaderBytes bytes{};
    std::copy(kMagicBytes.begin(), kMagicBytes.end(), bytes.begin() + kOffsetMagic);
    io::storeLE(bytes.data() + kOffsetTypeFlags, encodeTypeFlags(header.type, header.compressed));
    io::storeLE(bytes.data() + kOffsetMetaLength, header.metaLength);
    io::storeLE(bytes.data() + kOffsetBodyLength, header.bodyLength);
    return bytes;
}

Result<RecordHeader> parseHeader(const HeaderBytes& bytes) {
    if (const auto magic = magicOf(bytes); !validateMagic(magic)) {
        return invalidMagic(magic);
    }

    const auto word = io::loadLE<std::uint32_t>(bytes.data() + kOffsetTypeFlags);
    if (hasReservedBits(word)) {
        return makeError<RecordHeader>(
            ErrorCode::kInvalidReservedBits,
            fmt::format("Garbage found in reserved header bits: 0x{:08x}", word));
    }

    RecordHeader header;
    header.type = decodeRecordType(word);
    header.compressed = isBodyCompressed(word);
    header.metaLength = io::loadLE<std::uint32_t>(bytes.data() + kOffsetMetaLength);
    header.bodyLength = io::loadLE<std::uint64_t>(bytes.data() + kOffsetBodyLength);
    return header;
}

Result<RecordHeader> decodeHeader(std::istream& in) {
    HeaderBytes bytes{};
    const std::span<std::uint8_t> all(bytes);

    // Magic first: an empty read here is the only clean end of input.
    const std::size_t got = io::readUpTo(in, all.first(kMagicSize));
    if (got == 0 && !in.bad()) {
        return makeError<RecordHeader>(ErrorCode::kEndOfStream, "End of record stream");
    }
    if (in.bad()) {
        return makeError<RecordHeader>(ErrorCode::kIOError, "Stream failure while reading record magic");
    }
    if (got != kMagicSize) {
        return makeError<RecordHeader>(
            ErrorCode::kTruncated,
            fmt::format("Unexpected end of stream in record magic: expected {} bytes, got {}",
                        kMagicSize, got));
    }
    if (const auto magic = magicOf(bytes); !validateMagic(magic)) {
        return invalidMagic(magic);
    }

    if (auto result = io::readExact(in, all.subspan(kMagicSize), "record header"); !result) {
        return std::unexpected(result.error());
    }
    return parseHeader(bytes);
}

VoidResult encodeHeader(std::ostream& out, const RecordHeader& header) {
    const HeaderBytes bytes = serializeHeader(header);
    return io::writeBytes(out, bytes, "record header");
}

}  // namespace srf::format
