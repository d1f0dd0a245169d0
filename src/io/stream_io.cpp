// =============================================================================
// srf - Stream I/O Helpers Implementation
// =============================================================================

#include "srf/io/stream_io.h"

#include <algorithm>
#include <ios>
#include <string>

#include <fmt/format.h>

namespace srf::io {

namespace {

/// @brief Largest chunk appended to a growing read buffer at once.
/// @note Keeps a corrupted length field from allocating gigabytes up front.
constexpr std::size_t kReadChunkSize = 1024 * 1024;

VoidResult shortReadError(const std::istream& in,
                          std::string_view what,
                          std::uint64_t expected,
                          std::uint64_t actual) {
    if (in.bad()) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Stream failure while reading {}", what));
    }
    return makeVoidError(
        ErrorCode::kTruncated,
        fmt::format("Unexpected end of stream in {}: expected {} bytes, got {}",
                    what, expected, actual));
}

}  // namespace

// =============================================================================
// Stream Reads
// =============================================================================

std::size_t readUpTo(std::istream& in, std::span<std::uint8_t> out) {
    std::size_t total = 0;
    while (total < out.size()) {
        try {
            in.read(reinterpret_cast<char*>(out.data() + total),
                    static_cast<std::streamsize>(out.size() - total));
        } catch (const std::ios_base::failure&) {
            // The state bits are set before the stream throws; callers read them.
            total += static_cast<std::size_t>(in.gcount());
            break;
        }
        const auto got = static_cast<std::size_t>(in.gcount());
        total += got;
        if (got == 0 || !in.good()) {
            break;
        }
    }
    return total;
}

VoidResult readExact(std::istream& in, std::span<std::uint8_t> out, std::string_view what) {
    const std::size_t got = readUpTo(in, out);
    if (got != out.size()) {
        return shortReadError(in, what, out.size(), got);
    }
    return makeVoidSuccess();
}

Result<ByteBuffer> readBuffer(std::istream& in, std::uint64_t size, std::string_view what) {
    ByteBuffer buffer;
    buffer.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(size, kReadChunkSize)));

    std::uint64_t done = 0;
    while (done < size) {
        const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(size - done, kReadChunkSize));
        buffer.resize(buffer.size() + chunk);
        const std::size_t got =
            readUpTo(in, std::span<std::uint8_t>(buffer.data() + done, chunk));
        done += got;
        if (got != chunk) {
            return std::unexpected(shortReadError(in, what, size, done).error());
        }
    }
    return buffer;
}

VoidResult discardExact(std::istream& in,
                        std::uint64_t size,
                        std::span<std::uint8_t> scratch,
                        std::string_view what) {
    if (scratch.empty() && size > 0) {
        return makeVoidError(ErrorCode::kInvalidArgument, "Skip scratch buffer is empty");
    }

    std::uint64_t remaining = size;
    while (remaining > 0) {
        const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, scratch.size()));
        const std::size_t got = readUpTo(in, scratch.first(chunk));
        remaining -= got;
        if (got != chunk) {
            return shortReadError(in, what, size, size - remaining);
        }
    }
    return makeVoidSuccess();
}

// =============================================================================
// Stream Writes
// =============================================================================

VoidResult writeBytes(std::ostream& out, ByteSpan data, std::string_view what) {
    if (data.empty()) {
        return makeVoidSuccess();
    }
    try {
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    } catch (const std::ios_base::failure& e) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Failed to write {} ({} bytes): {}", what, data.size(), e.what()));
    }
    if (!out.good()) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Failed to write {} ({} bytes)", what, data.size()));
    }
    return makeVoidSuccess();
}

}  // namespace srf::io
