// =============================================================================
// srf - Compression Adapter Tests
// =============================================================================
// Unit and property tests for the zstd compression adapter.
//
// Property: for any byte sequence and valid configuration,
// decompress(compress(x)) == x.
// =============================================================================

#include "srf/io/compression_adapter.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>
#include <vector>

#include "support/test_streams.h"

namespace srf::io::test {

using srf::test::toBytes;

// =============================================================================
// Construction
// =============================================================================

TEST(ZstdAdapterTest, DefaultConfiguration) {
    ZstdAdapter adapter;

    EXPECT_EQ(adapter.config(), CompressionConfig{});
    EXPECT_EQ(adapter.name(), "zstd");
}

TEST(ZstdAdapterTest, RejectsInvalidConfiguration) {
    CompressionConfig config;
    config.level = 0;
    EXPECT_THROW(ZstdAdapter{config}, UsageError);

    config = CompressionConfig{};
    config.workers = -2;
    EXPECT_THROW(ZstdAdapter{config}, UsageError);
}

TEST(ZstdAdapterTest, MakeDefaultAdapter) {
    auto adapter = makeDefaultAdapter();
    ASSERT_NE(adapter, nullptr);
    EXPECT_EQ(adapter->name(), "zstd");
}

// =============================================================================
// Round Trips
// =============================================================================

TEST(ZstdAdapterTest, RoundTripText) {
    ZstdAdapter adapter;
    const auto input = toBytes("The quick brown fox jumps over the lazy dog");

    auto frame = adapter.compress(input);
    ASSERT_TRUE(frame.has_value());
    EXPECT_FALSE(frame->empty());

    auto output = adapter.decompress(*frame);
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(*output, input);
}

TEST(ZstdAdapterTest, EmptyInput) {
    ZstdAdapter adapter;

    auto frame = adapter.compress(ByteBuffer{});
    ASSERT_TRUE(frame.has_value());
    EXPECT_FALSE(frame->empty());

    auto output = adapter.decompress(*frame);
    ASSERT_TRUE(output.has_value());
    EXPECT_TRUE(output->empty());

    auto nothing = adapter.decompress(ByteBuffer{});
    ASSERT_TRUE(nothing.has_value());
    EXPECT_TRUE(nothing->empty());
}

TEST(ZstdAdapterTest, ConcatenatedFrames) {
    ZstdAdapter adapter;

    auto first = adapter.compress(toBytes("hello, "));
    auto second = adapter.compress(toBytes("world"));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    ByteBuffer joined = *first;
    joined.insert(joined.end(), second->begin(), second->end());

    auto output = adapter.decompress(joined);
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(*output, toBytes("hello, world"));
}

TEST(ZstdAdapterTest, LargeCompressibleInput) {
    ZstdAdapter adapter;
    ByteBuffer input(4 * 1024 * 1024);
    for (std::size_t i = 0; i < input.size(); ++i) {
        input[i] = static_cast<std::uint8_t>(i % 251);
    }

    auto frame = adapter.compress(input);
    ASSERT_TRUE(frame.has_value());
    EXPECT_LT(frame->size(), input.size());

    auto output = adapter.decompress(*frame);
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(*output, input);
}

// =============================================================================
// Corruption
// =============================================================================

TEST(ZstdAdapterTest, GarbageIsCorruptFrame) {
    ZstdAdapter adapter;

    auto output = adapter.decompress(toBytes("definitely not a zstd frame"));
    ASSERT_FALSE(output.has_value());
    EXPECT_EQ(output.error().code(), ErrorCode::kCorruptFrame);
}

TEST(ZstdAdapterTest, TruncatedFrameIsCorruptFrame) {
    ZstdAdapter adapter;
    auto frame = adapter.compress(toBytes(std::string(1000, 'q') + "some tail text"));
    ASSERT_TRUE(frame.has_value());

    frame->resize(frame->size() / 2);
    auto output = adapter.decompress(*frame);
    ASSERT_FALSE(output.has_value());
    EXPECT_EQ(output.error().code(), ErrorCode::kCorruptFrame);
}

TEST(ZstdAdapterTest, ChecksumDetectsPayloadDamage) {
    ZstdAdapter adapter;
    auto frame = adapter.compress(toBytes("checksummed content that is long enough"));
    ASSERT_TRUE(frame.has_value());

    // Last four bytes are the content checksum
    frame->back() ^= 0xFF;
    auto output = adapter.decompress(*frame);
    ASSERT_FALSE(output.has_value());
    EXPECT_EQ(output.error().code(), ErrorCode::kCorruptFrame);
}

TEST(ZstdAdapterTest, ContextsAreReusable) {
    ZstdAdapter adapter;

    // A failed decode must not poison the next one
    EXPECT_FALSE(adapter.decompress(toBytes("garbage bytes here")).has_value());

    const auto input = toBytes("after a failure");
    auto frame = adapter.compress(input);
    ASSERT_TRUE(frame.has_value());
    auto output = adapter.decompress(*frame);
    ASSERT_TRUE(output.has_value());
    EXPECT_EQ(*output, input);
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(ZstdAdapterProperty, RoundTrip, ()) {
    const auto data = *rc::gen::container<std::vector<std::uint8_t>>(rc::gen::arbitrary<std::uint8_t>());

    CompressionConfig config;
    config.level = *rc::gen::inRange(kMinCompressionLevel, 10);
    config.checksum = *rc::gen::arbitrary<bool>();

    ZstdAdapter adapter(config);
    auto frame = adapter.compress(data);
    RC_ASSERT(frame.has_value());

    auto output = adapter.decompress(*frame);
    RC_ASSERT(output.has_value());
    RC_ASSERT(*output == data);
}

}  // namespace srf::io::test
