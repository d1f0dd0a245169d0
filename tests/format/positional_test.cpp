// =============================================================================
// srf - Positional Operation Tests
// =============================================================================
// Unit and property tests for count, extract and copy.
//
// Properties:
// - count returns exactly the number of records written
// - extract(k, 1) returns the (k+1)-th record
// - a short stream yields max(0, M - start) records with allowPrematureEnd,
//   kEndOfStream without it
// - copy preserves type and body; the compressed flag follows recompress
// =============================================================================

#include "srf/format/positional.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <ios>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "srf/format/header_codec.h"
#include "srf/format/stream_navigator.h"
#include "support/test_streams.h"

namespace srf::format::test {

using srf::test::toBytes;

namespace {

/// @brief Write n plain text records "record-0" .. "record-(n-1)".
std::string textStream(int n) {
    RecordCodec codec;
    std::ostringstream out;
    for (int i = 0; i < n; ++i) {
        unwrapOrThrow(
            codec.writeString(out, kTypeText, "record-" + std::to_string(i), std::nullopt, false));
    }
    return out.str();
}

/// @brief Write n records of varied type, metadata and compression.
std::string mixedStream(int n) {
    RecordCodec codec;
    std::ostringstream out;
    for (int i = 0; i < n; ++i) {
        std::optional<Json::Value> meta;
        if (i % 3 == 0) {
            Json::Value value;
            value["i"] = i;
            meta = value;
        }
        const auto type = static_cast<RecordType>(kTypeBinary + i % 3);
        unwrapOrThrow(codec.writeString(out, type, std::string(i * 17, 'm'), meta, i % 2 == 0));
    }
    return out.str();
}

DatasetWindow window(std::int64_t start, std::int64_t count, bool allowPrematureEnd = false) {
    DatasetWindow w;
    w.start = start;
    w.count = count;
    w.allowPrematureEnd = allowPrematureEnd;
    return w;
}

}  // namespace

// =============================================================================
// Count
// =============================================================================

TEST(CountTest, EmptyStream) {
    std::istringstream in("");
    auto total = format::count(in);
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(*total, 0);
}

TEST(CountTest, MixedRecords) {
    std::istringstream in(mixedStream(25));
    auto total = format::count(in);
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(*total, 25);
}

TEST(CountTest, TrailingGarbageFails) {
    std::istringstream in(textStream(3) + "xx");
    auto total = format::count(in);
    ASSERT_FALSE(total.has_value());
    EXPECT_EQ(total.error().code(), ErrorCode::kTruncated);
    EXPECT_NE(total.error().message().find("record: 3, offset: 0x54"), std::string::npos);
    EXPECT_EQ(total.error().message().find("positional.cpp"), std::string::npos);
}

TEST(CountTest, UnseekableStreamReportsRecordOnly) {
    srf::test::ShortReadStreamBuf buf(textStream(3) + "xx", 4);
    std::istream in(&buf);

    auto total = format::count(in);
    ASSERT_FALSE(total.has_value());
    EXPECT_EQ(total.error().code(), ErrorCode::kTruncated);
    EXPECT_NE(total.error().message().find("(record: 3)"), std::string::npos);
    EXPECT_EQ(total.error().message().find("offset"), std::string::npos);
}

TEST(CountTest, StreamWithExceptionMask) {
    std::istringstream in(textStream(3));
    in.exceptions(std::ios::eofbit | std::ios::failbit | std::ios::badbit);

    Result<std::int64_t> total = 0;
    EXPECT_NO_THROW(total = format::count(in));
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(*total, 3);
}

TEST(CountTest, CorruptFrameFails) {
    std::ostringstream out;
    unwrapOrThrow(writeRawRecord(out, kTypeBinary, ByteBuffer{}, toBytes("not zstd"), true));

    std::istringstream in(out.str());
    auto total = format::count(in);
    ASSERT_FALSE(total.has_value());
    EXPECT_EQ(total.error().code(), ErrorCode::kCorruptFrame);
}

// =============================================================================
// Ten-Record Scenario
// =============================================================================

class TenRecordTest : public ::testing::Test {
protected:
    void SetUp() override { bytes_ = textStream(10); }

    std::string bytes_;
};

TEST_F(TenRecordTest, CountIsTen) {
    std::istringstream in(bytes_);
    auto total = format::count(in);
    ASSERT_TRUE(total.has_value());
    EXPECT_EQ(*total, 10);
}

TEST_F(TenRecordTest, ExtractMiddleWindow) {
    std::istringstream in(bytes_);
    auto records = extract(in, window(3, 3));
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 3U);
    EXPECT_EQ((*records)[0].text(), "record-3");
    EXPECT_EQ((*records)[1].text(), "record-4");
    EXPECT_EQ((*records)[2].text(), "record-5");
}

TEST_F(TenRecordTest, ExtractFirstRecord) {
    std::istringstream in(bytes_);
    auto records = extract(in, window(0, 1));
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 1U);
    EXPECT_EQ((*records)[0].text(), "record-0");
}

TEST_F(TenRecordTest, ExtractPastEndAllowed) {
    std::istringstream in(bytes_);
    auto records = extract(in, window(9, 5, true));
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 1U);
    EXPECT_EQ((*records)[0].text(), "record-9");
}

TEST_F(TenRecordTest, ExtractPastEndRejected) {
    std::istringstream in(bytes_);
    auto records = extract(in, window(9, 5, false));
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code(), ErrorCode::kEndOfStream);
}

TEST_F(TenRecordTest, ExtractStartBeyondEnd) {
    std::istringstream allowed(bytes_);
    auto empty = extract(allowed, window(12, 2, true));
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());

    std::istringstream rejected(bytes_);
    auto failed = extract(rejected, window(12, 2, false));
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code(), ErrorCode::kEndOfStream);
}

TEST_F(TenRecordTest, CopyWithRecompression) {
    std::istringstream src(bytes_);
    std::stringstream dst;

    auto copied = format::copy(src, dst, window(5, 3), true);
    ASSERT_TRUE(copied.has_value());
    EXPECT_EQ(*copied, 3);

    RecordCodec codec;
    for (int i = 5; i < 8; ++i) {
        auto header = decodeHeader(dst);
        ASSERT_TRUE(header.has_value());
        EXPECT_TRUE(header->compressed);
        EXPECT_EQ(header->type, kTypeText);

        // Rewind to the header and decode the whole record
        dst.seekg(-static_cast<std::streamoff>(RecordHeader::kSize), std::ios::cur);
        auto record = codec.read(dst);
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ(record->text(), "record-" + std::to_string(i));
    }

    auto end = codec.read(dst);
    ASSERT_FALSE(end.has_value());
    EXPECT_TRUE(end.error().isEndOfStream());
}

TEST_F(TenRecordTest, CopyWithoutRecompression) {
    std::istringstream src(bytes_);
    std::stringstream dst;

    auto copied = format::copy(src, dst, window(0, 2), false);
    ASSERT_TRUE(copied.has_value());
    EXPECT_EQ(*copied, 2);

    // Uncompressed text records re-emit byte for byte
    std::istringstream again(bytes_);
    ASSERT_TRUE(skipRecords(again, 2).has_value());
    const auto prefixLength = static_cast<std::size_t>(again.tellg());
    EXPECT_EQ(dst.str(), bytes_.substr(0, prefixLength));
}

TEST_F(TenRecordTest, CopyPrematureEnd) {
    std::istringstream allowedSrc(bytes_);
    std::stringstream allowedDst;
    auto copied = format::copy(allowedSrc, allowedDst, window(8, 5, true), false);
    ASSERT_TRUE(copied.has_value());
    EXPECT_EQ(*copied, 2);

    std::istringstream rejectedSrc(bytes_);
    std::stringstream rejectedDst;
    auto failed = format::copy(rejectedSrc, rejectedDst, window(8, 5, false), false);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code(), ErrorCode::kEndOfStream);
}

// =============================================================================
// Window Validation
// =============================================================================

TEST(WindowValidationTest, RejectedBeforeAnyRead) {
    srf::test::FailingStreamBuf buf;
    std::istream in(&buf);
    std::ostringstream out;

    auto negativeStart = extract(in, window(-1, 1));
    ASSERT_FALSE(negativeStart.has_value());
    EXPECT_EQ(negativeStart.error().code(), ErrorCode::kInvalidStartOffset);

    auto zeroCount = extract(in, window(0, 0));
    ASSERT_FALSE(zeroCount.has_value());
    EXPECT_EQ(zeroCount.error().code(), ErrorCode::kInvalidCount);

    auto negativeCount = format::copy(in, out, window(2, -4), false);
    ASSERT_FALSE(negativeCount.has_value());
    EXPECT_EQ(negativeCount.error().code(), ErrorCode::kInvalidCount);

    // The stream was never touched
    EXPECT_TRUE(in.good());
    EXPECT_TRUE(out.str().empty());
}

// =============================================================================
// Errors During the Pass
// =============================================================================

TEST(PositionalErrorTest, TruncationIsNotMaskedByPrematureEnd) {
    const std::string bytes = textStream(4);
    std::istringstream in(bytes.substr(0, bytes.size() - 2));

    auto records = extract(in, window(1, 10, true));
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code(), ErrorCode::kTruncated);
}

TEST(PositionalErrorTest, TruncationWhileSkipping) {
    const std::string bytes = textStream(4);
    std::istringstream in(bytes.substr(0, bytes.size() / 2 + 5));

    auto records = extract(in, window(3, 1, true));
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code(), ErrorCode::kTruncated);
}

TEST(PositionalErrorTest, SkippedCorruptFrameIsHarmless) {
    std::ostringstream out;
    unwrapOrThrow(writeRawRecord(out, kTypeBinary, ByteBuffer{}, toBytes("not zstd"), true));
    out << textStream(1);

    std::istringstream in(out.str());
    auto records = extract(in, window(1, 1));
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 1U);
    EXPECT_EQ((*records)[0].text(), "record-0");
}

TEST(PositionalErrorTest, CollectedCorruptFrameFails) {
    std::ostringstream out;
    out << textStream(1);
    unwrapOrThrow(writeRawRecord(out, kTypeBinary, ByteBuffer{}, toBytes("not zstd"), true));

    std::istringstream in(out.str());
    auto records = extract(in, window(0, 2, true));
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code(), ErrorCode::kCorruptFrame);
    EXPECT_NE(records.error().message().find("record: 1, offset: 0x1c"), std::string::npos);
}

TEST(PositionalErrorTest, ExtractFromStartAcrossShortReads) {
    srf::test::ShortReadStreamBuf buf(textStream(5), 3);
    std::istream in(&buf);

    auto records = extract(in, window(0, 5));
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 5U);
    EXPECT_EQ(records->front().text(), "record-0");
    EXPECT_EQ(records->back().text(), "record-4");
}

TEST(PositionalErrorTest, CopyWriteFailure) {
    std::istringstream src(textStream(3));
    std::ostringstream dst;
    dst.setstate(std::ios::badbit);

    auto copied = format::copy(src, dst, window(0, 3), false);
    ASSERT_FALSE(copied.has_value());
    EXPECT_EQ(copied.error().code(), ErrorCode::kIOError);
}

TEST(PositionalErrorTest, CustomCodecSkipBuffer) {
    CodecConfig config;
    config.skipBufferSize = kMinSkipBufferSize;
    RecordCodec codec(config);

    srf::test::ShortReadStreamBuf buf(mixedStream(40), 5);
    std::istream in(&buf);

    auto records = extract(in, window(30, 2), codec);
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 2U);
    EXPECT_EQ((*records)[0].body.size(), 30U * 17U);
    EXPECT_EQ((*records)[1].body.size(), 31U * 17U);
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(PositionalProperty, CountMatchesWritten, ()) {
    const int n = *rc::gen::inRange(0, 40);
    std::istringstream in(mixedStream(n));

    auto total = format::count(in);
    RC_ASSERT(total.has_value());
    RC_ASSERT(*total == n);
}

RC_GTEST_PROP(PositionalProperty, ExtractBoundaryLaw, ()) {
    const int n = *rc::gen::inRange(1, 30);
    const int k = *rc::gen::inRange(0, n);
    std::istringstream in(textStream(n));

    auto records = extract(in, window(k, 1));
    RC_ASSERT(records.has_value());
    RC_ASSERT(records->size() == 1U);
    RC_ASSERT((*records)[0].text() == "record-" + std::to_string(k));
}

RC_GTEST_PROP(PositionalProperty, PrematureEndLaw, ()) {
    const int m = *rc::gen::inRange(0, 20);
    const int start = *rc::gen::inRange(0, 25);
    const int count = *rc::gen::inRange(1, 10);
    RC_PRE(m < start + count);
    const std::string bytes = textStream(m);

    std::istringstream allowed(bytes);
    auto records = extract(allowed, window(start, count, true));
    RC_ASSERT(records.has_value());
    RC_ASSERT(records->size() == static_cast<std::size_t>(std::max(0, m - start)));

    std::istringstream rejected(bytes);
    auto failed = extract(rejected, window(start, count, false));
    RC_ASSERT(!failed.has_value());
    RC_ASSERT(failed.error().isEndOfStream());
}

RC_GTEST_PROP(PositionalProperty, CopyPreservesContent, ()) {
    const int n = *rc::gen::inRange(1, 20);
    const int start = *rc::gen::inRange(0, n);
    const int count = *rc::gen::inRange(1, n - start + 1);
    const bool recompress = *rc::gen::arbitrary<bool>();
    const std::string bytes = mixedStream(n);

    std::istringstream src(bytes);
    std::stringstream dst;
    auto copied = format::copy(src, dst, window(start, count), recompress);
    RC_ASSERT(copied.has_value());
    RC_ASSERT(*copied == count);

    std::istringstream original(bytes);
    auto expected = extract(original, window(start, count));
    RC_ASSERT(expected.has_value());

    RecordCodec codec;
    for (const Record& want : *expected) {
        auto header = decodeHeader(dst);
        RC_ASSERT(header.has_value());
        RC_ASSERT(header->compressed == recompress);
        dst.seekg(-static_cast<std::streamoff>(RecordHeader::kSize), std::ios::cur);

        auto got = codec.read(dst);
        RC_ASSERT(got.has_value());
        RC_ASSERT(got->type == want.type);
        RC_ASSERT(got->body == want.body);
        RC_ASSERT(got->meta == want.meta);
    }
}

}  // namespace srf::format::test
