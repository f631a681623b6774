// =============================================================================
// sff-codec - Byte Source and Cursor Tests
// =============================================================================
// Unit tests for big-endian field reads, padding checks, skipping on
// sequential sources and the sink overwrite used to patch headers.
// =============================================================================

#include "sffc/io/byte_cursor.h"

#include <gtest/gtest.h>

#include <optional>
#include <sstream>
#include <string>

#include "sffc/io/byte_source.h"

namespace sffc::io {
namespace {

std::optional<FormatError> captureFormatError(const auto& fn) {
    try {
        fn();
    } catch (const FormatError& e) {
        return e;
    }
    return std::nullopt;
}

// =============================================================================
// Big-Endian Fields
// =============================================================================

TEST(BigEndianTest, LoadAndStore) {
    const ByteBuffer bytes = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    EXPECT_EQ(loadBE<std::uint16_t>(bytes), 0x0102U);
    EXPECT_EQ(loadBE<std::uint32_t>(bytes), 0x01020304U);
    EXPECT_EQ(loadBE<std::uint64_t>(bytes), 0x0102030405060708ULL);

    ByteBuffer out;
    appendBE<std::uint32_t>(out, 0xDEADBEEF);
    EXPECT_EQ(out, (ByteBuffer{0xDE, 0xAD, 0xBE, 0xEF}));

    storeBE<std::uint16_t>(std::span(out).subspan(1), 0x1234);
    EXPECT_EQ(out, (ByteBuffer{0xDE, 0x12, 0x34, 0xEF}));
}

// =============================================================================
// ByteCursor
// =============================================================================

TEST(ByteCursorTest, ReadsFieldsAndTracksOffset) {
    const ByteBuffer bytes = {0x2E, 0x73, 0x66, 0x66, 0x00, 0x30, 0x00, 0x00, 0x00, 0x03, 0x04};
    MemoryByteSource source{std::span<const std::uint8_t>(bytes)};
    ByteCursor cursor(source);

    EXPECT_EQ(cursor.label(), "<memory>");
    EXPECT_EQ(cursor.readString(4, "magic"), ".sff");
    EXPECT_EQ(cursor.readBE<std::uint16_t>("length"), 48U);
    EXPECT_EQ(cursor.readBE<std::uint32_t>("count"), 3U);
    EXPECT_EQ(cursor.readBE<std::uint8_t>("code"), 4U);
    EXPECT_EQ(cursor.offset(), 11U);
    EXPECT_EQ(cursor.remaining(), 0U);
}

TEST(ByteCursorTest, ShortReadIsPrematureEOF) {
    const ByteBuffer bytes = {0x00, 0x00, 0x01};
    MemoryByteSource source{std::span<const std::uint8_t>(bytes)};
    ByteCursor cursor(source, "short.sff");
    (void)cursor.readBE<std::uint8_t>("first");

    const auto error = captureFormatError([&] { (void)cursor.readBE<std::uint32_t>("nreads"); });
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), FormatErrorKind::kPrematureEOF);
    EXPECT_EQ(error->byteOffset(), 1U);
    ASSERT_TRUE(error->context().has_value());
    EXPECT_EQ(error->context()->filePath, "short.sff");
    EXPECT_EQ(error->context()->expectedValue, 4U);
    EXPECT_EQ(error->context()->actualValue, 2U);
    EXPECT_NE(error->message().find("nreads"), std::string::npos);
}

TEST(ByteCursorTest, HugeLengthRejectedBeforeAllocating) {
    const ByteBuffer bytes(16, 0);
    MemoryByteSource source{std::span<const std::uint8_t>(bytes)};
    ByteCursor cursor(source);

    const auto error =
        captureFormatError([&] { (void)cursor.readBytes(std::size_t{1} << 40, "read name"); });
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), FormatErrorKind::kPrematureEOF);
    EXPECT_EQ(error->context()->actualValue, 16U);
    EXPECT_EQ(cursor.offset(), 0U);
}

TEST(ByteCursorTest, ZeroPaddingAccepted) {
    const ByteBuffer bytes(20, 0);
    MemoryByteSource source{std::span<const std::uint8_t>(bytes)};
    ByteCursor cursor(source);
    EXPECT_NO_THROW(cursor.expectZeroPadding(19, "padding"));
    EXPECT_EQ(cursor.offset(), 19U);
    EXPECT_NO_THROW(cursor.expectZeroPadding(0, "padding"));
}

TEST(ByteCursorTest, BadPaddingReportsFirstNonNullByte) {
    ByteBuffer bytes(20, 0);
    bytes[13] = 0x41;
    bytes[15] = 0x42;
    MemoryByteSource source{std::span<const std::uint8_t>(bytes)};
    ByteCursor cursor(source);
    cursor.skip(2, "prefix");

    const auto error = captureFormatError([&] { cursor.expectZeroPadding(16, "read data padding"); });
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), FormatErrorKind::kBadPadding);
    EXPECT_EQ(error->byteOffset(), 13U);
}

TEST(ByteCursorTest, SkipOnSequentialStreamReadsForward) {
    std::istringstream stream(std::string("0123456789"));
    StreamByteSource source(stream, false, "pipe");
    ByteCursor cursor(source);

    EXPECT_FALSE(cursor.isSeekable());
    EXPECT_FALSE(cursor.remaining().has_value());
    cursor.skip(7, "gap");
    EXPECT_EQ(cursor.offset(), 7U);
    EXPECT_EQ(cursor.readString(3, "tail"), "789");

    EXPECT_THROW(cursor.seekTo(0), IOError);
}

TEST(ByteCursorTest, SkipPastEndIsPrematureEOF) {
    std::istringstream stream(std::string("0123"));
    StreamByteSource source(stream, false);
    ByteCursor cursor(source);

    const auto error = captureFormatError([&] { cursor.skip(10, "index block"); });
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), FormatErrorKind::kPrematureEOF);
    EXPECT_EQ(error->context()->actualValue, 4U);
}

TEST(ByteCursorTest, ReadUpToStopsAtEnd) {
    const ByteBuffer bytes = {1, 2, 3};
    MemoryByteSource source{std::span<const std::uint8_t>(bytes)};
    ByteCursor cursor(source);

    std::uint8_t out[8] = {};
    EXPECT_EQ(cursor.readUpTo(out), 3U);
    EXPECT_EQ(cursor.readUpTo(out), 0U);
}

// =============================================================================
// Sources and Sinks
// =============================================================================

TEST(ByteSourceTest, StreamOffsetsStartAtConstructionPosition) {
    std::istringstream stream(std::string("junkDATA!"));
    stream.ignore(4);
    StreamByteSource source(stream);

    EXPECT_TRUE(source.isSeekable());
    EXPECT_EQ(source.position(), 0U);
    EXPECT_EQ(source.size(), 5U);

    ByteCursor cursor(source);
    EXPECT_EQ(cursor.readString(4, "data"), "DATA");
    cursor.seekTo(1);
    EXPECT_EQ(cursor.readString(2, "data"), "AT");
}

TEST(ByteSourceTest, OwnedMemorySource) {
    MemoryByteSource source(ByteBuffer{9, 8, 7});
    ByteCursor cursor(source);
    cursor.seekTo(2);
    EXPECT_EQ(cursor.readBE<std::uint8_t>("last"), 7U);
}

TEST(ByteSourceTest, MissingFileIsIOError) {
    EXPECT_THROW(FileByteSource("/nonexistent/sffc/missing.sff"), IOError);
}

TEST(ByteSinkTest, MemorySinkOverwritesInPlace) {
    MemoryByteSink sink;
    sink.write(ByteBuffer{1, 2, 3, 4, 5, 6, 7, 8});
    sink.seek(2);
    sink.write(ByteBuffer{0xAA, 0xBB});
    EXPECT_EQ(sink.position(), 4U);
    EXPECT_EQ(sink.data(), (ByteBuffer{1, 2, 0xAA, 0xBB, 5, 6, 7, 8}));

    EXPECT_THROW(sink.seek(9), IOError);

    const ByteBuffer released = sink.release();
    EXPECT_EQ(released.size(), 8U);
    EXPECT_TRUE(sink.data().empty());
    EXPECT_EQ(sink.position(), 0U);
}

}  // namespace
}  // namespace sffc::io
