// =============================================================================
// sff-codec - SFF Reader Tests
// =============================================================================
// Unit tests for the header and record decoders and for the stream checks run
// after the last record (index placement, padding, concatenation).
// =============================================================================

#include "sffc/format/sff_reader.h"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

#include "sff_test_data.h"

namespace sffc::format::test {
namespace {

std::string toString(const ByteBuffer& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

void expectSameRecords(const std::vector<ReadRecord>& actual,
                       const std::vector<ReadRecord>& expected, std::size_t count) {
    ASSERT_EQ(actual.size(), count);
    for (std::size_t i = 0; i < count; ++i) {
        EXPECT_TRUE(actual[i].sameContent(expected[i])) << "record " << i;
    }
}

// =============================================================================
// Well-formed Files
// =============================================================================

TEST(SffReaderTest, ReadsAllRecordsInOrder) {
    const SampleFile file = buildSampleFile();
    ASSERT_EQ(file.bytes.size(), 376U);

    io::MemoryByteSource source(std::span<const std::uint8_t>(file.bytes));
    SffReader reader(source);
    reader.open();

    const GlobalHeader& header = reader.globalHeader();
    EXPECT_EQ(header.numberOfReads, 3U);
    EXPECT_EQ(header.headerLength, kHeaderLength);
    EXPECT_EQ(header.flowChars, kFlowChars);
    EXPECT_EQ(header.keySequence, kKeySequence);
    EXPECT_EQ(header.indexOffset, kRecordsEnd);
    EXPECT_EQ(header.indexLength, 87U);
    EXPECT_TRUE(reader.hasIndex());

    std::vector<ReadRecord> records;
    for (const auto& record : reader) {
        records.push_back(record);
    }
    expectSameRecords(records, file.records, 3);
    for (std::size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].fileOffset, file.offsets[i]);
    }
    EXPECT_TRUE(reader.isFinished());
    EXPECT_EQ(reader.recordsRead(), 3U);
    EXPECT_FALSE(reader.next().has_value());
}

TEST(SffReaderTest, ReadsFileWithoutIndex) {
    const SampleFile file = buildSampleFile(std::nullopt);
    ASSERT_EQ(file.bytes.size(), kRecordsEnd);

    const DrainResult result = drain(file.bytes);
    EXPECT_FALSE(result.error.has_value());
    expectSameRecords(result.records, file.records, 3);
}

TEST(SffReaderTest, ReadsFromFilePath) {
    const SampleFile file = buildSampleFile();
    TempFileGuard guard(tempFilePath());
    {
        std::ofstream out(guard.path(), std::ios::binary);
        out.write(reinterpret_cast<const char*>(file.bytes.data()),
                  static_cast<std::streamsize>(file.bytes.size()));
    }

    SffReader reader(guard.path());
    reader.open();
    std::size_t count = 0;
    for (const auto& record : reader) {
        EXPECT_TRUE(record.sameContent(file.records[count]));
        ++count;
    }
    EXPECT_EQ(count, 3U);
}

TEST(SffReaderTest, SequentialStreamMatchesSeekableSource) {
    const SampleFile file = buildSampleFile();
    std::istringstream stream(toString(file.bytes));
    io::StreamByteSource source(stream, false, "pipe");
    ASSERT_FALSE(source.isSeekable());

    const DrainResult result = drain(source);
    EXPECT_FALSE(result.error.has_value());
    expectSameRecords(result.records, file.records, 3);
}

TEST(SffReaderTest, StreamOffsetsAreRelativeToStartPosition) {
    const SampleFile file = buildSampleFile();
    std::istringstream stream("JUNK!" + toString(file.bytes));
    stream.seekg(5);
    io::StreamByteSource source(stream);

    SffReader reader(source);
    reader.open();
    const auto record = reader.readRecordByName("E3MFGYR02JHD4H");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->fileOffset, file.offsets[2]);
    EXPECT_TRUE(record->sameContent(file.records[2]));
}

TEST(SffReaderTest, GlobalHeaderBeforeOpenIsStateError) {
    const SampleFile file = buildSampleFile();
    io::MemoryByteSource source(std::span<const std::uint8_t>(file.bytes));
    SffReader reader(source);
    EXPECT_THROW((void)reader.globalHeader(), StateError);
    EXPECT_THROW((void)reader.next(), StateError);
}

// =============================================================================
// Global Header Violations
// =============================================================================

TEST(SffReaderTest, EmptyFile) {
    const DrainResult result = drain(ByteBuffer{});
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kEmptyFile);
    EXPECT_EQ(result.error->message(), "Empty file.");
}

TEST(SffReaderTest, TooSmallForHeader) {
    ByteBuffer bytes = buildSampleFile().bytes;
    bytes.resize(20);
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kTooSmall);
    EXPECT_EQ(result.error->message(), "File too small to hold a valid SFF header.");
}

TEST(SffReaderTest, BadMagic) {
    ByteBuffer bytes = buildSampleFile().bytes;
    patchText(bytes, 0, "xxxx");
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kBadMagic);
    EXPECT_EQ(result.error->message(), "SFF file did not start '.sff', but 'xxxx'");
    EXPECT_EQ(result.error->byteOffset(), 0U);
}

TEST(SffReaderTest, PositionedAtIndexBlock) {
    const SampleFile file = buildSampleFile();
    const ByteBuffer index(file.bytes.begin() + static_cast<std::ptrdiff_t>(file.indexOffset),
                           file.bytes.end());
    const DrainResult result = drain(index);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kAtIndexBlock);
    EXPECT_EQ(result.error->message(), "Handle seems to be at SFF index block, not start");
}

TEST(SffReaderTest, UnsupportedVersion) {
    ByteBuffer bytes = buildSampleFile().bytes;
    patchText(bytes, 4, "1.00");
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kUnsupportedVersion);
    EXPECT_EQ(result.error->message(), "Unsupported SFF version in header, 49.46.48.48");
    EXPECT_EQ(result.error->code(), ErrorCode::kUnsupportedFormat);
}

TEST(SffReaderTest, UnsupportedFlowgramFormat) {
    ByteBuffer bytes = buildSampleFile().bytes;
    bytes[30] = 'x';
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kUnsupportedFlowgramFormat);
    EXPECT_EQ(result.error->message(), "Flowgram format code 120 not supported");
}

TEST(SffReaderTest, IndexOffsetWithoutLength) {
    ByteBuffer bytes = buildSampleFile().bytes;
    patchBE64(bytes, 8, 0);
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kInconsistentIndex);
    EXPECT_EQ(result.error->message(), "Index offset 0 but index length 87");
}

TEST(SffReaderTest, HeaderLengthMismatch) {
    ByteBuffer bytes = buildSampleFile().bytes;
    patchBE16(bytes, 24, 40);
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kMalformedHeader);
    EXPECT_EQ(result.error->byteOffset(), 24U);
}

TEST(SffReaderTest, NonNullHeaderPadding) {
    ByteBuffer bytes = buildSampleFile().bytes;
    bytes[45] = 0x7F;
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kBadPadding);
    EXPECT_EQ(result.error->byteOffset(), 45U);
}

// =============================================================================
// Record Violations
// =============================================================================

TEST(SffReaderTest, ReadHeaderLengthMismatch) {
    ByteBuffer bytes = buildSampleFile().bytes;
    patchBE16(bytes, kHeaderLength, 40);
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kMalformedRecordHeader);
    EXPECT_EQ(result.error->byteOffset(), kHeaderLength);
    ASSERT_TRUE(result.error->context().has_value());
    EXPECT_EQ(result.error->context()->readIndex, 0U);
    EXPECT_TRUE(result.records.empty());
}

TEST(SffReaderTest, NonNullReadHeaderPadding) {
    ByteBuffer bytes = buildSampleFile().bytes;
    // Read 0: 16 fixed bytes and a 14-byte name at 48, padded to 80
    bytes[79] = 0x01;
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kBadPadding);
    EXPECT_EQ(result.error->byteOffset(), 79U);
    EXPECT_TRUE(result.records.empty());
}

TEST(SffReaderTest, NonNullReadDataPaddingKeepsEarlierRecords) {
    const SampleFile file = buildSampleFile();
    ByteBuffer bytes = file.bytes;
    // Read 1: header at 128, data at 160, 46 data bytes, padding at 206
    bytes[206] = 0x41;
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kBadPadding);
    EXPECT_EQ(result.error->byteOffset(), 206U);
    expectSameRecords(result.records, file.records, 1);
}

TEST(SffReaderTest, TruncatedRecordData) {
    const SampleFile file = buildSampleFile();
    ByteBuffer bytes = file.bytes;
    bytes.resize(250);
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kPrematureEOF);
    EXPECT_EQ(result.error->byteOffset(), 240U);
    expectSameRecords(result.records, file.records, 2);
}

TEST(SffReaderTest, TruncatedSequentialStream) {
    const SampleFile file = buildSampleFile();
    std::string text = toString(file.bytes);
    text.resize(250);
    std::istringstream stream(text);
    io::StreamByteSource source(stream, false);

    const DrainResult result = drain(source);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kPrematureEOF);
    EXPECT_EQ(result.records.size(), 2U);
}

// =============================================================================
// Stream Layout Violations
// =============================================================================

TEST(SffReaderTest, IndexReachedBeforeAllRecords) {
    const SampleFile file = buildSampleFile();
    ByteBuffer bytes = file.bytes;
    patchBE32(bytes, 20, 4);
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kIndexBeforeRecordsExhausted);
    EXPECT_EQ(result.error->byteOffset(), kRecordsEnd);
    expectSameRecords(result.records, file.records, 3);
}

TEST(SffReaderTest, GapBeforeIndex) {
    ByteBuffer bytes = buildSampleFile().bytes;
    patchBE64(bytes, 8, kRecordsEnd + 8);
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kUnexpectedGapBeforeIndex);
    EXPECT_EQ(result.error->message(),
              "Gap of 8 bytes after final record end 288, before 296 where index starts?");
    EXPECT_EQ(result.records.size(), 3U);
}

TEST(SffReaderTest, IndexOffsetInsideRecords) {
    ByteBuffer bytes = buildSampleFile().bytes;
    patchBE64(bytes, 8, kRecordsEnd - 8);
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kCorruptIndexPointer);
    EXPECT_EQ(result.error->byteOffset(), kRecordsEnd - 8);
}

TEST(SffReaderTest, MissingTerminalPaddingIsTolerated) {
    const SampleFile file = buildSampleFile();
    ByteBuffer bytes = file.bytes;
    bytes.pop_back();
    const DrainResult result = drain(bytes);
    EXPECT_FALSE(result.error.has_value());
    expectSameRecords(result.records, file.records, 3);
}

TEST(SffReaderTest, MissingTerminalPaddingRejectedWhenRequired) {
    ByteBuffer bytes = buildSampleFile().bytes;
    bytes.pop_back();
    ReaderOptions options;
    options.requireTerminalPadding = true;
    const DrainResult result = drain(bytes, options);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kPrematureEOF);
    EXPECT_EQ(result.error->byteOffset(), 375U);
    EXPECT_EQ(result.records.size(), 3U);
}

TEST(SffReaderTest, NonNullPaddingAfterIndex) {
    ByteBuffer bytes = buildSampleFile().bytes;
    bytes[375] = 0x01;
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kBadPadding);
    EXPECT_EQ(result.error->byteOffset(), 375U);
}

TEST(SffReaderTest, FiveBytePaddingEndingInMagic) {
    // 16 + 7 + 60 = 83 index bytes end at 371, leaving 5 bytes of padding
    const SampleFile file = buildSampleFile("<mani/>");
    ASSERT_EQ(file.bytes.size(), 376U);
    ByteBuffer bytes = file.bytes;
    patchText(bytes, 372, ".sff");

    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kTrailingPaddingLooksLikeConcatenation);
    EXPECT_EQ(result.error->byteOffset(), 371U);
    EXPECT_NE(result.error->message().find("post index 5 byte null padding region ended '.sff'"),
              std::string::npos);
    EXPECT_NE(result.error->message().find("See offset 371"), std::string::npos);
    expectSameRecords(result.records, file.records, 3);
}

TEST(SffReaderTest, FourBytePaddingEndingInMagic) {
    const SampleFile file = buildSampleFile("<mani />");
    ByteBuffer bytes = file.bytes;
    patchText(bytes, 372, ".sff");

    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kTrailingPaddingLooksLikeConcatenation);
    EXPECT_EQ(result.error->byteOffset(), 372U);
}

TEST(SffReaderTest, ConcatenatedFiles) {
    const SampleFile file = buildSampleFile();
    ByteBuffer bytes = file.bytes;
    bytes.insert(bytes.end(), file.bytes.begin(), file.bytes.end());

    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kConcatenatedFilesDetected);
    EXPECT_EQ(result.error->byteOffset(), 376U);
    EXPECT_NE(result.error->message().find("perhaps multiple SFF files concatenated? See offset 376"),
              std::string::npos);
    expectSameRecords(result.records, file.records, 3);
}

TEST(SffReaderTest, ConcatenatedFilesWithoutIndexOnSequentialStream) {
    const SampleFile file = buildSampleFile(std::nullopt);
    std::istringstream stream(toString(file.bytes) + toString(file.bytes));
    io::StreamByteSource source(stream, false);

    const DrainResult result = drain(source);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kConcatenatedFilesDetected);
    EXPECT_EQ(result.error->byteOffset(), kRecordsEnd);
    EXPECT_EQ(result.records.size(), 3U);
}

TEST(SffReaderTest, TrailingGarbage) {
    ByteBuffer bytes = buildSampleFile().bytes;
    appendText(bytes, "junk");
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kTrailingGarbage);
    EXPECT_EQ(result.error->byteOffset(), 376U);
    EXPECT_EQ(result.records.size(), 3U);
}

TEST(SffReaderTest, ShortTrailingGarbage) {
    ByteBuffer bytes = buildSampleFile(std::nullopt).bytes;
    appendText(bytes, "ab");
    const DrainResult result = drain(bytes);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind(), FormatErrorKind::kTrailingGarbage);
}

TEST(SffReaderTest, ErrorMessageCarriesContext) {
    ByteBuffer bytes = buildSampleFile().bytes;
    bytes[45] = 0x7F;
    io::MemoryByteSource source{std::span<const std::uint8_t>(bytes)};
    ReaderOptions options;
    options.label = "sample.sff";
    const DrainResult result = drain(source, options);
    ASSERT_TRUE(result.error.has_value());
    const std::string what = result.error->what();
    EXPECT_EQ(what.rfind("[format error]", 0), 0U);
    EXPECT_NE(what.find("file: sample.sff"), std::string::npos);
    EXPECT_NE(what.find("offset: 45 (0x2d)"), std::string::npos);
}

}  // namespace
}  // namespace sffc::format::test
