// =============================================================================
// sff-codec - Global Header Codec Implementation
// =============================================================================

#include "sffc/format/header_codec.h"

#include <array>
#include <limits>

#include <fmt/format.h>

#include "sffc/common/logger.h"
#include "sffc/io/big_endian.h"

namespace sffc::format {

namespace {

FourCC takeFourCC(std::span<const std::uint8_t> bytes) {
    return {bytes[0], bytes[1], bytes[2], bytes[3]};
}

}  // namespace

GlobalHeader decodeGlobalHeader(io::ByteCursor& cursor) {
    const FileOffset start = cursor.offset();

    std::array<std::uint8_t, kGlobalHeaderFixedSize> fixed{};
    const std::size_t got = cursor.readUpTo(fixed);
    if (got == 0) {
        throw FormatError(FormatErrorKind::kEmptyFile, "Empty file.", cursor.contextAt(start));
    }
    if (got < fixed.size()) {
        throw FormatError(FormatErrorKind::kTooSmall, "File too small to hold a valid SFF header.",
                          cursor.contextAt(start).withValues(fixed.size(), got));
    }

    const std::span<const std::uint8_t> bytes(fixed);

    GlobalHeader header;
    header.magic = takeFourCC(bytes.subspan(0, 4));
    if (isIndexMagic(header.magic)) {
        throw FormatError(FormatErrorKind::kAtIndexBlock,
                          "Handle seems to be at SFF index block, not start",
                          cursor.contextAt(start).withObserved(describeBytes(header.magic)));
    }
    if (header.magic != kSffMagic) {
        throw FormatError(FormatErrorKind::kBadMagic,
                          fmt::format("SFF file did not start '.sff', but '{}'",
                                      describeBytes(header.magic)),
                          cursor.contextAt(start).withObserved(describeBytes(header.magic)));
    }

    header.version = takeFourCC(bytes.subspan(4, 4));
    if (header.version != kSffVersion) {
        throw FormatError(FormatErrorKind::kUnsupportedVersion,
                          fmt::format("Unsupported SFF version in header, {}",
                                      dottedBytes(header.version)),
                          cursor.contextAt(start + 4).withObserved(dottedBytes(header.version)));
    }

    header.indexOffset = io::loadBE<std::uint64_t>(bytes.subspan(8));
    header.indexLength = io::loadBE<std::uint32_t>(bytes.subspan(16));
    header.numberOfReads = io::loadBE<std::uint32_t>(bytes.subspan(20));
    header.headerLength = io::loadBE<std::uint16_t>(bytes.subspan(24));
    header.keyLength = io::loadBE<std::uint16_t>(bytes.subspan(26));
    header.flowLength = io::loadBE<std::uint16_t>(bytes.subspan(28));
    header.flowgramFormat = bytes[30];

    if (header.flowgramFormat != kFlowgramFormatCode) {
        throw FormatError(FormatErrorKind::kUnsupportedFlowgramFormat,
                          fmt::format("Flowgram format code {} not supported",
                                      header.flowgramFormat),
                          cursor.contextAt(start + 30).withValues(kFlowgramFormatCode,
                                                                 header.flowgramFormat));
    }

    if ((header.indexOffset == 0) != (header.indexLength == 0)) {
        throw FormatError(FormatErrorKind::kInconsistentIndex,
                          fmt::format("Index offset {} but index length {}", header.indexOffset,
                                      header.indexLength),
                          cursor.contextAt(start + 8));
    }

    header.flowChars = cursor.readString(header.flowLength, "flow chars");
    header.keySequence = cursor.readString(header.keyLength, "key sequence");

    const std::uint64_t expected = header.expectedHeaderLength();
    if (header.headerLength != expected) {
        throw FormatError(FormatErrorKind::kMalformedHeader,
                          fmt::format("Header length {} does not match {} flows and {} key "
                                      "bases, expected {}",
                                      header.headerLength, header.flowLength, header.keyLength,
                                      expected),
                          cursor.contextAt(start + 24).withValues(expected, header.headerLength));
    }

    const std::uint64_t consumed = kGlobalHeaderFixedSize + header.flowLength + header.keyLength;
    cursor.expectZeroPadding(static_cast<std::size_t>(header.headerLength - consumed),
                             "global header padding");

    SFFC_LOG_DEBUG("SFF header: reads={}, flows={}, key={}, index={}+{}", header.numberOfReads,
                   header.flowLength, header.keySequence, header.indexOffset, header.indexLength);

    return header;
}

GlobalHeader makeGlobalHeader(const FlowParameters& params, std::uint32_t numberOfReads) {
    constexpr auto kMaxField = std::numeric_limits<std::uint16_t>::max();
    if (params.flowChars.size() > kMaxField || params.keySequence.size() > kMaxField) {
        throw FormatError(FormatErrorKind::kInvalidRecord,
                          fmt::format("Flow chars ({}) and key ({}) must each fit in 65535 bytes",
                                      params.flowChars.size(), params.keySequence.size()));
    }

    GlobalHeader header;
    header.numberOfReads = numberOfReads;
    header.flowLength = static_cast<std::uint16_t>(params.flowChars.size());
    header.keyLength = static_cast<std::uint16_t>(params.keySequence.size());
    header.flowChars = params.flowChars;
    header.keySequence = params.keySequence;

    const std::uint64_t length = header.expectedHeaderLength();
    if (length > kMaxField) {
        throw FormatError(FormatErrorKind::kInvalidRecord,
                          fmt::format("Padded header length {} does not fit the 16-bit field",
                                      length));
    }
    header.headerLength = static_cast<std::uint16_t>(length);
    return header;
}

ByteBuffer encodeGlobalHeader(const GlobalHeader& header) {
    ByteBuffer out;
    const std::uint64_t length = header.expectedHeaderLength();
    out.reserve(length);

    out.insert(out.end(), header.magic.begin(), header.magic.end());
    out.insert(out.end(), header.version.begin(), header.version.end());
    io::appendBE(out, header.indexOffset);
    io::appendBE(out, header.indexLength);
    io::appendBE(out, header.numberOfReads);
    io::appendBE(out, static_cast<std::uint16_t>(length));
    io::appendBE(out, static_cast<std::uint16_t>(header.keySequence.size()));
    io::appendBE(out, static_cast<std::uint16_t>(header.flowChars.size()));
    out.push_back(header.flowgramFormat);
    out.insert(out.end(), header.flowChars.begin(), header.flowChars.end());
    out.insert(out.end(), header.keySequence.begin(), header.keySequence.end());
    out.resize(length, 0);
    return out;
}

}  // namespace sffc::format
