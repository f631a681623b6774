// =============================================================================
// sff-codec - Read Record Codec Implementation
// =============================================================================

#include "sffc/format/record_codec.h"

#include <limits>

#include <fmt/format.h>

#include "sffc/io/big_endian.h"

namespace sffc::format {

ReadRecord decodeReadRecord(io::ByteCursor& cursor, const GlobalHeader& header,
                            std::optional<ReadIndex> readIndex) {
    ReadRecord record;
    record.fileOffset = cursor.offset();

    const auto declaredHeaderLength = cursor.readBE<std::uint16_t>("read header length");
    const auto nameLength = cursor.readBE<std::uint16_t>("read name length");
    const auto numberOfBases = cursor.readBE<std::uint32_t>("number of bases");
    record.clipQualLeft = cursor.readBE<std::uint16_t>("clip qual left");
    record.clipQualRight = cursor.readBE<std::uint16_t>("clip qual right");
    record.clipAdapterLeft = cursor.readBE<std::uint16_t>("clip adapter left");
    record.clipAdapterRight = cursor.readBE<std::uint16_t>("clip adapter right");

    const std::uint64_t expectedHeaderLength = readHeaderLength(nameLength);
    if (declaredHeaderLength != expectedHeaderLength) {
        ErrorContext context = cursor.contextAt(record.fileOffset);
        context.withValues(expectedHeaderLength, declaredHeaderLength);
        if (readIndex.has_value()) {
            context.withRead(*readIndex);
        }
        throw FormatError(FormatErrorKind::kMalformedRecordHeader,
                          fmt::format("Read header length {} does not match name length {}, "
                                      "expected {}",
                                      declaredHeaderLength, nameLength, expectedHeaderLength),
                          std::move(context));
    }

    record.name = cursor.readString(nameLength, "read name");
    cursor.expectZeroPadding(
        static_cast<std::size_t>(declaredHeaderLength - kReadHeaderFixedSize - nameLength),
        "read header padding");

    // Reject impossible base counts before allocating four arrays for them
    const std::uint64_t dataLength = readDataLength(header.flowLength, numberOfBases);
    cursor.requireAvailable(dataLength, "read data");

    record.flowgram.resize(header.flowLength);
    for (auto& value : record.flowgram) {
        value = cursor.readBE<std::uint16_t>("flowgram values");
    }
    record.flowIndex = cursor.readBytes(numberOfBases, "flow index per base");
    record.bases = cursor.readString(numberOfBases, "bases");
    record.quality = cursor.readBytes(numberOfBases, "quality scores");

    cursor.expectZeroPadding(static_cast<std::size_t>(paddingTo8(dataLength)), "read data padding");

    return record;
}

void validateReadRecord(const ReadRecord& record, const GlobalHeader& header, ReadIndex readIndex) {
    auto reject = [&](std::string message) {
        ErrorContext context;
        context.withRead(readIndex);
        throw FormatError(FormatErrorKind::kInvalidRecord,
                          fmt::format("Read '{}': {}", record.name, message), std::move(context));
    };

    if (record.name.empty()) {
        reject("read name is empty");
    }
    // The padded read header length is itself a 16-bit field
    if (readHeaderLength(record.name.size()) > std::numeric_limits<std::uint16_t>::max()) {
        reject(fmt::format("read name length {} exceeds {}", record.name.size(),
                           kMaxReadNameLength));
    }
    if (record.name.find('\0') != std::string::npos ||
        record.name.find(static_cast<char>(kIndexEntryFlag)) != std::string::npos) {
        reject("read name contains a null or 0xFF byte");
    }
    if (record.flowgram.size() != header.flowLength) {
        reject(fmt::format("{} flowgram values for {} flows", record.flowgram.size(),
                           header.flowLength));
    }
    if (record.bases.size() > std::numeric_limits<std::uint32_t>::max()) {
        reject(fmt::format("{} bases exceed the 32-bit base count", record.bases.size()));
    }
    if (record.flowIndex.size() != record.bases.size() ||
        record.quality.size() != record.bases.size()) {
        reject(fmt::format("{} bases but {} flow index values and {} quality scores",
                           record.bases.size(), record.flowIndex.size(), record.quality.size()));
    }
}

std::uint64_t encodedRecordSize(const ReadRecord& record, const GlobalHeader& header) noexcept {
    return readHeaderLength(record.name.size()) +
           padTo8(readDataLength(header.flowLength, record.bases.size()));
}

ByteBuffer encodeReadRecord(const ReadRecord& record) {
    const std::uint64_t headerLength = readHeaderLength(record.name.size());
    const std::uint64_t dataLength = readDataLength(record.flowgram.size(), record.bases.size());

    ByteBuffer out;
    out.reserve(headerLength + padTo8(dataLength));

    io::appendBE(out, static_cast<std::uint16_t>(headerLength));
    io::appendBE(out, static_cast<std::uint16_t>(record.name.size()));
    io::appendBE(out, static_cast<std::uint32_t>(record.bases.size()));
    io::appendBE(out, record.clipQualLeft);
    io::appendBE(out, record.clipQualRight);
    io::appendBE(out, record.clipAdapterLeft);
    io::appendBE(out, record.clipAdapterRight);
    out.insert(out.end(), record.name.begin(), record.name.end());
    out.resize(headerLength, 0);

    for (const std::uint16_t value : record.flowgram) {
        io::appendBE(out, value);
    }
    out.insert(out.end(), record.flowIndex.begin(), record.flowIndex.end());
    out.insert(out.end(), record.bases.begin(), record.bases.end());
    out.insert(out.end(), record.quality.begin(), record.quality.end());
    out.resize(headerLength + padTo8(dataLength), 0);
    return out;
}

}  // namespace sffc::format
