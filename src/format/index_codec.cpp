// =============================================================================
// sff-codec - Index Block Codec Implementation
// =============================================================================

#include "sffc/format/index_codec.h"

#include <algorithm>
#include <limits>
#include <numeric>

#include <fmt/format.h>

#include "sffc/common/logger.h"
#include "sffc/io/big_endian.h"

namespace sffc::format {

namespace {

/// @brief Manifest index header fields following the magic.
struct ManifestHeader {
    FileOffset offset = 0;
    std::uint32_t xmlSize = 0;
    std::uint32_t entriesSize = 0;
};

/// @brief Position at the index and read its tag.
/// @return The manifest header fields, or the unknown index for other tags.
std::variant<ManifestHeader, UnknownIndex> readIndexHeader(io::ByteCursor& cursor,
                                                           const GlobalHeader& header) {
    if (!header.hasIndex()) {
        throw FormatError(FormatErrorKind::kNoIndexPresent, "No index present in this SFF file",
                          cursor.contextAt(cursor.offset()));
    }

    cursor.seekTo(header.indexOffset);

    std::array<std::uint8_t, 8> tag{};
    cursor.readExact(tag, "index block header");
    const FourCC magic = {tag[0], tag[1], tag[2], tag[3]};
    const FourCC version = {tag[4], tag[5], tag[6], tag[7]};

    if (magic != kManifestIndexMagic) {
        SFFC_LOG_DEBUG("Index block at {} has unsupported magic '{}'", header.indexOffset,
                       describeBytes(magic));
        return UnknownIndex{magic, version, header.indexOffset, header.indexLength};
    }

    if (version != kManifestIndexVersion) {
        throw FormatError(FormatErrorKind::kUnsupportedIndexVersion,
                          fmt::format("Unsupported version in .mft index header, {}",
                                      dottedBytes(version)),
                          cursor.contextAt(header.indexOffset + 4)
                              .withObserved(dottedBytes(version)));
    }

    ManifestHeader manifest;
    manifest.offset = header.indexOffset;
    manifest.xmlSize = cursor.readBE<std::uint32_t>("manifest XML size");
    manifest.entriesSize = cursor.readBE<std::uint32_t>("manifest entries size");

    const std::uint64_t computed = std::uint64_t{8} + 8 + manifest.xmlSize + manifest.entriesSize;
    if (header.indexLength != computed) {
        throw FormatError(FormatErrorKind::kManifestHeaderSizeMismatch,
                          fmt::format("Problem understanding .mft index header, {} != 8 + 8 + {} "
                                      "+ {}",
                                      header.indexLength, manifest.xmlSize, manifest.entriesSize),
                          cursor.contextAt(header.indexOffset + 8)
                              .withValues(header.indexLength, computed));
    }
    return manifest;
}

/// @brief Read one entry: name, 0x00, four offset digits, 0xFF.
IndexEntry readIndexEntry(io::ByteCursor& cursor) {
    const FileOffset start = cursor.offset();

    ByteBuffer data(kIndexEntryTrailerSize);
    cursor.readExact(data, "index entry");
    std::uint8_t byte = 0;
    while (true) {
        if (cursor.readUpTo(std::span(&byte, 1)) == 0) {
            throw FormatError(FormatErrorKind::kPrematureEOF,
                              fmt::format("Premature end of file in index entry starting at {}",
                                          start),
                              cursor.contextAt(cursor.offset()));
        }
        data.push_back(byte);
        if (byte == kIndexEntryFlag) {
            break;
        }
    }

    const std::size_t nameLength = data.size() - kIndexEntryTrailerSize;
    if (data[nameLength] != 0) {
        throw FormatError(FormatErrorKind::kMissingNullTerminator,
                          "Expected a null terminator to the read name.",
                          cursor.contextAt(start + nameLength));
    }

    IndexEntry entry;
    entry.readName.assign(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(nameLength));
    entry.recordOffset =
        decodeIndexOffset(std::span<const std::uint8_t, 4>(data.data() + nameLength + 1, 4));
    return entry;
}

/// @brief Report an index block this codec cannot interpret.
[[noreturn]] void throwUnknownIndex(const UnknownIndex& unknown) {
    ByteBuffer tag(unknown.magic.begin(), unknown.magic.end());
    tag.insert(tag.end(), unknown.version.begin(), unknown.version.end());

    std::string message;
    if (unknown.magic == kHashIndexMagic) {
        message = "Hash table style indexes (.hsh) in SFF files are not supported";
    } else if (unknown.magic == kSortedIndexMagic) {
        message = "Sorted table style indexes (.srt) in SFF files are not supported";
    } else {
        message = fmt::format("Unknown magic number '{}' in SFF index header: '{}'",
                              describeBytes(unknown.magic), describeBytes(tag));
    }

    ErrorContext context;
    context.withOffset(unknown.offset).withObserved(describeBytes(unknown.magic));
    throw FormatError(FormatErrorKind::kUnknownIndexFormat, std::move(message), std::move(context));
}

}  // namespace

// =============================================================================
// ManifestIndex
// =============================================================================

ManifestIndex::ManifestIndex(std::string xml, std::vector<IndexEntry> entries)
    : xml_(std::move(xml)), entries_(std::move(entries)), byName_(entries_.size()) {
    std::iota(byName_.begin(), byName_.end(), std::size_t{0});
    // Stable so the first of any duplicated names wins
    std::stable_sort(byName_.begin(), byName_.end(), [this](std::size_t a, std::size_t b) {
        return entries_[a].readName < entries_[b].readName;
    });
}

const IndexEntry* ManifestIndex::find(std::string_view readName) const noexcept {
    const auto it = std::lower_bound(
        byName_.begin(), byName_.end(), readName,
        [this](std::size_t pos, std::string_view name) { return entries_[pos].readName < name; });
    if (it == byName_.end() || entries_[*it].readName != readName) {
        return nullptr;
    }
    return &entries_[*it];
}

// =============================================================================
// Decoding
// =============================================================================

IndexBlock decodeIndexBlock(io::ByteCursor& cursor, const GlobalHeader& header) {
    auto parsed = readIndexHeader(cursor, header);
    if (auto* unknown = std::get_if<UnknownIndex>(&parsed)) {
        return *unknown;
    }
    const auto& manifest = std::get<ManifestHeader>(parsed);

    std::string xml = cursor.readString(manifest.xmlSize, "manifest XML");

    std::vector<IndexEntry> entries;
    entries.reserve(std::min<std::size_t>(header.numberOfReads, manifest.entriesSize));
    for (std::uint32_t i = 0; i < header.numberOfReads; ++i) {
        entries.push_back(readIndexEntry(cursor));
    }

    const FileOffset expectedEnd =
        manifest.offset + kManifestIndexHeaderSize + manifest.xmlSize + manifest.entriesSize;
    if (cursor.offset() != expectedEnd) {
        throw FormatError(FormatErrorKind::kIndexLengthMismatch,
                          fmt::format("Problem with index length? {} vs {}", cursor.offset(),
                                      expectedEnd),
                          cursor.contextAt(cursor.offset()).withValues(expectedEnd,
                                                                       cursor.offset()));
    }

    SFFC_LOG_DEBUG("Manifest index decoded: {} entries, {} bytes of XML", entries.size(),
                   xml.size());
    return ManifestIndex(std::move(xml), std::move(entries));
}

const ManifestIndex& requireManifestIndex(const IndexBlock& block) {
    if (const auto* manifest = std::get_if<ManifestIndex>(&block)) {
        return *manifest;
    }
    throwUnknownIndex(std::get<UnknownIndex>(block));
}

std::string decodeManifestXml(io::ByteCursor& cursor, const GlobalHeader& header) {
    auto parsed = readIndexHeader(cursor, header);
    if (const auto* unknown = std::get_if<UnknownIndex>(&parsed)) {
        throwUnknownIndex(*unknown);
    }
    const auto& manifest = std::get<ManifestHeader>(parsed);
    if (manifest.xmlSize == 0) {
        throw FormatError(FormatErrorKind::kNoXmlManifest, "No XML manifest found",
                          cursor.contextAt(manifest.offset + 8));
    }
    return cursor.readString(manifest.xmlSize, "manifest XML");
}

// =============================================================================
// Encoding
// =============================================================================

std::array<std::uint8_t, 4> encodeIndexOffset(FileOffset offset) noexcept {
    std::array<std::uint8_t, 4> digits{};
    for (std::size_t i = digits.size(); i-- > 0;) {
        digits[i] = static_cast<std::uint8_t>(offset % 255);
        offset /= 255;
    }
    return digits;
}

FileOffset decodeIndexOffset(std::span<const std::uint8_t, 4> digits) noexcept {
    return digits[3] + 255ULL * digits[2] + 65025ULL * digits[1] + 16581375ULL * digits[0];
}

void requireManifestIndexFits(std::uint64_t xmlSize, std::uint64_t entriesSize) {
    constexpr std::uint64_t kLimit = std::numeric_limits<std::uint32_t>::max();
    // Each term is checked alone first so the sum cannot wrap
    if (xmlSize > kLimit || entriesSize > kLimit ||
        kManifestIndexHeaderSize + xmlSize + entriesSize > kLimit) {
        throw FormatError(FormatErrorKind::kInvalidRecord,
                          fmt::format("Manifest index of {} XML bytes and {} entry bytes exceeds "
                                      "the 32-bit index length",
                                      xmlSize, entriesSize));
    }
}

EncodedIndex encodeManifestIndex(std::string_view xml, std::vector<IndexEntry> entries) {
    std::sort(entries.begin(), entries.end(),
              [](const IndexEntry& a, const IndexEntry& b) { return a.readName < b.readName; });

    ByteBuffer body;
    for (const auto& entry : entries) {
        body.insert(body.end(), entry.readName.begin(), entry.readName.end());
        body.push_back(0);
        const auto digits = encodeIndexOffset(entry.recordOffset);
        body.insert(body.end(), digits.begin(), digits.end());
        body.push_back(kIndexEntryFlag);
    }
    requireManifestIndexFits(xml.size(), body.size());

    EncodedIndex encoded;
    ByteBuffer& out = encoded.bytes;
    out.insert(out.end(), kManifestIndexMagic.begin(), kManifestIndexMagic.end());
    out.insert(out.end(), kManifestIndexVersion.begin(), kManifestIndexVersion.end());
    io::appendBE(out, static_cast<std::uint32_t>(xml.size()));
    io::appendBE(out, static_cast<std::uint32_t>(body.size()));
    out.insert(out.end(), xml.begin(), xml.end());
    out.insert(out.end(), body.begin(), body.end());

    encoded.indexLength = static_cast<std::uint32_t>(out.size());
    out.resize(padTo8(out.size()), 0);
    return encoded;
}

std::string defaultManifestXml() {
    return "<!-- This file was written by sff-codec. -->\n"
           "<!-- The XML and index block follow the layout of Roche SFF files. -->\n"
           "<!-- The index holds read names and offsets only. -->\n";
}

}  // namespace sffc::format
