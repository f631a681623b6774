// =============================================================================
// sff-codec - Index Block Codec
// =============================================================================
// Decodes and encodes the optional index block that trails the read records.
//
// Only the Roche manifest index (".mft" version "1.00") is interpreted:
//
//   +--------+---------+-------------+-----------------+
//   | ".mft" | "1.00"  | xml_size u32| entries_size u32|
//   +--------+---------+-------------+-----------------+
//   | manifest XML (xml_size bytes)                    |
//   +--------------------------------------------------+
//   | entries: name, 0x00, 4 base-255 offset digits,   |
//   |          0xFF flag                (entries_size) |
//   +--------------------------------------------------+
//
// Other index types (".srt", ".hsh", vendor tags) decode to UnknownIndex,
// which keeps the raw tag bytes and is never interpreted further.
//
// Thread Safety:
// - A decoded ManifestIndex is immutable; concurrent find() calls are safe
// =============================================================================

#ifndef SFFC_FORMAT_INDEX_CODEC_H
#define SFFC_FORMAT_INDEX_CODEC_H

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "sffc/common/types.h"
#include "sffc/format/read_name.h"
#include "sffc/format/sff_format.h"
#include "sffc/io/byte_cursor.h"

namespace sffc::format {

// =============================================================================
// Index Structures
// =============================================================================

/// @brief One manifest index entry.
struct IndexEntry {
    std::string readName;

    /// @brief Offset of the read header within the file.
    FileOffset recordOffset = 0;

    /// @brief Run time, region and coordinates carried by the name.
    [[nodiscard]] std::optional<ReadNameInfo> nameInfo() const noexcept {
        return decodeReadName(readName);
    }

    bool operator==(const IndexEntry&) const = default;
};

/// @brief Decoded ".mft" index: manifest XML plus name-to-offset entries.
class ManifestIndex {
public:
    ManifestIndex(std::string xml, std::vector<IndexEntry> entries);

    /// @brief Manifest XML, verbatim; empty when the file carries none.
    [[nodiscard]] const std::string& xml() const noexcept { return xml_; }

    [[nodiscard]] bool hasXml() const noexcept { return !xml_.empty(); }

    /// @brief Entries in file order.
    [[nodiscard]] std::span<const IndexEntry> entries() const noexcept { return entries_; }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    /// @brief Look up a read by name.
    /// @return The entry, or nullptr if the name is not indexed.
    [[nodiscard]] const IndexEntry* find(std::string_view readName) const noexcept;

private:
    std::string xml_;
    std::vector<IndexEntry> entries_;

    /// @brief Positions into entries_, ordered by name.
    std::vector<std::size_t> byName_;
};

/// @brief Index block of a type this codec does not interpret.
struct UnknownIndex {
    FourCC magic{};
    FourCC version{};
    FileOffset offset = 0;
    std::uint32_t length = 0;
};

/// @brief Index block, keyed by its four-byte magic.
using IndexBlock = std::variant<ManifestIndex, UnknownIndex>;

// =============================================================================
// Decoding
// =============================================================================

/// @brief Decode the index block the header points at.
/// @note Seeks to header.indexOffset; the cursor ends after the last entry.
/// @throws FormatError with kinds kNoIndexPresent, kPrematureEOF,
///         kUnsupportedIndexVersion, kManifestHeaderSizeMismatch,
///         kMissingNullTerminator or kIndexLengthMismatch.
[[nodiscard]] IndexBlock decodeIndexBlock(io::ByteCursor& cursor, const GlobalHeader& header);

/// @brief Unwrap a manifest index.
/// @throws FormatError(kUnknownIndexFormat) carrying the raw magic otherwise.
[[nodiscard]] const ManifestIndex& requireManifestIndex(const IndexBlock& block);

/// @brief Read only the manifest XML, without scanning entries.
/// @throws FormatError(kNoXmlManifest) when the XML section is empty,
///         plus the header errors of decodeIndexBlock.
[[nodiscard]] std::string decodeManifestXml(io::ByteCursor& cursor, const GlobalHeader& header);

// =============================================================================
// Encoding
// =============================================================================

/// @brief Encode an offset as four base-255 digits, most significant first.
/// @note Requires offset <= kMaxIndexableOffset.
[[nodiscard]] std::array<std::uint8_t, 4> encodeIndexOffset(FileOffset offset) noexcept;

[[nodiscard]] FileOffset decodeIndexOffset(std::span<const std::uint8_t, 4> digits) noexcept;

/// @brief Serialized manifest index block.
struct EncodedIndex {
    /// @brief Block bytes including trailing null padding.
    ByteBuffer bytes;

    /// @brief Value for the header's index_length (padding excluded).
    std::uint32_t indexLength = 0;
};

/// @brief Check that a manifest index with these section sizes fits the u32
///        xml_size, entries_size and index_length fields.
/// @throws FormatError (InvalidRecord) when it does not.
void requireManifestIndexFits(std::uint64_t xmlSize, std::uint64_t entriesSize);

/// @brief Encode a manifest index; entries are written sorted by name.
/// @throws FormatError (InvalidRecord) when the block exceeds 32-bit lengths.
[[nodiscard]] EncodedIndex encodeManifestIndex(std::string_view xml,
                                               std::vector<IndexEntry> entries);

/// @brief XML comment block used when a writer is given no manifest.
[[nodiscard]] std::string defaultManifestXml();

}  // namespace sffc::format

#endif  // SFFC_FORMAT_INDEX_CODEC_H
