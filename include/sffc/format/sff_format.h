// =============================================================================
// sff-codec - SFF Format Definitions
// =============================================================================
// Layout constants and in-memory structures for the Standard Flowgram Format.
//
// File layout (all integers big-endian, every section 8-byte aligned):
//
//   +---------------------------+  offset 0
//   | Global Header             |  31 fixed bytes + flow chars + key, padded
//   +---------------------------+  header_length
//   | Read Record 0             |  read header (16 bytes + name, padded)
//   |                           |  read data (flowgram, index, bases, quality, padded)
//   +---------------------------+
//   | ... Read Record N-1       |
//   +---------------------------+  index_offset (optional)
//   | Index Block               |  ".mft" manifest index or another vendor index
//   +---------------------------+  index_offset + index_length, then padding
//
// This module provides:
// - Magic numbers, versions and fixed section sizes
// - GlobalHeader, ReadRecord and FlowParameters structures
// - Clip window computation following the Roche convention
// =============================================================================

#ifndef SFFC_FORMAT_SFF_FORMAT_H
#define SFFC_FORMAT_SFF_FORMAT_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "sffc/common/types.h"

namespace sffc::format {

// =============================================================================
// Magic Numbers and Versions
// =============================================================================

/// @brief File magic ".sff" (0x2E736666).
inline constexpr FourCC kSffMagic = {'.', 's', 'f', 'f'};

/// @brief The only supported file version, bytes 0 0 0 1.
inline constexpr FourCC kSffVersion = {0, 0, 0, 1};

/// @brief Roche manifest index ".mft".
inline constexpr FourCC kManifestIndexMagic = {'.', 'm', 'f', 't'};

/// @brief Roche sorted table index ".srt".
inline constexpr FourCC kSortedIndexMagic = {'.', 's', 'r', 't'};

/// @brief Roche hash table index ".hsh".
inline constexpr FourCC kHashIndexMagic = {'.', 'h', 's', 'h'};

/// @brief Supported manifest index version, ASCII "1.00".
inline constexpr FourCC kManifestIndexVersion = {'1', '.', '0', '0'};

/// @brief Flowgram values are u16 intensities times 100.
inline constexpr std::uint8_t kFlowgramFormatCode = 1;

// =============================================================================
// Fixed Section Sizes
// =============================================================================

/// @brief Fixed part of the global header, before flow chars and key.
inline constexpr std::size_t kGlobalHeaderFixedSize = 31;

/// @brief Fixed part of a read header, before the name.
inline constexpr std::size_t kReadHeaderFixedSize = 16;

/// @brief Manifest index magic, version, xml size and entries size.
inline constexpr std::size_t kManifestIndexHeaderSize = 16;

/// @brief Bytes following the name in a manifest index entry.
/// @note One null terminator, four base-255 offset digits, one flag byte.
inline constexpr std::size_t kIndexEntryTrailerSize = 6;

/// @brief Terminates every manifest index entry.
inline constexpr std::uint8_t kIndexEntryFlag = 0xFF;

/// @brief Largest record offset the base-255 index encoding can hold.
inline constexpr std::uint64_t kMaxIndexableOffset = 254ULL * (1 + 255 + 255 * 255 + 255 * 255 * 255);

/// @brief Check whether a tag names one of the known index block types.
[[nodiscard]] constexpr bool isIndexMagic(const FourCC& magic) noexcept {
    return magic == kManifestIndexMagic || magic == kSortedIndexMagic || magic == kHashIndexMagic;
}

/// @brief Render raw tag bytes for messages, escaping non-printables (".sff", "\x00\x01").
[[nodiscard]] std::string describeBytes(std::span<const std::uint8_t> bytes);

/// @brief Render bytes as dotted decimal, e.g. "49.46.48.48".
[[nodiscard]] std::string dottedBytes(std::span<const std::uint8_t> bytes);

// =============================================================================
// Flow Parameters
// =============================================================================

/// @brief Run-wide flow settings the writer needs to build a header.
struct FlowParameters {
    /// @brief Nucleotide flowed at each cycle, e.g. "TACG" repeated.
    std::string flowChars;

    /// @brief Key sequence prefixed to every read, usually "TCAG".
    std::string keySequence;
};

// =============================================================================
// Global Header
// =============================================================================

/// @brief Decoded global header.
/// @note Immutable once decoded; lent read-only to the record decoder.
struct GlobalHeader {
    FourCC magic = kSffMagic;
    FourCC version = kSffVersion;

    /// @brief Offset of the index block, 0 when absent.
    std::uint64_t indexOffset = 0;

    /// @brief Length of the index block excluding trailing padding, 0 when absent.
    std::uint32_t indexLength = 0;

    std::uint32_t numberOfReads = 0;

    /// @brief Total header size including padding (multiple of 8).
    std::uint16_t headerLength = 0;

    std::uint16_t keyLength = 0;

    /// @brief Number of flows per read.
    std::uint16_t flowLength = 0;

    std::uint8_t flowgramFormat = kFlowgramFormatCode;

    std::string flowChars;
    std::string keySequence;

    /// @brief True when both index fields are set.
    [[nodiscard]] bool hasIndex() const noexcept { return indexOffset != 0 && indexLength != 0; }

    /// @brief Header length implied by the flow and key lengths.
    [[nodiscard]] std::uint64_t expectedHeaderLength() const noexcept {
        return padTo8(kGlobalHeaderFixedSize + flowLength + keyLength);
    }

    [[nodiscard]] FlowParameters flowParameters() const { return {flowChars, keySequence}; }
};

// =============================================================================
// Read Record
// =============================================================================

/// @brief One decoded read.
/// @note Clip positions are 1-based, 0 meaning "not set".
struct ReadRecord {
    std::string name;

    std::uint16_t clipQualLeft = 0;
    std::uint16_t clipQualRight = 0;
    std::uint16_t clipAdapterLeft = 0;
    std::uint16_t clipAdapterRight = 0;

    /// @brief One intensity (x100) per flow.
    std::vector<std::uint16_t> flowgram;

    /// @brief Per-base flow position deltas.
    std::vector<std::uint8_t> flowIndex;

    std::string bases;

    /// @brief Phred quality per base.
    std::vector<std::uint8_t> quality;

    /// @brief Offset of the read header in the file it was decoded from.
    FileOffset fileOffset = 0;

    [[nodiscard]] std::size_t numberOfBases() const noexcept { return bases.size(); }

    /// @brief Content equality, ignoring where the record was stored.
    [[nodiscard]] bool sameContent(const ReadRecord& other) const noexcept {
        return name == other.name && clipQualLeft == other.clipQualLeft &&
               clipQualRight == other.clipQualRight && clipAdapterLeft == other.clipAdapterLeft &&
               clipAdapterRight == other.clipAdapterRight && flowgram == other.flowgram &&
               flowIndex == other.flowIndex && bases == other.bases && quality == other.quality;
    }
};

/// @brief Read header length required for a name: 16 + name, padded to 8.
[[nodiscard]] constexpr std::uint64_t readHeaderLength(std::size_t nameLength) noexcept {
    return padTo8(kReadHeaderFixedSize + nameLength);
}

/// @brief Longest name whose padded read header length still fits in 16 bits.
inline constexpr std::size_t kMaxReadNameLength = 0xFFF8 - kReadHeaderFixedSize;

static_assert(readHeaderLength(kMaxReadNameLength) == 0xFFF8);
static_assert(readHeaderLength(kMaxReadNameLength + 1) > 0xFFFF);

/// @brief Unpadded read data length: flowgram, flow index, bases and quality.
[[nodiscard]] constexpr std::uint64_t readDataLength(std::size_t flowLength,
                                                     std::size_t numberOfBases) noexcept {
    return 2 * static_cast<std::uint64_t>(flowLength) + 3 * static_cast<std::uint64_t>(numberOfBases);
}

// =============================================================================
// Clipping
// =============================================================================

/// @brief Half-open range [begin, end) of bases kept after clipping.
struct ClipWindow {
    std::size_t begin = 0;
    std::size_t end = 0;

    [[nodiscard]] std::size_t length() const noexcept { return end > begin ? end - begin : 0; }
    [[nodiscard]] bool empty() const noexcept { return length() == 0; }
};

/// @brief Effective clip window of a read.
/// @note Left is the larger of the two left clips, right the smaller non-zero
///       right clip, clamped to the read length.
[[nodiscard]] ClipWindow clipWindow(const ReadRecord& record) noexcept;

/// @brief Bases inside the clip window.
[[nodiscard]] std::string trimmedBases(const ReadRecord& record);

/// @brief Quality scores inside the clip window.
[[nodiscard]] std::vector<std::uint8_t> trimmedQuality(const ReadRecord& record);

}  // namespace sffc::format

#endif  // SFFC_FORMAT_SFF_FORMAT_H
