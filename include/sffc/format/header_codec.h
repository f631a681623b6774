// =============================================================================
// sff-codec - Global Header Codec
// =============================================================================
// Decodes and encodes the SFF global header.
//
// Decoding validates, in this order: empty input, short input, index magic at
// the start, file magic, version, flowgram format code, index offset/length
// consistency, flow chars and key presence, header length and padding.
// =============================================================================

#ifndef SFFC_FORMAT_HEADER_CODEC_H
#define SFFC_FORMAT_HEADER_CODEC_H

#include <cstdint>

#include "sffc/common/types.h"
#include "sffc/format/sff_format.h"
#include "sffc/io/byte_cursor.h"

namespace sffc::format {

/// @brief Decode the global header at the cursor's position.
/// @param cursor Cursor at the start of the SFF data.
/// @return The validated header; the cursor is left at header_length.
/// @throws FormatError with kinds kEmptyFile, kTooSmall, kAtIndexBlock, kBadMagic,
///         kUnsupportedVersion, kUnsupportedFlowgramFormat, kInconsistentIndex,
///         kPrematureEOF, kMalformedHeader or kBadPadding.
[[nodiscard]] GlobalHeader decodeGlobalHeader(io::ByteCursor& cursor);

/// @brief Build a header for the given flows with no index.
/// @throws FormatError(kInvalidRecord) if flow chars or key exceed 65535 bytes.
[[nodiscard]] GlobalHeader makeGlobalHeader(const FlowParameters& params,
                                            std::uint32_t numberOfReads);

/// @brief Serialize a header including its null padding.
/// @note header.headerLength is ignored; the padded length is recomputed.
[[nodiscard]] ByteBuffer encodeGlobalHeader(const GlobalHeader& header);

}  // namespace sffc::format

#endif  // SFFC_FORMAT_HEADER_CODEC_H
