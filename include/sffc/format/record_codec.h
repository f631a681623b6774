// =============================================================================
// sff-codec - Read Record Codec
// =============================================================================
// Decodes and encodes one SFF read record (read header plus read data).
//
// Read header:  read_header_length u16, name_length u16, number_of_bases u32,
//               clip_qual_left/right u16, clip_adapter_left/right u16,
//               name, null padding to read_header_length
// Read data:    flowgram (flow_length x u16), flow index (n x u8),
//               bases (n), quality (n), null padding to 8
// =============================================================================

#ifndef SFFC_FORMAT_RECORD_CODEC_H
#define SFFC_FORMAT_RECORD_CODEC_H

#include <optional>

#include "sffc/common/types.h"
#include "sffc/format/sff_format.h"
#include "sffc/io/byte_cursor.h"

namespace sffc::format {

/// @brief Decode the record at the cursor's position.
/// @param cursor Cursor on an 8-byte boundary at a read header.
/// @param header Global header supplying the flow count.
/// @param readIndex Zero-based record number for error context, when known.
/// @return The record, with fileOffset set; the cursor is left on the next boundary.
/// @throws FormatError with kinds kMalformedRecordHeader, kBadPadding or kPrematureEOF.
[[nodiscard]] ReadRecord decodeReadRecord(io::ByteCursor& cursor, const GlobalHeader& header,
                                          std::optional<ReadIndex> readIndex = std::nullopt);

/// @brief Check that a record can be encoded under a header.
/// @throws FormatError(kInvalidRecord) naming the first problem found.
void validateReadRecord(const ReadRecord& record, const GlobalHeader& header, ReadIndex readIndex);

/// @brief Bytes a record occupies on disk, padding included.
[[nodiscard]] std::uint64_t encodedRecordSize(const ReadRecord& record,
                                              const GlobalHeader& header) noexcept;

/// @brief Serialize a validated record with both padding regions.
[[nodiscard]] ByteBuffer encodeReadRecord(const ReadRecord& record);

}  // namespace sffc::format

#endif  // SFFC_FORMAT_RECORD_CODEC_H
