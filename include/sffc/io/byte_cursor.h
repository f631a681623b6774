// =============================================================================
// sff-codec - Byte Cursor
// =============================================================================
// Positioned big-endian reader over a ByteSource.
//
// The cursor knows the absolute offset of every byte it hands out, so the
// decoders can report exactly where a structural violation starts. Reads
// that cannot be satisfied raise FormatError(kPrematureEOF); padding checks
// raise FormatError(kBadPadding) at the first non-null byte.
// =============================================================================

#ifndef SFFC_IO_BYTE_CURSOR_H
#define SFFC_IO_BYTE_CURSOR_H

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "sffc/common/error.h"
#include "sffc/common/types.h"
#include "sffc/io/big_endian.h"
#include "sffc/io/byte_source.h"

namespace sffc::io {

class ByteCursor {
public:
    /// @param source Source to read from; must outlive the cursor.
    /// @param label Name for error messages; defaults to the source's name.
    explicit ByteCursor(ByteSource& source, std::string label = {});

    ByteCursor(const ByteCursor&) = delete;
    ByteCursor& operator=(const ByteCursor&) = delete;
    ByteCursor(ByteCursor&&) noexcept = default;
    ByteCursor& operator=(ByteCursor&&) noexcept = default;

    /// @brief Absolute offset of the next byte.
    [[nodiscard]] FileOffset offset() const noexcept { return source_->position(); }

    /// @brief Bytes left before end of data, when the source size is known.
    [[nodiscard]] std::optional<std::uint64_t> remaining() const noexcept;

    [[nodiscard]] bool isSeekable() const noexcept { return source_->isSeekable(); }

    /// @brief Source label used in error contexts.
    [[nodiscard]] const std::string& label() const noexcept { return label_; }

    /// @brief Error context pointing at an offset in this source.
    [[nodiscard]] ErrorContext contextAt(FileOffset offset) const;

    // =========================================================================
    // Reading
    // =========================================================================

    /// @brief Read as many bytes as available, up to out.size().
    /// @return Number of bytes read; less than requested only at end of data.
    [[nodiscard]] std::size_t readUpTo(std::span<std::uint8_t> out);

    /// @brief Fill out completely.
    /// @param what Description of the field for the error message.
    /// @throws FormatError(kPrematureEOF) if the data ends first.
    void readExact(std::span<std::uint8_t> out, std::string_view what);

    /// @brief Read a length-prefixed field into a new buffer.
    /// @note Refuses lengths exceeding the known remaining size before
    ///       allocating, so corrupted lengths cannot trigger huge allocations.
    [[nodiscard]] ByteBuffer readBytes(std::size_t count, std::string_view what);

    /// @brief Read count bytes as text.
    [[nodiscard]] std::string readString(std::size_t count, std::string_view what);

    /// @brief Read one big-endian integer.
    template <WireInteger T>
    [[nodiscard]] T readBE(std::string_view what) {
        std::uint8_t raw[sizeof(T)];
        readExact(raw, what);
        return loadBE<T>(raw);
    }

    /// @brief Read count bytes that must all be zero.
    /// @throws FormatError(kBadPadding) naming the offset of the first bad byte.
    void expectZeroPadding(std::size_t count, std::string_view what);

    // =========================================================================
    // Positioning
    // =========================================================================

    /// @brief Advance by count bytes.
    /// @note Sequential sources are skipped by reading, never by seeking.
    void skip(std::uint64_t count, std::string_view what);

    /// @brief Jump to an absolute offset.
    /// @throws IOError on sequential sources.
    void seekTo(FileOffset offset);

    /// @brief Fail early when a declared length cannot fit in the data left.
    void requireAvailable(std::uint64_t count, std::string_view what) const;

private:
    [[noreturn]] void throwPrematureEOF(std::string_view what, FileOffset start,
                                        std::uint64_t wanted, std::uint64_t got) const;

    ByteSource* source_;
    std::string label_;
};

}  // namespace sffc::io

#endif  // SFFC_IO_BYTE_CURSOR_H
