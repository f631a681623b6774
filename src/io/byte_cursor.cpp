// =============================================================================
// sff-codec - Byte Cursor Implementation
// =============================================================================

#include "sffc/io/byte_cursor.h"

#include <algorithm>
#include <array>
#include <utility>

#include <fmt/format.h>

namespace sffc::io {

ByteCursor::ByteCursor(ByteSource& source, std::string label)
    : source_(&source), label_(label.empty() ? source.name() : std::move(label)) {}

std::optional<std::uint64_t> ByteCursor::remaining() const noexcept {
    const auto total = source_->size();
    if (!total.has_value()) {
        return std::nullopt;
    }
    const FileOffset here = offset();
    return here >= *total ? 0 : *total - here;
}

ErrorContext ByteCursor::contextAt(FileOffset offset) const {
    ErrorContext context(label_);
    context.withOffset(offset);
    return context;
}

std::size_t ByteCursor::readUpTo(std::span<std::uint8_t> out) {
    std::size_t total = 0;
    while (total < out.size()) {
        const std::size_t got = source_->read(out.subspan(total));
        if (got == 0) {
            break;
        }
        total += got;
    }
    return total;
}

void ByteCursor::readExact(std::span<std::uint8_t> out, std::string_view what) {
    const FileOffset start = offset();
    const std::size_t got = readUpTo(out);
    if (got != out.size()) {
        throwPrematureEOF(what, start, out.size(), got);
    }
}

ByteBuffer ByteCursor::readBytes(std::size_t count, std::string_view what) {
    requireAvailable(count, what);
    ByteBuffer buffer(count);
    readExact(buffer, what);
    return buffer;
}

std::string ByteCursor::readString(std::size_t count, std::string_view what) {
    requireAvailable(count, what);
    std::string text(count, '\0');
    readExact(std::span<std::uint8_t>(reinterpret_cast<std::uint8_t*>(text.data()), text.size()),
              what);
    return text;
}

void ByteCursor::expectZeroPadding(std::size_t count, std::string_view what) {
    if (count == 0) {
        return;
    }
    std::array<std::uint8_t, kSffAlignment> padding{};
    const FileOffset start = offset();
    // Checked one alignment-sized chunk at a time
    const std::size_t length = std::min(count, padding.size());
    readExact(std::span(padding).first(length), what);

    const auto bad = std::find_if(padding.begin(), padding.begin() + static_cast<std::ptrdiff_t>(length),
                                  [](std::uint8_t b) { return b != 0; });
    if (bad != padding.begin() + static_cast<std::ptrdiff_t>(length)) {
        const FileOffset badOffset = start + static_cast<FileOffset>(bad - padding.begin());
        throw FormatError(FormatErrorKind::kBadPadding,
                          fmt::format("Non-null byte 0x{:02x} in {} at offset {}", *bad, what,
                                      badOffset),
                          contextAt(badOffset));
    }

    if (count > length) {
        expectZeroPadding(count - length, what);
    }
}

void ByteCursor::skip(std::uint64_t count, std::string_view what) {
    if (count == 0) {
        return;
    }
    const FileOffset start = offset();

    if (source_->isSeekable() && source_->size().has_value()) {
        requireAvailable(count, what);
        source_->seek(start + count);
        return;
    }

    ByteBuffer scratch(static_cast<std::size_t>(std::min<std::uint64_t>(count, kSkipChunkSize)));
    std::uint64_t left = count;
    while (left > 0) {
        const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(left, scratch.size()));
        const std::size_t got = readUpTo(std::span(scratch).first(chunk));
        if (got != chunk) {
            throwPrematureEOF(what, start, count, count - left + got);
        }
        left -= got;
    }
}

void ByteCursor::seekTo(FileOffset target) {
    if (target == offset()) {
        return;
    }
    source_->seek(target);
}

void ByteCursor::requireAvailable(std::uint64_t count, std::string_view what) const {
    const auto left = remaining();
    if (left.has_value() && count > *left) {
        throwPrematureEOF(what, offset(), count, *left);
    }
}

void ByteCursor::throwPrematureEOF(std::string_view what, FileOffset start, std::uint64_t wanted,
                                   std::uint64_t got) const {
    ErrorContext context = contextAt(start);
    context.withValues(wanted, got);
    throw FormatError(FormatErrorKind::kPrematureEOF,
                      fmt::format("Premature end of file reading {} at offset {}: wanted {} "
                                  "bytes, {} available",
                                  what, start, wanted, got),
                      std::move(context));
}

}  // namespace sffc::io
