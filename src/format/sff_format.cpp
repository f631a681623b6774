// =============================================================================
// sff-codec - SFF Format Helpers
// =============================================================================

#include "sffc/format/sff_format.h"

#include <algorithm>

#include <fmt/format.h>

namespace sffc::format {

std::string describeBytes(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (const std::uint8_t b : bytes) {
        if (b >= 0x20 && b < 0x7F && b != '\\') {
            out.push_back(static_cast<char>(b));
        } else {
            out += fmt::format("\\x{:02x}", b);
        }
    }
    return out;
}

std::string dottedBytes(std::span<const std::uint8_t> bytes) {
    std::string out;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0) {
            out.push_back('.');
        }
        out += fmt::format("{}", bytes[i]);
    }
    return out;
}

// =============================================================================
// Clipping
// =============================================================================

ClipWindow clipWindow(const ReadRecord& record) noexcept {
    const std::size_t length = record.numberOfBases();

    // Left clips are 1-based positions of the first kept base
    auto toZeroBased = [](std::uint16_t clip) -> std::size_t {
        return clip == 0 ? 0 : static_cast<std::size_t>(clip) - 1;
    };
    const std::size_t left =
        std::max(toZeroBased(record.clipQualLeft), toZeroBased(record.clipAdapterLeft));

    // Right clips are 1-based positions of the last kept base, 0 meaning none
    std::size_t right = length;
    if (record.clipQualRight != 0 && record.clipAdapterRight != 0) {
        right = std::min(record.clipQualRight, record.clipAdapterRight);
    } else if (record.clipQualRight != 0) {
        right = record.clipQualRight;
    } else if (record.clipAdapterRight != 0) {
        right = record.clipAdapterRight;
    }
    right = std::min(right, length);

    ClipWindow window;
    window.begin = std::min(left, right);
    window.end = right;
    return window;
}

std::string trimmedBases(const ReadRecord& record) {
    const ClipWindow window = clipWindow(record);
    return record.bases.substr(window.begin, window.length());
}

std::vector<std::uint8_t> trimmedQuality(const ReadRecord& record) {
    const ClipWindow window = clipWindow(record);
    // Quality may be shorter than bases only on records that failed validation
    const std::size_t end = std::min(window.end, record.quality.size());
    const std::size_t begin = std::min(window.begin, end);
    return {record.quality.begin() + static_cast<std::ptrdiff_t>(begin),
            record.quality.begin() + static_cast<std::ptrdiff_t>(end)};
}

}  // namespace sffc::format
