// =============================================================================
// sff-codec - Universal Accession Number Decoding Implementation
// =============================================================================

#include "sffc/format/read_name.h"

#include <cctype>

#include <fmt/format.h>

namespace sffc::format {

namespace {

constexpr std::size_t kUanLength = 14;

/// @brief Seconds per year, month, day, hour and minute in the UAN clock.
/// @note Months are 32 days and years 13 months.
constexpr std::array<std::uint64_t, 5> kTimeDenominators = {
    13ULL * 32 * 24 * 3600, 32ULL * 24 * 3600, 24ULL * 3600, 3600, 60};

constexpr int kYearBase = 2000;

constexpr std::uint64_t kCoordinateRadix = 4096;

}  // namespace

bool isUniversalAccessionNumber(std::string_view name) noexcept {
    if (name.size() != kUanLength) {
        return false;
    }
    for (const char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::uint64_t rocheBase36(std::string_view text) noexcept {
    if (text.size() > 6) {
        text.remove_prefix(text.size() - 6);
    }
    std::uint64_t value = 0;
    for (const char c : text) {
        std::uint64_t digit = 0;
        if (c >= '0' && c <= '9') {
            digit = static_cast<std::uint64_t>(c - '0') + 26;
        } else if (c >= 'A' && c <= 'Z') {
            digit = static_cast<std::uint64_t>(c - 'A');
        } else if (c >= 'a' && c <= 'z') {
            digit = static_cast<std::uint64_t>(c - 'a');
        }
        value = value * 36 + digit;
    }
    return value;
}

std::optional<ReadNameInfo> decodeReadName(std::string_view name) noexcept {
    if (!isUniversalAccessionNumber(name)) {
        return std::nullopt;
    }

    const char tens = name[7];
    const char units = name[8];
    if (!std::isdigit(static_cast<unsigned char>(tens)) ||
        !std::isdigit(static_cast<unsigned char>(units))) {
        return std::nullopt;
    }

    ReadNameInfo info;
    std::uint64_t seconds = rocheBase36(name.substr(0, 6));
    for (std::size_t i = 0; i < kTimeDenominators.size(); ++i) {
        info.time[i] = static_cast<int>(seconds / kTimeDenominators[i]);
        seconds %= kTimeDenominators[i];
    }
    info.time[5] = static_cast<int>(seconds);
    info.time[0] += kYearBase;

    info.region = (tens - '0') * 10 + (units - '0');

    const std::uint64_t packed = rocheBase36(name.substr(9));
    info.x = static_cast<int>(packed / kCoordinateRadix);
    info.y = static_cast<int>(packed % kCoordinateRadix);
    return info;
}

std::string runPrefix(const ReadNameInfo& info) {
    return fmt::format("R_{:04}_{:02}_{:02}_{:02}_{:02}_{:02}_", info.time[0], info.time[1],
                       info.time[2], info.time[3], info.time[4], info.time[5]);
}

}  // namespace sffc::format
