// =============================================================================
// sff-codec - Universal Accession Number Decoding
// =============================================================================
// Roche read names are 14-character Universal Accession Numbers (UANs) that
// encode the run time, the plate region and the well position:
//
//   E3MFGY R 02 JWQ7T
//   ^^^^^^      ^^^^^  base-36 run timestamp / base-36 packed X,Y (x * 4096 + y)
//          ^           random character
//            ^^        decimal region number
// =============================================================================

#ifndef SFFC_FORMAT_READ_NAME_H
#define SFFC_FORMAT_READ_NAME_H

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sffc::format {

/// @brief Fields recovered from a UAN read name.
struct ReadNameInfo {
    /// @brief Run time as year, month, day, hour, minute, second.
    std::array<int, 6> time{};

    /// @brief Plate region number.
    int region = 0;

    int x = 0;
    int y = 0;

    auto operator<=>(const ReadNameInfo&) const = default;
};

/// @brief Check that a name matches [A-Za-z0-9]{14}.
[[nodiscard]] bool isUniversalAccessionNumber(std::string_view name) noexcept;

/// @brief Value of the last six characters as Roche base 36.
/// @note Letters of either case map to 0-25 and '0'-'9' to 26-35; anything
///       else counts as 0.
[[nodiscard]] std::uint64_t rocheBase36(std::string_view text) noexcept;

/// @brief Decode time, region and coordinates from a read name.
/// @return Nothing for names that are not UANs or whose region is not decimal.
[[nodiscard]] std::optional<ReadNameInfo> decodeReadName(std::string_view name) noexcept;

/// @brief Run prefix as printed by Roche tools, e.g. "R_2008_01_09_16_16_00_".
[[nodiscard]] std::string runPrefix(const ReadNameInfo& info);

}  // namespace sffc::format

#endif  // SFFC_FORMAT_READ_NAME_H
