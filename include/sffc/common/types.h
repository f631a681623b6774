// =============================================================================
// sff-codec - Common Type Definitions
// =============================================================================
// Core aliases, constants and concepts shared by the I/O and format layers.
//
// Naming Conventions:
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef SFFC_COMMON_TYPES_H
#define SFFC_COMMON_TYPES_H

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sffc {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Absolute byte offset from the start of an SFF stream.
using FileOffset = std::uint64_t;

/// @brief Zero-based position of a read record within the file.
using ReadIndex = std::uint64_t;

/// @brief Owned byte buffer.
using ByteBuffer = std::vector<std::uint8_t>;

/// @brief Four-byte tag such as a magic number or version.
using FourCC = std::array<std::uint8_t, 4>;

// =============================================================================
// Constants
// =============================================================================

/// @brief Every SFF section starts on a multiple of this.
inline constexpr std::size_t kSffAlignment = 8;

/// @brief Chunk size used when skipping over sequential sources.
inline constexpr std::size_t kSkipChunkSize = 64 * 1024;  // 64KB

// =============================================================================
// Concepts
// =============================================================================

/// @brief Unsigned integer types that appear as big-endian fields on disk.
template <typename T>
concept WireInteger = std::unsigned_integral<T> && (sizeof(T) == 1 || sizeof(T) == 2 ||
                                                    sizeof(T) == 4 || sizeof(T) == 8);

// =============================================================================
// Alignment Helpers
// =============================================================================

/// @brief Round a length up to the next multiple of 8.
[[nodiscard]] constexpr std::uint64_t padTo8(std::uint64_t length) noexcept {
    return (length + (kSffAlignment - 1)) & ~static_cast<std::uint64_t>(kSffAlignment - 1);
}

/// @brief Number of null bytes needed to bring a length to a multiple of 8.
[[nodiscard]] constexpr std::uint64_t paddingTo8(std::uint64_t length) noexcept {
    return padTo8(length) - length;
}

}  // namespace sffc

#endif  // SFFC_COMMON_TYPES_H
