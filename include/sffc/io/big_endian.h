// =============================================================================
// sff-codec - Big-Endian Field Helpers
// =============================================================================
// Every multi-byte integer in an SFF file is stored most significant byte
// first. These helpers convert between host order and the wire order.
// =============================================================================

#ifndef SFFC_IO_BIG_ENDIAN_H
#define SFFC_IO_BIG_ENDIAN_H

#include <bit>
#include <cstdint>
#include <cstring>
#include <span>

#include "sffc/common/types.h"

namespace sffc::io {

/// @brief Swap a value between host order and big-endian order.
template <WireInteger T>
[[nodiscard]] constexpr T hostToBig(T value) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        if constexpr (sizeof(T) == 2) {
            value = static_cast<T>(__builtin_bswap16(static_cast<std::uint16_t>(value)));
        } else if constexpr (sizeof(T) == 4) {
            value = static_cast<T>(__builtin_bswap32(static_cast<std::uint32_t>(value)));
        } else if constexpr (sizeof(T) == 8) {
            value = static_cast<T>(__builtin_bswap64(static_cast<std::uint64_t>(value)));
        }
    }
    return value;
}

/// @brief Decode a big-endian integer from the first sizeof(T) bytes.
template <WireInteger T>
[[nodiscard]] T loadBE(std::span<const std::uint8_t> bytes) noexcept {
    T value;
    std::memcpy(&value, bytes.data(), sizeof(T));
    return hostToBig(value);
}

/// @brief Append a big-endian integer to a buffer.
template <WireInteger T>
void appendBE(ByteBuffer& out, T value) {
    const T wire = hostToBig(value);
    const auto* raw = reinterpret_cast<const std::uint8_t*>(&wire);
    out.insert(out.end(), raw, raw + sizeof(T));
}

/// @brief Overwrite sizeof(T) bytes at a position with a big-endian integer.
template <WireInteger T>
void storeBE(std::span<std::uint8_t> bytes, T value) noexcept {
    const T wire = hostToBig(value);
    std::memcpy(bytes.data(), &wire, sizeof(T));
}

}  // namespace sffc::io

#endif  // SFFC_IO_BIG_ENDIAN_H
