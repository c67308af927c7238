/**
 * @file bits.hpp
 * @brief Bit extraction and insertion within a single byte.
 *
 * @cond INTERNAL
 * ============================================================================
 *   _     _ _
 *  | |__ (_) |_ ___ _   _ _ __ ___  ___  _ __
 *  | '_ \| | __/ __| | | | '__/ __|/ _ \| '__|
 *  | |_) | | || (__| |_| | |  \__ \ (_) | |
 *  |_.__/|_|\__\___|\__,_|_|  |___/\___/|_|
 * ============================================================================
 * @endcond
 *
 * Stateless arithmetic used by BitCursor. All functions are constexpr and
 * never fail; callers guarantee the index arguments are in range.
 *
 * @par Bit Numbering Convention
 * - Bit 0 = MSB (leftmost, transmitted first)
 * - Bit 7 = LSB (rightmost, transmitted last)
 *
 * @see https://www.rfc-editor.org/rfc/rfc1700 RFC 1700 (network bit order convention)
 */

#ifndef BITCURSOR_BITS_HPP
#define BITCURSOR_BITS_HPP

#include "config.hpp"

namespace bitcursor {

namespace detail {

/**
 * @brief Right shift that moves a field ending at MSB-first index into the LSBs.
 *
 * @param start Index of the first bit of the field (0-7)
 * @param count Width of the field (start + count <= 8)
 */
constexpr unsigned field_shift(std::size_t start, std::size_t count) noexcept {
    return static_cast<unsigned>(BITS_PER_BYTE - start - count);
}

constexpr unsigned low_mask(std::size_t count) noexcept {
    return (1U << count) - 1U;
}

} // namespace detail

/**
 * @brief Get a single bit.
 *
 * @param byte Source byte
 * @param index Bit index (0 = MSB, 7 = LSB)
 * @return Bit value (0 or 1)
 */
[[nodiscard]] constexpr int get_bit(std::uint8_t byte, std::size_t index) noexcept {
    return (byte >> (LAST_BIT_INDEX - index)) & 1;
}

/**
 * @brief Get a range of bits, right-justified.
 *
 * The bit at @p start becomes the most significant bit of the result and
 * the bit at start + count - 1 its least significant bit.
 *
 * @param byte Source byte
 * @param start Index of the first bit (0 = MSB)
 * @param count Number of bits (start + count <= 8)
 * @return Extracted value in the low @p count bits
 */
[[nodiscard]] constexpr std::uint8_t get_bits(std::uint8_t byte, std::size_t start,
                                              std::size_t count) noexcept {
    if (count == 0) {
        return 0;
    }
    return static_cast<std::uint8_t>((byte >> detail::field_shift(start, count)) &
                                     detail::low_mask(count));
}

/**
 * @brief Get a single bit as a boolean.
 */
[[nodiscard]] constexpr bool get_bit_as_bool(std::uint8_t byte, std::size_t index) noexcept {
    return get_bit(byte, index) == 1;
}

/**
 * @brief Set or clear a single bit.
 *
 * @param byte Source byte
 * @param index Bit index (0 = MSB, 7 = LSB)
 * @param value New bit value
 * @return Copy of @p byte with only bit @p index changed
 */
[[nodiscard]] constexpr std::uint8_t put_bit(std::uint8_t byte, std::size_t index,
                                             bool value) noexcept {
    const unsigned mask = 0x80U >> index;
    return static_cast<std::uint8_t>(value ? (byte | mask) : (byte & ~mask));
}

/**
 * @brief Insert the low bits of a value into a range of bits.
 *
 * @param byte Source byte
 * @param start Index of the first bit to overwrite (0 = MSB)
 * @param value Value whose low @p count bits are inserted (higher bits ignored)
 * @param count Number of bits (start + count <= 8)
 * @return Copy of @p byte with bits [start, start + count) replaced
 */
[[nodiscard]] constexpr std::uint8_t put_bits(std::uint8_t byte, std::size_t start,
                                              std::uint8_t value, std::size_t count) noexcept {
    if (count == 0) {
        return byte;
    }
    const unsigned shift = detail::field_shift(start, count);
    const unsigned mask = detail::low_mask(count) << shift;
    return static_cast<std::uint8_t>((byte & ~mask) | ((static_cast<unsigned>(value) << shift) & mask));
}

} // namespace bitcursor

#endif // BITCURSOR_BITS_HPP
