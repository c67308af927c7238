/**
 * @file hex.hpp
 * @brief Hex rendering of buffer contents for diagnostics.
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
 * Output layout: two uppercase digits per byte, bytes grouped by
 * HEX_GROUP_BYTES with a space between groups, and a newline after every
 * HEX_LINE_BYTES. No trailing separator.
 *
 * Example (16 + 2 bytes):
 * @code
 * 00010203 04050607 08090A0B 0C0D0E0F
 * 1011
 * @endcode
 */

#ifndef BITCURSOR_HEX_HPP
#define BITCURSOR_HEX_HPP

#include "byte_buffer.hpp"
#include "config.hpp"

#include <cstdint>

namespace bitcursor {

/**
 * @brief Get characters needed to render a number of bytes.
 *
 * @param num_bytes Bytes to render
 * @return Length of the rendering, excluding the terminating NUL
 */
[[nodiscard]] std::size_t hex_length(std::size_t num_bytes) noexcept;

/**
 * @brief Render bytes as hex text.
 *
 * Output is truncated at a byte boundary when @p out is too small and is
 * always NUL-terminated when out_size > 0.
 *
 * @param data Source bytes
 * @param size Number of source bytes
 * @param out Destination character buffer
 * @param out_size Capacity of @p out including the NUL
 * @param max_bytes Upper bound on bytes rendered
 * @return Number of characters written, excluding the NUL
 */
std::size_t to_hex(const std::uint8_t* data, std::size_t size, char* out, std::size_t out_size,
                   std::size_t max_bytes = SIZE_MAX) noexcept;

/**
 * @brief Render a whole buffer, independent of its position.
 */
std::size_t to_hex(const ByteBuffer& buffer, char* out, std::size_t out_size,
                   std::size_t max_bytes = SIZE_MAX) noexcept;

} // namespace bitcursor

#endif // BITCURSOR_HEX_HPP
