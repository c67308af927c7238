/**
 * @file config.hpp
 * @brief bitcursor compile-time configuration.
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
 * Bit-granular access to byte-oriented protocol buffers.
 */

#ifndef BITCURSOR_CONFIG_HPP
#define BITCURSOR_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace bitcursor {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Bits addressable within a single buffer byte
inline constexpr std::size_t BITS_PER_BYTE = 8U;

/// Index of the least significant bit (MSB-first numbering)
inline constexpr std::size_t LAST_BIT_INDEX = BITS_PER_BYTE - 1U;

/// Bytes per space-separated group in hex dumps
#ifndef BITCURSOR_HEX_GROUP_BYTES
#define BITCURSOR_HEX_GROUP_BYTES 4U
#endif

/// Bytes per line in hex dumps
#ifndef BITCURSOR_HEX_LINE_BYTES
#define BITCURSOR_HEX_LINE_BYTES 16U
#endif

inline constexpr std::size_t HEX_GROUP_BYTES = BITCURSOR_HEX_GROUP_BYTES;
inline constexpr std::size_t HEX_LINE_BYTES = BITCURSOR_HEX_LINE_BYTES;

static_assert(HEX_GROUP_BYTES > 0 && HEX_LINE_BYTES % HEX_GROUP_BYTES == 0,
              "hex line width must be a whole number of groups");

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define BITCURSOR_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * @{
 */
#ifndef BITCURSOR_NO_EXCEPTIONS
#define BITCURSOR_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace bitcursor

#endif // BITCURSOR_CONFIG_HPP
