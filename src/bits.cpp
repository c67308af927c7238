/**
 * @file bits.cpp
 * @brief Byte bit accessor compilation unit.
 *
 * The accessor functions are constexpr and live in bits.hpp. This file
 * checks the MSB-first convention at compile time.
 *
 * @see include/bitcursor/bits.hpp for the full implementation
 */

#include <bitcursor/bits.hpp>

namespace bitcursor {

static_assert(get_bit(0x80, 0) == 1 && get_bit(0x80, 7) == 0, "bit 0 is the MSB");
static_assert(get_bits(0xB2, 0, 3) == 0x5 && get_bits(0xB2, 3, 5) == 0x12);
static_assert(put_bit(0x00, 7, true) == 0x01);
static_assert(put_bits(0xFF, 2, 0x0, 4) == 0xC3);

} // namespace bitcursor
