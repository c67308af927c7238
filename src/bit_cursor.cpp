/**
 * @file bit_cursor.cpp
 * @brief BitCursor compilation unit.
 *
 * BitCursor is a template over the buffer type and is implemented in
 * bit_cursor.hpp. The in-memory ByteBuffer instantiation is compiled here
 * once so that every member is checked even if a client only uses a few.
 *
 * @see include/bitcursor/bit_cursor.hpp for the full implementation
 */

#include <bitcursor/bit_cursor.hpp>

namespace bitcursor {

template class BitCursor<ByteBuffer>;

} // namespace bitcursor
