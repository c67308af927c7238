/**
 * @file byte_buffer.cpp
 * @brief ByteBuffer compilation unit.
 *
 * This file exists for library structure purposes. ByteBuffer is
 * implemented entirely in the header file (byte_buffer.hpp) so that the
 * per-byte accessors inline into the cursor's bit operations.
 *
 * @see include/bitcursor/byte_buffer.hpp for the full implementation
 */

#include <bitcursor/byte_buffer.hpp>

// All implementation is in the header (inline functions)
