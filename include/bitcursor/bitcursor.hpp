/**
 * @file bitcursor.hpp
 * @brief High-level bitcursor API.
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
 * Provides layout-driven helpers that read or write a sequence of bit fields
 * (e.g. a 1-bit flag, a 3-bit enumeration and a 4-bit count packed into one
 * header byte) through a BitCursor.
 *
 * @see https://www.rfc-editor.org/rfc/rfc3550 RFC 3550 (RTP fixed header bit fields)
 */

#ifndef BITCURSOR_HPP
#define BITCURSOR_HPP

#include "bit_cursor.hpp"
#include "bits.hpp"
#include "byte_buffer.hpp"
#include "config.hpp"
#include "error.hpp"
#include "hex.hpp"

namespace bitcursor {

/**
 * @brief Check that a field layout never crosses a byte boundary.
 *
 * The layout is assumed to start at bit 0 of a byte.
 *
 * @param widths Field widths in bits
 * @param num_fields Number of fields
 * @return Error::Ok if valid, Error::InvalidArg for a width outside 1-8,
 *         Error::InvalidBitRange if a field would span two bytes
 */
inline Error validate_layout(const std::uint8_t* widths, std::size_t num_fields) noexcept {
    std::size_t bit_offset = 0;

    for (std::size_t i = 0; i < num_fields; ++i) {
        std::size_t width = widths[i];
        if (width == 0 || width > BITS_PER_BYTE) {
            return Error::InvalidArg;
        }
        if (bit_offset + width > BITS_PER_BYTE) {
            return Error::InvalidBitRange;
        }
        bit_offset = (bit_offset + width) % BITS_PER_BYTE;
    }

    return Error::Ok;
}

/**
 * @brief Read a sequence of bit fields.
 *
 * Stops at the first failing field; values of the fields before it are
 * already stored.
 *
 * @tparam Buffer Buffer type of the cursor
 * @param cursor Cursor positioned at the first field
 * @param widths Field widths in bits
 * @param num_fields Number of fields
 * @param[out] values One value per field, right-justified
 * @return Error::Ok on success
 */
template <typename Buffer>
Error read_fields(BitCursor<Buffer>& cursor, const std::uint8_t* widths, std::size_t num_fields,
                  std::uint8_t* values) noexcept {
    for (std::size_t i = 0; i < num_fields; ++i) {
        auto result = cursor.read_bits(widths[i], values[i]);
        if (result != Error::Ok) {
            return result;
        }
    }
    return Error::Ok;
}

/**
 * @brief Write a sequence of bit fields.
 *
 * @tparam Buffer Buffer type of the cursor
 * @param cursor Cursor positioned at the first field
 * @param widths Field widths in bits
 * @param values One value per field (low-order bits used)
 * @param num_fields Number of fields
 * @return Error::Ok on success
 */
template <typename Buffer>
Error write_fields(BitCursor<Buffer>& cursor, const std::uint8_t* widths,
                   const std::uint8_t* values, std::size_t num_fields) noexcept {
    for (std::size_t i = 0; i < num_fields; ++i) {
        auto result = cursor.write_bits(values[i], widths[i]);
        if (result != Error::Ok) {
            return result;
        }
    }
    return Error::Ok;
}

/**
 * @brief Get the total width of a layout in bits.
 */
inline std::size_t layout_bits(const std::uint8_t* widths, std::size_t num_fields) noexcept {
    std::size_t total = 0;
    for (std::size_t i = 0; i < num_fields; ++i) {
        total += widths[i];
    }
    return total;
}

/**
 * @brief Decode a buffer as a repeating sequence of bit-field records.
 *
 * The layout must be valid and cover whole bytes, so every record starts at
 * bit 0 of a byte. Records are decoded from the buffer's position until it
 * is exhausted. @p visit is called once per complete record as
 * visit(record_index, record_start_byte, values).
 *
 * @param buffer Buffer holding the records
 * @param widths Field widths in bits
 * @param num_fields Number of fields per record
 * @param[out] values Scratch space for one value per field
 * @param visit Callback for each decoded record
 * @return Error::Ok when the buffer ends on a record boundary,
 *         Error::InvalidArg or Error::InvalidBitRange for a bad layout
 *         (including one that does not cover whole bytes), or
 *         Error::Underflow for a truncated final record
 */
template <typename Visitor>
Error for_each_record(ByteBuffer& buffer, const std::uint8_t* widths, std::size_t num_fields,
                      std::uint8_t* values, Visitor&& visit) {
    if (num_fields == 0) {
        return Error::InvalidArg;
    }

    auto result = validate_layout(widths, num_fields);
    if (result != Error::Ok) {
        return result;
    }
    if (layout_bits(widths, num_fields) % BITS_PER_BYTE != 0) {
        return Error::InvalidArg;
    }

    BitCursor<> cursor(buffer);
    std::size_t record = 0;

    while (buffer.remaining() > 0) {
        std::size_t record_start = buffer.position();
        result = read_fields(cursor, widths, num_fields, values);
        if (result != Error::Ok) {
            return result;
        }
        visit(record, record_start, static_cast<const std::uint8_t*>(values));
        ++record;
    }

    return Error::Ok;
}

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace bitcursor

#endif // BITCURSOR_HPP
