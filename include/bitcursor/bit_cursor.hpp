/**
 * @file bit_cursor.hpp
 * @brief Bit-level cursor over a byte-addressable buffer.
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
 * BitCursor reads and writes bits relative to the previous bit position in
 * the current byte of a buffer. Only when the last bit of a byte has been
 * consumed does the buffer's position move on to the next byte. A single
 * request never spans two bytes.
 *
 * @par Resynchronization
 * Byte-level code may use the same buffer between bit operations. When the
 * buffer's position no longer matches the byte the cursor last touched, the
 * next bit operation starts at bit 0 of the byte at the new position. Any
 * partially consumed byte is abandoned silently, so callers that reposition
 * the buffer in the middle of a byte lose the remaining bits of that byte.
 * resynchronize() performs the same reset explicitly.
 *
 * @par Bit Ordering
 * MSB-first: the first bit read from or written to a byte is bit 0 (0x80).
 *
 * @see https://www.rfc-editor.org/rfc/rfc3550 RFC 3550 (RTP fixed header bit fields)
 * @see https://www.rfc-editor.org/rfc/rfc8285 RFC 8285 (RTP header extensions)
 */

#ifndef BITCURSOR_BIT_CURSOR_HPP
#define BITCURSOR_BIT_CURSOR_HPP

#include "bits.hpp"
#include "byte_buffer.hpp"
#include "config.hpp"
#include "error.hpp"

namespace bitcursor {

/**
 * @brief Bit-granular reader and writer on top of a byte buffer.
 *
 * The cursor borrows the buffer and must not outlive it. It is not safe for
 * concurrent use; all access to the buffer must be serialized by the caller.
 *
 * @tparam Buffer Type satisfying the buffer contract documented in
 *                byte_buffer.hpp
 */
template <typename Buffer = ByteBuffer> class BitCursor {
public:
    /**
     * @brief Bind a cursor to a buffer at the buffer's current position.
     *
     * @param buffer Buffer to operate on
     */
    explicit BitCursor(Buffer& buffer) noexcept
        : buffer_(buffer), bit_offset_(0), byte_pos_(buffer.position()) {}

    /**
     * @brief Read bits from the current byte.
     *
     * @param num_bits Number of bits to read (1-8)
     * @param[out] value Bits read, right-justified
     * @return Error::Ok on success, Error::InvalidBitRange if the request
     *         would cross into the next byte, or the buffer's read error
     */
    Error read_bits(std::size_t num_bits, std::uint8_t& value) noexcept {
        std::uint8_t byte = 0;
        auto result = fetch(num_bits, byte);
        if (result != Error::Ok) {
            return result;
        }

        std::uint8_t bits = get_bits(byte, bit_offset_, num_bits);
        result = advance(num_bits);
        if (result == Error::Ok) {
            value = bits;
        }
        return result;
    }

    /**
     * @brief Read the next bit as a boolean.
     *
     * @param[out] value True if the bit is set
     * @return Error::Ok on success
     */
    Error read_bit_as_bool(bool& value) noexcept {
        std::uint8_t byte = 0;
        auto result = fetch(1, byte);
        if (result != Error::Ok) {
            return result;
        }

        bool bit = get_bit_as_bool(byte, bit_offset_);
        result = advance(1);
        if (result == Error::Ok) {
            value = bit;
        }
        return result;
    }

    /**
     * @brief Write the low-order bits of a value into the current byte.
     *
     * E.g. value 0b00000011 with num_bits 2 writes '11' into the next two
     * bit positions. Other bits of the byte are preserved.
     *
     * @param value Source bits (right-justified, higher bits ignored)
     * @param num_bits Number of bits to write (1-8)
     * @return Error::Ok on success
     */
    Error write_bits(std::uint8_t value, std::size_t num_bits) noexcept {
        std::size_t pos = buffer_.position();
        std::uint8_t byte = 0;
        auto result = fetch(num_bits, byte);
        if (result != Error::Ok) {
            return result;
        }

        return store(pos, put_bits(byte, bit_offset_, value, num_bits), num_bits);
    }

    /**
     * @brief Write a single bit.
     *
     * @param value Bit value
     * @return Error::Ok on success
     */
    Error write_bool(bool value) noexcept {
        std::size_t pos = buffer_.position();
        std::uint8_t byte = 0;
        auto result = fetch(1, byte);
        if (result != Error::Ok) {
            return result;
        }

        return store(pos, put_bit(byte, bit_offset_, value), 1);
    }

    /**
     * @brief Start over at bit 0 of the byte at the buffer's current position.
     */
    void resynchronize() noexcept {
        bit_offset_ = 0;
        byte_pos_ = buffer_.position();
    }

    /**
     * @brief Get bits already consumed in the current byte (0-8).
     */
    [[nodiscard]] std::size_t bit_offset() const noexcept {
        return bit_offset_;
    }

    /**
     * @brief Get the buffer position last observed by the cursor.
     */
    [[nodiscard]] std::size_t byte_position() const noexcept {
        return byte_pos_;
    }

    /**
     * @brief Get bits available to the next operation.
     *
     * @return Bits left in the current byte, or 8 if the buffer has moved
     *         since the last operation
     */
    [[nodiscard]] std::size_t bits_remaining() const noexcept {
        if (buffer_.position() != byte_pos_) {
            return BITS_PER_BYTE;
        }
        return BITS_PER_BYTE - bit_offset_;
    }

private:
    Buffer& buffer_;
    std::size_t bit_offset_;
    std::size_t byte_pos_;

    /**
     * @brief Reconcile with the buffer, validate the request and fetch the byte.
     *
     * Nothing but the reconciliation is mutated when validation fails.
     */
    Error fetch(std::size_t num_bits, std::uint8_t& byte) noexcept {
        if (buffer_.position() != byte_pos_) {
            resynchronize();
        }

        if (num_bits == 0 || bit_offset_ + num_bits > BITS_PER_BYTE) {
            return Error::InvalidBitRange;
        }

        return buffer_.read_byte(byte);
    }

    /**
     * @brief Write back a modified byte, then advance.
     */
    Error store(std::size_t pos, std::uint8_t byte, std::size_t num_bits) noexcept {
        auto result = buffer_.write_byte_at(pos, byte);
        if (result != Error::Ok) {
            // Undo the fetch
            auto undo = buffer_.rewind_one_byte();
            return (undo != Error::Ok) ? undo : result;
        }
        return advance(num_bits);
    }

    /**
     * @brief Consume bits and put the buffer back on a partially used byte.
     *
     * A fully consumed byte leaves the buffer advanced; the next call then
     * sees a new position and starts at bit 0. If the buffer refuses the
     * rewind, the bit offset is left where it was and the buffer stays on
     * the following byte, so the next call starts there at bit 0.
     */
    Error advance(std::size_t num_bits) noexcept {
        if (bit_offset_ + num_bits < BITS_PER_BYTE) {
            auto result = buffer_.rewind_one_byte();
            if (result != Error::Ok) {
                return result;
            }
        }
        bit_offset_ += num_bits;
        return Error::Ok;
    }
};

} // namespace bitcursor

#endif // BITCURSOR_BIT_CURSOR_HPP
