/**
 * @file byte_buffer.hpp
 * @brief Byte-addressable buffer view with a movable position.
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
 * ByteBuffer is the in-memory backing store for BitCursor. It does not own
 * its storage; the caller keeps the byte array alive for the lifetime of the
 * view.
 *
 * @par Buffer Contract
 * BitCursor<Buffer> requires these members from any buffer type:
 * - position() const: current byte offset
 * - read_byte(out): return the byte at position() and advance by one
 * - write_byte_at(pos, value): store at an absolute offset, position() unchanged
 * - rewind_one_byte(): move position() back by exactly one byte
 *
 * A rewind issued right after a successful read_byte() is expected to
 * succeed. When it does not, BitCursor returns the buffer's error and keeps
 * its bit offset unchanged.
 *
 * The remaining members are the byte-granular access that protocol code
 * interleaves with bit-level parsing.
 */

#ifndef BITCURSOR_BYTE_BUFFER_HPP
#define BITCURSOR_BYTE_BUFFER_HPP

#include "config.hpp"
#include "error.hpp"

namespace bitcursor {

/**
 * @brief Non-owning view over a mutable byte array.
 */
class ByteBuffer {
public:
    /**
     * @brief Construct a buffer view.
     *
     * @param data Pointer to the byte storage
     * @param size Number of valid bytes in storage
     */
    ByteBuffer(std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    /**
     * @brief Get current byte position.
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

    /**
     * @brief Get remaining bytes.
     *
     * @return Number of bytes between position() and the end
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (pos_ < size_) ? (size_ - pos_) : 0;
    }

    [[nodiscard]] const std::uint8_t* data() const noexcept {
        return data_;
    }

    /**
     * @brief Move the position to an absolute offset.
     *
     * @param pos New position (0 to size(), size() meaning exhausted)
     * @return Error::Ok on success, Error::InvalidArg if out of range
     */
    Error set_position(std::size_t pos) noexcept {
        if (pos > size_) {
            return Error::InvalidArg;
        }
        pos_ = pos;
        return Error::Ok;
    }

    /**
     * @brief Advance the position by a number of bytes.
     *
     * @param num_bytes Bytes to skip
     * @return Error::Ok on success, Error::Underflow if fewer bytes remain
     */
    Error skip(std::size_t num_bytes) noexcept {
        if (num_bytes > remaining()) {
            return Error::Underflow;
        }
        pos_ += num_bytes;
        return Error::Ok;
    }

    /**
     * @brief Read the byte at the current position and advance.
     *
     * @param[out] value Byte read
     * @return Error::Ok on success, Error::Underflow at the end of the buffer
     */
    Error read_byte(std::uint8_t& value) noexcept {
        if (pos_ >= size_) [[unlikely]] {
            return Error::Underflow;
        }
        value = data_[pos_++];
        return Error::Ok;
    }

    /**
     * @brief Write a byte at the current position and advance.
     *
     * @param value Byte to store
     * @return Error::Ok on success, Error::Overflow at the end of the buffer
     */
    Error put_byte(std::uint8_t value) noexcept {
        if (pos_ >= size_) [[unlikely]] {
            return Error::Overflow;
        }
        data_[pos_++] = value;
        return Error::Ok;
    }

    /**
     * @brief Read a byte at an absolute offset without moving the position.
     */
    Error get_byte_at(std::size_t pos, std::uint8_t& value) const noexcept {
        if (pos >= size_) {
            return Error::Underflow;
        }
        value = data_[pos];
        return Error::Ok;
    }

    /**
     * @brief Write a byte at an absolute offset without moving the position.
     *
     * @param pos Byte offset
     * @param value Byte to store
     * @return Error::Ok on success, Error::Overflow if pos is out of range
     */
    Error write_byte_at(std::size_t pos, std::uint8_t value) noexcept {
        if (pos >= size_) {
            return Error::Overflow;
        }
        data_[pos] = value;
        return Error::Ok;
    }

    /**
     * @brief Move the position back by one byte.
     *
     * Un-consumes the byte most recently read or written.
     *
     * @return Error::Ok on success, Error::InvalidArg at position 0
     */
    Error rewind_one_byte() noexcept {
        if (pos_ == 0) {
            return Error::InvalidArg;
        }
        --pos_;
        return Error::Ok;
    }

private:
    std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

} // namespace bitcursor

#endif // BITCURSOR_BYTE_BUFFER_HPP
