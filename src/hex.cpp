/**
 * @file hex.cpp
 * @brief Hex rendering implementation.
 */

#include <bitcursor/hex.hpp>

namespace bitcursor {

namespace {

constexpr char HEX_DIGITS[] = "0123456789ABCDEF";

/// Separator emitted before byte @p index, or 0 for none
char separator_before(std::size_t index) noexcept {
    if (index == 0) {
        return 0;
    }
    if (index % HEX_LINE_BYTES == 0) {
        return '\n';
    }
    if (index % HEX_GROUP_BYTES == 0) {
        return ' ';
    }
    return 0;
}

} // namespace

std::size_t hex_length(std::size_t num_bytes) noexcept {
    if (num_bytes == 0) {
        return 0;
    }
    // Every group boundary gets exactly one separator (space or newline)
    return num_bytes * 2 + (num_bytes - 1) / HEX_GROUP_BYTES;
}

std::size_t to_hex(const std::uint8_t* data, std::size_t size, char* out, std::size_t out_size,
                   std::size_t max_bytes) noexcept {
    if (out_size == 0) {
        return 0;
    }

    std::size_t num_bytes = (size < max_bytes) ? size : max_bytes;
    std::size_t capacity = out_size - 1;
    std::size_t written = 0;

    for (std::size_t i = 0; i < num_bytes; ++i) {
        char sep = separator_before(i);
        std::size_t needed = (sep != 0) ? 3 : 2;
        if (written + needed > capacity) {
            break;
        }

        if (sep != 0) {
            out[written++] = sep;
        }
        out[written++] = HEX_DIGITS[data[i] >> 4];
        out[written++] = HEX_DIGITS[data[i] & 0x0FU];
    }

    out[written] = '\0';
    return written;
}

std::size_t to_hex(const ByteBuffer& buffer, char* out, std::size_t out_size,
                   std::size_t max_bytes) noexcept {
    return to_hex(buffer.data(), buffer.size(), out, out_size, max_bytes);
}

} // namespace bitcursor
