/**
 * @file cli.cpp
 * @brief bitcursor command line interface.
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
 * Decodes a binary file as a repeating sequence of sub-byte fields, or
 * prints its hex dump.
 */

#include <bitcursor/bitcursor.hpp>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

using namespace bitcursor;

static constexpr std::size_t MAX_FIELDS = 64;

static void print_version() {
    std::printf("bitcursor %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nBit-level field inspector (v%s C++)\n", version());
    std::printf("===================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <input> <layout>\n", prog_name);
    std::printf("  %s -x <input> [max_bytes]\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -x             Print hex dump of input\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  input          Binary input file\n");
    std::printf("  layout         Comma-separated field widths in bits (1-8), MSB first.\n");
    std::printf("                 Fields may not cross a byte boundary and the layout\n");
    std::printf("                 must cover whole bytes. It is repeated until the\n");
    std::printf("                 input is exhausted.\n");
    std::printf("  max_bytes      Maximum bytes to dump (default: all)\n\n");
    std::printf("Examples:\n");
    std::printf("  %s header.bin 1,3,4        # flag, 3-bit id, 4-bit length\n", prog_name);
    std::printf("  %s -x header.bin 32        # first 32 bytes as hex\n\n", prog_name);
}

static std::vector<std::uint8_t> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return {};
    }

    return buffer;
}

/**
 * Parse "1,3,4" into widths. Returns the number of fields, 0 on syntax error.
 */
static std::size_t parse_layout(const char* text, std::uint8_t* widths) {
    std::size_t count = 0;
    const char* p = text;

    while (*p != '\0') {
        char* end = nullptr;
        long width = std::strtol(p, &end, 10);
        if (end == p || width < 0 || width > 255 || count == MAX_FIELDS) {
            return 0;
        }
        widths[count++] = static_cast<std::uint8_t>(width);

        if (*end == ',') {
            ++end;
        } else if (*end != '\0') {
            return 0;
        }
        p = end;
    }

    return count;
}

static int do_inspect(const char* input_path, const char* layout) {
    std::uint8_t widths[MAX_FIELDS];
    std::size_t num_fields = parse_layout(layout, widths);
    if (num_fields == 0) {
        std::fprintf(stderr, "Error: Malformed layout: %s\n", layout);
        return 1;
    }

    Error result = validate_layout(widths, num_fields);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Invalid layout %s: %s\n", layout, error_string(result));
        return 1;
    }

    std::size_t record_bits = layout_bits(widths, num_fields);
    if (record_bits % BITS_PER_BYTE != 0) {
        std::fprintf(stderr, "Error: Layout covers %zu bits, not a whole number of bytes\n",
                     record_bits);
        return 1;
    }

    auto input_data = read_file(input_path);
    if (input_data.empty()) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return 1;
    }

    ByteBuffer buffer(input_data.data(), input_data.size());
    std::uint8_t values[MAX_FIELDS];
    std::size_t num_records = 0;

    result = for_each_record(
        buffer, widths, num_fields, values,
        [&](std::size_t record, std::size_t record_start, const std::uint8_t* fields) {
            std::printf("Record %zu:\n", record);
            std::size_t bit_pos = 0;
            for (std::size_t i = 0; i < num_fields; ++i) {
                std::printf("  byte %-6zu bit %zu  width %u  value %u\n",
                            record_start + bit_pos / BITS_PER_BYTE, bit_pos % BITS_PER_BYTE,
                            static_cast<unsigned>(widths[i]), static_cast<unsigned>(fields[i]));
                bit_pos += widths[i];
            }
            ++num_records;
        });

    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Record %zu at byte %zu failed with code %d (%s)\n",
                     num_records, buffer.position(), static_cast<int>(result),
                     error_string(result));
        return 1;
    }

    std::printf("Input:       %s (%zu bytes, %zu records)\n", input_path, input_data.size(),
                num_records);
    return 0;
}

static int do_hex(const char* input_path, std::size_t max_bytes) {
    auto input_data = read_file(input_path);
    if (input_data.empty()) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return 1;
    }

    ByteBuffer buffer(input_data.data(), input_data.size());
    std::size_t shown = (buffer.size() < max_bytes) ? buffer.size() : max_bytes;

    std::vector<char> text(hex_length(shown) + 1);
    to_hex(buffer, text.data(), text.size(), max_bytes);

    std::printf("%s\n", text.data());
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    if (std::strcmp(argv[1], "-x") == 0) {
        // Hex mode: -x <input> [max_bytes]
        if (argc != 3 && argc != 4) {
            std::fprintf(stderr, "Error: Hex dump requires 1 or 2 arguments after -x\n");
            std::fprintf(stderr, "Usage: %s -x <input> [max_bytes]\n", argv[0]);
            return 1;
        }

        std::size_t max_bytes = SIZE_MAX;
        if (argc == 4) {
            char* end = nullptr;
            long limit = std::strtol(argv[3], &end, 10);
            if (end == argv[3] || *end != '\0' || limit <= 0) {
                std::fprintf(stderr, "Error: max_bytes must be a positive integer\n");
                return 1;
            }
            max_bytes = static_cast<std::size_t>(limit);
        }

        return do_hex(argv[2], max_bytes);
    }

    // Inspect mode: <input> <layout>
    if (argc != 3) {
        std::fprintf(stderr, "Error: Inspect requires 2 arguments\n");
        std::fprintf(stderr, "Usage: %s <input> <layout>\n", argv[0]);
        return 1;
    }

    return do_inspect(argv[1], argv[2]);
}
