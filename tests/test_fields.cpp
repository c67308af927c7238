/**
 * @file test_fields.cpp
 * @brief Tests for layout helpers and error reporting.
 */

#include <catch2/catch.hpp>
#include <bitcursor/bitcursor.hpp>

#include <cstring>
#include <vector>

using namespace bitcursor;

TEST_CASE("validate_layout", "[fields]") {
    SECTION("valid layouts") {
        const std::uint8_t flags[] = {1, 3, 4};
        REQUIRE(validate_layout(flags, 3) == Error::Ok);

        const std::uint8_t two_bytes[] = {2, 6, 8, 4, 4};
        REQUIRE(validate_layout(two_bytes, 5) == Error::Ok);

        REQUIRE(validate_layout(nullptr, 0) == Error::Ok);
    }

    SECTION("field crosses a byte") {
        const std::uint8_t layout[] = {3, 6};
        REQUIRE(validate_layout(layout, 2) == Error::InvalidBitRange);
    }

    SECTION("bad widths") {
        const std::uint8_t zero[] = {4, 0, 4};
        REQUIRE(validate_layout(zero, 3) == Error::InvalidArg);

        const std::uint8_t wide[] = {9};
        REQUIRE(validate_layout(wide, 1) == Error::InvalidArg);
    }
}

TEST_CASE("read_fields and write_fields", "[fields]") {
    const std::uint8_t widths[] = {1, 3, 4, 2, 6};
    const std::uint8_t values[] = {1, 0x5, 0xC, 0x0, 0x2A};
    std::uint8_t data[2] = {0, 0};
    ByteBuffer buffer(data, 2);
    BitCursor<> writer(buffer);

    REQUIRE(write_fields(writer, widths, values, 5) == Error::Ok);
    REQUIRE(data[0] == 0xDC); // 1 101 1100
    REQUIRE(data[1] == 0x2A); // 00 101010
    REQUIRE(buffer.position() == 2);

    REQUIRE(buffer.set_position(0) == Error::Ok);
    BitCursor<> reader(buffer);
    std::uint8_t decoded[5] = {};
    REQUIRE(read_fields(reader, widths, 5, decoded) == Error::Ok);
    REQUIRE(std::memcmp(decoded, values, 5) == 0);

    SECTION("truncated input stops at the failing field") {
        ByteBuffer short_buffer(data, 1);
        BitCursor<> cursor(short_buffer);
        std::uint8_t partial[5] = {};
        REQUIRE(read_fields(cursor, widths, 5, partial) == Error::Underflow);
        REQUIRE(partial[0] == 1);
        REQUIRE(partial[2] == 0xC);
        REQUIRE(partial[3] == 0);
    }
}

TEST_CASE("for_each_record", "[fields]") {
    const std::uint8_t widths[] = {1, 3, 4};
    std::uint8_t values[3] = {};
    std::vector<std::uint8_t> seen;
    std::vector<std::size_t> starts;
    auto collect = [&](std::size_t record, std::size_t start, const std::uint8_t* fields) {
        REQUIRE(record == starts.size());
        starts.push_back(start);
        seen.insert(seen.end(), fields, fields + 3);
    };

    SECTION("decodes every record") {
        std::uint8_t data[] = {0xB2, 0x93}; // 1 011 0010, 1 001 0011
        ByteBuffer buffer(data, 2);

        const std::vector<std::size_t> expected_starts = {0, 1};
        const std::vector<std::uint8_t> expected_fields = {1, 3, 2, 1, 1, 3};

        REQUIRE(for_each_record(buffer, widths, 3, values, collect) == Error::Ok);
        REQUIRE(starts == expected_starts);
        REQUIRE(seen == expected_fields);
        REQUIRE(buffer.remaining() == 0);
    }

    SECTION("multi-byte record") {
        const std::uint8_t header[] = {2, 1, 1, 4, 1, 7};
        std::uint8_t fields[6] = {};
        std::uint8_t data[] = {0x93, 0xE0};
        ByteBuffer buffer(data, 2);
        std::size_t count = 0;

        REQUIRE(for_each_record(buffer, header, 6, fields,
                                [&](std::size_t, std::size_t start, const std::uint8_t* f) {
                                    REQUIRE(start == 0);
                                    REQUIRE(f[0] == 2);
                                    REQUIRE(f[3] == 3);
                                    REQUIRE(f[5] == 96);
                                    ++count;
                                }) == Error::Ok);
        REQUIRE(count == 1);
    }

    SECTION("field crossing a byte is rejected before decoding") {
        const std::uint8_t crossing[] = {3, 6};
        std::uint8_t data[] = {0xFF, 0xFF};
        ByteBuffer buffer(data, 2);

        REQUIRE(for_each_record(buffer, crossing, 2, values, collect) == Error::InvalidBitRange);
        REQUIRE(starts.empty());
        REQUIRE(buffer.position() == 0);
    }

    SECTION("layout must cover whole bytes") {
        const std::uint8_t partial[] = {1, 3};
        std::uint8_t data[] = {0xFF};
        ByteBuffer buffer(data, 1);

        REQUIRE(for_each_record(buffer, partial, 2, values, collect) == Error::InvalidArg);
        REQUIRE(for_each_record(buffer, partial, 0, values, collect) == Error::InvalidArg);
        REQUIRE(starts.empty());
    }

    SECTION("truncated final record") {
        const std::uint8_t pair[] = {4, 4, 8};
        std::uint8_t data[] = {0x12, 0x34, 0x56};
        ByteBuffer buffer(data, 3);
        std::size_t count = 0;

        REQUIRE(for_each_record(buffer, pair, 3, values,
                                [&](std::size_t, std::size_t, const std::uint8_t*) { ++count; }) ==
                Error::Underflow);
        REQUIRE(count == 1);
    }
}

TEST_CASE("error_string", "[error]") {
    REQUIRE(std::strcmp(error_string(Error::Ok), "Success") == 0);
    REQUIRE(std::strcmp(error_string(Error::InvalidBitRange),
                        "Bit range crosses a byte boundary") == 0);
    REQUIRE(std::strcmp(error_string(Error::Underflow), "Buffer underflow") == 0);
}

TEST_CASE("throw_if_error", "[error]") {
    SECTION("Ok does not throw") {
        REQUIRE_NOTHROW(throw_if_error(Error::Ok, "read"));
    }

    SECTION("maps codes to exception types") {
        REQUIRE_THROWS_AS(throw_if_error(Error::InvalidBitRange, "read"),
                          InvalidBitRangeException);
        REQUIRE_THROWS_AS(throw_if_error(Error::Underflow, "read"), UnderflowException);
        REQUIRE_THROWS_AS(throw_if_error(Error::Overflow, "write"), OverflowException);
        REQUIRE_THROWS_AS(throw_if_error(Error::InvalidArg, "layout"), InvalidArgumentException);
    }

    SECTION("carries code and context") {
        try {
            throw_if_error(Error::InvalidBitRange, "flags");
            FAIL("expected exception");
        } catch (const BitCursorException& e) {
            REQUIRE(e.code() == Error::InvalidBitRange);
            REQUIRE(std::strcmp(e.what(), "flags: Bit range crosses a byte boundary") == 0);
        }
    }
}
