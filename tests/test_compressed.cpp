/**
 * @file test_compressed.cpp
 * @brief Unit tests for the compressed integer encoding.
 */

#include <catch2/catch_test_macros.hpp>
#include <bitcodec/bitbuffer.hpp>

#include <vector>

using namespace bitcodec;

TEST_CASE("Compressed short layout", "[compressed]") {
    BitBuffer bb;

    SECTION("zero takes the shortest path") {
        // '1' (high byte zero) '1' (top nibble zero) 0000
        bb.write_compressed_short(0);
        REQUIRE(bb.bits() == 6);
        REQUIRE(bb.data()[0] == 0xC0);
    }

    SECTION("single nibble") {
        // '1' '1' 0101
        bb.write_compressed_short(0x05);
        REQUIRE(bb.bits() == 6);
        REQUIRE(bb.data()[0] == 0xD4);
    }

    SECTION("single byte") {
        // '1' '0' 10101011
        bb.write_compressed_short(0xAB);
        REQUIRE(bb.bits() == 10);
        REQUIRE(bb.data() == std::vector<std::uint8_t>{0xAA, 0xC0});
    }

    SECTION("full width") {
        // '0' 00110100 00010010
        bb.write_compressed_short(0x1234);
        REQUIRE(bb.bits() == 17);
        REQUIRE(bb.data() == std::vector<std::uint8_t>{0x1A, 0x09, 0x00});
    }
}

TEST_CASE("Compressed long layout", "[compressed]") {
    BitBuffer bb;

    SECTION("zero") {
        // '1' '1' '1' '1' 0000
        bb.write_compressed_long(0);
        REQUIRE(bb.bits() == 8);
        REQUIRE(bb.data()[0] == 0xF0);
    }

    SECTION("low byte only") {
        bb.write_compressed_long(0xFF);
        REQUIRE(bb.bits() == 4 + 8);
    }

    SECTION("stops at the first non-zero byte") {
        // '1' '0' then bytes 0..2
        bb.write_compressed_long(0x00010000);
        REQUIRE(bb.bits() == 2 + 24);
    }

    SECTION("full width") {
        bb.write_compressed_long(0xFFFFFFFF);
        REQUIRE(bb.bits() == 1 + 32);
    }
}

TEST_CASE("Compressed short round-trip", "[compressed]") {
    const std::uint16_t values[] = {0x0000, 0x0001, 0x000F, 0x0010, 0x00FF,
                                    0x0100, 0x1234, 0x8000, 0xFFFF};

    SECTION("one buffer per value") {
        for (auto v : values) {
            BitBuffer bb;
            bb.write_compressed_short(v);
            REQUIRE(bb.read_compressed_short() == v);
            REQUIRE(bb.read_cursor().byte * 8 + static_cast<std::size_t>(7 - bb.read_cursor().bit) ==
                    bb.bits());
        }
    }

    SECTION("back to back") {
        BitBuffer bb;
        for (auto v : values) {
            bb.write_compressed_short(v);
        }
        for (auto v : values) {
            REQUIRE(bb.read_compressed_short() == v);
        }
    }
}

TEST_CASE("Compressed long round-trip", "[compressed]") {
    const std::uint32_t values[] = {0x00000000, 0x0000000F, 0x00000010, 0x000000FF,
                                    0x00000100, 0x0000FFFF, 0x00010000, 0x00FFFFFF,
                                    0x01000000, 0x80000001, 0xFFFFFFFF};

    BitBuffer bb;
    for (auto v : values) {
        bb.write_compressed_long(v);
    }
    for (auto v : values) {
        REQUIRE(bb.read_compressed_long() == v);
    }
}

TEST_CASE("Compressed interleaved with other fields", "[compressed]") {
    BitBuffer bb;
    bb.write_bit(true);
    bb.write_compressed_long(0x42);
    bb.write_bits(0x5, 3);
    bb.write_compressed_short(0xBEEF);

    REQUIRE(bb.read_bit() == 1);
    REQUIRE(bb.read_compressed_long() == 0x42);
    REQUIRE(bb.read_bits(3) == 0x5);
    REQUIRE(bb.read_compressed_short() == 0xBEEF);
}

// Behaviour change: the nibble is zero-extended and the value's bytes come
// back little-endian. Earlier releases decoded the nibble as
// `nibble << 4 && 0xF0` (0xF0 or 0x00) and put the zero bytes before the
// literal bytes, so read_compressed_* did not return what was written.
TEST_CASE("read_compressed returns little-endian bytes", "[compressed][behavior-change]") {
    BitBuffer bb;

    SECTION("literal bytes then zero padding") {
        bb.write_compressed(0x00010000, 4);
        BitBuffer value = bb.read_compressed(4);
        REQUIRE(value.data() == std::vector<std::uint8_t>{0x00, 0x00, 0x01, 0x00});
    }

    SECTION("nibble is zero-extended") {
        bb.write_compressed(0x7, 4);
        BitBuffer value = bb.read_compressed(4);
        REQUIRE(value.data() == std::vector<std::uint8_t>{0x07, 0x00, 0x00, 0x00});
    }

    SECTION("eight-byte integers") {
        bb.write_compressed(0x0102030405060708ULL, 8);
        BitBuffer value = bb.read_compressed(8);
        REQUIRE(value.read_long_long() == 0x0102030405060708ULL);
    }

    SECTION("one-byte integers have only the nibble flag") {
        bb.write_compressed(0x0A, 1);
        REQUIRE(bb.bits() == 5);
        REQUIRE(bb.read_compressed(1).read_byte() == 0x0A);
    }
}

TEST_CASE("Compressed size validation", "[compressed]") {
    BitBuffer bb;
    REQUIRE_THROWS_AS(bb.write_compressed(1, 0), InvalidArgumentException);
    REQUIRE_THROWS_AS(bb.write_compressed(1, 9), InvalidArgumentException);
    REQUIRE(bb.length() == 0);
    REQUIRE(bb.bits() == 0);

    REQUIRE_THROWS_AS(bb.read_compressed(0), InvalidArgumentException);
    REQUIRE(bb.read_cursor() == Cursor{0, 7});
}
