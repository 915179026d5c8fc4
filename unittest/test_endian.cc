#include <doctest/doctest.h>
#include <fcc/endian.hh>

#include <cstring>

using namespace fcc;

TEST_CASE("byte order helpers") {
    SUBCASE("platform detection is consistent") {
        CHECK(is_big_endian != is_little_endian);

        const std::uint32_t one = 1;
        std::uint8_t first;
        std::memcpy(&first, &one, 1);
        CHECK(is_little_endian == (first == 1));
    }

    SUBCASE("swap32") {
        CHECK(swap32(0x11223344u) == 0x44332211u);
        CHECK(swap32(swap32(0xDEADBEEFu)) == 0xDEADBEEFu);
    }

    SUBCASE("load_be32") {
        const std::uint8_t bytes[4] = {0x52, 0x47, 0x42, 0x41};
        CHECK(load_be32(bytes) == 0x52474241u);
    }

    SUBCASE("store_be32") {
        std::uint8_t bytes[4] = {};
        store_be32(0x0A0B0C0Du, bytes);
        CHECK(bytes[0] == 0x0A);
        CHECK(bytes[1] == 0x0B);
        CHECK(bytes[2] == 0x0C);
        CHECK(bytes[3] == 0x0D);
        CHECK(load_be32(bytes) == 0x0A0B0C0Du);
    }
}
