#include <doctest/doctest.h>
#include <fcc/format.hh>

using namespace fcc;

TEST_SUITE("FORMAT") {
    TEST_CASE("format styles") {
        const auto rgba = fourcc::from_string("RGBA");

        SUBCASE("default is plain") {
            CHECK(format_fourcc(rgba) == "RGBA");
            CHECK(format_fourcc(rgba) == rgba.to_string());
        }

        SUBCASE("quoted") {
            format_options opts;
            opts.style = render_style::quoted;
            CHECK(format_fourcc(rgba, opts) == "'RGBA'");
            CHECK(format_fourcc(rgba, opts) == rgba.to_debug_string());

            opts.quote = '"';
            CHECK(format_fourcc(rgba, opts) == "\"RGBA\"");
        }

        SUBCASE("escaped") {
            format_options opts;
            opts.style = render_style::escaped;
            CHECK(format_fourcc(rgba, opts) == "'RGBA'");
            CHECK(format_fourcc(fourcc("fmt "), opts) == "'fmt '");

            auto binary = fourcc::from_bytes({'A', 'B', 0x01, '\n'});
            CHECK(format_fourcc(binary, opts) == "'AB\\x01\\x0a'");

            auto high = fourcc::from_bytes({0xE9, 0x7F, 'x', 0x00});
            CHECK(format_fourcc(high, opts) == "'\\xe9\\x7fx\\x00'");

            opts.uppercase_hex = true;
            CHECK(format_fourcc(high, opts) == "'\\xE9\\x7Fx\\x00'");
        }

        SUBCASE("hex") {
            format_options opts;
            opts.style = render_style::hex;
            CHECK(format_fourcc(rgba, opts) == "0x52474241");
            CHECK(format_fourcc(fourcc::from_uint32(0x2A), opts) == "0x0000002a");
            CHECK(format_fourcc(fourcc::from_uint32(0xDEADBEEFu), opts) == "0xdeadbeef");

            opts.uppercase_hex = true;
            CHECK(format_fourcc(fourcc::from_uint32(0xDEADBEEFu), opts) == "0xDEADBEEF");
        }
    }

    TEST_CASE("format is total") {
        const auto control = fourcc::from_bytes({0, 1, 2, 3});

        CHECK(format_fourcc(control).size() == 4);
        CHECK(format_fourcc(control, {render_style::quoted}).size() == 6);
        CHECK(format_fourcc(control, {render_style::escaped}) == "'\\x00\\x01\\x02\\x03'");
        CHECK(format_fourcc(control, {render_style::hex}) == "0x00010203");
    }
}
