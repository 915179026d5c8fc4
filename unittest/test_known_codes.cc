#include <doctest/doctest.h>
#include <fcc/known_codes.hh>

#include <unordered_set>

using namespace fcc;

TEST_CASE("fourcc common constants") {
    using namespace codes;

    SUBCASE("IFF constants") {
        CHECK(FORM.to_string() == "FORM");
        CHECK(LIST.to_string() == "LIST");
        CHECK(CAT_.to_string() == "CAT ");
        CHECK(PROP.to_string() == "PROP");
    }

    SUBCASE("RIFF constants") {
        CHECK(RIFF.to_string() == "RIFF");
        CHECK(RIFX.to_string() == "RIFX");
        CHECK(RF64.to_string() == "RF64");
    }

    SUBCASE("format types and chunks") {
        CHECK(WAVE == "WAVE");
        CHECK(AVI_ == "AVI ");
        CHECK(AIFF == "AIFF");
        CHECK(fmt_ == "fmt ");
        CHECK(data == "data");
        CHECK(JUNK == "JUNK");
    }

    SUBCASE("pixel formats") {
        CHECK(RGBA == 1380401729u);
        CHECK(ARGB == 1095911234u);
        CHECK(YUY2 == "YUY2");
        CHECK(NV12 == "NV12");
        CHECK(I420 == "I420");
    }

    SUBCASE("ISO BMFF") {
        CHECK(ftyp == "ftyp");
        CHECK(moov == "moov");
        CHECK(avc1 == "avc1");
        CHECK(hvc1 == "hvc1");
        CHECK(mp4a == "mp4a");
    }

    SUBCASE("space padded codes are printable but not valid") {
        CHECK(CAT_.is_printable());
        CHECK_FALSE(CAT_.is_valid());
        CHECK(fmt_.to_string_trimmed() == "fmt");
    }

    SUBCASE("constants are distinct") {
        const std::unordered_set<fourcc> all = {
            FORM, LIST, CAT_, PROP, RIFF, RIFX, RF64, WAVE, AVI_, AIFF, fmt_, data, JUNK,
            RGBA, ARGB, YUY2, NV12, I420, ftyp, moov, avc1, hvc1, mp4a
        };
        CHECK(all.size() == 23);
    }
}
