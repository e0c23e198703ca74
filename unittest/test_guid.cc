#include <doctest/doctest.h>
#include <raff/guid.hh>
#include <raff/exceptions.hh>

#include <sstream>

using namespace raff;

TEST_SUITE("GUID") {
    TEST_CASE("GUID text round trip") {
        auto g = guid::parse("20746D66-ACF3-11D3-8CD1-00C04F8EDB8A");
        CHECK(g.to_string() == "20746D66-ACF3-11D3-8CD1-00C04F8EDB8A");

        // First three groups are stored little-endian
        CHECK(g.bytes[0] == std::byte{0x66});
        CHECK(g.bytes[3] == std::byte{0x20});
        CHECK(g.bytes[4] == std::byte{0xF3});
        CHECK(g.bytes[8] == std::byte{0x8C});
        CHECK(g.leading_fourcc() == "fmt "_4cc);

        std::ostringstream os;
        os << g;
        CHECK(os.str() == g.to_string());
    }

    TEST_CASE("GUID parsing accepts lower case") {
        CHECK(guid::parse("66666972-912e-11cf-a5d6-28db04c10000") == wave64::riff_guid());
    }

    TEST_CASE("GUID parsing rejects malformed text") {
        CHECK_THROWS_AS(guid::parse("66666972-912E-11CF-A5D6"), parse_error);
        CHECK_THROWS_AS(guid::parse("66666972+912E-11CF-A5D6-28DB04C10000"), parse_error);
        CHECK_THROWS_AS(guid::parse("6666697Z-912E-11CF-A5D6-28DB04C10000"), parse_error);
    }

    TEST_CASE("Wave64 GUID mapping") {
        CHECK(wave64::riff_guid().leading_fourcc() == "riff"_4cc);
        CHECK(wave64::to_fourcc(wave64::riff_guid()) == "RIFF"_4cc);
        CHECK(wave64::to_fourcc(wave64::list_guid()) == "LIST"_4cc);
        CHECK(wave64::to_fourcc(wave64::wave_guid()) == "WAVE"_4cc);
        CHECK(wave64::to_fourcc(wave64::junk_guid()) == "JUNK"_4cc);
        CHECK(wave64::to_fourcc(guid::parse("ABF76256-392D-11D2-86C7-00C04F8EDB8A")) == "cue "_4cc);
        CHECK(wave64::to_fourcc(guid::parse("925F94BC-525A-11D2-86DC-00C04F8EDB8A")) == "SMRY"_4cc);

        auto data = guid::parse("61746164-ACF3-11D3-8CD1-00C04F8EDB8A");
        CHECK(wave64::to_fourcc(data) == "data"_4cc);
        CHECK(wave64::is_known(data));

        auto other = guid::parse("12345678-0000-0000-0000-000000000000");
        CHECK_FALSE(wave64::is_known(other));
        CHECK(wave64::to_fourcc(other) == other.leading_fourcc());
    }
}
