//
// byte_source over memory and streams
//

#include <doctest/doctest.h>
#include <raff/byte_source.hh>
#include <raff/exceptions.hh>

#include <sstream>
#include <string>

#include "test_utils.hh"

using namespace raff;

TEST_SUITE("BYTE_SOURCE") {
    TEST_CASE("Memory source reads, skips and reports its length") {
        auto src = memory(filler(10));

        CHECK(src->length() == 10u);
        CHECK(src->position() == 0);

        auto head = src->read_exact(3);
        REQUIRE(head.size() == 3);
        CHECK(head[2] == std::byte{2});
        CHECK(src->position() == 3);

        src->seek_forward(4);
        CHECK(src->position() == 7);
        CHECK(src->remaining() == 3u);

        SUBCASE("read_exact past the end is truncated") {
            CHECK_THROWS_AS(src->read_exact(4), truncated_error);
        }

        SUBCASE("seek_forward past the end is truncated") {
            try {
                src->seek_forward(5);
                FAIL("expected truncated_error");
            } catch (const truncated_error& e) {
                CHECK(e.offset() == 7);
            }
        }

        SUBCASE("skip stops at the end") {
            CHECK(src->skip(100) == 3);
            CHECK(src->remaining() == 0u);
            std::byte b;
            CHECK(src->read(&b, 1) == 0);
        }
    }

    TEST_CASE("Typed reads honour byte order") {
        bytes data;
        put_u32(data, 0x11223344, byte_order::big);
        put_u32(data, 0x11223344, byte_order::little);
        put_id(data, "ABCD");

        auto src = memory(data);
        CHECK(src->read<std::uint32_t>(byte_order::big) == 0x11223344u);
        CHECK(src->read<std::uint32_t>(byte_order::little) == 0x11223344u);
        CHECK(src->read_fourcc() == "ABCD"_4cc);
        CHECK_THROWS_AS(src->read<std::uint16_t>(byte_order::little), truncated_error);
    }

    TEST_CASE("Borrowed memory source") {
        const unsigned char raw[] = {'d', 'a', 't', 'a', 1, 2};
        auto src = byte_source::from_memory(raw, sizeof(raw));
        CHECK(src->length() == 6u);
        CHECK(src->read_fourcc() == "data"_4cc);

        CHECK_THROWS_AS(byte_source::from_memory(nullptr, 4), io_error);
        CHECK_NOTHROW(byte_source::from_memory(nullptr, 0));
    }

    TEST_CASE("Stream source positions are relative to where the stream starts") {
        std::string text = "xxxxABCDEFGH";
        std::istringstream is(text);
        is.seekg(4);

        auto src = byte_source::from_stream(is);
        CHECK(src->position() == 0);
        CHECK(src->length() == 8u);
        CHECK(src->read_fourcc() == "ABCD"_4cc);
        CHECK(src->position() == 4);

        CHECK(src->skip(10) == 4);
        CHECK(src->position() == 8);
        CHECK(src->remaining() == 0u);
    }

    TEST_CASE("Unseekable stream source") {
        auto data = filler(5000);
        sequential_streambuf buf(data);
        std::istream is(&buf);

        auto src = byte_source::from_stream(is);
        CHECK_FALSE(src->length().has_value());
        CHECK_FALSE(src->remaining().has_value());

        // Skips are served by reading
        src->seek_forward(4097);
        CHECK(src->position() == 4097);

        auto next = src->read_exact(1);
        CHECK(next[0] == static_cast<std::byte>(4097 & 0xFF));

        CHECK(src->skip(10000) == 5000 - 4098);
        CHECK_THROWS_AS(src->read_exact(1), truncated_error);
    }

    TEST_CASE("Opening a missing file fails with io_error") {
        CHECK_THROWS_AS(byte_source::open("/nonexistent/raff/input.wav"), io_error);
    }
}
