//
// Sony Wave64 scanning
//

#include <doctest/doctest.h>
#include <raff/chunk_scanner.hh>
#include <raff/exceptions.hh>

#include <functional>
#include <string>

#include "test_utils.hh"

using namespace raff;

namespace {
    const guid& fmt_guid() {
        static const guid g = guid::parse("20746D66-ACF3-11D3-8CD1-00C04F8EDB8A");
        return g;
    }

    const guid& data_guid() {
        static const guid g = guid::parse("61746164-ACF3-11D3-8CD1-00C04F8EDB8A");
        return g;
    }
}

TEST_SUITE("WAVE64") {
    TEST_CASE("Wave64 fmt and data") {
        bytes body;
        put_w64_chunk(body, fmt_guid(), filler(16));
        put_w64_chunk(body, data_guid(), filler(8, 7));
        auto data = make_wave64(body);

        auto src = memory(data);
        scan_options opts;
        opts.materialize_payload = true;
        auto scanner = chunk_scanner::create(*src, opts);

        const auto& master = scanner->master();
        CHECK(master.variant == container_variant::wave64);
        CHECK(master.id == "RIFF"_4cc);
        CHECK(master.type == "WAVE"_4cc);
        CHECK(master.size == 112);
        CHECK(master.id_guid == wave64::riff_guid());
        CHECK(master.type_guid == wave64::wave_guid());
        CHECK(scanner->order() == byte_order::little);

        auto fmt = scanner->next();
        REQUIRE(fmt.has_value());
        CHECK(fmt->id == "fmt "_4cc);
        CHECK(fmt->uuid == fmt_guid());
        CHECK(fmt->header_offset == 40);
        CHECK(fmt->offset == 64);
        CHECK(fmt->size == 16);
        CHECK(fmt->current_form == "WAVE"_4cc);

        auto samples = scanner->next();
        REQUIRE(samples.has_value());
        CHECK(samples->id == "data"_4cc);
        CHECK(samples->offset == 104);
        CHECK(samples->size == 8);
        CHECK(*samples->payload == filler(8, 7));

        CHECK_FALSE(scanner->next().has_value());
    }

    TEST_CASE("Wave64 chunks align to eight bytes") {
        bytes body;
        put_w64_chunk(body, fmt_guid(), filler(5));
        put_w64_chunk(body, data_guid(), filler(8));
        auto data = make_wave64(body);

        warning_tracker tracker;
        scan_options opts;
        opts.on_warning = std::ref(tracker);
        auto chunks = scan_all(data, opts);

        REQUIRE(chunks.size() == 2);
        CHECK(chunks[0].size == 5);
        CHECK(chunks[1].header_offset == 72);
        CHECK(tracker.warnings.empty());
    }

    TEST_CASE("Wave64 final chunk without alignment bytes") {
        bytes body;
        put_w64_chunk(body, data_guid(), filler(5), false);
        auto data = make_wave64(body);

        warning_tracker tracker;
        scan_options opts;
        opts.on_warning = std::ref(tracker);
        auto chunks = scan_all(data, opts);

        REQUIRE(chunks.size() == 1);
        CHECK(tracker.has_warning("missing_padding"));
    }

    TEST_CASE("Wave64 ignore set uses the mapped identifier") {
        bytes body;
        put_w64_chunk(body, wave64::junk_guid(), filler(20));
        put_w64_chunk(body, data_guid(), filler(8));
        auto data = make_wave64(body);

        scan_options opts;
        opts.ignore = {"JUNK"_4cc};
        auto chunks = scan_all(data, opts);

        REQUIRE(chunks.size() == 1);
        CHECK(chunks[0].id == "data"_4cc);
        CHECK(chunks[0].offset == 40 + 48 + 24);

        auto unfiltered = scan_all(data);
        REQUIRE(unfiltered.size() == 2);
        CHECK(unfiltered[0].id == "JUNK"_4cc);
    }

    TEST_CASE("Wave64 size smaller than its header") {
        bytes body;
        put_guid(body, data_guid());
        put_u64(body, 16);
        put_bytes(body, filler(16));
        auto data = make_wave64(body);

        for (bool strict : {true, false}) {
            CAPTURE(strict);
            scan_options opts;
            opts.strict = strict;
            auto src = memory(data);
            auto scanner = chunk_scanner::create(*src, opts);
            CHECK_THROWS_AS(scanner->next(), parse_error);
        }
    }

    TEST_CASE("Wave64 chunk size near the 64-bit limit") {
        bytes body;
        put_guid(body, data_guid());
        put_u64(body, 0xFFFFFFFFFFFFFFF0ull);
        put_bytes(body, filler(16));
        auto data = make_wave64(body);

        SUBCASE("strict reports the overrun") {
            auto src = memory(data);
            auto scanner = chunk_scanner::create(*src);
            try {
                scanner->next();
                FAIL("expected parse_error");
            } catch (const truncated_error&) {
                FAIL("size overflowed into a truncation");
            } catch (const parse_error& e) {
                CHECK(std::string(e.what()).find("extends past") != std::string::npos);
            }
        }

        SUBCASE("lenient clamps to the container end") {
            warning_tracker tracker;
            scan_options opts;
            opts.strict = false;
            opts.on_warning = std::ref(tracker);

            auto chunks = scan_all(data, opts);
            REQUIRE(chunks.size() == 1);
            CHECK(chunks[0].size == 16);
            CHECK(tracker.has_warning("container_overrun"));
        }
    }

    TEST_CASE("Wave64 master size smaller than its header") {
        bytes data;
        put_guid(data, wave64::riff_guid());
        put_u64(data, 24);
        put_guid(data, wave64::wave_guid());
        put_w64_chunk(data, data_guid(), filler(8));

        auto src = memory(data);
        CHECK_THROWS_AS(chunk_scanner::create(*src), parse_error);
    }

    TEST_CASE("Wave64 marker and summary list chunks have readable ids") {
        bytes body;
        put_w64_chunk(body, guid::parse("ABF76256-392D-11D2-86C7-00C04F8EDB8A"), filler(12));
        put_w64_chunk(body, guid::parse("925F94BC-525A-11D2-86DC-00C04F8EDB8A"), filler(4));
        auto data = make_wave64(body);

        warning_tracker tracker;
        scan_options opts;
        opts.on_warning = std::ref(tracker);
        auto chunks = scan_all(data, opts);

        REQUIRE(chunks.size() == 2);
        CHECK(chunks[0].id == "cue "_4cc);
        CHECK(chunks[1].id == "SMRY"_4cc);
        CHECK(chunks[0].id.is_printable());
        CHECK_FALSE(tracker.has_warning("unknown_guid"));
    }

    TEST_CASE("Wave64 unknown GUIDs") {
        auto custom = guid::parse("6D797463-0001-0002-0304-050607080900");

        bytes body;
        put_w64_chunk(body, custom, filler(8));
        auto data = make_wave64(body);

        warning_tracker tracker;
        scan_options opts;
        opts.on_warning = std::ref(tracker);
        auto chunks = scan_all(data, opts);

        REQUIRE(chunks.size() == 1);
        CHECK(chunks[0].id == custom.leading_fourcc());
        CHECK(chunks[0].uuid == custom);
        CHECK(tracker.count_category("unknown_guid") == 1);
    }

    TEST_CASE("Wave64 trailing bytes") {
        bytes body;
        put_w64_chunk(body, data_guid(), filler(8));
        put_bytes(body, filler(8));
        auto data = make_wave64(body);

        SUBCASE("strict") {
            auto src = memory(data);
            auto scanner = chunk_scanner::create(*src);
            REQUIRE(scanner->next().has_value());
            CHECK_THROWS_AS(scanner->next(), truncated_error);
        }

        SUBCASE("lenient") {
            warning_tracker tracker;
            scan_options opts;
            opts.strict = false;
            opts.on_warning = std::ref(tracker);
            CHECK(scan_all(data, opts).size() == 1);
            CHECK(tracker.has_warning("trailing_bytes"));
        }
    }
}
