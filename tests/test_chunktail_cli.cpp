// tests/test_chunktail_cli.cpp
#include "tests.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli.hpp"

using namespace chunktail;

namespace {
    options parse_args(const std::string& line) {
        CLI::App app{ "chunktail" };
        options opts;
        setup_app(app, opts);
        app.parse(line, /*program_name_included=*/false);
        return opts;
    }
}

TEST_SUITE("chunktail: command line") {

    TEST_CASE("type after the subcommand") {
        auto opts = parse_args("data.bin tail -n 3 --type f32");
        CHECK(opts.cmd == command::tail);
        CHECK(opts.filename == "data.bin");
        CHECK(opts.count == 3);
        CHECK(opts.kind == entry_kind::f32);
    }

    TEST_CASE("type before the subcommand") {
        auto opts = parse_args("data.bin --type u16 head");
        CHECK(opts.cmd == command::head);
        CHECK(opts.kind == entry_kind::u16);
        CHECK(opts.count == DEFAULT_COUNT);
    }

    TEST_CASE("defaults and case-insensitive type names") {
        SUBCASE("default type") {
            auto opts = parse_args("data.bin count");
            CHECK(opts.cmd == command::count);
            CHECK(opts.kind == entry_kind::i64);
        }
        SUBCASE("upper case") {
            auto opts = parse_args("data.bin count -t F64");
            CHECK(opts.kind == entry_kind::f64);
        }
    }

    TEST_CASE("append collects values") {
        auto opts = parse_args("data.bin append -t i32 1 20 3");
        CHECK(opts.cmd == command::append);
        CHECK(opts.kind == entry_kind::i32);
        CHECK(opts.values == std::vector<std::string>{ "1", "20", "3" });
    }

    TEST_CASE("rejected command lines") {
        CHECK_THROWS_AS(parse_args("data.bin tail --type nope"), CLI::ParseError);
        CHECK_THROWS_AS(parse_args("data.bin"), CLI::ParseError);
        CHECK_THROWS_AS(parse_args("data.bin tail --bogus"), CLI::ParseError);
    }
}

TEST_SUITE("chunktail: parse_value") {

    TEST_CASE("signed and floating values") {
        CHECK(parse_value<std::int64_t>("-42") == -42);
        CHECK(parse_value<std::int16_t>("-7") == -7);
        CHECK(parse_value<float>("2.5") == 2.5f);
        CHECK(parse_value<double>("-0.125") == -0.125);
    }

    TEST_CASE("unsigned values reject a minus sign") {
        CHECK(parse_value<std::uint32_t>("42") == 42u);
        CHECK_THROWS_AS(parse_value<std::uint32_t>("-1"), std::invalid_argument);
        CHECK_THROWS_AS(parse_value<std::uint64_t>("-1"), std::invalid_argument);
        CHECK_THROWS_AS(parse_value<std::uint16_t>("-1"), std::invalid_argument);
    }

    TEST_CASE("16-bit values are range checked") {
        CHECK(parse_value<std::uint16_t>("65535") == 65535u);
        CHECK_THROWS_AS(parse_value<std::uint16_t>("70000"), std::out_of_range);
        CHECK_THROWS_AS(parse_value<std::int16_t>("-40000"), std::out_of_range);
    }

    TEST_CASE("malformed text") {
        CHECK_THROWS_AS(parse_value<std::int32_t>("abc"), std::invalid_argument);
        CHECK_THROWS_AS(parse_value<std::int32_t>("1.5"), std::invalid_argument);
        CHECK_THROWS_AS(parse_value<std::int64_t>(""), std::invalid_argument);
    }
}
