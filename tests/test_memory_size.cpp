#include "catch2_custom.hpp"

#include <execbox/common/memory_size.hpp>

#include <cstdint>
#include <limits>
#include <string>

using execbox::format_memory_size;
using execbox::GIB;
using execbox::KIB;
using execbox::MIB;
using execbox::parse_memory_size;

TEST_CASE("Parse memory sizes with and without units") {
    REQUIRE(parse_memory_size("128m") == 128 * MIB);
    REQUIRE(parse_memory_size("512k") == 512 * KIB);
    REQUIRE(parse_memory_size("1g") == GIB);
    REQUIRE(parse_memory_size("4096") == 4096U);
    REQUIRE(parse_memory_size("100b") == 100U);

    // Case-insensitive, optional trailing 'b'
    REQUIRE(parse_memory_size("64M") == 64 * MIB);
    REQUIRE(parse_memory_size("2GB") == 2 * GIB);
    REQUIRE(parse_memory_size("16kb") == 16 * KIB);

    // Surrounding whitespace is tolerated
    REQUIRE(parse_memory_size(" 32m\n") == 32 * MIB);
}

TEST_CASE("Reject malformed memory sizes") {
    REQUIRE_FALSE(parse_memory_size(""));
    REQUIRE_FALSE(parse_memory_size("   "));
    REQUIRE_FALSE(parse_memory_size("m"));
    REQUIRE_FALSE(parse_memory_size("-5m"));
    REQUIRE_FALSE(parse_memory_size("12x"));
    REQUIRE_FALSE(parse_memory_size("1.5g"));
    REQUIRE_FALSE(parse_memory_size("10 m"));
    REQUIRE_FALSE(parse_memory_size("5bb"));
    REQUIRE_FALSE(parse_memory_size("0"));
    REQUIRE_FALSE(parse_memory_size("0m"));

    SECTION("Overflow is an error, not a wrap-around") {
        REQUIRE_FALSE(parse_memory_size("99999999999999999999999"));
        REQUIRE_FALSE(parse_memory_size(std::to_string(std::numeric_limits<std::uint64_t>::max() / 2) + "k"));
    }

    SECTION("Errors name the offending token") {
        auto res = parse_memory_size("12x");
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("12x"));
    }
}

TEST_CASE("Format memory sizes with the largest exact unit") {
    REQUIRE(format_memory_size(128 * MIB) == "128m");
    REQUIRE(format_memory_size(2 * GIB) == "2g");
    REQUIRE(format_memory_size(1536 * KIB) == "1536k");
    REQUIRE(format_memory_size(1000) == "1000b");
    REQUIRE(format_memory_size(0) == "0b");

    REQUIRE(parse_memory_size(format_memory_size(768 * MIB)) == 768 * MIB);
}
