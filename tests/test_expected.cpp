#include "catch2_custom.hpp"

#include <execbox/common/error_types.hpp>
#include <execbox/common/expected.hpp>

#include <string>
#include <string_view>
#include <system_error>

using namespace std::literals;
using execbox::ErrorKind;
using execbox::Expected;
using execbox::Result;

// Simple types
using Et = Expected<int, std::string>;

TEST_CASE("Simple construction and value checks") {
    // Default constructed "void-typed"
    REQUIRE(Expected{}.has_value());
    REQUIRE(!Expected{}.has_error());

    REQUIRE(Et{123}.has_value());
    REQUIRE(!Et{123}.has_error());

    REQUIRE(!Et{"Hello"}.has_value());
    REQUIRE(Et{"Hello"}.has_error());
}

TEST_CASE("Equality operators") {
    REQUIRE(Expected{} == Expected{});

    REQUIRE(Et{123} == Et{123});
    REQUIRE(Et{123} != Et{456});

    // Implicit conversions from value / error
    REQUIRE(Et{123} == 123);
    REQUIRE(Et{123} != 456);

    REQUIRE(Et{"Unexpected!"} == "Unexpected!"s);
    REQUIRE(Et{"Unexpected!"} != "Exp!"s);
}

TEST_CASE("Other (monadic) operations") {
    REQUIRE(Et{123}.value_or(456) == 123);
    REQUIRE(Et{123}.error_or("E") == "E");

    REQUIRE(Et{"A"}.value_or(456) == 456);
    REQUIRE(Et{"A"}.error_or("B") == "A");

    auto square = [](int n) { return n * n; };

    REQUIRE(Et{123}.transform(square) == 123 * 123);
    REQUIRE(Et{"no"}.transform(square).error() == "no");

    auto describe = [](const std::string& /*err*/) { return ErrorKind::InvalidArgument; };

    REQUIRE(Et{"bad"}.transform_error(describe) == ErrorKind::InvalidArgument);
    REQUIRE(Et{7}.transform_error(describe) == 7);
}

namespace {

Result<int> half(int num) {
    if (num % 2 != 0) {
        return ErrorKind::InvalidArgument;
    }

    return num / 2;
}

Result<int> quarter(int num) {
    int halved = TRY(half(num));

    return TRY(half(halved));
}

Expected<int, std::string> quarter_described(int num) {
    int halved = TRYE(half(num), "first halving");

    return TRYE(half(halved), "second halving");
}

Result<void> check_even(int num) {
    TRY(half(num));

    return {};
}

} // namespace

TEST_CASE("TRY propagates errors and unwraps values") {
    REQUIRE(quarter(8) == 2);
    REQUIRE(quarter(6) == ErrorKind::InvalidArgument);
    REQUIRE(quarter(3) == ErrorKind::InvalidArgument);

    REQUIRE(check_even(4).has_value());
    REQUIRE(check_even(5) == ErrorKind::InvalidArgument);
}

TEST_CASE("TRYE substitutes its own error") {
    REQUIRE(quarter_described(12) == 3);
    REQUIRE(quarter_described(3).error() == "first halving");
    REQUIRE(quarter_described(6).error() == "second halving");
}

TEST_CASE("Formatting of Expected and ErrorKind") {
    REQUIRE(fmt::format("{}", Result<int>{5}) == "Expected(5)");
    REQUIRE(fmt::format("{}", Result<int>{ErrorKind::TimedOut}) == "Error(TimedOut)");
    REQUIRE(fmt::format("{}", Expected<>{}) == "Expected(void)");

    execbox::CallerInputError err{.kind = ErrorKind::MissingCode, .message = "No code was provided"};
    REQUIRE(fmt::format("{}", err) == "MissingCode: No code was provided");
}
