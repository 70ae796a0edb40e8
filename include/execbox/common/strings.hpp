#pragma once

#include <string_view>

namespace execbox {

/// Characters considered whitespace when comparing program output
inline constexpr std::string_view WHITESPACE_CHARS = " \t\n\r\f\v";

constexpr std::string_view trim_start(std::string_view str) {
    auto first = str.find_first_not_of(WHITESPACE_CHARS);

    if (first == std::string_view::npos) {
        return {};
    }

    return str.substr(first);
}

constexpr std::string_view trim_end(std::string_view str) {
    auto last = str.find_last_not_of(WHITESPACE_CHARS);

    if (last == std::string_view::npos) {
        return {};
    }

    return str.substr(0, last + 1);
}

/// Removes surrounding whitespace only; internal whitespace is left untouched
constexpr std::string_view trim(std::string_view str) {
    return trim_end(trim_start(str));
}

static_assert(trim("  2\n") == "2");
static_assert(trim("2 3") == "2 3");
static_assert(trim(" \n\t ").empty());

} // namespace execbox
