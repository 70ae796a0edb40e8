#pragma once

#include <fmt/format.h>

#include <array>
#include <optional>
#include <string_view>

namespace execbox {

/// The closed set of languages a submission may be written in.
/// Adding a language means adding an enumerator here and a runner in runners/
enum class Language {
    Python,
    JavaScript,
};

inline constexpr std::array SUPPORTED_LANGUAGES = {Language::Python, Language::JavaScript};

/// Name as accepted at the engine boundary ("python", "javascript")
constexpr std::string_view to_string(Language language) {
    switch (language) {
    case Language::Python:
        return "python";
    case Language::JavaScript:
        return "javascript";
    }

    return "<unknown>";
}

/// Exact, case-sensitive match against the supported language names
constexpr std::optional<Language> parse_language(std::string_view name) {
    for (Language language : SUPPORTED_LANGUAGES) {
        if (to_string(language) == name) {
            return language;
        }
    }

    return std::nullopt;
}

/// Guess the language of a source file from its extension (".py", ".js")
constexpr std::optional<Language> language_from_extension(std::string_view extension) {
    if (extension == ".py") {
        return Language::Python;
    }
    if (extension == ".js") {
        return Language::JavaScript;
    }

    return std::nullopt;
}

static_assert(parse_language("python") == Language::Python);
static_assert(parse_language("javascript") == Language::JavaScript);
static_assert(!parse_language("Python").has_value());

} // namespace execbox

template <>
struct fmt::formatter<::execbox::Language> : fmt::formatter<std::string_view>
{
    auto format(::execbox::Language from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::execbox::to_string(from), ctx);
    }
};
