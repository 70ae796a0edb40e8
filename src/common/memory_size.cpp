#include <execbox/common/memory_size.hpp>

#include <execbox/common/strings.hpp>

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

namespace execbox {

namespace {

std::uint64_t suffix_multiplier(char suffix) {
    switch (std::tolower(static_cast<unsigned char>(suffix))) {
    case 'b':
        return 1;
    case 'k':
        return KIB;
    case 'm':
        return MIB;
    case 'g':
        return GIB;
    default:
        return 0;
    }
}

} // namespace

Expected<std::uint64_t, std::string> parse_memory_size(std::string_view token) {
    std::string_view trimmed = trim(token);

    if (trimmed.empty()) {
        return std::string{"memory size is empty"};
    }

    std::uint64_t count = 0;
    const char* const first = trimmed.data();
    const char* const last = trimmed.data() + trimmed.size();

    auto [ptr, ec] = std::from_chars(first, last, count);

    if (ec == std::errc::result_out_of_range) {
        return fmt::format("memory size \"{}\" is too large", trimmed);
    }
    if (ec != std::errc{}) {
        return fmt::format("memory size \"{}\" does not start with a number", trimmed);
    }

    std::string_view suffix{ptr, static_cast<std::size_t>(last - ptr)};

    std::uint64_t multiplier = 1;

    if (!suffix.empty()) {
        multiplier = suffix_multiplier(suffix.front());

        bool valid_suffix = multiplier != 0 &&
                            (suffix.size() == 1 || (suffix.size() == 2 && multiplier != 1 &&
                                                    std::tolower(static_cast<unsigned char>(suffix[1])) == 'b'));

        if (!valid_suffix) {
            return fmt::format("memory size \"{}\" has an unknown unit \"{}\" (expected one of b, k, m, g)", trimmed,
                               suffix);
        }
    }

    if (count == 0) {
        return fmt::format("memory size \"{}\" must be greater than zero", trimmed);
    }

    if (count > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        return fmt::format("memory size \"{}\" is too large", trimmed);
    }

    return count * multiplier;
}

std::string format_memory_size(std::uint64_t bytes) {
    if (bytes != 0 && bytes % GIB == 0) {
        return fmt::format("{}g", bytes / GIB);
    }
    if (bytes != 0 && bytes % MIB == 0) {
        return fmt::format("{}m", bytes / MIB);
    }
    if (bytes != 0 && bytes % KIB == 0) {
        return fmt::format("{}k", bytes / KIB);
    }

    return fmt::format("{}b", bytes);
}

} // namespace execbox
