#pragma once

#include <execbox/common/expected.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace execbox {

inline constexpr std::uint64_t KIB = 1024;
inline constexpr std::uint64_t MIB = 1024 * KIB;
inline constexpr std::uint64_t GIB = 1024 * MIB;

/// Parses a human readable memory budget such as "128m", "512k", "1G" or "4096".
///
/// Grammar: DIGITS [SUFFIX], where SUFFIX is one of b, k, m, g (case-insensitive),
/// optionally followed by a trailing 'b' ("kb", "MB", ...). Multiples are binary (1k = 1024 bytes).
/// A budget of zero bytes, an overflowing value, and any other trailing text are rejected.
Expected<std::uint64_t, std::string> parse_memory_size(std::string_view token);

/// Inverse of parse_memory_size for display purposes; picks the largest exact unit
std::string format_memory_size(std::uint64_t bytes);

} // namespace execbox
