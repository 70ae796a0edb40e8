#pragma once

#include <execbox/common/expected.hpp>
#include <execbox/execution/test_case.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

/// Reads a batch of test cases from a directory of ``NAME.out`` files (expected output) with
/// optional ``NAME.in`` files beside them (standard input; empty when absent).
///
/// Cases are ordered by natural name order ("case2" before "case10"), and NAME becomes the
/// case description. Other files are ignored; a ``NAME.in`` with no ``NAME.out`` is an error.
class CaseDirectoryReader
{
public:
    static constexpr std::string_view INPUT_EXTENSION = ".in";
    static constexpr std::string_view OUTPUT_EXTENSION = ".out";

    explicit CaseDirectoryReader(std::filesystem::path dir);

    Expected<std::vector<TestCase>, std::string> read() const;

private:
    std::filesystem::path dir_;
};

/// Entire contents of a file, byte for byte
Expected<std::string> read_whole_file(const std::filesystem::path& path);

/// Orders names so that embedded runs of digits compare by numeric value
bool natural_less(std::string_view lhs, std::string_view rhs);

} // namespace execbox
