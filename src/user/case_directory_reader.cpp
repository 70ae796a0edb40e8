#include "user/case_directory_reader.hpp"

#include <execbox/common/error_types.hpp>
#include <execbox/common/expected.hpp>
#include <execbox/execution/test_case.hpp>
#include <execbox/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/sort.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace execbox {

namespace {

bool is_digit(char chr) {
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

} // namespace

Expected<std::string> read_whole_file(const std::filesystem::path& path) {
    std::ifstream in_file{path, std::ios::binary};

    if (not in_file.is_open()) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }

    std::string contents{std::istreambuf_iterator<char>{in_file}, std::istreambuf_iterator<char>{}};

    if (in_file.bad()) {
        return std::make_error_code(std::errc::io_error);
    }

    return contents;
}

bool natural_less(std::string_view lhs, std::string_view rhs) {
    std::size_t i = 0;
    std::size_t j = 0;

    while (i < lhs.size() && j < rhs.size()) {
        if (is_digit(lhs[i]) && is_digit(rhs[j])) {
            std::size_t lhs_end = i;
            std::size_t rhs_end = j;

            while (lhs_end < lhs.size() && is_digit(lhs[lhs_end])) {
                ++lhs_end;
            }
            while (rhs_end < rhs.size() && is_digit(rhs[rhs_end])) {
                ++rhs_end;
            }

            // Compare numerically without converting, so arbitrarily long runs work
            std::string_view lhs_num = lhs.substr(i, lhs_end - i);
            std::string_view rhs_num = rhs.substr(j, rhs_end - j);

            lhs_num.remove_prefix(std::min(lhs_num.find_first_not_of('0'), lhs_num.size()));
            rhs_num.remove_prefix(std::min(rhs_num.find_first_not_of('0'), rhs_num.size()));

            if (lhs_num.size() != rhs_num.size()) {
                return lhs_num.size() < rhs_num.size();
            }
            if (lhs_num != rhs_num) {
                return lhs_num < rhs_num;
            }

            i = lhs_end;
            j = rhs_end;
            continue;
        }

        if (lhs[i] != rhs[j]) {
            return lhs[i] < rhs[j];
        }

        ++i;
        ++j;
    }

    if ((lhs.size() - i) != (rhs.size() - j)) {
        return (lhs.size() - i) < (rhs.size() - j);
    }

    // Equal under natural order ("a01" vs "a1"); fall back to plain order so the result is total
    return lhs < rhs;
}

CaseDirectoryReader::CaseDirectoryReader(std::filesystem::path dir)
    : dir_{std::move(dir)} {}

Expected<std::vector<TestCase>, std::string> CaseDirectoryReader::read() const {
    namespace fs = std::filesystem;

    std::error_code err;
    fs::directory_iterator iter{dir_, err};

    if (err) {
        return fmt::format("Failed to open test case directory \"{}\": {}", dir_.string(), err.message());
    }

    std::set<std::string> inputs;
    std::vector<std::string> names;

    for (const fs::directory_entry& entry : iter) {
        if (!entry.is_regular_file(err)) {
            continue;
        }

        const fs::path& path = entry.path();
        const std::string extension = path.extension().string();

        if (extension == OUTPUT_EXTENSION) {
            names.push_back(path.stem().string());
        } else if (extension == INPUT_EXTENSION) {
            inputs.insert(path.stem().string());
        } else {
            LOG_DEBUG("Ignoring \"{}\" in test case directory", path.filename().string());
        }
    }

    for (const std::string& input_name : inputs) {
        if (!fs::exists(dir_ / (input_name + std::string{OUTPUT_EXTENSION}))) {
            return fmt::format("Test case input \"{}\" has no matching {}{} file",
                               input_name + std::string{INPUT_EXTENSION}, input_name, OUTPUT_EXTENSION);
        }
    }

    if (names.empty()) {
        return fmt::format("No test cases (*{} files) found in \"{}\"", OUTPUT_EXTENSION, dir_.string());
    }

    ranges::sort(names, natural_less);

    std::vector<TestCase> result;
    result.reserve(names.size());

    for (std::string& name : names) {
        TestCase test_case;

        const fs::path output_path = dir_ / (name + std::string{OUTPUT_EXTENSION});
        const fs::path input_path = dir_ / (name + std::string{INPUT_EXTENSION});

        test_case.expected_output = TRYE(read_whole_file(output_path),
                                         fmt::format("Failed to read \"{}\"", output_path.string()));

        if (inputs.contains(name)) {
            test_case.input =
                TRYE(read_whole_file(input_path), fmt::format("Failed to read \"{}\"", input_path.string()));
        }

        test_case.description = std::move(name);

        result.push_back(std::move(test_case));
    }

    LOG_DEBUG("Read {} test case(s) from {}", result.size(), dir_.string());

    return result;
}

} // namespace execbox
