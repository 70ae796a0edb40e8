#include "catch2_custom.hpp"

#include "user/case_directory_reader.hpp"

#include <execbox/execution/test_case.hpp>

#include <string>
#include <system_error>
#include <vector>

using execbox::CaseDirectoryReader;
using execbox::natural_less;

TEST_CASE("Natural name order") {
    REQUIRE(natural_less("case2", "case10"));
    REQUIRE_FALSE(natural_less("case10", "case2"));
    REQUIRE(natural_less("a", "b"));
    REQUIRE(natural_less("case", "case1"));
    REQUIRE(natural_less("1-b", "2-a"));
    REQUIRE(natural_less("x9y", "x10a"));
    REQUIRE(natural_less("99999999999999999999998", "99999999999999999999999"));

    // Equal numbers with different padding still order deterministically
    REQUIRE(natural_less("a01", "a1"));
    REQUIRE_FALSE(natural_less("a1", "a01"));

    REQUIRE_FALSE(natural_less("same", "same"));
}

TEST_CASE("Cases are read in natural order with optional input") {
    TempDir dir;
    dir.write("case10.in", "10\n");
    dir.write("case10.out", "100\n");
    dir.write("case2.in", "2\n");
    dir.write("case2.out", "4\n");
    dir.write("no_input.out", "constant\n");
    dir.write("README.md", "ignored");

    auto cases = CaseDirectoryReader{dir.path()}.read();

    REQUIRE(cases);
    REQUIRE(cases->size() == 3);

    REQUIRE(cases->at(0).description == "case2");
    REQUIRE(cases->at(0).input == "2\n");
    REQUIRE(cases->at(0).expected_output == "4\n");

    REQUIRE(cases->at(1).description == "case10");
    REQUIRE(cases->at(1).input == "10\n");

    REQUIRE(cases->at(2).description == "no_input");
    REQUIRE(cases->at(2).input.empty());
    REQUIRE(cases->at(2).expected_output == "constant\n");
}

TEST_CASE("Malformed case directories are rejected") {
    TempDir dir;

    SECTION("Input without expected output") {
        dir.write("a.out", "1");
        dir.write("b.in", "2");

        auto cases = CaseDirectoryReader{dir.path()}.read();

        REQUIRE_FALSE(cases);
        REQUIRE_THAT(cases.error(), Catch::Matchers::ContainsSubstring("b.in"));
    }

    SECTION("No cases at all") {
        dir.write("notes.txt", "nothing here");

        auto cases = CaseDirectoryReader{dir.path()}.read();

        REQUIRE_FALSE(cases);
        REQUIRE_THAT(cases.error(), Catch::Matchers::StartsWith("No test cases"));
    }

    SECTION("Missing directory") {
        auto cases = CaseDirectoryReader{dir / "does-not-exist"}.read();

        REQUIRE_FALSE(cases);
        REQUIRE_THAT(cases.error(), Catch::Matchers::StartsWith("Failed to open test case directory"));
    }
}

TEST_CASE("Whole files are read byte for byte") {
    TempDir dir;
    const std::string contents{"line one\r\n\0binary\n", 18};
    auto file = dir.write("data", contents);

    REQUIRE(execbox::read_whole_file(file) == contents);
    REQUIRE(execbox::read_whole_file(dir / "missing") ==
            std::make_error_code(std::errc::no_such_file_or_directory));
}
