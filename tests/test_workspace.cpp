#include "catch2_custom.hpp"

#include <execbox/common/error_types.hpp>
#include <execbox/sandbox/workspace.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <sys/stat.h>

namespace fs = std::filesystem;
using execbox::Workspace;

TEST_CASE("Workspaces are private, unique, and removed on destruction") {
    TempDir root;
    fs::path first_path;

    {
        auto first = Workspace::create(root.path() / "nested" / "root");
        auto second = Workspace::create(root.path() / "nested" / "root");

        REQUIRE(first);
        REQUIRE(second);
        REQUIRE(first->path() != second->path());
        REQUIRE(first->path().parent_path() == root.path() / "nested" / "root");

        REQUIRE(fs::is_directory(first->path()));
        REQUIRE((fs::status(first->path()).permissions() & fs::perms::all) == fs::perms::owner_all);

        first_path = first->path();
    }

    REQUIRE_FALSE(fs::exists(first_path));
    // The root itself is kept for later runs
    REQUIRE(fs::exists(root.path() / "nested" / "root"));
}

TEST_CASE("Files are written exactly once") {
    TempDir root;

    auto workspace = Workspace::create(root.path());
    REQUIRE(workspace);

    auto file = workspace->write_file("main.py", "print('hi')\n");
    REQUIRE(file);
    REQUIRE(file.value() == workspace->path() / "main.py");

    std::ifstream in{file.value()};
    std::stringstream contents;
    contents << in.rdbuf();
    REQUIRE(contents.str() == "print('hi')\n");

    REQUIRE(workspace->write_file("main.py", "again") == execbox::ErrorKind::FilesystemFailure);
}

TEST_CASE("Removal copes with files the program locked down") {
    TempDir root;
    fs::path locked_dir;

    {
        auto workspace = Workspace::create(root.path());
        REQUIRE(workspace);

        locked_dir = workspace->path() / "locked";
        fs::create_directories(locked_dir / "inner");
        std::ofstream{locked_dir / "inner" / "data.txt"} << "x";

        fs::permissions(locked_dir / "inner", fs::perms::none);
        fs::permissions(locked_dir, fs::perms::owner_read);
    }

    REQUIRE_FALSE(fs::exists(locked_dir));
}

TEST_CASE("Moving a workspace transfers ownership of the directory") {
    TempDir root;

    auto created = Workspace::create(root.path());
    REQUIRE(created);

    std::optional<Workspace> moved{std::move(created.value())};
    const fs::path dir = moved->path();

    REQUIRE(fs::exists(dir));

    moved.reset();

    REQUIRE_FALSE(fs::exists(dir));
}
