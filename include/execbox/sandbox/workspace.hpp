#pragma once

#include <execbox/common/class_traits.hpp>
#include <execbox/common/error_types.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace execbox {

/// Exclusive, freshly created working directory for one run.
/// The directory and everything in it is removed when the Workspace is destroyed.
class Workspace : NonCopyable
{
public:
    /// Creates a new private (0700) directory below ``root``, creating ``root`` if needed
    static Result<Workspace> create(const std::filesystem::path& root);

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& rhs) noexcept;
    ~Workspace();

    const std::filesystem::path& path() const { return path_; }

    /// Final path component; unique among live workspaces
    std::string name() const { return path_.filename().string(); }

    /// Creates ``file_name`` inside the workspace. Fails if it already exists.
    Result<std::filesystem::path> write_file(std::string_view file_name, std::string_view contents) const;

private:
    explicit Workspace(std::filesystem::path path)
        : path_{std::move(path)} {}

    void remove();

    std::filesystem::path path_;
};

} // namespace execbox
