#pragma once

#include <examforge/common/class_traits.hpp>

#include <filesystem>
#include <string_view>

namespace examforge {

/// Create a fresh, uniquely named directory under the system temp dir.
/// Throws std::filesystem::filesystem_error on failure.
std::filesystem::path make_temp_directory(std::string_view prefix);

/// Remove ``dir`` and everything below it, after making it writable.
/// Returns false (and logs) on failure.
bool remove_directory_tree(const std::filesystem::path& dir) noexcept;

/// Owns a temporary directory; removes it on destruction unless released
class TempDirectory : NonCopyable
{
public:
    explicit TempDirectory(std::string_view prefix);

    /// Take ownership of an existing directory
    static TempDirectory adopt(std::filesystem::path dir);

    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;

    ~TempDirectory();

    const std::filesystem::path& path() const { return path_; }

    /// Stop managing the directory; it is left on disk
    std::filesystem::path release();

private:
    TempDirectory() = default;

    std::filesystem::path path_;
};

} // namespace examforge
