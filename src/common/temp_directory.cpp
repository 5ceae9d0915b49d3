#include <examforge/common/temp_directory.hpp>

#include <examforge/logging.hpp>

#include <fmt/format.h>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace examforge {

std::filesystem::path make_temp_directory(std::string_view prefix) {
    std::string templ = (std::filesystem::temp_directory_path() / fmt::format("{}XXXXXX", prefix)).string();

    // mkdtemp modifies its argument in place
    if (::mkdtemp(templ.data()) == nullptr) {
        throw std::filesystem::filesystem_error("mkdtemp", templ, std::error_code{errno, std::generic_category()});
    }

    LOG_DEBUG("Created temporary directory {}", templ);

    return templ;
}

bool remove_directory_tree(const std::filesystem::path& dir) noexcept {
    namespace fs = std::filesystem;

    std::error_code err;

    // Files created inside a container may be read-only for us
    for (fs::recursive_directory_iterator iter{dir, fs::directory_options::skip_permission_denied, err}, end;
         !err && iter != end; iter.increment(err)) {
        if (!iter->is_symlink(err)) {
            fs::permissions(iter->path(), fs::perms::owner_all, fs::perm_options::add, err);
        }
        err.clear();
    }

    err.clear();
    fs::remove_all(dir, err);

    if (err) {
        LOG_WARN("Failed to remove {}: {}", dir.string(), err.message());
        return false;
    }

    LOG_DEBUG("Removed {}", dir.string());
    return true;
}

TempDirectory::TempDirectory(std::string_view prefix)
    : path_{make_temp_directory(prefix)} {}

TempDirectory TempDirectory::adopt(std::filesystem::path dir) {
    TempDirectory res;
    res.path_ = std::move(dir);
    return res;
}

TempDirectory::TempDirectory(TempDirectory&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

TempDirectory& TempDirectory::operator=(TempDirectory&& other) noexcept {
    if (this != &other) {
        if (!path_.empty()) {
            remove_directory_tree(path_);
        }
        path_ = std::exchange(other.path_, {});
    }

    return *this;
}

TempDirectory::~TempDirectory() {
    if (!path_.empty()) {
        remove_directory_tree(path_);
    }
}

std::filesystem::path TempDirectory::release() {
    return std::exchange(path_, {});
}

} // namespace examforge
