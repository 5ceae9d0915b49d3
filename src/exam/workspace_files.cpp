#include "exam/workspace_files.hpp"

#include <examforge/exceptions.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace examforge {

std::string read_workspace_file(const std::filesystem::path& workspace, const std::string& name) {
    const std::filesystem::path path = workspace / name;

    std::ifstream in{path, std::ios::binary};
    if (!in) {
        throw ExamRecordError(fmt::format("Workspace {} has no readable {}", workspace.string(), name));
    }

    std::string contents{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};

    if (in.bad()) {
        throw ExamRecordError(fmt::format("Failed to read {}", path.string()));
    }

    return contents;
}

bool is_missing_or_empty(const std::filesystem::path& dir) {
    std::error_code err;
    return !std::filesystem::exists(dir, err) || std::filesystem::is_empty(dir, err);
}

} // namespace examforge
