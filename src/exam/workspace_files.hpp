#pragma once

#include <filesystem>
#include <string>

namespace examforge {

/// Exact contents of ``workspace / name``. Throws ExamRecordError if it cannot be read.
std::string read_workspace_file(const std::filesystem::path& workspace, const std::string& name);

/// Whether ``dir`` is missing or has no entries
bool is_missing_or_empty(const std::filesystem::path& dir);

} // namespace examforge
