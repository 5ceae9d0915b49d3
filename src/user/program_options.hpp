#pragma once

#include <examforge/common/error_types.hpp>
#include <examforge/common/expected.hpp>
#include <examforge/container/environment_profile.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace examforge {

struct ProgramOptions
{

    // ###### Argument fields

    enum class Subcommand { Create, Solve, Evaluate, Verify } command = Subcommand::Create;

    /// Number of times -v was given
    int verbosity = 0;

    // Global options. Defaults may come from EXAMFORGE_* environment variables
    std::string image = DEFAULT_IMAGE;
    std::string engine = std::string{DEFAULT_ENGINE};

    /// Agent executable and its arguments, whitespace separated
    std::string agent_command;

    bool use_cache = true;
    std::filesystem::path cache_dir = DEFAULT_CACHE_DIR;
    std::filesystem::path cargo_cache_dir = DEFAULT_CARGO_CACHE_DIR;
    std::chrono::seconds health_timeout{DEFAULT_HEALTH_TIMEOUT_SECS};

    // create
    std::filesystem::path project_path;
    std::filesystem::path library_path;
    std::string title;
    std::string description;
    std::filesystem::path output_path = DEFAULT_OUTPUT_PATH;
    bool keep_workspace = false;

    // solve, evaluate, verify
    std::filesystem::path exam_path;

    // evaluate
    std::filesystem::path workspace_path;

    // ###### Argument defaults

    static constexpr std::string_view DEFAULT_ENGINE = "docker";
    static constexpr std::string_view DEFAULT_CACHE_DIR = ".sccache";
    static constexpr std::string_view DEFAULT_CARGO_CACHE_DIR = ".cargo_cache";
    static constexpr std::string_view DEFAULT_OUTPUT_PATH = "exam.json";
    static constexpr int DEFAULT_HEALTH_TIMEOUT_SECS = 30;

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path, std::string_view what) {
        if (!std::filesystem::exists(path)) {
            return fmt::format("{} {:?} does not exist", what, path.string());
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              std::string_view what) {
        TRY(ensure_file_exists(path, what));

        if (!std::filesystem::is_regular_file(path)) {
            return fmt::format("{} {:?} is not a regular file", what, path.string());
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path, std::string_view what) {
        TRY(ensure_file_exists(path, what));

        if (!std::filesystem::is_directory(path)) {
            return fmt::format("{} {:?} is not a directory", what, path.string());
        }

        return {};
    }

    /// Whether the subcommand starts containers and drives the agent
    bool needs_agent() const { return command != Subcommand::Verify; }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const {
        if (needs_agent() && agent_command.find_first_not_of(" \t") == std::string::npos) {
            return std::string{"No agent command given (use --agent or set EXAMFORGE_AGENT)"};
        }

        if (health_timeout <= std::chrono::seconds::zero()) {
            return fmt::format("Health timeout must be positive, got {}", health_timeout);
        }

        switch (command) {
        case Subcommand::Create:
            TRY(ensure_is_directory(project_path, "Project repository"));
            TRY(ensure_is_directory(library_path, "Library repository"));
            if (title.empty()) {
                return std::string{"Exam title must not be empty"};
            }
            break;
        case Subcommand::Evaluate:
            TRY(ensure_is_directory(workspace_path, "Workspace"));
            [[fallthrough]];
        case Subcommand::Solve:
        case Subcommand::Verify:
            TRY(ensure_is_regular_file(exam_path, "Exam record"));
            break;
        }

        return {};
    }
};

} // namespace examforge

template <>
struct fmt::formatter<::examforge::ProgramOptions::Subcommand> : fmt::formatter<std::string_view>
{
    auto format(::examforge::ProgramOptions::Subcommand from, fmt::format_context& ctx) const {
        using enum ::examforge::ProgramOptions::Subcommand;

        std::string_view name = "<unknown>";
        switch (from) {
        case Create:
            name = "create";
            break;
        case Solve:
            name = "solve";
            break;
        case Evaluate:
            name = "evaluate";
            break;
        case Verify:
            name = "verify";
            break;
        }

        return fmt::formatter<std::string_view>::format(name, ctx);
    }
};
