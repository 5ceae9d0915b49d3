#pragma once

#include <examforge/common/error_types.hpp>
#include <examforge/process/process_result.hpp>

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace examforge {

struct Command
{
    std::string program;
    std::vector<std::string> args;

    /// Working directory of the child; inherits ours if unset
    std::optional<std::filesystem::path> working_dir;

    /// Added on top of the inherited environment
    std::map<std::string, std::string> env;

    std::string stdin_data;

    std::optional<std::chrono::milliseconds> timeout;

    /// Shell-like rendering of program + arguments, for logs and error messages
    std::string to_string() const;
};

/// Executes external programs to completion.
///
/// Everything in examforge that shells out (git, the container engine, the agent process)
/// goes through this interface, so that it can be substituted in tests.
class CommandRunner
{
public:
    virtual ~CommandRunner() = default;

    /// Fails only if the program could not be run at all (not found, timed out, ...).
    /// A non-zero exit status is reported through ProcessResult.
    virtual Result<ProcessResult> run(const Command& command) = 0;
};

/// Runs commands as real child processes of this one
class LocalCommandRunner final : public CommandRunner
{
public:
    Result<ProcessResult> run(const Command& command) override;
};

std::shared_ptr<CommandRunner> make_local_runner();

} // namespace examforge

template <>
struct fmt::formatter<::examforge::Command> : fmt::formatter<std::string_view>
{
    auto format(const ::examforge::Command& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(from.to_string(), ctx);
    }
};
