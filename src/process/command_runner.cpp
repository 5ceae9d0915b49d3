#include <examforge/process/command_runner.hpp>

#include "subprocess/subprocess.hpp"

#include <examforge/common/error_types.hpp>
#include <examforge/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <memory>
#include <string>

namespace examforge {

std::string Command::to_string() const {
    if (args.empty()) {
        return program;
    }
    return fmt::format("{} {}", program, fmt::join(args, " "));
}

Result<ProcessResult> LocalCommandRunner::run(const Command& command) {
    Subprocess proc{command.program, command.args};

    if (command.working_dir) {
        proc.set_working_dir(*command.working_dir);
    }
    for (const auto& [name, value] : command.env) {
        proc.set_env(name, value);
    }

    TRY(proc.start());

    if (command.timeout) {
        return proc.communicate(command.stdin_data, *command.timeout);
    }

    return proc.communicate(command.stdin_data);
}

std::shared_ptr<CommandRunner> make_local_runner() {
    return std::make_shared<LocalCommandRunner>();
}

} // namespace examforge
