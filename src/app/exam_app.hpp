#pragma once

#include "app/app.hpp" // IWYU pragma: export

#include <examforge/agent/agent.hpp>
#include <examforge/container/container_runtime.hpp>
#include <examforge/container/environment_profile.hpp>
#include <examforge/process/command_runner.hpp>

#include <memory>
#include <string>
#include <vector>

namespace examforge {

class ExamApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;

    int create();
    int solve();
    int evaluate();
    int verify();

    EnvironmentProfile make_profile() const;
    std::shared_ptr<const ContainerRuntime> make_runtime() const;
    std::shared_ptr<Agent> make_agent() const;

    std::shared_ptr<CommandRunner> runner_ = make_local_runner();
};

/// Split a command line on whitespace. No quoting support.
std::vector<std::string> split_command(const std::string& command);

} // namespace examforge
