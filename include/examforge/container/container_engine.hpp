#pragma once

#include <examforge/common/error_types.hpp>
#include <examforge/common/expected.hpp>
#include <examforge/process/command_runner.hpp>
#include <examforge/process/process_result.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace examforge {

/// Adapter over a docker-compatible container engine CLI
class ContainerEngine
{
public:
    explicit ContainerEngine(std::shared_ptr<CommandRunner> runner, std::string program = "docker");

    const std::string& get_program() const { return program_; }

    /// ``inspect --type=image``. Throws ContainerError if the engine itself could not be run.
    bool image_exists(const std::string& image) const;

    /// ``run <launch_args...>``; returns the container id printed by the engine.
    /// Throws ContainerStartError if the engine rejects the launch.
    std::string run(const std::vector<std::string>& launch_args, const std::string& container_name) const;

    /// ``port <name> <container_port>``; nullopt if no mapping is (yet) known
    std::optional<std::uint16_t> published_port(const std::string& container_name,
                                                 std::uint16_t container_port) const;

    /// Combined stdout+stderr of ``logs <name>``; nullopt if they could not be retrieved
    std::optional<std::string> logs(const std::string& container_name) const;

    /// ``stop <name>``; error holds the engine's diagnostic output
    Expected<void, std::string> stop(const std::string& container_name) const;

    /// Whether a container by this name currently exists and is running
    bool is_running(const std::string& container_name) const;

private:
    Result<ProcessResult> invoke(std::vector<std::string> args,
                                 std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    std::shared_ptr<CommandRunner> runner_;
    std::string program_;
};

/// Parse the output of ``port <name> <port>``, e.g.::
///
///     0.0.0.0:49483
///     :::49483
///
/// Only the first line containing a ``:`` is considered; the host port is whatever follows its last ``:``.
std::optional<std::uint16_t> parse_published_port(std::string_view output);

} // namespace examforge
