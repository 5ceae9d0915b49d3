#pragma once

#include <fmt/format.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace examforge {

/// A version-control subcommand could not be run, or returned non-zero
class RepositoryCommandError : public std::runtime_error
{
public:
    RepositoryCommandError(std::string repository_name, std::vector<std::string> command, std::string output);

    /// Symbolic name of the repository handle the command was run through
    const std::string& get_repository_name() const { return repository_name_; }

    /// Full command line, including the program name
    const std::vector<std::string>& get_command() const { return command_; }

    /// Captured stderr (or stdout, if stderr was empty)
    const std::string& get_output() const { return output_; }

private:
    std::string repository_name_;
    std::vector<std::string> command_;
    std::string output_;
};

/// Base for every failure of the container lifecycle.
///
/// Carries the container's own log output when it could be retrieved; it is frequently the only
/// thing that tells a boot failure apart from a health-check misconfiguration.
class ContainerError : public std::runtime_error
{
public:
    explicit ContainerError(const std::string& msg, std::optional<std::string> container_logs = std::nullopt)
        : std::runtime_error{msg}
        , container_logs_{std::move(container_logs)} {}

    const std::optional<std::string>& get_container_logs() const { return container_logs_; }

private:
    std::optional<std::string> container_logs_;
};

class ImageNotFoundError : public ContainerError
{
public:
    explicit ImageNotFoundError(const std::string& image)
        : ContainerError{fmt::format("Container image '{}' not found locally. Please build or pull it first.", image)}
        , image_{image} {}

    const std::string& get_image() const { return image_; }

private:
    std::string image_;
};

class ContainerStartError : public ContainerError
{
public:
    ContainerStartError(const std::string& container_name, const std::string& engine_stderr,
                        std::optional<std::string> container_logs = std::nullopt)
        : ContainerError{fmt::format("Failed to start container '{}': {}", container_name, engine_stderr),
                         std::move(container_logs)}
        , engine_stderr_{engine_stderr} {}

    const std::string& get_engine_stderr() const { return engine_stderr_; }

private:
    std::string engine_stderr_;
};

class PortDiscoveryError : public ContainerError
{
public:
    PortDiscoveryError(const std::string& container_name, int container_port,
                       std::optional<std::string> container_logs = std::nullopt)
        : ContainerError{fmt::format("Could not determine the host port bound to port {} of container '{}'",
                                     container_port, container_name),
                         std::move(container_logs)} {}
};

class HealthCheckTimeoutError : public ContainerError
{
public:
    HealthCheckTimeoutError(const std::string& container_name, const std::string& health_url,
                            std::optional<std::string> container_logs = std::nullopt)
        : ContainerError{fmt::format("Container '{}' did not become healthy in time ({})", container_name,
                                     health_url),
                         std::move(container_logs)} {}
};

/// The agent collaborator could not be run, failed, or produced unreadable output
class AgentError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// An exam record could not be read / written, or a workspace lacks required exam files
class ExamRecordError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace examforge
