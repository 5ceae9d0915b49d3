#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace examforge {

/// Port the agent server listens on inside the container
constexpr std::uint16_t DEFAULT_CONTAINER_PORT = 3000;

struct VolumeMount
{
    /// Resolved to an absolute path before being handed to the engine
    std::filesystem::path host_path;
    std::string container_path;
};

/// Everything needed to launch one container session
struct ContainerConfig
{
    std::string image;

    /// Generated (``examforge-<hex>``) if unset
    std::optional<std::string> container_name;

    /// Unset or 0: publish the container port to an engine-chosen host port and discover it afterwards
    std::optional<std::uint16_t> host_port;

    std::uint16_t container_port = DEFAULT_CONTAINER_PORT;

    std::map<std::string, std::string> env;

    std::vector<VolumeMount> volumes;

    /// Raw ``host:container`` mappings passed straight through as extra ``-p`` arguments
    std::vector<std::string> extra_port_mappings;

    std::string health_path = "/health";
    std::chrono::milliseconds health_timeout{std::chrono::seconds{30}};
    std::chrono::milliseconds health_interval{std::chrono::seconds{1}};

    /// How long port information is allowed to take to show up after the container started
    std::chrono::milliseconds port_discovery_grace{std::chrono::seconds{2}};
    std::chrono::milliseconds port_discovery_interval{std::chrono::milliseconds{200}};

    bool publishes_dynamic_port() const { return !host_port.has_value() || *host_port == 0; }
};

/// Arguments to the engine's ``run`` subcommand (not including the engine program itself)
std::vector<std::string> build_launch_args(const ContainerConfig& config, const std::string& container_name);

/// A fresh, globally unique container name
std::string generate_container_name();

} // namespace examforge
