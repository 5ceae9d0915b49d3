#pragma once

#include <examforge/container/container_config.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace examforge {

constexpr const char* DEFAULT_IMAGE = "openhands-agent-server-rs";
constexpr const char* WORKSPACE_MOUNT_POINT = "/workspace";

/// Produces the launch configuration of a container session scoped to ``workspace``.
///
/// Flavors of compute environment (plain, compiler-cache enabled, ...) are just different profiles; they all
/// feed the same ContainerRuntime.
using EnvironmentProfile = std::function<ContainerConfig(const std::filesystem::path& workspace)>;

/// Caller-supplied additions layered on top of a profile's defaults
struct ProfileOverrides
{
    std::map<std::string, std::string> env;
    std::vector<VolumeMount> volumes;
    std::vector<std::string> extra_port_mappings;
};

/// Where the compiler cache and package caches live, on the host and in the container
struct CacheSettings
{
    std::string compiler_wrapper = "/usr/local/bin/sccache";
    std::string container_cache_dir = "/var/cache/sccache";
    std::string container_cargo_home = "/usr/local/cargo";

    std::filesystem::path host_cache_dir = ".sccache";
    /// ``registry/`` and ``git/`` subdirectories are mounted separately
    std::filesystem::path host_cargo_cache_dir = ".cargo_cache";
};

/// ``defaults`` overlaid by ``overrides``; caller values win.
/// Volumes are keyed by container path; host paths are made absolute.
ContainerConfig merge_overrides(ContainerConfig defaults, const ProfileOverrides& overrides);

/// Workspace mounted at /workspace and nothing else
EnvironmentProfile make_plain_profile(ContainerConfig base, ProfileOverrides overrides = {});

/// Workspace plus persistent host-backed compiler and package caches
EnvironmentProfile make_caching_profile(ContainerConfig base, CacheSettings cache = {},
                                        ProfileOverrides overrides = {});

} // namespace examforge
