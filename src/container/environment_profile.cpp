#include <examforge/container/environment_profile.hpp>

#include <examforge/container/container_config.hpp>
#include <examforge/logging.hpp>

#include <range/v3/algorithm/find_if.hpp>

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

namespace examforge {

namespace {

void set_volume(ContainerConfig& config, const VolumeMount& volume) {
    VolumeMount resolved{.host_path = std::filesystem::absolute(volume.host_path),
                         .container_path = volume.container_path};

    auto existing = ranges::find_if(config.volumes, [&resolved](const VolumeMount& mount) {
        return mount.container_path == resolved.container_path;
    });

    if (existing != config.volumes.end()) {
        *existing = std::move(resolved);
    } else {
        config.volumes.push_back(std::move(resolved));
    }
}

/// The engine would otherwise create missing bind-mount sources itself, owned by root
void ensure_directory(const std::filesystem::path& dir) {
    std::error_code err;
    std::filesystem::create_directories(dir, err);
    if (err) {
        LOG_WARN("Could not create cache directory {}: {}", dir.string(), err.message());
    }
}

ContainerConfig with_workspace(ContainerConfig config, const std::filesystem::path& workspace) {
    set_volume(config, {.host_path = workspace, .container_path = WORKSPACE_MOUNT_POINT});
    return config;
}

} // namespace

ContainerConfig merge_overrides(ContainerConfig defaults, const ProfileOverrides& overrides) {
    for (const auto& [name, value] : overrides.env) {
        defaults.env.insert_or_assign(name, value);
    }

    for (const VolumeMount& volume : overrides.volumes) {
        set_volume(defaults, volume);
    }

    // Resolve whatever was already there, too
    for (VolumeMount& volume : defaults.volumes) {
        volume.host_path = std::filesystem::absolute(volume.host_path);
    }

    defaults.extra_port_mappings.insert(defaults.extra_port_mappings.end(), overrides.extra_port_mappings.begin(),
                                        overrides.extra_port_mappings.end());

    return defaults;
}

EnvironmentProfile make_plain_profile(ContainerConfig base, ProfileOverrides overrides) {
    return [base = std::move(base), overrides = std::move(overrides)](const std::filesystem::path& workspace) {
        return merge_overrides(with_workspace(base, workspace), overrides);
    };
}

EnvironmentProfile make_caching_profile(ContainerConfig base, CacheSettings cache, ProfileOverrides overrides) {
    return [base = std::move(base), cache = std::move(cache),
            overrides = std::move(overrides)](const std::filesystem::path& workspace) {
        ContainerConfig config = with_workspace(base, workspace);

        config.env.insert_or_assign("RUSTC_WRAPPER", cache.compiler_wrapper);
        config.env.insert_or_assign("SCCACHE_DIR", cache.container_cache_dir);
        // Incremental compilation artifacts defeat sccache
        config.env.insert_or_assign("CARGO_INCREMENTAL", "0");

        const std::filesystem::path cargo_cache = std::filesystem::absolute(cache.host_cargo_cache_dir);

        ensure_directory(cache.host_cache_dir);
        ensure_directory(cargo_cache / "registry");
        ensure_directory(cargo_cache / "git");

        set_volume(config, {.host_path = cache.host_cache_dir, .container_path = cache.container_cache_dir});
        set_volume(config,
                   {.host_path = cargo_cache / "registry", .container_path = cache.container_cargo_home + "/registry"});
        set_volume(config, {.host_path = cargo_cache / "git", .container_path = cache.container_cargo_home + "/git"});

        LOG_DEBUG("Caching profile: compiler cache {}, cargo cache {}",
                  std::filesystem::absolute(cache.host_cache_dir).string(), cargo_cache.string());

        return merge_overrides(std::move(config), overrides);
    };
}

} // namespace examforge
