#include <examforge/container/container_config.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace examforge {

std::vector<std::string> build_launch_args(const ContainerConfig& config, const std::string& container_name) {
    std::vector<std::string> args{"run", "-d", "--rm", "--name", container_name};

    args.emplace_back("-p");
    if (config.publishes_dynamic_port()) {
        args.push_back(fmt::format("{}", config.container_port));
    } else {
        args.push_back(fmt::format("{}:{}", *config.host_port, config.container_port));
    }

    for (const auto& [name, value] : config.env) {
        args.emplace_back("-e");
        args.push_back(fmt::format("{}={}", name, value));
    }

    for (const VolumeMount& volume : config.volumes) {
        args.emplace_back("-v");
        args.push_back(fmt::format("{}:{}", std::filesystem::absolute(volume.host_path).string(),
                                   volume.container_path));
    }

    for (const std::string& mapping : config.extra_port_mappings) {
        args.emplace_back("-p");
        args.push_back(mapping);
    }

    args.push_back(config.image);

    return args;
}

std::string generate_container_name() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> dist;

    return fmt::format("examforge-{:08x}", dist(gen));
}

} // namespace examforge
