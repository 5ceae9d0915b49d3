#include <examforge/container/container_engine.hpp>

#include <examforge/common/error_types.hpp>
#include <examforge/common/expected.hpp>
#include <examforge/exceptions.hpp>
#include <examforge/logging.hpp>
#include <examforge/process/command_runner.hpp>
#include <examforge/process/process_result.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace examforge {

namespace {

constexpr std::chrono::seconds STOP_TIMEOUT{60};

std::string_view trim(std::string_view str) {
    constexpr std::string_view WHITESPACE = " \t\r\n";

    auto first = str.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = str.find_last_not_of(WHITESPACE);

    return str.substr(first, last - first + 1);
}

} // namespace

ContainerEngine::ContainerEngine(std::shared_ptr<CommandRunner> runner, std::string program)
    : runner_{std::move(runner)}
    , program_{std::move(program)} {
    ASSERT(runner_ != nullptr);
}

Result<ProcessResult> ContainerEngine::invoke(std::vector<std::string> args,
                                              std::optional<std::chrono::milliseconds> timeout) const {
    Command command{.program = program_,
                    .args = std::move(args),
                    .working_dir = std::nullopt,
                    .env = {},
                    .stdin_data = {},
                    .timeout = timeout};

    LOG_DEBUG("Running container engine command: {}", command);

    return runner_->run(command);
}

bool ContainerEngine::image_exists(const std::string& image) const {
    auto res = invoke({"inspect", "--type=image", image});

    if (!res) {
        throw ContainerError(fmt::format("Could not run container engine '{}': {}", program_, res.error()));
    }

    return res->succeeded();
}

std::string ContainerEngine::run(const std::vector<std::string>& launch_args,
                                 const std::string& container_name) const {
    auto res = invoke(launch_args);

    if (!res) {
        throw ContainerStartError(container_name,
                                  fmt::format("could not run container engine '{}': {}", program_, res.error()));
    }

    if (!res->succeeded()) {
        throw ContainerStartError(container_name, std::string{trim(res->get_diagnostic_output())});
    }

    return std::string{trim(res->get_stdout())};
}

std::optional<std::uint16_t> ContainerEngine::published_port(const std::string& container_name,
                                                             std::uint16_t container_port) const {
    auto res = invoke({"port", container_name, fmt::format("{}", container_port)});

    if (!res || !res->succeeded()) {
        return std::nullopt;
    }

    return parse_published_port(res->get_stdout());
}

std::optional<std::string> ContainerEngine::logs(const std::string& container_name) const {
    auto res = invoke({"logs", container_name});

    if (!res) {
        LOG_WARN("Could not retrieve logs of container {}: {}", container_name, res.error());
        return std::nullopt;
    }

    if (!res->succeeded()) {
        LOG_WARN("Could not retrieve logs of container {}: {}", container_name, res->get_diagnostic_output());
        return std::nullopt;
    }

    return res->get_stdout() + res->get_stderr();
}

Expected<void, std::string> ContainerEngine::stop(const std::string& container_name) const {
    auto res = invoke({"stop", container_name}, STOP_TIMEOUT);

    if (!res) {
        return fmt::format("could not run container engine '{}': {}", program_, res.error());
    }

    if (!res->succeeded()) {
        return std::string{trim(res->get_diagnostic_output())};
    }

    return {};
}

bool ContainerEngine::is_running(const std::string& container_name) const {
    auto res = invoke({"inspect", "--type=container", "-f", "{{.State.Running}}", container_name});

    if (!res) {
        throw ContainerError(fmt::format("Could not run container engine '{}': {}", program_, res.error()));
    }

    // Non-zero: no such container (which, with --rm, is what a stopped one looks like)
    return res->succeeded() && trim(res->get_stdout()) == "true";
}

std::optional<std::uint16_t> parse_published_port(std::string_view output) {
    while (!output.empty()) {
        auto eol = output.find('\n');
        std::string_view line = trim(output.substr(0, eol));
        output = (eol == std::string_view::npos ? std::string_view{} : output.substr(eol + 1));

        auto colon = line.rfind(':');
        if (colon == std::string_view::npos) {
            continue;
        }

        std::string_view port_str = line.substr(colon + 1);
        std::uint16_t port{};
        const auto* end = port_str.data() + port_str.size();
        auto [ptr, ec] = std::from_chars(port_str.data(), end, port);

        if (ec != std::errc{} || ptr != end || port == 0) {
            continue;
        }

        return port;
    }

    return std::nullopt;
}

} // namespace examforge
