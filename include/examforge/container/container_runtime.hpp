#pragma once

#include <examforge/common/class_traits.hpp>
#include <examforge/container/container_config.hpp>
#include <examforge/container/container_engine.hpp>
#include <examforge/container/health_probe.hpp>
#include <examforge/container/tool_connection.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace examforge {

enum class SessionState { NotStarted, Starting, HealthChecking, Ready, Stopped, Failed };

constexpr std::string_view to_string(SessionState state) {
    switch (state) {
    case SessionState::NotStarted:
        return "not started";
    case SessionState::Starting:
        return "starting";
    case SessionState::HealthChecking:
        return "health checking";
    case SessionState::Ready:
        return "ready";
    case SessionState::Stopped:
        return "stopped";
    case SessionState::Failed:
        return "failed";
    }

    return "<unknown>";
}

/// One running container, owned for the lifetime of this object.
///
/// Move-only. Destruction (or an explicit ``release()``) closes the connection handle and then stops the
/// container, whatever happened in between.
class ContainerSession : NonCopyable
{
public:
    ContainerSession(ContainerSession&& other) noexcept;
    ContainerSession& operator=(ContainerSession&& other) noexcept;

    ~ContainerSession();

    SessionState state() const { return state_; }

    const std::string& get_name() const { return name_; }

    /// Container id as reported by the engine
    const std::string& get_container_id() const { return container_id_; }

    /// 0 until the port is known
    std::uint16_t get_host_port() const { return host_port_; }

    /// Only valid while the session is Ready
    ToolConnection& connection();

    /// Close the connection, then stop the container. Idempotent.
    /// Each step is attempted regardless of the other's outcome; failures are logged.
    void release() noexcept;

private:
    friend class ContainerRuntime;

    ContainerSession(std::shared_ptr<const ContainerEngine> engine, std::string name);

    std::shared_ptr<const ContainerEngine> engine_;
    std::string name_;
    std::string container_id_;
    std::uint16_t host_port_ = 0;
    std::unique_ptr<ToolConnection> connection_;
    SessionState state_ = SessionState::NotStarted;
    bool started_ = false;
};

/// Starts health-checked container sessions
class ContainerRuntime
{
public:
    ContainerRuntime(std::shared_ptr<const ContainerEngine> engine, std::shared_ptr<HealthProbe> probe,
                     ConnectionFactory connection_factory = make_http_connection_factory());

    /// Start a container per ``config`` and wait for it to become healthy.
    ///
    /// Throws ImageNotFoundError (no container is created), ContainerStartError, PortDiscoveryError or
    /// HealthCheckTimeoutError. Any failure after the container started stops it before the error propagates.
    ContainerSession acquire(const ContainerConfig& config) const;

    const ContainerEngine& get_engine() const { return *engine_; }

private:
    std::unique_ptr<ToolConnection> connect(const ContainerSession& session) const;
    std::uint16_t discover_port(const ContainerSession& session, const ContainerConfig& config) const;
    void wait_until_healthy(const ContainerSession& session, const ContainerConfig& config) const;

    std::shared_ptr<const ContainerEngine> engine_;
    std::shared_ptr<HealthProbe> probe_;
    ConnectionFactory connection_factory_;
};

} // namespace examforge

template <>
struct fmt::formatter<::examforge::SessionState> : fmt::formatter<std::string_view>
{
    auto format(::examforge::SessionState from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::examforge::to_string(from), ctx);
    }
};
