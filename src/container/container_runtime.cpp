#include <examforge/container/container_runtime.hpp>

#include <examforge/container/container_config.hpp>
#include <examforge/container/container_engine.hpp>
#include <examforge/container/health_probe.hpp>
#include <examforge/container/tool_connection.hpp>
#include <examforge/exceptions.hpp>
#include <examforge/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace examforge {

ContainerSession::ContainerSession(std::shared_ptr<const ContainerEngine> engine, std::string name)
    : engine_{std::move(engine)}
    , name_{std::move(name)} {}

ContainerSession::ContainerSession(ContainerSession&& other) noexcept
    : engine_{std::move(other.engine_)}
    , name_{std::move(other.name_)}
    , container_id_{std::move(other.container_id_)}
    , host_port_{other.host_port_}
    , connection_{std::move(other.connection_)}
    , state_{other.state_}
    , started_{std::exchange(other.started_, false)} {}

ContainerSession& ContainerSession::operator=(ContainerSession&& other) noexcept {
    if (this != &other) {
        release();

        engine_ = std::move(other.engine_);
        name_ = std::move(other.name_);
        container_id_ = std::move(other.container_id_);
        host_port_ = other.host_port_;
        connection_ = std::move(other.connection_);
        state_ = other.state_;
        started_ = std::exchange(other.started_, false);
    }

    return *this;
}

ContainerSession::~ContainerSession() {
    release();
}

ToolConnection& ContainerSession::connection() {
    ASSERT(state_ == SessionState::Ready && connection_ != nullptr, "Container session is not ready");

    return *connection_;
}

void ContainerSession::release() noexcept {
    if (connection_) {
        try {
            connection_->close();
        } catch (const std::exception& ex) {
            LOG_ERROR("Failed to close tool connection of container {}: {}", name_, ex.what());
        }
        connection_.reset();
    }

    if (!started_) {
        return;
    }
    started_ = false;

    try {
        LOG_INFO("Stopping container {}", name_);
        auto res = engine_->stop(name_);
        if (!res) {
            LOG_ERROR("Failed to stop container {}: {}", name_, res.error());
        }
    } catch (const std::exception& ex) {
        LOG_ERROR("Failed to stop container {}: {}", name_, ex.what());
    }

    if (state_ != SessionState::Failed) {
        state_ = SessionState::Stopped;
    }
}

ContainerRuntime::ContainerRuntime(std::shared_ptr<const ContainerEngine> engine, std::shared_ptr<HealthProbe> probe,
                                   ConnectionFactory connection_factory)
    : engine_{std::move(engine)}
    , probe_{std::move(probe)}
    , connection_factory_{std::move(connection_factory)} {
    ASSERT(engine_ != nullptr);
    ASSERT(probe_ != nullptr);
    ASSERT(connection_factory_ != nullptr);
}

ContainerSession ContainerRuntime::acquire(const ContainerConfig& config) const {
    if (!engine_->image_exists(config.image)) {
        LOG_ERROR("Container image {} not found locally", config.image);
        throw ImageNotFoundError(config.image);
    }

    ContainerSession session{engine_, config.container_name.value_or(generate_container_name())};
    const std::string& name = session.get_name();

    LOG_INFO("Starting container {} from image {}", name, config.image);
    session.state_ = SessionState::Starting;

    try {
        session.container_id_ = engine_->run(build_launch_args(config, name), name);
    } catch (const ContainerStartError& err) {
        session.state_ = SessionState::Failed;
        throw ContainerStartError(name, err.get_engine_stderr(), engine_->logs(name));
    }
    session.started_ = true;

    try {
        session.host_port_ = config.publishes_dynamic_port() ? discover_port(session, config) : *config.host_port;
        LOG_INFO("Container {} is bound to host port {}", name, session.host_port_);

        session.state_ = SessionState::HealthChecking;
        wait_until_healthy(session, config);

        session.connection_ = connect(session);
    } catch (const std::exception& ex) {
        LOG_ERROR("Container {} failed while {}: {}", name, session.state_, ex.what());
        session.state_ = SessionState::Failed;
        session.release();
        throw;
    }

    session.state_ = SessionState::Ready;
    LOG_INFO("Container {} is ready", name);

    return session;
}

std::unique_ptr<ToolConnection> ContainerRuntime::connect(const ContainerSession& session) const {
    const std::string& name = session.get_name();
    std::unique_ptr<ToolConnection> connection;

    try {
        connection = connection_factory_(session.get_host_port());
    } catch (const ContainerError&) {
        throw;
    } catch (const std::exception& ex) {
        throw ContainerError(fmt::format("Failed to connect to container '{}': {}", name, ex.what()),
                             engine_->logs(name));
    }

    if (!connection) {
        throw ContainerError(fmt::format("No connection could be established to container '{}'", name),
                             engine_->logs(name));
    }

    return connection;
}

std::uint16_t ContainerRuntime::discover_port(const ContainerSession& session, const ContainerConfig& config) const {
    using Clock = std::chrono::steady_clock;

    const auto deadline = Clock::now() + config.port_discovery_grace;

    // Port information can take a moment to propagate after ``run`` returns
    while (true) {
        if (auto port = engine_->published_port(session.get_name(), config.container_port)) {
            return *port;
        }

        if (Clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(config.port_discovery_interval);
    }

    throw PortDiscoveryError(session.get_name(), config.container_port, engine_->logs(session.get_name()));
}

void ContainerRuntime::wait_until_healthy(const ContainerSession& session, const ContainerConfig& config) const {
    using Clock = std::chrono::steady_clock;
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    const std::string url = fmt::format("http://localhost:{}{}", session.get_host_port(), config.health_path);
    const auto deadline = Clock::now() + config.health_timeout;

    LOG_DEBUG("Waiting up to {} for {} to become healthy", config.health_timeout, url);

    while (true) {
        auto remaining = duration_cast<milliseconds>(deadline - Clock::now());
        if (remaining <= milliseconds::zero()) {
            break;
        }

        if (probe_->check(url, remaining)) {
            LOG_DEBUG("Health check of {} succeeded", url);
            return;
        }

        remaining = duration_cast<milliseconds>(deadline - Clock::now());
        if (remaining <= milliseconds::zero()) {
            break;
        }
        std::this_thread::sleep_for(std::min(config.health_interval, remaining));
    }

    LOG_ERROR("Container {} did not become healthy within {}", session.get_name(), config.health_timeout);

    throw HealthCheckTimeoutError(session.get_name(), url, engine_->logs(session.get_name()));
}

} // namespace examforge
