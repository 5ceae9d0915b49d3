#include "catch2_custom.hpp"

#include "fakes.hpp"

#include <examforge/container/container_config.hpp>
#include <examforge/container/container_engine.hpp>
#include <examforge/container/container_runtime.hpp>
#include <examforge/exceptions.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

using namespace examforge;
using namespace std::chrono_literals;
using examforge::test::FakeContainerStack;

namespace {

ContainerConfig quick_config() {
    ContainerConfig config;
    config.image = "test-image";
    config.health_timeout = 300ms;
    config.health_interval = 20ms;
    config.port_discovery_grace = 100ms;
    config.port_discovery_interval = 10ms;
    return config;
}

} // namespace

TEST_CASE("Acquired sessions are ready and stopped on scope exit") {
    FakeContainerStack stack;
    std::string name;

    {
        ContainerSession session = stack.runtime->acquire(quick_config());

        REQUIRE(session.state() == SessionState::Ready);
        REQUIRE(session.get_name().starts_with("examforge-"));
        REQUIRE(session.get_host_port() == 49100);
        REQUIRE_FALSE(session.get_container_id().empty());
        REQUIRE(session.connection().endpoint() == "fake://localhost:49100");
        REQUIRE(session.connection().is_open());

        REQUIRE(stack.docker->running.contains(session.get_name()));
        REQUIRE(stack.probe->urls.at(0) == "http://localhost:49100/health");

        name = session.get_name();
    }

    REQUIRE_FALSE(stack.docker->running.contains(name));
    REQUIRE(stack.docker->stopped == std::vector<std::string>{name});
    REQUIRE(stack.connections->opened == 1);
    REQUIRE(stack.connections->closed == 1);
}

TEST_CASE("Explicit release is idempotent") {
    FakeContainerStack stack;

    ContainerSession session = stack.runtime->acquire(quick_config());
    session.release();
    REQUIRE(session.state() == SessionState::Stopped);

    session.release();
    REQUIRE(stack.docker->count("stop") == 1);
    REQUIRE(stack.connections->closed == 1);
}

TEST_CASE("Moved-from sessions do not stop the container") {
    FakeContainerStack stack;

    std::optional<ContainerSession> outer;
    {
        ContainerSession inner = stack.runtime->acquire(quick_config());
        outer.emplace(std::move(inner));
    }

    REQUIRE(stack.docker->count("stop") == 0);
    REQUIRE(outer->state() == SessionState::Ready);

    outer.reset();
    REQUIRE(stack.docker->count("stop") == 1);
}

TEST_CASE("Missing images fail before any container is created") {
    FakeContainerStack stack;
    ContainerConfig config = quick_config();
    config.image = "not-built";

    try {
        (void)stack.runtime->acquire(config);
        FAIL("expected ImageNotFoundError");
    } catch (const ImageNotFoundError& err) {
        REQUIRE(err.get_image() == "not-built");
        REQUIRE_THAT(err.what(), Catch::Matchers::ContainsSubstring("build or pull"));
    }

    REQUIRE(stack.docker->count("run") == 0);
    REQUIRE(stack.docker->count("stop") == 0);
}

TEST_CASE("Engine launch failures are reported and nothing is left running") {
    FakeContainerStack stack;
    stack.docker->run_failure = "port is already allocated\n";

    REQUIRE_THROWS_AS(stack.runtime->acquire(quick_config()), ContainerStartError);

    REQUIRE(stack.docker->running.empty());
    REQUIRE(stack.docker->count("stop") == 0);
    REQUIRE(stack.probe->urls.empty());
}

TEST_CASE("Late port information is waited for") {
    FakeContainerStack stack;
    stack.docker->port_delay = 3;

    ContainerSession session = stack.runtime->acquire(quick_config());

    REQUIRE(session.state() == SessionState::Ready);
    REQUIRE(session.get_host_port() == 49100);
    REQUIRE(stack.docker->count("port") == 4);
}

TEST_CASE("Undiscoverable ports stop the container") {
    FakeContainerStack stack;
    stack.docker->never_publish_port = true;

    try {
        (void)stack.runtime->acquire(quick_config());
        FAIL("expected PortDiscoveryError");
    } catch (const PortDiscoveryError& err) {
        REQUIRE(err.get_container_logs() == "agent server booting\n");
    }

    REQUIRE(stack.docker->running.empty());
    REQUIRE(stack.docker->count("stop") == 1);
    REQUIRE(stack.connections->opened == 0);
}

TEST_CASE("Fixed host ports skip discovery") {
    FakeContainerStack stack;
    ContainerConfig config = quick_config();
    config.host_port = 8123;

    ContainerSession session = stack.runtime->acquire(config);

    REQUIRE(session.get_host_port() == 8123);
    REQUIRE(stack.docker->count("port") == 0);
    REQUIRE(stack.probe->urls.at(0) == "http://localhost:8123/health");
}

TEST_CASE("Health checks are retried until they pass") {
    FakeContainerStack stack{3};
    ContainerConfig config = quick_config();
    config.health_path = "/ready";

    ContainerSession session = stack.runtime->acquire(config);

    REQUIRE(session.state() == SessionState::Ready);
    REQUIRE(stack.probe->urls.size() == 4);
    REQUIRE(stack.probe->urls.back() == "http://localhost:49100/ready");
}

TEST_CASE("Unhealthy containers time out within bounds and are stopped") {
    FakeContainerStack stack{std::nullopt};
    stack.docker->container_logs = "panic: could not bind\n";
    ContainerConfig config = quick_config();

    auto start = std::chrono::steady_clock::now();

    try {
        (void)stack.runtime->acquire(config);
        FAIL("expected HealthCheckTimeoutError");
    } catch (const HealthCheckTimeoutError& err) {
        REQUIRE(err.get_container_logs() == "panic: could not bind\n");
    }

    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(elapsed >= config.health_timeout);
    // The fake engine and probe answer immediately, leaving only scheduling slack on top of the bound
    REQUIRE(elapsed < config.health_timeout + config.health_interval + 150ms);

    REQUIRE(stack.probe->urls.size() >= 2);
    for (auto timeout : stack.probe->timeouts) {
        REQUIRE(timeout <= config.health_timeout);
    }

    REQUIRE(stack.docker->running.empty());
    REQUIRE(stack.connections->opened == 0);
}

TEST_CASE("Concurrent sessions get distinct names and ports") {
    FakeContainerStack stack;

    ContainerSession first = stack.runtime->acquire(quick_config());
    ContainerSession second = stack.runtime->acquire(quick_config());

    REQUIRE(first.get_name() != second.get_name());
    REQUIRE(first.get_host_port() != second.get_host_port());
    REQUIRE(stack.docker->running.size() == 2);
}

TEST_CASE("Explicit container names are used verbatim") {
    FakeContainerStack stack;
    ContainerConfig config = quick_config();
    config.container_name = "my-session";

    ContainerSession session = stack.runtime->acquire(config);

    REQUIRE(session.get_name() == "my-session");
    REQUIRE(stack.docker->last_run_args().at(4) == "my-session");
}

TEST_CASE("A connection that fails to close does not prevent the stop") {
    FakeContainerStack stack;
    stack.connections->throw_on_close = true;

    {
        ContainerSession session = stack.runtime->acquire(quick_config());
    }

    REQUIRE(stack.connections->closed == 1);
    REQUIRE(stack.docker->running.empty());
}

TEST_CASE("A failing stop is logged, not thrown") {
    FakeContainerStack stack;
    stack.docker->stop_fails = true;

    ContainerSession session = stack.runtime->acquire(quick_config());

    REQUIRE_NOTHROW(session.release());
    REQUIRE(stack.docker->count("stop") == 1);
}

TEST_CASE("A missing connection handle fails the session") {
    FakeContainerStack stack;
    auto engine = std::make_shared<const ContainerEngine>(stack.docker);
    ContainerRuntime runtime{engine, stack.probe, [](std::uint16_t) { return std::unique_ptr<ToolConnection>{}; }};

    try {
        (void)runtime.acquire(quick_config());
        FAIL("expected ContainerError");
    } catch (const ContainerError& err) {
        REQUIRE(err.get_container_logs() == "agent server booting\n");
    }

    REQUIRE(stack.docker->running.empty());
}

TEST_CASE("A throwing connection factory is reported with container logs") {
    FakeContainerStack stack;
    auto engine = std::make_shared<const ContainerEngine>(stack.docker);
    ContainerRuntime runtime{engine, stack.probe, [](std::uint16_t) -> std::unique_ptr<ToolConnection> {
                                 throw std::runtime_error("connection refused");
                             }};

    try {
        (void)runtime.acquire(quick_config());
        FAIL("expected ContainerError");
    } catch (const ContainerError& err) {
        REQUIRE_THAT(err.what(), Catch::Matchers::ContainsSubstring("connection refused"));
        REQUIRE(err.get_container_logs() == "agent server booting\n");
    }

    REQUIRE(stack.docker->running.empty());
    REQUIRE(stack.docker->stopped.size() == 1);
}

TEST_CASE("Session states render for logs") {
    REQUIRE(fmt::format("{}", SessionState::HealthChecking) == "health checking");
    REQUIRE(fmt::format("{}", SessionState::Failed) == "failed");
}
