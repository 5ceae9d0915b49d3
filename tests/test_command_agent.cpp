#include "catch2_custom.hpp"

#include "fakes.hpp"

#include <examforge/agent/agent.hpp>
#include <examforge/common/error_types.hpp>
#include <examforge/container/tool_connection.hpp>
#include <examforge/exceptions.hpp>
#include <examforge/process/command_runner.hpp>
#include <examforge/process/process_result.hpp>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace examforge;
using examforge::test::FakeCommandRunner;
using json = nlohmann::json;

namespace {

std::shared_ptr<FakeCommandRunner> replying(std::string stdout_text, int exit_code = 0) {
    return std::make_shared<FakeCommandRunner>(
        [stdout_text = std::move(stdout_text), exit_code](const Command&) -> Result<ProcessResult> {
            return ProcessResult::make_exited(exit_code, stdout_text, exit_code == 0 ? "" : "agent crashed\n");
        });
}

} // namespace

TEST_CASE("Agent turns are passed the tool endpoint and the conversation") {
    auto runner = replying(R"({"final_output": "done", "messages": [
        {"role": "user", "content": "earlier"},
        {"role": "assistant", "content": "ok"},
        {"role": "user", "content": "do it"},
        {"role": "assistant", "content": "done"}]})");

    CommandAgent agent{{"my-agent", "--model", "x"}, runner, std::chrono::minutes{5}};
    HttpToolConnection connection{49200};

    Conversation history{{.role = "user", .content = "earlier"}, {.role = "assistant", .content = "ok"}};
    AgentResult result = agent.run(connection, history, "do it", {.max_turns = 7});

    REQUIRE(result.final_output == "done");
    REQUIRE(result.history.size() == 4);
    REQUIRE(result.history.back() == Message{.role = "assistant", .content = "done"});

    const Command& cmd = runner->commands.at(0);
    REQUIRE(cmd.program == "my-agent");
    REQUIRE(cmd.args == std::vector<std::string>{"--model", "x"});
    REQUIRE(cmd.env.at("EXAMFORGE_TOOL_URL") == "http://localhost:49200/mcp");
    REQUIRE(cmd.timeout == std::chrono::minutes{5});

    json request = json::parse(cmd.stdin_data);
    REQUIRE(request.at("max_turns") == 7);
    REQUIRE(request.at("messages").size() == 3);
    REQUIRE(request.at("messages").back().at("content") == "do it");
    REQUIRE(request.at("messages").back().at("role") == "user");
}

TEST_CASE("History is synthesized when the agent returns none") {
    auto runner = replying(R"({"final_output": "report"})");
    CommandAgent agent{{"my-agent"}, runner};
    HttpToolConnection connection{1234};

    AgentResult result = agent.run(connection, "grade it", {.max_turns = EVALUATION_MAX_TURNS});

    REQUIRE(result.final_output == "report");
    REQUIRE(result.history == Conversation{{.role = "user", .content = "grade it"},
                                           {.role = "assistant", .content = "report"}});
    REQUIRE(json::parse(runner->commands.at(0).stdin_data).at("max_turns") == EVALUATION_MAX_TURNS);
}

TEST_CASE("Empty final output is not an error") {
    CommandAgent agent{{"my-agent"}, replying("{}")};
    HttpToolConnection connection{1234};

    AgentResult result = agent.run(connection, "grade it", {});

    REQUIRE(result.final_output.empty());
    REQUIRE(result.history.size() == 1);
}

TEST_CASE("Agent failures surface as AgentError") {
    HttpToolConnection connection{1234};

    SECTION("non-zero exit") {
        CommandAgent agent{{"my-agent"}, replying("", 2)};
        try {
            agent.run(connection, "x", {});
            FAIL("expected AgentError");
        } catch (const AgentError& err) {
            REQUIRE_THAT(err.what(), Catch::Matchers::ContainsSubstring("agent crashed"));
        }
    }

    SECTION("unreadable output") {
        CommandAgent agent{{"my-agent"}, replying("this is not json")};
        REQUIRE_THROWS_AS(agent.run(connection, "x", {}), AgentError);
    }

    SECTION("malformed messages") {
        CommandAgent agent{{"my-agent"}, replying(R"({"final_output": "a", "messages": [{"role": 1}]})")};
        REQUIRE_THROWS_AS(agent.run(connection, "x", {}), AgentError);
    }

    SECTION("program could not be run") {
        auto runner = std::make_shared<FakeCommandRunner>(
            [](const Command&) -> Result<ProcessResult> { return ErrorKind::SpawnFailure; });
        CommandAgent agent{{"missing-agent"}, runner};
        REQUIRE_THROWS_AS(agent.run(connection, "x", {}), AgentError);
    }
}

TEST_CASE("HTTP tool connections point at the MCP endpoint") {
    HttpToolConnection connection{49483};

    REQUIRE(connection.endpoint() == "http://localhost:49483/mcp");
    REQUIRE(connection.is_open());

    connection.close();
    REQUIRE_FALSE(connection.is_open());

    // Closing twice is harmless
    connection.close();
}

TEST_CASE("A real agent process round-trips through the local runner") {
    // Echoes a fixed reply, ignoring its input
    CommandAgent agent{{"/bin/sh", "-c", R"(cat >/dev/null; printf '%s' '{"final_output": "hi from sh"}')"},
                       make_local_runner()};
    HttpToolConnection connection{1};

    REQUIRE(agent.run(connection, "hello", {}).final_output == "hi from sh");
}
