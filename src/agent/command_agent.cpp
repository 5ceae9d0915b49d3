#include <examforge/agent/agent.hpp>

#include <examforge/container/tool_connection.hpp>
#include <examforge/exceptions.hpp>
#include <examforge/logging.hpp>
#include <examforge/process/command_runner.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace examforge {

using json = nlohmann::json;

void to_json(json& j, const Message& msg) {
    j = json{{"role", msg.role}, {"content", msg.content}};
}

void from_json(const json& j, Message& msg) {
    j.at("role").get_to(msg.role);
    j.at("content").get_to(msg.content);
}

CommandAgent::CommandAgent(std::vector<std::string> command, std::shared_ptr<CommandRunner> runner,
                           std::optional<std::chrono::milliseconds> timeout)
    : command_{std::move(command)}
    , runner_{std::move(runner)}
    , timeout_{timeout} {
    ASSERT(!command_.empty(), "Agent command must name a program");
    ASSERT(runner_ != nullptr);
}

AgentResult CommandAgent::run(ToolConnection& connection, const Conversation& history, const std::string& instruction,
                              const AgentTurnOptions& options) {
    Conversation messages = history;
    messages.push_back({.role = "user", .content = instruction});

    json request;
    request["messages"] = messages;
    request["max_turns"] = options.max_turns;

    Command command{.program = command_.front(),
                    .args = std::vector<std::string>(command_.begin() + 1, command_.end()),
                    .working_dir = std::nullopt,
                    .env = {{"EXAMFORGE_TOOL_URL", connection.endpoint()}},
                    .stdin_data = request.dump(),
                    .timeout = timeout_};

    LOG_INFO("Running agent turn ({} prior messages, max {} turns) against {}", history.size(), options.max_turns,
             connection.endpoint());
    LOG_DEBUG("Agent command: {}", command);

    auto res = runner_->run(command);
    if (!res) {
        throw AgentError(fmt::format("Could not run agent `{}`: {}", command, res.error()));
    }

    if (!res->succeeded()) {
        throw AgentError(fmt::format("Agent `{}` failed with status {}: {}", command, res->get_code(),
                                     res->get_diagnostic_output()));
    }

    AgentResult result;

    try {
        json response = json::parse(res->get_stdout());

        result.final_output = response.value("final_output", std::string{});

        if (response.contains("messages")) {
            response.at("messages").get_to(result.history);
        } else {
            result.history = std::move(messages);
            if (!result.final_output.empty()) {
                result.history.push_back({.role = "assistant", .content = result.final_output});
            }
        }
    } catch (const json::exception& ex) {
        throw AgentError(fmt::format("Agent `{}` produced unreadable output: {}", command, ex.what()));
    }

    LOG_DEBUG("Agent turn finished with {} messages of history", result.history.size());

    return result;
}

} // namespace examforge
