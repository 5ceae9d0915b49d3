#pragma once

#include <examforge/container/tool_connection.hpp>
#include <examforge/process/command_runner.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace examforge {

struct Message
{
    std::string role;
    std::string content;

    bool operator==(const Message&) const = default;
};

/// Turn history, in order. Opaque to examforge beyond being replayable into a later turn.
using Conversation = std::vector<Message>;

constexpr int DEFAULT_MAX_TURNS = 30;
constexpr int EVALUATION_MAX_TURNS = 15;

struct AgentTurnOptions
{
    int max_turns = DEFAULT_MAX_TURNS;
};

struct AgentResult
{
    std::string final_output;

    /// Full history including the instruction of this turn; feeds a follow-up turn in another session
    Conversation history;
};

/// The automated agent that does the actual work inside a container session
class Agent
{
public:
    virtual ~Agent() = default;

    /// Continue ``history`` (possibly empty) with ``instruction``, using the tools behind ``connection``.
    /// Throws AgentError on failure.
    virtual AgentResult run(ToolConnection& connection, const Conversation& history, const std::string& instruction,
                            const AgentTurnOptions& options) = 0;

    AgentResult run(ToolConnection& connection, const std::string& instruction, const AgentTurnOptions& options) {
        return run(connection, {}, instruction, options);
    }
};

/// Runs an external agent executable once per turn.
///
/// The tool endpoint is passed as ``EXAMFORGE_TOOL_URL``; ``{"messages": [...], "max_turns": n}`` is written to
/// its stdin and ``{"final_output": "...", "messages": [...]}`` is expected on its stdout.
class CommandAgent final : public Agent
{
public:
    /// ``command`` is the program followed by its arguments
    CommandAgent(std::vector<std::string> command, std::shared_ptr<CommandRunner> runner,
                 std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    using Agent::run;

    AgentResult run(ToolConnection& connection, const Conversation& history, const std::string& instruction,
                    const AgentTurnOptions& options) override;

private:
    std::vector<std::string> command_;
    std::shared_ptr<CommandRunner> runner_;
    std::optional<std::chrono::milliseconds> timeout_;
};

} // namespace examforge
