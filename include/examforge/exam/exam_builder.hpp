#pragma once

#include <examforge/agent/agent.hpp>
#include <examforge/container/container_runtime.hpp>
#include <examforge/container/environment_profile.hpp>
#include <examforge/exam/exam.hpp>
#include <examforge/vcs/repository.hpp>

#include <fmt/format.h>

#include <memory>
#include <string>
#include <string_view>

namespace examforge {

enum class BuildStage { Cloned, SolutionAuthored, SolutionCommitted, ProblemAuthored, ProblemCommitted, Published };

constexpr std::string_view to_string(BuildStage stage) {
    switch (stage) {
    case BuildStage::Cloned:
        return "cloned";
    case BuildStage::SolutionAuthored:
        return "solution authored";
    case BuildStage::SolutionCommitted:
        return "solution committed";
    case BuildStage::ProblemAuthored:
        return "problem authored";
    case BuildStage::ProblemCommitted:
        return "problem committed";
    case BuildStage::Published:
        return "published";
    }

    return "<unknown>";
}

constexpr const char* SOLUTION_COMMIT_MESSAGE = "Exam Solution: Reference Implementation";
constexpr const char* PROBLEM_COMMIT_MESSAGE = "Exam Problem: Initial State";

struct ExamBuilderSettings
{
    std::string committer_name = "examforge Exam Creator";
    std::string committer_email = "creator@examforge.invalid";
    std::string remote = "origin";
    std::string temp_prefix = "examforge_create_";
};

/// Drives the agent through authoring a solution and then a matching problem, and publishes both as commits.
class ExamBuilder
{
public:
    ExamBuilder(std::shared_ptr<const ContainerRuntime> runtime, EnvironmentProfile profile,
                std::shared_ptr<Agent> agent, ExamBuilderSettings settings = {});

    /// Build an exam over a fresh clone of ``project``, with ``library`` cloned into it as a read-only dependency.
    ///
    /// The solution commit is created first and the problem commit on top of it; the problem commit is pushed to
    /// ``exam-<id>`` on the clone's origin (i.e. ``project``). The returned exam's project repository is the
    /// temporary workspace. On failure the workspace is left on disk for inspection.
    Exam build(const Repository& project, const Repository& library, const Topic& topic) const;

private:
    std::shared_ptr<const ContainerRuntime> runtime_;
    EnvironmentProfile profile_;
    std::shared_ptr<Agent> agent_;
    ExamBuilderSettings settings_;
};

} // namespace examforge

template <>
struct fmt::formatter<::examforge::BuildStage> : fmt::formatter<std::string_view>
{
    auto format(::examforge::BuildStage from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::examforge::to_string(from), ctx);
    }
};
