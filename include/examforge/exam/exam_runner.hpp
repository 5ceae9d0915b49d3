#pragma once

#include <examforge/agent/agent.hpp>
#include <examforge/container/container_runtime.hpp>
#include <examforge/container/environment_profile.hpp>
#include <examforge/exam/exam.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace examforge {

constexpr const char* NO_REPORT_TEXT = "No evaluation report generated.";

struct ExamRunnerSettings
{
    std::string committer_name = "examforge Exam Solver";
    std::string committer_email = "solver@examforge.invalid";
    std::string temp_prefix = "examforge_solve_";
};

/// Replays an exam's problem state for a solver, and grades the result
class ExamRunner
{
public:
    ExamRunner(std::shared_ptr<const ContainerRuntime> runtime, EnvironmentProfile profile,
               std::shared_ptr<Agent> agent, ExamRunnerSettings settings = {});

    /// Check out the problem commit into a fresh temporary workspace and let the agent solve it there.
    /// Returns the workspace, which is left on disk for evaluation.
    std::filesystem::path solve(const Exam& exam) const;

    /// Grade the solution in ``workspace``; returns the agent's report verbatim.
    std::string evaluate(const Exam& exam, const std::filesystem::path& workspace) const;

private:
    ContainerConfig config_for(const Exam& exam, const std::filesystem::path& workspace) const;

    std::shared_ptr<const ContainerRuntime> runtime_;
    EnvironmentProfile profile_;
    std::shared_ptr<Agent> agent_;
    ExamRunnerSettings settings_;
};

} // namespace examforge
