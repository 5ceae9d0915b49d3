#include <examforge/exam/exam_runner.hpp>

#include "exam/workspace_files.hpp"

#include <examforge/agent/agent.hpp>
#include <examforge/common/temp_directory.hpp>
#include <examforge/container/container_runtime.hpp>
#include <examforge/exam/exam.hpp>
#include <examforge/exam/prompts.hpp>
#include <examforge/logging.hpp>
#include <examforge/vcs/repository.hpp>

#include <libassert/assert.hpp>

#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace examforge {

ExamRunner::ExamRunner(std::shared_ptr<const ContainerRuntime> runtime, EnvironmentProfile profile,
                       std::shared_ptr<Agent> agent, ExamRunnerSettings settings)
    : runtime_{std::move(runtime)}
    , profile_{std::move(profile)}
    , agent_{std::move(agent)}
    , settings_{std::move(settings)} {
    ASSERT(runtime_ != nullptr);
    ASSERT(profile_ != nullptr);
    ASSERT(agent_ != nullptr);
}

ContainerConfig ExamRunner::config_for(const Exam& exam, const std::filesystem::path& workspace) const {
    ContainerConfig config = profile_(workspace);

    if (!exam.image.empty()) {
        config.image = exam.image;
    }

    return config;
}

std::filesystem::path ExamRunner::solve(const Exam& exam) const {
    const std::filesystem::path work_dir = make_temp_directory(settings_.temp_prefix);
    LOG_INFO("Solving exam {} in workspace {}", exam.id, work_dir.string());

    try {
        Repository workspace = exam.project.clone_to(work_dir, "solve_workspace");

        workspace.set_config("user.name", settings_.committer_name);
        workspace.set_config("user.email", settings_.committer_email);

        LOG_INFO("Checking out problem commit {}", exam.problem_commit);
        workspace.checkout(exam.problem_commit);

        // The library is committed as a bare gitlink, so a clone only has an empty directory in its place
        const std::filesystem::path lib_dir = work_dir / prompts::LIBRARY_SUBPATH;
        if (is_missing_or_empty(lib_dir)) {
            std::filesystem::create_directories(lib_dir.parent_path());
            exam.library.clone_to(lib_dir, "solve_library");
        }

        ContainerSession session = runtime_->acquire(config_for(exam, work_dir));
        agent_->run(session.connection(), prompts::solve(exam), {.max_turns = DEFAULT_MAX_TURNS});
    } catch (const std::exception& ex) {
        LOG_ERROR("Failed to solve exam {}: {}", exam.id, ex.what());
        throw;
    }

    return work_dir;
}

std::string ExamRunner::evaluate(const Exam& exam, const std::filesystem::path& workspace) const {
    LOG_INFO("Evaluating solution of exam {} at {}", exam.id, workspace.string());

    try {
        ContainerSession session = runtime_->acquire(config_for(exam, workspace));
        AgentResult result =
            agent_->run(session.connection(), prompts::evaluate(exam), {.max_turns = EVALUATION_MAX_TURNS});

        if (result.final_output.empty()) {
            LOG_WARN("Evaluation of exam {} produced no report", exam.id);
            return NO_REPORT_TEXT;
        }

        return std::move(result.final_output);
    } catch (const std::exception& ex) {
        LOG_ERROR("Failed to evaluate exam {}: {}", exam.id, ex.what());
        throw;
    }
}

} // namespace examforge
