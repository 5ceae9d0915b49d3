#include <examforge/exam/exam_builder.hpp>

#include "exam/workspace_files.hpp"

#include <examforge/agent/agent.hpp>
#include <examforge/common/temp_directory.hpp>
#include <examforge/container/container_runtime.hpp>
#include <examforge/exceptions.hpp>
#include <examforge/exam/exam.hpp>
#include <examforge/exam/prompts.hpp>
#include <examforge/logging.hpp>
#include <examforge/vcs/repository.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace examforge {

namespace {

/// Put question and rubric back to their solution-commit contents if the problem phase touched them
void restore_exam_files(const Repository& workspace, const std::string& solution_commit,
                        const std::string& question, const std::string& rubric) {
    const std::filesystem::path& dir = workspace.get_local_dir();

    bool changed = false;
    for (const auto& [file, recorded] : {std::pair{QUESTION_FILE, &question}, std::pair{RUBRIC_FILE, &rubric}}) {
        std::error_code err;
        if (!std::filesystem::exists(dir / file, err)) {
            LOG_WARN("Problem phase removed {}; restoring it", file);
            changed = true;
        } else if (read_workspace_file(dir, file) != *recorded) {
            LOG_WARN("Problem phase modified {}; restoring it", file);
            changed = true;
        }
    }

    if (changed) {
        workspace.run({"checkout", solution_commit, "--", QUESTION_FILE, RUBRIC_FILE});
    }
}

} // namespace

ExamBuilder::ExamBuilder(std::shared_ptr<const ContainerRuntime> runtime, EnvironmentProfile profile,
                         std::shared_ptr<Agent> agent, ExamBuilderSettings settings)
    : runtime_{std::move(runtime)}
    , profile_{std::move(profile)}
    , agent_{std::move(agent)}
    , settings_{std::move(settings)} {
    ASSERT(runtime_ != nullptr);
    ASSERT(profile_ != nullptr);
    ASSERT(agent_ != nullptr);
}

Exam ExamBuilder::build(const Repository& project, const Repository& library, const Topic& topic) const {
    const std::filesystem::path work_dir = make_temp_directory(settings_.temp_prefix);
    LOG_INFO("Creating exam '{}' in workspace {}", topic.title, work_dir.string());

    std::optional<BuildStage> stage;
    const auto advance = [&stage](BuildStage next) {
        stage = next;
        LOG_INFO("Exam build: {}", next);
    };

    try {
        project.run({"clone", project.get_local_dir().string(), "."}, work_dir);
        Repository workspace{"exam_workspace", work_dir, project.get_runner()};

        workspace.set_config("user.name", settings_.committer_name);
        workspace.set_config("user.email", settings_.committer_email);

        const std::filesystem::path lib_dir = work_dir / prompts::LIBRARY_SUBPATH;
        std::filesystem::create_directories(lib_dir.parent_path());
        library.clone_to(lib_dir, "exam_library");
        advance(BuildStage::Cloned);

        const ContainerConfig config = profile_(work_dir);

        Conversation history;
        {
            ContainerSession session = runtime_->acquire(config);
            AgentResult result =
                agent_->run(session.connection(), prompts::solution(topic), {.max_turns = DEFAULT_MAX_TURNS});
            history = std::move(result.history);
        }
        advance(BuildStage::SolutionAuthored);

        workspace.stage_all();
        workspace.commit(SOLUTION_COMMIT_MESSAGE);
        const std::string solution_commit = workspace.resolve_ref();
        LOG_INFO("Solution commit: {}", solution_commit);
        advance(BuildStage::SolutionCommitted);

        // Both files are fixed by the solution commit; a missing one ends the build here
        std::string question = read_workspace_file(work_dir, QUESTION_FILE);
        std::string rubric = read_workspace_file(work_dir, RUBRIC_FILE);

        // A second, independent session: tool state from phase 1 must not carry over, only the conversation
        {
            ContainerSession session = runtime_->acquire(config);
            agent_->run(session.connection(), history, prompts::problem(), {.max_turns = DEFAULT_MAX_TURNS});
        }
        advance(BuildStage::ProblemAuthored);

        restore_exam_files(workspace, solution_commit, question, rubric);

        workspace.stage_all();
        workspace.commit(PROBLEM_COMMIT_MESSAGE);
        const std::string problem_commit = workspace.resolve_ref();
        LOG_INFO("Problem commit: {}", problem_commit);
        advance(BuildStage::ProblemCommitted);

        std::string exam_id = make_exam_id(topic.title, solution_commit);
        const std::string branch = exam_branch_name(exam_id);

        Exam exam{
            .id = std::move(exam_id),
            .image = config.image,
            .project = std::move(workspace),
            .library = library,
            .solution_commit = solution_commit,
            .problem_commit = problem_commit,
            .question = std::move(question),
            .rubric = std::move(rubric),
        };

        if (auto res = verify_exam(exam); !res) {
            throw ExamRecordError(fmt::format("Refusing to publish exam {}: {}", exam.id, res.error()));
        }

        exam.project.push(settings_.remote, fmt::format("HEAD:refs/heads/{}", branch));
        LOG_INFO("Pushed exam {} to branch {}", exam.id, branch);
        advance(BuildStage::Published);

        return exam;
    } catch (const std::exception& ex) {
        LOG_ERROR("Failed to create exam '{}' (last completed stage: {}): {}", topic.title,
                  stage ? to_string(*stage) : "none", ex.what());
        LOG_ERROR("Workspace left for inspection at {}", work_dir.string());
        throw;
    }
}

} // namespace examforge
