#include "app/exam_app.hpp"

#include "user/program_options.hpp"

#include <examforge/agent/agent.hpp>
#include <examforge/common/temp_directory.hpp>
#include <examforge/container/container_config.hpp>
#include <examforge/container/container_engine.hpp>
#include <examforge/container/container_runtime.hpp>
#include <examforge/container/environment_profile.hpp>
#include <examforge/container/health_probe.hpp>
#include <examforge/exam/exam.hpp>
#include <examforge/exam/exam_builder.hpp>
#include <examforge/exam/exam_runner.hpp>
#include <examforge/logging.hpp>
#include <examforge/vcs/repository.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace examforge {

std::vector<std::string> split_command(const std::string& command) {
    std::istringstream stream{command};
    std::vector<std::string> parts;

    for (std::string part; stream >> part;) {
        parts.push_back(std::move(part));
    }

    return parts;
}

int ExamApp::run_impl() {
    increase_log_verbosity(OPTS.verbosity);

    using enum ProgramOptions::Subcommand;

    switch (OPTS.command) {
    case Create:
        return create();
    case Solve:
        return solve();
    case Evaluate:
        return evaluate();
    case Verify:
        return verify();
    }

    std::unreachable();
}

EnvironmentProfile ExamApp::make_profile() const {
    ContainerConfig base;
    base.image = OPTS.image;
    base.health_timeout = OPTS.health_timeout;

    if (!OPTS.use_cache) {
        return make_plain_profile(std::move(base));
    }

    CacheSettings cache;
    cache.host_cache_dir = OPTS.cache_dir;
    cache.host_cargo_cache_dir = OPTS.cargo_cache_dir;

    return make_caching_profile(std::move(base), std::move(cache));
}

std::shared_ptr<const ContainerRuntime> ExamApp::make_runtime() const {
    auto engine = std::make_shared<const ContainerEngine>(runner_, OPTS.engine);

    return std::make_shared<const ContainerRuntime>(std::move(engine), std::make_shared<CurlHealthProbe>());
}

std::shared_ptr<Agent> ExamApp::make_agent() const {
    return std::make_shared<CommandAgent>(split_command(OPTS.agent_command), runner_);
}

int ExamApp::create() {
    Repository project{"project", OPTS.project_path, runner_};
    Repository library{"library", OPTS.library_path, runner_};

    ExamBuilder builder{make_runtime(), make_profile(), make_agent()};
    Exam exam = builder.build(project, library, Topic{.title = OPTS.title, .description = OPTS.description});

    // Both commits now live on the pushed branch of the origin project; point the record there
    const std::filesystem::path workspace = exam.project.get_local_dir();
    exam.project = project;

    save_exam(exam, OPTS.output_path);

    if (OPTS.keep_workspace) {
        LOG_INFO("Keeping creation workspace {}", workspace.string());
    } else {
        remove_directory_tree(workspace);
    }

    fmt::print("{}\n", exam.id);
    fmt::print("branch: {}\n", exam_branch_name(exam));
    fmt::print("record: {}\n", std::filesystem::absolute(OPTS.output_path).string());

    return 0;
}

int ExamApp::solve() {
    Exam exam = load_exam(OPTS.exam_path, runner_);

    ExamRunner runner{make_runtime(), make_profile(), make_agent()};
    std::filesystem::path workspace = runner.solve(exam);

    fmt::print("{}\n", workspace.string());

    return 0;
}

int ExamApp::evaluate() {
    Exam exam = load_exam(OPTS.exam_path, runner_);

    ExamRunner runner{make_runtime(), make_profile(), make_agent()};
    std::string report = runner.evaluate(exam, OPTS.workspace_path);

    fmt::print("{}\n", report);

    if (auto score = parse_score(report)) {
        LOG_INFO("Score: {}/{}", score->awarded, score->total);
    } else {
        LOG_WARN("Evaluation report has no score line");
    }

    return 0;
}

int ExamApp::verify() {
    Exam exam = load_exam(OPTS.exam_path, runner_);

    if (auto res = verify_exam(exam); !res) {
        fmt::print(stderr, "{}\n", fmt::styled(fmt::format("Exam {} is invalid: {}", exam.id, res.error()),
                                               fg(fmt::color::red)));
        return 1;
    }

    fmt::print("Exam {} is valid\n", exam.id);

    return 0;
}

} // namespace examforge
