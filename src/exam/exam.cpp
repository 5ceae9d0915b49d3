#include <examforge/exam/exam.hpp>

#include <examforge/common/expected.hpp>
#include <examforge/exceptions.hpp>
#include <examforge/logging.hpp>
#include <examforge/process/command_runner.hpp>
#include <examforge/vcs/repository.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>

namespace examforge {

using json = nlohmann::json;

namespace {

constexpr std::size_t SHORT_HASH_LEN = 7;

json repository_to_json(const Repository& repo) {
    return json{{"name", repo.get_name()}, {"path", repo.get_local_dir().string()}};
}

Repository repository_from_json(const json& j, const std::shared_ptr<CommandRunner>& runner) {
    return Repository{j.at("name").get<std::string>(), j.at("path").get<std::string>(), runner};
}

} // namespace

std::string make_exam_id(std::string_view title, std::string_view commit) {
    std::string sanitized;
    sanitized.reserve(title.size());

    for (char chr : title) {
        auto uchr = static_cast<unsigned char>(chr);
        if (std::isalnum(uchr) != 0 || chr == '-' || chr == '_') {
            sanitized.push_back(static_cast<char>(std::tolower(uchr)));
        } else {
            sanitized.push_back('_');
        }
    }

    return fmt::format("exam_{}_{}", sanitized, commit.substr(0, SHORT_HASH_LEN));
}

std::string exam_branch_name(std::string_view exam_id) {
    return fmt::format("exam-{}", exam_id);
}

std::string exam_branch_name(const Exam& exam) {
    return exam_branch_name(exam.id);
}

void save_exam(const Exam& exam, const std::filesystem::path& path) {
    json record{
        {"id", exam.id},
        {"image", exam.image},
        {"project", repository_to_json(exam.project)},
        {"library", repository_to_json(exam.library)},
        {"solution_commit", exam.solution_commit},
        {"problem_commit", exam.problem_commit},
        {"question", exam.question},
        {"rubric", exam.rubric},
    };

    std::ofstream out{path};
    if (!out) {
        throw ExamRecordError(fmt::format("Could not open exam record {} for writing", path.string()));
    }

    out << record.dump(4) << '\n';

    if (!out) {
        throw ExamRecordError(fmt::format("Failed to write exam record {}", path.string()));
    }

    LOG_INFO("Saved exam {} to {}", exam.id, path.string());
}

Exam load_exam(const std::filesystem::path& path, const std::shared_ptr<CommandRunner>& runner) {
    std::ifstream in{path};
    if (!in) {
        throw ExamRecordError(fmt::format("Could not open exam record {}", path.string()));
    }

    json record;
    try {
        record = json::parse(in);

        return Exam{
            .id = record.at("id").get<std::string>(),
            .image = record.at("image").get<std::string>(),
            .project = repository_from_json(record.at("project"), runner),
            .library = repository_from_json(record.at("library"), runner),
            .solution_commit = record.at("solution_commit").get<std::string>(),
            .problem_commit = record.at("problem_commit").get<std::string>(),
            .question = record.at("question").get<std::string>(),
            .rubric = record.at("rubric").get<std::string>(),
        };
    } catch (const json::exception& ex) {
        throw ExamRecordError(fmt::format("Malformed exam record {}: {}", path.string(), ex.what()));
    }
}

std::optional<Score> parse_score(std::string_view report) {
    static const std::regex SCORE_RE{R"(TOTAL USER SCORE:\s*(\d+)\s*/\s*(\d+))"};

    std::optional<Score> score;

    auto begin = std::cregex_iterator(report.data(), report.data() + report.size(), SCORE_RE);
    for (auto iter = begin; iter != std::cregex_iterator{}; ++iter) {
        const auto& match = *iter;
        try {
            score = Score{.awarded = std::stoi(match[1].str()), .total = std::stoi(match[2].str())};
        } catch (const std::out_of_range&) {
            LOG_WARN("Ignoring out-of-range score line: {}", match[0].str());
        }
    }

    return score;
}

Expected<void, std::string> verify_exam(const Exam& exam) {
    const Repository& repo = exam.project;

    if (exam.solution_commit == exam.problem_commit) {
        return fmt::format("solution and problem commits are the same ({})", exam.solution_commit);
    }

    if (!repo.is_ancestor(exam.solution_commit, exam.problem_commit)) {
        return fmt::format("solution commit {} is not an ancestor of problem commit {}", exam.solution_commit,
                           exam.problem_commit);
    }

    const auto check_file = [&](const char* file, const std::string& recorded) -> std::optional<std::string> {
        std::string at_solution;
        std::string at_problem;

        try {
            at_solution = repo.show_file(exam.solution_commit, file);
            at_problem = repo.show_file(exam.problem_commit, file);
        } catch (const RepositoryCommandError& err) {
            return fmt::format("{} could not be read at both commits: {}", file, err.get_output());
        }

        if (at_solution != at_problem) {
            return fmt::format("{} differs between solution and problem commits", file);
        }
        if (at_solution != recorded) {
            return fmt::format("{} in the repository differs from the exam record", file);
        }
        return std::nullopt;
    };

    if (auto err = check_file(QUESTION_FILE, exam.question)) {
        return *err;
    }
    if (auto err = check_file(RUBRIC_FILE, exam.rubric)) {
        return *err;
    }

    const std::string branch = exam_branch_name(exam);
    if (repo.branch_exists(branch)) {
        std::string tip = repo.resolve_ref(fmt::format("refs/heads/{}", branch));
        if (tip != exam.problem_commit) {
            return fmt::format("branch {} points at {}, expected problem commit {}", branch, tip,
                               exam.problem_commit);
        }
    }

    LOG_DEBUG("Exam {} verified", exam.id);

    return {};
}

} // namespace examforge
