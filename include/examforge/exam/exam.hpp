#pragma once

#include <examforge/common/expected.hpp>
#include <examforge/process/command_runner.hpp>
#include <examforge/vcs/repository.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace examforge {

/// What exam to generate
struct Topic
{
    std::string title;
    std::string description;
};

constexpr const char* QUESTION_FILE = "question.md";
constexpr const char* RUBRIC_FILE = "rubric.md";

/// A (solution, problem) pair of commits in a project repository, with the accompanying question and rubric.
///
/// The solution commit is the parent of the problem commit: the reference implementation is committed first,
/// and the stubbed-out problem state is committed on top of it.
struct Exam
{
    std::string id;
    std::string image;

    Repository project;
    Repository library;

    std::string solution_commit;
    std::string problem_commit;

    std::string question;
    std::string rubric;
};

/// ``exam_<sanitized title>_<first 7 characters of commit>``
std::string make_exam_id(std::string_view title, std::string_view commit);

/// Name of the remote branch an exam is published under
std::string exam_branch_name(const Exam& exam);
std::string exam_branch_name(std::string_view exam_id);

/// Write ``exam`` as JSON to ``path``. Throws ExamRecordError.
void save_exam(const Exam& exam, const std::filesystem::path& path);

/// Read an exam record written by save_exam.
/// Throws ExamRecordError if the file is missing or malformed, and RepositoryCommandError if one of the
/// repositories it refers to is no longer a checkout.
Exam load_exam(const std::filesystem::path& path, const std::shared_ptr<CommandRunner>& runner = make_local_runner());

struct Score
{
    int awarded;
    int total;

    bool operator==(const Score&) const = default;
};

/// Extract the last ``TOTAL USER SCORE: <n>/<m>`` line of an evaluation report
std::optional<Score> parse_score(std::string_view report);

/// Check the structural invariants of an exam against its project repository:
/// distinct commits, solution is an ancestor of problem, question and rubric identical at both commits
/// (and identical to the record), and a published branch, if present locally, pointing at the problem commit.
Expected<void, std::string> verify_exam(const Exam& exam);

} // namespace examforge
