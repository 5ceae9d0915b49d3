#include "catch2_custom.hpp"

#include "fakes.hpp"

#include <examforge/common/temp_directory.hpp>
#include <examforge/exam/exam.hpp>
#include <examforge/exceptions.hpp>
#include <examforge/vcs/repository.hpp>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

using namespace examforge;
using examforge::test::git;
using examforge::test::GitFixture;
using examforge::test::read_file;
using examforge::test::write_file;
namespace fs = std::filesystem;

namespace {

/// A project with a solution commit followed by a problem commit, authored by hand
struct HandmadeExam
{
    HandmadeExam() {
        Repository repo{"project", project.path()};

        write_file(project.path() / "src" / "lib.rs", "pub fn add(a: i32, b: i32) -> i32 { a + b }\n");
        write_file(project.path() / QUESTION_FILE, "Implement `add`.\n");
        write_file(project.path() / RUBRIC_FILE, "1. add works (10 points)\n");
        repo.stage_all();
        repo.commit("solution");
        solution = repo.resolve_ref();

        write_file(project.path() / "src" / "lib.rs", "pub fn add(a: i32, b: i32) -> i32 { todo!() }\n");
        repo.stage_all();
        repo.commit("problem");
        problem = repo.resolve_ref();
    }

    Exam exam() const {
        return Exam{
            .id = make_exam_id("Add", solution),
            .image = "test-image",
            .project = Repository{"project", project.path()},
            .library = Repository{"library", library.path()},
            .solution_commit = solution,
            .problem_commit = problem,
            .question = "Implement `add`.\n",
            .rubric = "1. add works (10 points)\n",
        };
    }

    GitFixture project;
    GitFixture library{{{"lib.rs", "// library\n"}}};
    std::string solution;
    std::string problem;
};

} // namespace

TEST_CASE("Exam ids are derived from the title and the solution commit") {
    const std::string commit = "0123456789abcdef0123456789abcdef01234567";

    REQUIRE(make_exam_id("Async Retry", commit) == "exam_async_retry_0123456");
    REQUIRE(make_exam_id("LRU-cache_v2", commit) == "exam_lru-cache_v2_0123456");
    REQUIRE(make_exam_id("C++ / Rust: FFI!", commit) == "exam_c_____rust__ffi__0123456");
    REQUIRE(make_exam_id("", "abc") == "exam__abc");

    REQUIRE(exam_branch_name("exam_x_0123456") == "exam-exam_x_0123456");
}

TEST_CASE("Score lines are extracted from evaluation reports") {
    REQUIRE(parse_score("All good.\nTOTAL USER SCORE: 42/50\n") == Score{42, 50});
    REQUIRE(parse_score("TOTAL USER SCORE:  7 / 10") == Score{7, 10});

    // Last one wins
    REQUIRE(parse_score("TOTAL USER SCORE: 1/10\nrevised:\nTOTAL USER SCORE: 9/10") == Score{9, 10});

    REQUIRE(parse_score("") == std::nullopt);
    REQUIRE(parse_score("TOTAL SCORE: 4/5") == std::nullopt);
    REQUIRE(parse_score("TOTAL USER SCORE: four/five") == std::nullopt);
    REQUIRE(parse_score("TOTAL USER SCORE: 99999999999999999999/1") == std::nullopt);
}

TEST_CASE("Exam records survive a save and load") {
    HandmadeExam handmade;
    Exam exam = handmade.exam();

    TempDirectory out{"examforge_test_record_"};
    const fs::path record = out.path() / "exam.json";

    save_exam(exam, record);

    auto parsed = nlohmann::json::parse(read_file(record));
    REQUIRE(parsed.at("id") == exam.id);
    REQUIRE(parsed.at("project").at("path") == handmade.project.path().string());

    Exam loaded = load_exam(record);

    REQUIRE(loaded.id == exam.id);
    REQUIRE(loaded.image == "test-image");
    REQUIRE(loaded.project.get_local_dir() == exam.project.get_local_dir());
    REQUIRE(loaded.library.get_name() == "library");
    REQUIRE(loaded.solution_commit == handmade.solution);
    REQUIRE(loaded.problem_commit == handmade.problem);
    REQUIRE(loaded.question == exam.question);
    REQUIRE(loaded.rubric == exam.rubric);
}

TEST_CASE("Unreadable exam records are rejected") {
    TempDirectory dir{"examforge_test_record_"};

    REQUIRE_THROWS_AS(load_exam(dir.path() / "missing.json"), ExamRecordError);

    write_file(dir.path() / "garbage.json", "{ not json");
    REQUIRE_THROWS_AS(load_exam(dir.path() / "garbage.json"), ExamRecordError);

    write_file(dir.path() / "partial.json", R"({"id": "exam_x_1234567"})");
    REQUIRE_THROWS_AS(load_exam(dir.path() / "partial.json"), ExamRecordError);

    REQUIRE_THROWS_AS(save_exam(HandmadeExam{}.exam(), dir.path() / "no_such_dir" / "exam.json"), ExamRecordError);
}

TEST_CASE("Well-formed exams verify") {
    HandmadeExam handmade;
    Exam exam = handmade.exam();

    REQUIRE(verify_exam(exam));

    // Published branch pointing at the problem commit
    git(handmade.project.path(), {"branch", exam_branch_name(exam), handmade.problem});
    REQUIRE(verify_exam(exam));
}

TEST_CASE("Structural violations are reported") {
    HandmadeExam handmade;
    Exam exam = handmade.exam();

    SECTION("identical commits") {
        exam.problem_commit = exam.solution_commit;
        auto res = verify_exam(exam);
        REQUIRE_FALSE(res);
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("are the same"));
    }

    SECTION("reversed ancestry") {
        std::swap(exam.solution_commit, exam.problem_commit);
        auto res = verify_exam(exam);
        REQUIRE_FALSE(res);
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("not an ancestor"));
    }

    SECTION("record out of sync with the repository") {
        exam.rubric = "something else";
        auto res = verify_exam(exam);
        REQUIRE_FALSE(res);
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring(RUBRIC_FILE));
    }

    SECTION("question edited by the problem commit") {
        Repository repo{"project", handmade.project.path()};
        write_file(handmade.project.path() / QUESTION_FILE, "A different question.\n");
        repo.stage_all();
        repo.commit("edit question");
        exam.problem_commit = repo.resolve_ref();

        auto res = verify_exam(exam);
        REQUIRE_FALSE(res);
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("differs between solution and problem"));
    }

    SECTION("rubric missing from the commits") {
        Repository repo{"project", handmade.project.path()};
        git(handmade.project.path(), {"rm", "-q", RUBRIC_FILE});
        repo.commit("drop rubric");
        exam.problem_commit = repo.resolve_ref();

        auto res = verify_exam(exam);
        REQUIRE_FALSE(res);
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring(RUBRIC_FILE));
    }

    SECTION("branch pointing elsewhere") {
        git(handmade.project.path(), {"branch", exam_branch_name(exam), handmade.solution});
        auto res = verify_exam(exam);
        REQUIRE_FALSE(res);
        REQUIRE_THAT(res.error(), Catch::Matchers::ContainsSubstring("points at"));
    }
}
