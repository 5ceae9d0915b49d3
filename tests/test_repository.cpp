#include "catch2_custom.hpp"

#include "fakes.hpp"

#include <examforge/common/temp_directory.hpp>
#include <examforge/exceptions.hpp>
#include <examforge/vcs/repository.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <vector>

using namespace examforge;
using examforge::test::GitFixture;
using examforge::test::read_file;
using examforge::test::write_file;
namespace fs = std::filesystem;

TEST_CASE("Handles are only created on existing work trees") {
    TempDirectory not_a_repo{"examforge_test_plain_"};

    REQUIRE_THROWS_AS(Repository("ghost", not_a_repo.path() / "does_not_exist"), RepositoryCommandError);
    REQUIRE_THROWS_AS(Repository("plain", not_a_repo.path()), RepositoryCommandError);

    GitFixture fixture;
    Repository repo{"project", fixture.path()};

    REQUIRE(repo.get_name() == "project");
    REQUIRE(repo.get_local_dir().is_absolute());
    REQUIRE(fmt::format("{}", repo) == "project@" + fixture.path().string());
}

TEST_CASE("Failed git commands carry the command and output") {
    GitFixture fixture;
    Repository repo{"project", fixture.path()};

    try {
        repo.run({"rev-parse", "no-such-ref"});
        FAIL("expected RepositoryCommandError");
    } catch (const RepositoryCommandError& err) {
        REQUIRE(err.get_repository_name() == "project");
        REQUIRE(err.get_command() == std::vector<std::string>{"git", "rev-parse", "no-such-ref"});
        REQUIRE_FALSE(err.get_output().empty());
        REQUIRE_THAT(err.what(), Catch::Matchers::ContainsSubstring("rev-parse"));
    }
}

TEST_CASE("Commit, resolve and inspect history") {
    GitFixture fixture{{{"a.txt", "alpha\n"}, {"dir/b.txt", "beta\n"}}};
    Repository repo{"project", fixture.path()};

    const std::string first = repo.resolve_ref();
    REQUIRE(first == fixture.head());
    REQUIRE(first.size() == 40);

    write_file(fixture.path() / "c.txt", "gamma");
    repo.stage_all();
    repo.commit("Add c");
    const std::string second = repo.resolve_ref("HEAD");

    REQUIRE(second != first);
    REQUIRE(repo.resolve_ref("HEAD~1") == first);

    REQUIRE(repo.is_ancestor(first, second));
    REQUIRE_FALSE(repo.is_ancestor(second, first));
    REQUIRE_THROWS_AS(repo.is_ancestor("0000000000000000000000000000000000000000", second), RepositoryCommandError);

    REQUIRE(repo.list_files(first) == std::vector<std::string>{"a.txt", "dir/b.txt"});
    REQUIRE(repo.list_files() == std::vector<std::string>{"a.txt", "c.txt", "dir/b.txt"});

    // Byte-exact, no trailing newline added or stripped
    REQUIRE(repo.show_file(second, "c.txt") == "gamma");
    REQUIRE(repo.show_file(first, "a.txt") == "alpha\n");
    REQUIRE_THROWS_AS(repo.show_file(first, "c.txt"), RepositoryCommandError);
}

TEST_CASE("Committing with nothing staged fails loudly") {
    GitFixture fixture;
    Repository repo{"project", fixture.path()};

    REQUIRE_THROWS_AS(repo.commit("empty"), RepositoryCommandError);
}

TEST_CASE("Branches, checkout and push") {
    GitFixture origin_fixture;
    Repository origin{"origin", origin_fixture.path()};

    TempDirectory clone_dir{"examforge_test_clone_"};
    Repository clone = origin.clone_to(clone_dir.path() / "clone", "clone");

    REQUIRE(clone.get_name() == "clone");
    REQUIRE(fs::exists(clone.get_local_dir() / "README.md"));

    clone.set_config("user.name", "tester");
    clone.set_config("user.email", "tester@examforge.invalid");
    clone.set_config("commit.gpgsign", "false");
    REQUIRE(clone.run({"config", "user.name"}) == "tester");

    REQUIRE_FALSE(clone.branch_exists("feature"));
    clone.checkout("feature", true);
    REQUIRE(clone.branch_exists("feature"));

    write_file(clone.get_local_dir() / "feature.txt", "feature\n");
    clone.stage_all();
    clone.commit("Feature");
    const std::string tip = clone.resolve_ref();

    clone.push("origin", "HEAD:refs/heads/published");

    REQUIRE(origin.branch_exists("published"));
    REQUIRE(origin.resolve_ref("refs/heads/published") == tip);

    // Detached checkout of an older commit
    clone.checkout(origin_fixture.head());
    REQUIRE(clone.resolve_ref() == origin_fixture.head());
    REQUIRE_FALSE(fs::exists(clone.get_local_dir() / "feature.txt"));
}

TEST_CASE("Permissions are relaxed before staging") {
    GitFixture fixture;
    Repository repo{"project", fixture.path()};

    const fs::path locked_dir = fixture.path() / "locked";
    write_file(locked_dir / "file.txt", "data\n");
    fs::permissions(locked_dir / "file.txt", fs::perms::owner_read);
    fs::permissions(locked_dir, fs::perms::owner_read | fs::perms::owner_exec);

    repo.stage_all();
    repo.commit("Add locked");

    REQUIRE((fs::status(locked_dir).permissions() & fs::perms::others_write) != fs::perms::none);
    REQUIRE((fs::status(locked_dir / "file.txt").permissions() & fs::perms::owner_write) != fs::perms::none);
    REQUIRE(read_file(locked_dir / "file.txt") == "data\n");
}

TEST_CASE("Git never prompts for credentials") {
    auto runner = std::make_shared<examforge::test::FakeCommandRunner>([](const Command&) -> Result<ProcessResult> {
        return ProcessResult::make_exited(0, "true\n");
    });

    TempDirectory dir{"examforge_test_fake_repo_"};
    Repository repo{"fake", dir.path(), runner};

    REQUIRE(repo.run({"status"}) == "true");

    for (const Command& cmd : runner->commands) {
        REQUIRE(cmd.program == "git");
        REQUIRE(cmd.working_dir == repo.get_local_dir());
        REQUIRE(cmd.env.at("GIT_TERMINAL_PROMPT") == "0");
    }
}
