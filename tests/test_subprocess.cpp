#include "catch2_custom.hpp"

#include "subprocess/subprocess.hpp"

#include <examforge/common/error_types.hpp>
#include <examforge/common/temp_directory.hpp>
#include <examforge/process/command_runner.hpp>
#include <examforge/process/process_result.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>

#include <csignal>

using examforge::Command;
using examforge::ErrorKind;
using examforge::ProcessResult;
using examforge::Subprocess;

TEST_CASE("Read /bin/echo stdout") {
    Subprocess proc("/bin/echo", {"-n", "Hello", "world!"});
    REQUIRE(proc.start());

    auto res = proc.communicate();

    REQUIRE(res);
    REQUIRE(res->succeeded());
    REQUIRE(res->get_stdout() == "Hello world!");
    REQUIRE(res->get_stderr().empty());
}

TEST_CASE("Feed stdin to /bin/cat") {
    Subprocess proc("/bin/cat", {});
    REQUIRE(proc.start());

    auto res = proc.communicate("Goodbye dog...\nDu Du DUHHH");

    REQUIRE(res);
    REQUIRE(res->get_stdout() == "Goodbye dog...\nDu Du DUHHH");
}

TEST_CASE("Exit code and stderr are reported") {
    Subprocess proc("/bin/sh", {"-c", "echo out; echo err >&2; exit 3"});
    REQUIRE(proc.start());

    auto res = proc.communicate();

    REQUIRE(res);
    REQUIRE(res->get_kind() == ProcessResult::Kind::Exited);
    REQUIRE(res->get_code() == 3);
    REQUIRE_FALSE(res->succeeded());
    REQUIRE(res->get_stdout() == "out\n");
    REQUIRE(res->get_stderr() == "err\n");
    REQUIRE(res->get_diagnostic_output() == "err\n");
}

TEST_CASE("Large output does not deadlock the pipes") {
    // Well over a pipe buffer's worth on both streams
    Subprocess proc("/bin/sh", {"-c", "head -c 300000 /dev/zero; head -c 300000 /dev/zero >&2"});
    REQUIRE(proc.start());

    auto res = proc.communicate();

    REQUIRE(res);
    REQUIRE(res->get_stdout().size() == 300000);
    REQUIRE(res->get_stderr().size() == 300000);
}

TEST_CASE("Killed processes report the signal") {
    Subprocess proc("/bin/sh", {"-c", "kill -TERM $$"});
    REQUIRE(proc.start());

    auto res = proc.communicate();

    REQUIRE(res);
    REQUIRE(res->get_kind() == ProcessResult::Kind::Killed);
    REQUIRE(res->get_code() == SIGTERM);
}

TEST_CASE("Programs are looked up in PATH") {
    Subprocess proc("echo", {"-n", "found"});
    REQUIRE(proc.start());

    REQUIRE(proc.communicate()->get_stdout() == "found");
}

TEST_CASE("Nonexistent programs fail to spawn") {
    Subprocess proc("/nonexistent/definitely_not_a_program", {});

    REQUIRE(proc.start() == ErrorKind::SpawnFailure);
}

TEST_CASE("Slow processes are killed on timeout") {
    using namespace std::chrono_literals;

    Subprocess proc("/bin/sleep", {"10"});
    REQUIRE(proc.start());

    auto start = std::chrono::steady_clock::now();
    auto res = proc.communicate("", 200ms);

    REQUIRE(res == ErrorKind::TimedOut);
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    REQUIRE_FALSE(proc.is_alive());
}

TEST_CASE("LocalCommandRunner applies working directory and environment") {
    examforge::TempDirectory dir{"examforge_test_"};

    Command cmd{.program = "/bin/sh",
                .args = {"-c", "pwd; printf '%s' \"$EXAMFORGE_TEST_VAR\""},
                .working_dir = dir.path(),
                .env = {{"EXAMFORGE_TEST_VAR", "forty two"}}};

    auto res = examforge::LocalCommandRunner{}.run(cmd);

    REQUIRE(res);
    REQUIRE(res->succeeded());

    auto canonical_dir = std::filesystem::canonical(dir.path()).string();
    REQUIRE(res->get_stdout() == canonical_dir + "\nforty two");
}

TEST_CASE("Command renders like a shell line") {
    REQUIRE(Command{.program = "git", .args = {"commit", "-m", "msg"}}.to_string() == "git commit -m msg");
    REQUIRE(Command{.program = "docker"}.to_string() == "docker");
}
