#pragma once

#include <examforge/common/class_traits.hpp>
#include <examforge/common/error_types.hpp>
#include <examforge/common/linux.hpp>
#include <examforge/process/process_result.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

namespace examforge {

class Subprocess : NonCopyable
{
public:
    /// Creates a sub (child) process by running ``exec`` with ``args``
    /// ``exec`` is looked up in PATH if it does not contain a slash.
    /// ENV variables are inherited, plus any overrides given by ``set_env``.
    explicit Subprocess(std::string exec, std::vector<std::string> args);
    ~Subprocess();
    Subprocess(Subprocess&&) noexcept;
    Subprocess& operator=(Subprocess&&) noexcept;

    /// Directory the child changes into before exec. Must be called before ``start``
    void set_working_dir(std::filesystem::path dir) { working_dir_ = std::move(dir); }

    /// Extra environment variable for the child. Must be called before ``start``
    void set_env(std::string name, std::string value) { env_.emplace_back(std::move(name), std::move(value)); }

    /// Spawn the child. Fails with ``SpawnFailure`` if the program could not be exec'd
    Result<void> start();

    /// Feed ``input`` to the child's stdin, then close it, while draining stdout and stderr.
    /// Blocks until the child exits or ``timeout`` elapses (in which case the child is killed).
    template <ChronoDuration Duration>
    Result<ProcessResult> communicate(std::string_view input, const Duration& timeout) {
        return communicate_impl(input, std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
    }

    Result<ProcessResult> communicate(std::string_view input = {}) {
        return communicate_impl(input, std::nullopt);
    }

    /// Forcefully terminate the child and reap it
    Result<void> kill();

    /// Whether the process is still running
    bool is_alive() const;

    pid_t get_pid() const { return child_pid_; }

private:
    Result<ProcessResult> communicate_impl(std::string_view input, std::optional<std::chrono::milliseconds> timeout);

    /// Runs in the forked child; never returns
    [[noreturn]] void exec_child(int exec_status_fd);
    Result<void> init_parent();

    /// Reads whatever is currently available on ``fd`` into ``buffer``.
    /// Returns false once the write end has been closed (EOF)
    static Result<bool> drain_fd(int fd, std::string& buffer);

    Result<ProcessResult> reap(std::string stdout_text, std::string stderr_text);

    void close_pipes();

    std::string exec_;
    std::vector<std::string> args_;
    std::optional<std::filesystem::path> working_dir_;
    std::vector<std::pair<std::string, std::string>> env_;

    pid_t child_pid_{};
    bool reaped_ = false;

    /// pipes to communicate with the subprocess' stdin, stdout and stderr respectively
    linux::Pipe stdin_pipe_{-1, -1};
    linux::Pipe stdout_pipe_{-1, -1};
    linux::Pipe stderr_pipe_{-1, -1};
};

} // namespace examforge
