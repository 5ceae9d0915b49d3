#include "subprocess/subprocess.hpp"

#include <examforge/common/error_types.hpp>
#include <examforge/common/expected.hpp>
#include <examforge/common/linux.hpp>
#include <examforge/logging.hpp>
#include <examforge/process/process_result.hpp>

#include <fmt/ranges.h>
#include <libassert/assert.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace examforge {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 4096;

void ignore_sigpipe_once() {
    // Writing to the stdin of a child that already exited must surface as EPIPE, not kill us
    static const bool ignored = [] {
        std::ignore = std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    std::ignore = ignored;
}

void close_fd(int& fd) {
    if (fd != -1) {
        std::ignore = linux::close(fd);
        fd = -1;
    }
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args)
    : exec_{std::move(exec)}
    , args_{std::move(args)} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then initialization failed, or the object was moved from
    if (child_pid_ == 0) {
        return;
    }

    close_pipes();

    if (!reaped_) {
        std::ignore = kill();
    }
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : NonCopyable{std::move(other)}
    , exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , working_dir_{std::move(other.working_dir_)}
    , env_{std::move(other.env_)}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , reaped_{std::exchange(other.reaped_, false)}
    , stdin_pipe_{std::exchange(other.stdin_pipe_, {-1, -1})}
    , stdout_pipe_{std::exchange(other.stdout_pipe_, {-1, -1})}
    , stderr_pipe_{std::exchange(other.stderr_pipe_, {-1, -1})} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);
    working_dir_ = std::move(rhs.working_dir_);
    env_ = std::move(rhs.env_);
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    reaped_ = std::exchange(rhs.reaped_, false);
    stdin_pipe_ = std::exchange(rhs.stdin_pipe_, {-1, -1});
    stdout_pipe_ = std::exchange(rhs.stdout_pipe_, {-1, -1});
    stderr_pipe_ = std::exchange(rhs.stderr_pipe_, {-1, -1});

    return *this;
}

Result<void> Subprocess::start() {
    ASSERT(child_pid_ == 0, "Subprocess::start called twice");

    ignore_sigpipe_once();

    // Every fd is close-on-exec; dup2 clears the flag for the child's std streams
    stdin_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stdout_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stderr_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    // The child reports a failed exec through this pipe. EOF means exec succeeded.
    linux::Pipe exec_status = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    // Child process
    if (fork_res.which == linux::Fork::Child) {
        std::ignore = linux::close(exec_status.read_fd);
        exec_child(exec_status.write_fd);
    }

    // Parent process
    child_pid_ = fork_res.pid;
    std::ignore = linux::close(exec_status.write_fd);

    int child_errno = 0;
    ssize_t num_read{};
    do {
        num_read = ::read(exec_status.read_fd, &child_errno, sizeof(child_errno));
    } while (num_read == -1 && errno == EINTR);
    std::ignore = linux::close(exec_status.read_fd);

    if (num_read > 0) {
        LOG_DEBUG("Failed to spawn {:?} {}: {}", exec_, args_, get_err_msg(child_errno));
        std::ignore = linux::waitpid(child_pid_);
        reaped_ = true;
        close_pipes();
        return ErrorKind::SpawnFailure;
    }

    LOG_TRACE("Spawned {:?} {} as pid {}", exec_, args_, child_pid_);

    return init_parent();
}

void Subprocess::exec_child(int exec_status_fd) {
    auto fail = [exec_status_fd](const std::error_code& err) {
        int err_num = err.value();
        std::ignore = ::write(exec_status_fd, &err_num, sizeof(err_num));
        ::_exit(127);
    };

    if (auto res = linux::dup2(stdin_pipe_.read_fd, STDIN_FILENO); !res) {
        fail(res.error());
    }
    if (auto res = linux::dup2(stdout_pipe_.write_fd, STDOUT_FILENO); !res) {
        fail(res.error());
    }
    if (auto res = linux::dup2(stderr_pipe_.write_fd, STDERR_FILENO); !res) {
        fail(res.error());
    }

    if (working_dir_) {
        if (auto res = linux::chdir(working_dir_->string()); !res) {
            fail(res.error());
        }
    }

    for (const auto& [name, value] : env_) {
        if (auto res = linux::setenv(name, value); !res) {
            fail(res.error());
        }
    }

    // Ignored dispositions survive exec; the child should get default SIGPIPE behavior
    std::ignore = std::signal(SIGPIPE, SIG_DFL);

    auto exec_res = linux::execvp(exec_, args_);
    fail(exec_res.error());

    // fail() does not return
    std::abort();
}

Result<void> Subprocess::init_parent() {
    // Close the pipe ends being used in the child proc
    //  - read end for stdin
    //  - write end for stdout and stderr
    close_fd(stdin_pipe_.read_fd);
    close_fd(stdout_pipe_.write_fd);
    close_fd(stderr_pipe_.write_fd);

    // All parent ends are non-blocking; communicate() multiplexes them with poll
    for (int fd : {stdin_pipe_.write_fd, stdout_pipe_.read_fd, stderr_pipe_.read_fd}) {
        int pre_flags = TRYE(linux::fcntl(fd, F_GETFL), SyscallFailure);
        TRYE(linux::fcntl(fd, F_SETFL, pre_flags | O_NONBLOCK), // NOLINT
             SyscallFailure);
    }

    return {};
}

Result<bool> Subprocess::drain_fd(int fd, std::string& buffer) {
    while (true) {
        auto chunk = linux::read(fd, READ_CHUNK_SIZE);

        if (!chunk) {
            if (chunk.error() == std::errc::resource_unavailable_try_again) {
                return true;
            }
            if (chunk.error() == std::errc::interrupted) {
                continue;
            }
            return ErrorKind::SyscallFailure;
        }

        if (chunk->empty()) {
            return false;
        }

        buffer += *chunk;
    }
}

Result<ProcessResult> Subprocess::communicate_impl(std::string_view input,
                                                   std::optional<std::chrono::milliseconds> timeout) {
    using std::chrono::steady_clock;

    ASSERT(child_pid_ != 0 && !reaped_, "communicate() requires a running child");

    std::string stdout_text;
    std::string stderr_text;
    std::size_t input_pos = 0;

    const std::optional<steady_clock::time_point> deadline =
        timeout ? std::optional{steady_clock::now() + *timeout} : std::nullopt;

    if (input.empty()) {
        close_fd(stdin_pipe_.write_fd);
    }

    while (stdout_pipe_.read_fd != -1 || stderr_pipe_.read_fd != -1 || stdin_pipe_.write_fd != -1) {
        int poll_timeout_ms = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - steady_clock::now());
            if (remaining.count() <= 0) {
                LOG_WARN("{:?} (pid {}) timed out after {}; killing it", exec_, child_pid_, *timeout);
                std::ignore = kill();
                return ErrorKind::TimedOut;
            }
            poll_timeout_ms = static_cast<int>(remaining.count());
        }

        std::vector<pollfd> fds;
        for (int fd : {stdout_pipe_.read_fd, stderr_pipe_.read_fd}) {
            if (fd != -1) {
                fds.push_back({.fd = fd, .events = POLLIN, .revents = 0});
            }
        }
        if (stdin_pipe_.write_fd != -1) {
            fds.push_back({.fd = stdin_pipe_.write_fd, .events = POLLOUT, .revents = 0});
        }

        auto poll_res = linux::poll(fds, poll_timeout_ms);
        if (!poll_res) {
            if (poll_res.error() == std::errc::interrupted) {
                continue;
            }
            LOG_WARN("Error polling pipes of pid {}: '{}'", child_pid_, poll_res.error().message());
            return ErrorKind::SyscallFailure;
        }

        for (const pollfd& entry : fds) {
            if (entry.revents == 0) {
                continue;
            }

            if (entry.fd == stdin_pipe_.write_fd) {
                if ((entry.revents & (POLLERR | POLLHUP)) != 0) { // NOLINT(*-signed-bitwise)
                    close_fd(stdin_pipe_.write_fd);
                    continue;
                }

                auto written = linux::write(stdin_pipe_.write_fd, input.substr(input_pos));
                if (!written) {
                    if (written.error() != std::errc::resource_unavailable_try_again) {
                        LOG_DEBUG("Child pid {} stopped reading stdin: '{}'", child_pid_, written.error().message());
                        close_fd(stdin_pipe_.write_fd);
                    }
                    continue;
                }

                input_pos += static_cast<std::size_t>(written.value());
                if (input_pos >= input.size()) {
                    close_fd(stdin_pipe_.write_fd);
                }
                continue;
            }

            int& fd = entry.fd == stdout_pipe_.read_fd ? stdout_pipe_.read_fd : stderr_pipe_.read_fd;
            std::string& buffer = entry.fd == stdout_pipe_.read_fd ? stdout_text : stderr_text;

            bool still_open = TRY(drain_fd(fd, buffer));
            if (!still_open) {
                close_fd(fd);
            }
        }
    }

    return reap(std::move(stdout_text), std::move(stderr_text));
}

Result<ProcessResult> Subprocess::reap(std::string stdout_text, std::string stderr_text) {
    int status = TRYE(linux::waitpid(child_pid_), SyscallFailure);
    reaped_ = true;

    if (WIFSIGNALED(status)) {
        return ProcessResult::make_killed(WTERMSIG(status), std::move(stdout_text), std::move(stderr_text));
    }

    return ProcessResult::make_exited(WEXITSTATUS(status), std::move(stdout_text), std::move(stderr_text));
}

Result<void> Subprocess::kill() {
    close_pipes();

    if (child_pid_ == 0 || reaped_) {
        return {};
    }

    TRYE(linux::kill(child_pid_, SIGKILL), SyscallFailure);
    TRYE(linux::waitpid(child_pid_), SyscallFailure);
    reaped_ = true;

    return {};
}

bool Subprocess::is_alive() const {
    return child_pid_ != 0 && !reaped_ && linux::kill(child_pid_, 0).has_value();
}

void Subprocess::close_pipes() {
    for (int* fd : {&stdin_pipe_.read_fd, &stdin_pipe_.write_fd, &stdout_pipe_.read_fd, &stdout_pipe_.write_fd,
                    &stderr_pipe_.read_fd, &stderr_pipe_.write_fd}) {
        close_fd(*fd);
    }
}

} // namespace examforge
