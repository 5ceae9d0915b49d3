#pragma once

#include <examforge/common/expected.hpp>
#include <examforge/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace examforge::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// returns success/failure; logs failure at debug level
inline Expected<ssize_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// reads from a file descriptor. See read(2)
/// returns success/failure; logs failure at debug level
/// an empty string signals end-of-file
inline Expected<std::string> read(int fd, size_t count) { // NOLINT
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("read failed: '{}'", err.message());
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see kill(2)
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// args does NOT need to have an extra NULL element; this is added for you.
/// ``exec`` is resolved against PATH. See execvp(3)
/// Only returns on failure; logs failure at debug level
inline Expected<> execvp(const std::string& exec, const std::vector<std::string>& args) {
    // Reason: execvp requires non-const strings
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<char*> cstr_arg_list(args.size() + 2, nullptr);

    auto to_cstr = [](const std::string& str) { return const_cast<char*>(str.c_str()); };

    cstr_arg_list.front() = const_cast<char*>(exec.c_str());
    ranges::transform(args, cstr_arg_list.begin() + 1, to_cstr);
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    ::execvp(exec.c_str(), cstr_arg_list.data());

    auto err = make_error_code(errno);
    LOG_DEBUG("execvp failed: '{}'", err.message());

    return err;
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if type == Parent
};

/// see fork(2)
/// returns result from enum; logs failure at debug level
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see dup(2)
/// returns success/failure; logs failure at debug level
inline Expected<> dup2(int oldfd, int newfd) {
    int res = ::dup2(oldfd, newfd);

    if (res != newfd) {
        auto err = make_error_code(errno);
        LOG_DEBUG("dup2 failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see fcntl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fcntl failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// see chdir(2)
/// returns success/failure; logs failure at debug level
inline Expected<> chdir(const std::string& path) {
    int res = ::chdir(path.c_str());

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("chdir({:?}) failed: '{}'", path, err.message());
        return err;
    }

    return {};
}

/// see setenv(3)
/// returns success/failure; logs failure at debug level
inline Expected<> setenv(const std::string& name, const std::string& value) {
    int res = ::setenv(name.c_str(), value.c_str(), /*overwrite=*/1);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("setenv({:?}) failed: '{}'", name, err.message());
        return err;
    }

    return {};
}

/// see waitpid(2)
/// Retries on EINTR. returns the raw wait status; logs failure at debug level
inline Expected<int> waitpid(pid_t pid, int options = 0) {
    int status = 0;
    pid_t res{};

    do {
        res = ::waitpid(pid, &status, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("waitpid failed: '{}'", err.message());
        return err;
    }

    // WNOHANG and the child has not changed state yet
    if (res == 0) {
        return make_error_code(EAGAIN);
    }

    return status;
}

/// see poll(2)
/// returns the number of ready descriptors; logs failure at debug level
inline Expected<int> poll(std::vector<pollfd>& fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        auto err = make_error_code(errno);

        // EINTR is routine while waiting on children
        if (err != std::errc::interrupted) {
            LOG_DEBUG("poll failed: '{}'", err.message());
        }

        return err;
    }

    return res;
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("pipe failed: '{}'", err.message());
        return err;
    }

    return pipe;
}

} // namespace examforge::linux
