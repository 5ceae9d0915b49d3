#pragma once

#include <string>

namespace examforge {

/// Outcome of a child process that ran to completion, along with everything it wrote
class ProcessResult
{
public:
    enum class Kind { Exited, Killed };

    static ProcessResult make_exited(int code, std::string stdout_text = {}, std::string stderr_text = {});
    static ProcessResult make_killed(int signal_num, std::string stdout_text = {}, std::string stderr_text = {});

    Kind get_kind() const { return kind_; }

    /// Exit code if the process exited, otherwise the number of the signal that killed it
    int get_code() const { return code_; }

    bool succeeded() const { return kind_ == Kind::Exited && code_ == 0; }

    const std::string& get_stdout() const { return stdout_; }
    const std::string& get_stderr() const { return stderr_; }

    /// stderr if anything was written there, otherwise stdout.
    /// Tools like git print failure diagnostics to either.
    const std::string& get_diagnostic_output() const { return stderr_.empty() ? stdout_ : stderr_; }

private:
    ProcessResult(Kind kind, int code, std::string stdout_text, std::string stderr_text);

    Kind kind_;
    int code_;
    std::string stdout_;
    std::string stderr_;
};

} // namespace examforge
