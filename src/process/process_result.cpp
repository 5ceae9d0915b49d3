#include <examforge/process/process_result.hpp>

#include <string>
#include <utility>

namespace examforge {

ProcessResult::ProcessResult(Kind kind, int code, std::string stdout_text, std::string stderr_text)
    : kind_{kind}
    , code_{code}
    , stdout_{std::move(stdout_text)}
    , stderr_{std::move(stderr_text)} {}

ProcessResult ProcessResult::make_exited(int code, std::string stdout_text, std::string stderr_text) {
    return {Kind::Exited, code, std::move(stdout_text), std::move(stderr_text)};
}

ProcessResult ProcessResult::make_killed(int signal_num, std::string stdout_text, std::string stderr_text) {
    return {Kind::Killed, signal_num, std::move(stdout_text), std::move(stderr_text)};
}

} // namespace examforge
