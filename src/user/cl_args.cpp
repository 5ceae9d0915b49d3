#include "user/cl_args.hpp"

#include "user/program_options.hpp"

#include <examforge/common/expected.hpp>
#include <examforge/logging.hpp>
#include <examforge/version.hpp>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <span>
#include <string>
#include <string_view>

namespace examforge {

namespace {

/// Value of environment variable ``name``, or ``fallback`` if unset or empty
std::string env_or(const char* name, std::string_view fallback) {
    const char* value = std::getenv(name);

    if (value == nullptr || *value == '\0') {
        return std::string{fallback};
    }

    return value;
}

} // namespace

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), EXAMFORGE_VERSION_STRING, argparse::default_arguments::help}
    , create_cmd_{"create", EXAMFORGE_VERSION_STRING, argparse::default_arguments::help}
    , solve_cmd_{"solve", EXAMFORGE_VERSION_STRING, argparse::default_arguments::help}
    , evaluate_cmd_{"evaluate", EXAMFORGE_VERSION_STRING, argparse::default_arguments::help}
    , verify_cmd_{"verify", EXAMFORGE_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

void CommandLineArgs::setup_parser() {
    arg_parser_.add_description(fmt::format("examforge v{}: create, solve and grade agent-authored coding exams",
                                            EXAMFORGE_VERSION_STRING));

    // Environment defaults are resolved here, once; nothing below the CLI reads the environment
    opts_buffer_.image = env_or("EXAMFORGE_IMAGE", opts_buffer_.image);
    opts_buffer_.engine = env_or("EXAMFORGE_ENGINE", opts_buffer_.engine);
    opts_buffer_.agent_command = env_or("EXAMFORGE_AGENT", "");
    opts_buffer_.cache_dir = env_or("EXAMFORGE_SCCACHE_DIR", opts_buffer_.cache_dir.string());
    opts_buffer_.cargo_cache_dir = env_or("EXAMFORGE_CARGO_CACHE_DIR", opts_buffer_.cargo_cache_dir.string());

    // clang-format off

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", EXAMFORGE_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("-v", "--verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.verbosity++;
            })
        .append()
        .help("Increase log verbosity (info -> debug -> trace)");

    arg_parser_.add_argument("--image")
        .metavar("IMAGE")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.image = opt; })
        .help(fmt::format("Container image of the agent server [env: EXAMFORGE_IMAGE, default: {}]", DEFAULT_IMAGE));

    arg_parser_.add_argument("--engine")
        .metavar("PROGRAM")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.engine = opt; })
        .help("Container engine CLI (docker-compatible) [env: EXAMFORGE_ENGINE, default: docker]");

    arg_parser_.add_argument("--agent")
        .metavar("COMMAND")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.agent_command = opt; })
        .help("Agent executable and arguments, run once per agent turn [env: EXAMFORGE_AGENT]");

    arg_parser_.add_argument("--no-cache")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.use_cache = false; })
        .help("Do not mount persistent compiler / package caches into the container");

    arg_parser_.add_argument("--cache-dir")
        .metavar("DIR")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.cache_dir = opt; })
        .help("Host directory for the compiler cache [env: EXAMFORGE_SCCACHE_DIR, default: .sccache]");

    arg_parser_.add_argument("--cargo-cache-dir")
        .metavar("DIR")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.cargo_cache_dir = opt; })
        .help("Host directory for the package registry and sources [env: EXAMFORGE_CARGO_CACHE_DIR, default: .cargo_cache]");

    arg_parser_.add_argument("--health-timeout")
        .metavar("SECONDS")
        .nargs(1)
        .action([this] (const std::string& opt) { opts_buffer_.health_timeout = std::chrono::seconds{std::stoi(opt)}; })
        .help(fmt::format("How long to wait for a container to become healthy (default: {})",
                          ProgramOptions::DEFAULT_HEALTH_TIMEOUT_SECS));

    create_cmd_.add_description("Create an exam from a project and a library repository");

    create_cmd_.add_argument("--project")
        .metavar("DIR")
        .required()
        .action([this] (const std::string& opt) { opts_buffer_.project_path = opt; })
        .help("Project repository the exam is built on; the exam branch is pushed here");

    create_cmd_.add_argument("--library")
        .metavar("DIR")
        .required()
        .action([this] (const std::string& opt) { opts_buffer_.library_path = opt; })
        .help("Library repository the solution must use (read-only)");

    create_cmd_.add_argument("--title")
        .required()
        .store_into(opts_buffer_.title)
        .help("Exam topic title");

    create_cmd_.add_argument("--description")
        .default_value(std::string{})
        .store_into(opts_buffer_.description)
        .help("Free-text description of the topic");

    create_cmd_.add_argument("-o", "--output")
        .metavar("FILE")
        .action([this] (const std::string& opt) { opts_buffer_.output_path = opt; })
        .help(fmt::format("Where to write the exam record (default: {})", ProgramOptions::DEFAULT_OUTPUT_PATH));

    create_cmd_.add_argument("--keep-workspace")
        .flag()
        .store_into(opts_buffer_.keep_workspace)
        .help("Leave the temporary creation workspace on disk");

    solve_cmd_.add_description("Check out an exam's problem state into a fresh workspace and solve it");

    solve_cmd_.add_argument("--exam")
        .metavar("FILE")
        .required()
        .action([this] (const std::string& opt) { opts_buffer_.exam_path = opt; })
        .help("Exam record");

    evaluate_cmd_.add_description("Grade a solved workspace against an exam's rubric");

    evaluate_cmd_.add_argument("--exam")
        .metavar("FILE")
        .required()
        .action([this] (const std::string& opt) { opts_buffer_.exam_path = opt; })
        .help("Exam record");

    evaluate_cmd_.add_argument("--workspace")
        .metavar("DIR")
        .required()
        .action([this] (const std::string& opt) { opts_buffer_.workspace_path = opt; })
        .help("Workspace produced by `solve`");

    verify_cmd_.add_description("Check an exam record against its project repository");

    verify_cmd_.add_argument("--exam")
        .metavar("FILE")
        .required()
        .action([this] (const std::string& opt) { opts_buffer_.exam_path = opt; })
        .help("Exam record");

    // clang-format on

    arg_parser_.add_subparser(create_cmd_);
    arg_parser_.add_subparser(solve_cmd_);
    arg_parser_.add_subparser(evaluate_cmd_);
    arg_parser_.add_subparser(verify_cmd_);
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return err.what();
    }

    using enum ProgramOptions::Subcommand;

    if (arg_parser_.is_subcommand_used(create_cmd_)) {
        opts_buffer_.command = Create;
    } else if (arg_parser_.is_subcommand_used(solve_cmd_)) {
        opts_buffer_.command = Solve;
    } else if (arg_parser_.is_subcommand_used(evaluate_cmd_)) {
        opts_buffer_.command = Evaluate;
    } else if (arg_parser_.is_subcommand_used(verify_cmd_)) {
        opts_buffer_.command = Verify;
    } else {
        return std::string{"No subcommand given"};
    }

    if (auto valid = opts_buffer_.validate(); !valid) {
        return valid.error();
    }

    LOG_DEBUG("Parsed CLI arguments for subcommand {}", opts_buffer_.command);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};

    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fg(fmt::color::red)), cl_args.help_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace examforge
