#include <examforge/vcs/repository.hpp>

#include <examforge/exceptions.hpp>
#include <examforge/logging.hpp>
#include <examforge/process/command_runner.hpp>
#include <examforge/process/process_result.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <libassert/assert.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#include <cctype>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace examforge {

namespace {

std::string strip(std::string_view str) {
    const auto* first = str.begin();
    const auto* last = str.end();

    while (first != last && std::isspace(static_cast<unsigned char>(*first)) != 0) {
        ++first;
    }
    while (last != first && std::isspace(static_cast<unsigned char>(*(last - 1))) != 0) {
        --last;
    }

    return {first, last};
}

std::vector<std::string> full_command(const std::vector<std::string>& args) {
    std::vector<std::string> cmd{"git"};
    cmd.insert(cmd.end(), args.begin(), args.end());
    return cmd;
}

} // namespace

Repository::Repository(std::string name, std::filesystem::path local_dir, std::shared_ptr<CommandRunner> runner)
    : name_{std::move(name)}
    , local_dir_{std::filesystem::absolute(local_dir)}
    , runner_{std::move(runner)} {
    ASSERT(runner_ != nullptr);

    if (!std::filesystem::is_directory(local_dir_)) {
        throw RepositoryCommandError(name_, {"git", "rev-parse", "--is-inside-work-tree"},
                                     fmt::format("Repository directory does not exist: {}", local_dir_.string()));
    }

    // Fail fast: a handle on something that is not a checkout is useless
    run({"rev-parse", "--is-inside-work-tree"});
}

ProcessResult Repository::run_unchecked(const std::vector<std::string>& args,
                                        const std::optional<std::filesystem::path>& cwd) const {
    const std::filesystem::path& working_dir = cwd.value_or(local_dir_);

    Command command{.program = std::string{GIT_PROGRAM},
                    .args = args,
                    .working_dir = working_dir,
                    .env = {{"GIT_TERMINAL_PROMPT", "0"}},
                    .stdin_data = {},
                    .timeout = std::nullopt};

    LOG_DEBUG("Running git command: {} in {}", command, working_dir.string());

    auto res = runner_->run(command);

    if (!res) {
        auto msg = fmt::format("could not run git: {}", res.error());
        LOG_ERROR("Git command failed in repository '{}': {}", name_, msg);
        throw RepositoryCommandError(name_, full_command(args), msg);
    }

    return std::move(res.value());
}

ProcessResult Repository::run_raw(const std::vector<std::string>& args,
                                  const std::optional<std::filesystem::path>& cwd) const {
    ProcessResult result = run_unchecked(args, cwd);

    if (!result.succeeded()) {
        LOG_ERROR("Git command failed in repository '{}': {}", name_, result.get_diagnostic_output());
        throw RepositoryCommandError(name_, full_command(args), result.get_diagnostic_output());
    }

    return result;
}

std::string Repository::run(const std::vector<std::string>& args,
                            const std::optional<std::filesystem::path>& cwd) const {
    return strip(run_raw(args, cwd).get_stdout());
}

Repository Repository::clone_to(const std::filesystem::path& destination, std::string name) const {
    auto abs_destination = std::filesystem::absolute(destination);

    LOG_INFO("Cloning {} to {}", name_, abs_destination.string());
    run({"clone", local_dir_.string(), abs_destination.string()});

    return Repository{std::move(name), abs_destination, runner_};
}

void Repository::set_config(const std::string& key, const std::string& value) const {
    run({"config", key, value});
}

void Repository::stage_all() const {
    relax_permissions();
    run({"add", "."});
}

void Repository::commit(const std::string& message) const {
    run({"commit", "-m", message});
}

std::string Repository::resolve_ref(const std::string& ref) const {
    return run({"rev-parse", ref});
}

void Repository::checkout(const std::string& branch, bool create) const {
    relax_permissions();

    if (create) {
        run({"checkout", "-b", branch});
    } else {
        run({"checkout", branch});
    }
}

void Repository::push(const std::string& remote, const std::string& refspec) const {
    run({"push", remote, refspec});
}

bool Repository::is_ancestor(const std::string& ancestor, const std::string& descendant) const {
    const std::vector<std::string> args{"merge-base", "--is-ancestor", ancestor, descendant};
    ProcessResult result = run_unchecked(args);

    // 0 = ancestor, 1 = not an ancestor, anything else is a real failure (e.g. unknown commit)
    if (result.get_kind() == ProcessResult::Kind::Exited && result.get_code() <= 1) {
        return result.get_code() == 0;
    }

    throw RepositoryCommandError(name_, full_command(args), result.get_diagnostic_output());
}

std::vector<std::string> Repository::list_files(const std::string& ref) const {
    std::string output = run({"ls-tree", "-r", ref, "--name-only"});

    return output | ranges::views::split('\n') | ranges::views::transform([](auto&& line) {
               return line | ranges::to<std::string>();
           }) |
           ranges::views::filter([](const std::string& line) { return !line.empty(); }) |
           ranges::to<std::vector>();
}

bool Repository::branch_exists(const std::string& branch) const {
    return !run({"branch", "--list", branch}).empty();
}

std::string Repository::show_file(const std::string& ref, const std::string& path) const {
    return run_raw({"show", fmt::format("{}:{}", ref, path)}).get_stdout();
}

void Repository::relax_permissions() const noexcept {
    namespace fs = std::filesystem;

    LOG_DEBUG("Relaxing permissions (chmod -R 777) on {}", local_dir_.string());

    constexpr auto ALL_PERMS = fs::perms::all;
    std::size_t num_failures = 0;
    std::error_code err;

    fs::permissions(local_dir_, ALL_PERMS, err);
    if (err) {
        ++num_failures;
    }

    fs::recursive_directory_iterator iter{local_dir_, fs::directory_options::skip_permission_denied, err};
    if (err) {
        LOG_WARN("Failed to relax permissions on {}: {}", local_dir_.string(), err.message());
        return;
    }

    for (const fs::recursive_directory_iterator end; iter != end; iter.increment(err)) {
        if (err) {
            ++num_failures;
            break;
        }

        // chmod on a symlink would change its target, which may live outside the tree
        if (iter->is_symlink(err)) {
            continue;
        }

        fs::permissions(iter->path(), ALL_PERMS, err);
        if (err) {
            LOG_DEBUG("Could not chmod {}: {}", iter->path().string(), err.message());
            ++num_failures;
        }
    }

    if (num_failures > 0) {
        LOG_WARN("Failed to relax permissions on {} path(s) under {}", num_failures, local_dir_.string());
    }
}

} // namespace examforge
