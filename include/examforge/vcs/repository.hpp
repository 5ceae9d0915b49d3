#pragma once

#include <examforge/process/command_runner.hpp>
#include <examforge/process/process_result.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace examforge {

/// Fail-fast handle on one git working directory.
///
/// Every operation shells out to git through the injected CommandRunner; a non-zero exit
/// becomes a RepositoryCommandError carrying the command, its output and this handle's name.
class Repository
{
public:
    /// ``local_dir`` is made absolute. Verifies eagerly that it exists and is inside a git work tree.
    /// Throws RepositoryCommandError otherwise.
    Repository(std::string name, std::filesystem::path local_dir,
               std::shared_ptr<CommandRunner> runner = make_local_runner());

    const std::string& get_name() const { return name_; }
    const std::filesystem::path& get_local_dir() const { return local_dir_; }
    const std::shared_ptr<CommandRunner>& get_runner() const { return runner_; }

    /// Run ``git <args>`` in the repository (or in ``cwd``, for commands such as clone that target
    /// a tree which does not exist yet). Returns stdout with surrounding whitespace stripped.
    std::string run(const std::vector<std::string>& args,
                    const std::optional<std::filesystem::path>& cwd = std::nullopt) const;

    /// Clone this repository into ``destination`` and return a handle on the new checkout
    Repository clone_to(const std::filesystem::path& destination, std::string name) const;

    void set_config(const std::string& key, const std::string& value) const;

    /// ``git add .``, after relaxing permissions on the tree
    void stage_all() const;

    void commit(const std::string& message) const;

    std::string resolve_ref(const std::string& ref = "HEAD") const;

    /// Checks out a branch or commit, after relaxing permissions on the tree
    void checkout(const std::string& branch, bool create = false) const;

    void push(const std::string& remote, const std::string& refspec) const;

    /// Whether ``ancestor`` is reachable from ``descendant``
    bool is_ancestor(const std::string& ancestor, const std::string& descendant) const;

    /// Paths of every file tracked at ``ref``
    std::vector<std::string> list_files(const std::string& ref = "HEAD") const;

    bool branch_exists(const std::string& branch) const;

    /// Exact (byte-for-byte) contents of ``path`` as recorded at ``ref``
    std::string show_file(const std::string& ref, const std::string& path) const;

    /// Recursively make the tree world read/write/executable.
    ///
    /// The work tree may have been populated from inside a container running as another user.
    /// Best effort: failures are logged, never thrown.
    void relax_permissions() const noexcept;

private:
    /// Runs git and returns the raw result; throws on spawn failure or non-zero exit
    ProcessResult run_raw(const std::vector<std::string>& args,
                          const std::optional<std::filesystem::path>& cwd = std::nullopt) const;

    /// Runs git and returns the raw result whatever the exit code; throws only on spawn failure
    ProcessResult run_unchecked(const std::vector<std::string>& args,
                                const std::optional<std::filesystem::path>& cwd = std::nullopt) const;

    std::string name_;
    std::filesystem::path local_dir_;
    std::shared_ptr<CommandRunner> runner_;

    static constexpr std::string_view GIT_PROGRAM = "git";
};

} // namespace examforge

template <>
struct fmt::formatter<::examforge::Repository> : fmt::formatter<std::string_view>
{
    auto format(const ::examforge::Repository& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}@{}", from.get_name(), from.get_local_dir().string());
    }
};
