#include <examforge/exceptions.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <utility>
#include <vector>

namespace examforge {

RepositoryCommandError::RepositoryCommandError(std::string repository_name, std::vector<std::string> command,
                                               std::string output)
    : std::runtime_error{fmt::format("Git command failed in repository '{}': `{}`: {}", repository_name,
                                     fmt::join(command, " "), output)}
    , repository_name_{std::move(repository_name)}
    , command_{std::move(command)}
    , output_{std::move(output)} {}

} // namespace examforge
