#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/popper_errors.hpp"

namespace popper::scm {

struct ParentCommit {
    std::string sha;
    std::string message;
};

struct CommitInfo {
    std::string sha;
    std::string message;
    std::vector<ParentCommit> parents;
};

// Read-only view of the repository the command runs in.
class ScmProvider {
public:
    virtual ~ScmProvider() = default;

    // std::nullopt when the repository has no commits (or there is no repository).
    virtual core::errors::Result<std::optional<CommitInfo>> head_commit() const = 0;

    // Top-level folder of the working tree; the current directory outside a repository.
    virtual std::filesystem::path root_folder() const = 0;
};

}  // namespace popper::scm
