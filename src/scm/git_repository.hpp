#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "scm/scm_provider.hpp"
#include "tools/process_runner.hpp"

namespace popper::scm {

// ScmProvider backed by the `git` command line.
class GitRepository : public ScmProvider {
public:
    explicit GitRepository(std::filesystem::path search_directory,
                           std::string git_program = "git");

    core::errors::Result<std::optional<CommitInfo>> head_commit() const override;
    std::filesystem::path root_folder() const override;

private:
    core::errors::Result<tools::ProcessCapture> git(const std::vector<std::string>& args) const;
    core::errors::Result<std::string> commit_message(const std::string& sha) const;

    std::filesystem::path search_directory_;
    std::string git_program_;
    tools::ProcessRunner runner_;
};

}  // namespace popper::scm
