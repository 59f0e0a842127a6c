#include "scm/git_repository.hpp"

#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"

namespace popper::scm {

using core::errors::ErrorCategory;
using core::errors::PopperError;

namespace {

std::string trim_trailing_newlines(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

}  // namespace

GitRepository::GitRepository(std::filesystem::path search_directory, std::string git_program)
    : search_directory_(std::move(search_directory)), git_program_(std::move(git_program)) {}

core::errors::Result<tools::ProcessCapture> GitRepository::git(
    const std::vector<std::string>& args) const {
    tools::ProcessRequest request;
    request.argv.push_back(git_program_);
    request.argv.insert(request.argv.end(), args.begin(), args.end());
    request.working_directory = search_directory_;
    request.capture_output = true;
    return runner_.run(request);
}

core::errors::Result<std::string> GitRepository::commit_message(const std::string& sha) const {
    auto result = git({"log", "-1", "--format=%B", sha});
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& capture = core::errors::get_value(result);
    if (capture.exit_code != 0) {
        return PopperError{ErrorCategory::Scm,
                           "Unable to read message of commit " + sha + ": " +
                               trim_trailing_newlines(capture.stderr_text),
                           "commit_read_failed"};
    }
    return trim_trailing_newlines(capture.stdout_text);
}

core::errors::Result<std::optional<CommitInfo>> GitRepository::head_commit() const {
    auto head = git({"rev-parse", "--verify", "--quiet", "HEAD"});
    if (core::errors::is_error(head)) {
        return core::errors::get_error(head);
    }
    const auto& head_capture = core::errors::get_value(head);
    if (head_capture.exit_code == tools::kExitCommandNotFound) {
        return PopperError{ErrorCategory::Scm, "Unable to run " + git_program_ + ".",
                           "git_not_found", "Install git or run outside CI mode."};
    }
    if (head_capture.exit_code != 0) {
        LOG_DEBUG("GitRepository: no head commit in " + search_directory_.string());
        return std::optional<CommitInfo>{};
    }

    // `rev-list --parents` prints "<sha> <parent1> <parent2> ..."
    auto listing = git({"rev-list", "--parents", "-n", "1", "HEAD"});
    if (core::errors::is_error(listing)) {
        return core::errors::get_error(listing);
    }
    const auto& listing_capture = core::errors::get_value(listing);
    if (listing_capture.exit_code != 0) {
        return PopperError{ErrorCategory::Scm,
                           "Unable to list parents of HEAD: " +
                               trim_trailing_newlines(listing_capture.stderr_text),
                           "commit_read_failed"};
    }

    std::istringstream in(listing_capture.stdout_text);
    CommitInfo commit;
    in >> commit.sha;
    std::string parent_sha;
    while (in >> parent_sha) {
        auto parent_message = commit_message(parent_sha);
        if (core::errors::is_error(parent_message)) {
            return core::errors::get_error(parent_message);
        }
        commit.parents.push_back(ParentCommit{parent_sha, core::errors::get_value(parent_message)});
    }

    auto message = commit_message(commit.sha);
    if (core::errors::is_error(message)) {
        return core::errors::get_error(message);
    }
    commit.message = core::errors::get_value(message);
    return std::optional<CommitInfo>{std::move(commit)};
}

std::filesystem::path GitRepository::root_folder() const {
    auto result = git({"rev-parse", "--show-toplevel"});
    if (!core::errors::is_error(result)) {
        const auto& capture = core::errors::get_value(result);
        if (capture.exit_code == 0) {
            const std::string root = trim_trailing_newlines(capture.stdout_text);
            if (!root.empty()) {
                return std::filesystem::path(root);
            }
        }
    } else {
        LOG_DEBUG("GitRepository: " + core::errors::get_error(result).message);
    }
    return search_directory_;
}

}  // namespace popper::scm
