#include "workflow/workflow_locator.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace popper::workflow {

using core::errors::ErrorCategory;
using core::errors::PopperError;

namespace {

bool is_workflow_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}

}  // namespace

FilesystemWorkflowLocator::FilesystemWorkflowLocator(std::filesystem::path search_root)
    : search_root_(std::move(search_root)) {}

core::errors::Result<std::filesystem::path> FilesystemWorkflowLocator::resolve(
    const std::optional<std::filesystem::path>& explicit_path) const {
    if (explicit_path.has_value()) {
        std::filesystem::path candidate = explicit_path.value();
        if (candidate.is_relative()) {
            candidate = search_root_ / candidate;
        }
        if (!is_workflow_file(candidate)) {
            return PopperError{ErrorCategory::Input,
                               "File " + explicit_path->string() + " not found.",
                               "workflow_not_found"};
        }
        return candidate.lexically_normal();
    }

    const std::filesystem::path github_default = search_root_ / ".github" / "main.workflow";
    const std::filesystem::path root_default = search_root_ / "main.workflow";
    if (is_workflow_file(github_default)) {
        return github_default;
    }
    if (is_workflow_file(root_default)) {
        return root_default;
    }
    return PopperError{ErrorCategory::Input,
                       "Files .github/main.workflow or main.workflow not found.",
                       "workflow_not_found",
                       "Pass --wfile or create main.workflow."};
}

core::errors::Result<std::vector<std::filesystem::path>> FilesystemWorkflowLocator::discover(
    const std::filesystem::path& root) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return PopperError{ErrorCategory::Input,
                           "Workspace is not a directory: " + root.string(),
                           "invalid_workspace"};
    }

    std::vector<std::filesystem::path> found;
    const auto options = std::filesystem::directory_options::skip_permission_denied;
    for (auto it = std::filesystem::recursive_directory_iterator(root, options, ec);
         it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return PopperError{ErrorCategory::Internal,
                               "Failed to walk " + root.string() + ": " + ec.message(),
                               "workspace_walk_failed"};
        }
        if (it->path().extension() != kWorkflowExtension) {
            continue;
        }
        if (!is_workflow_file(it->path())) {
            continue;
        }
        found.push_back(it->path());
    }
    if (ec) {
        return PopperError{ErrorCategory::Internal,
                           "Failed to walk " + root.string() + ": " + ec.message(),
                           "workspace_walk_failed"};
    }

    // Directory iteration order is filesystem-dependent.
    std::sort(found.begin(), found.end(),
              [](const std::filesystem::path& a, const std::filesystem::path& b) {
                  return a.generic_string() < b.generic_string();
              });
    return found;
}

}  // namespace popper::workflow
