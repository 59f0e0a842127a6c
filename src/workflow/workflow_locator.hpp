#pragma once

#include <filesystem>
#include <optional>
#include <vector>
#include "core/errors/popper_errors.hpp"

namespace popper::workflow {

inline constexpr const char* kWorkflowExtension = ".workflow";

// Finds workflow definition files on disk.
class WorkflowLocator {
public:
    virtual ~WorkflowLocator() = default;

    // The explicit path when given (it must exist), otherwise the default location.
    virtual core::errors::Result<std::filesystem::path> resolve(
        const std::optional<std::filesystem::path>& explicit_path) const = 0;

    // Every workflow file under `root`, in a stable order.
    virtual core::errors::Result<std::vector<std::filesystem::path>> discover(
        const std::filesystem::path& root) const = 0;
};

// Looks for `.github/main.workflow`, then `main.workflow`, under `search_root`.
class FilesystemWorkflowLocator : public WorkflowLocator {
public:
    explicit FilesystemWorkflowLocator(std::filesystem::path search_root);

    core::errors::Result<std::filesystem::path> resolve(
        const std::optional<std::filesystem::path>& explicit_path) const override;

    core::errors::Result<std::vector<std::filesystem::path>> discover(
        const std::filesystem::path& root) const override;

private:
    std::filesystem::path search_root_;
};

}  // namespace popper::workflow
