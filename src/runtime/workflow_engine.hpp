#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "core/config/environment.hpp"
#include "core/errors/popper_errors.hpp"
#include "protocol/run_config.hpp"
#include "protocol/run_outcome.hpp"
#include "tools/process_runner.hpp"

namespace popper::runtime {

// One workflow execution as handed to the engine.
struct EngineRequest {
    std::filesystem::path workflow;
    std::optional<std::string> action;
    bool with_dependencies = false;
    std::set<std::string> skip;
    protocol::Runtime runtime = protocol::Runtime::Docker;
    bool parallel = false;
    bool reuse = false;
    bool skip_clone = false;
    bool skip_pull = false;
    std::filesystem::path workspace;
    protocol::Verbosity verbosity = protocol::Verbosity::ActionInfo;
};

// Loads and runs workflows. Errors are reserved for failures to reach the
// engine at all; a workflow that ran and failed is a failed RunOutcome.
class WorkflowEngine {
public:
    virtual ~WorkflowEngine() = default;
    virtual core::errors::Result<protocol::RunOutcome> execute(const EngineRequest& request) = 0;
};

// Command-line arguments describing `request`, without the program name.
std::vector<std::string> engine_arguments(const EngineRequest& request);

// Human-readable one-liner for logs and dry runs.
std::string describe(const EngineRequest& request);

// Runs an external engine program with inherited stdio.
class ProcessWorkflowEngine : public WorkflowEngine {
public:
    explicit ProcessWorkflowEngine(std::string engine_command = core::config::kDefaultEngineCommand);

    core::errors::Result<protocol::RunOutcome> execute(const EngineRequest& request) override;

private:
    std::string engine_command_;
    tools::ProcessRunner runner_;
};

}  // namespace popper::runtime
