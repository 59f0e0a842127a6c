#pragma once

#include "core/config/environment.hpp"
#include "core/errors/popper_errors.hpp"
#include "protocol/run_config.hpp"
#include "protocol/run_outcome.hpp"
#include "runtime/workflow_engine.hpp"
#include "workflow/workflow_locator.hpp"

namespace popper::runtime {

// Runs one RunConfig: optional pre-workflow, the main workflow, optional
// post-workflow, then the on-failure action if any stage failed.
//
// Errors are fatal (missing workflow files, engine unreachable); a workflow
// that ran and failed is reported through the returned RunOutcome.
class ExecutionSequencer {
public:
    ExecutionSequencer(WorkflowEngine& engine, const workflow::WorkflowLocator& locator,
                       const core::config::EnvironmentConfig& environment);

    core::errors::Result<protocol::RunOutcome> run(const protocol::RunConfig& config);

private:
    core::errors::Result<protocol::RunOutcome> run_stage(const std::string& stage,
                                                         const EngineRequest& request,
                                                         bool dry_run);

    WorkflowEngine& engine_;
    const workflow::WorkflowLocator& locator_;
    const core::config::EnvironmentConfig& environment_;
};

}  // namespace popper::runtime
