#pragma once

#include <string>
#include "app/cli_parser.hpp"
#include "app/run_config_resolver.hpp"
#include "core/config/environment.hpp"
#include "runtime/workflow_engine.hpp"
#include "scm/scm_provider.hpp"
#include "workflow/workflow_locator.hpp"

namespace popper::app {

// Everything one `run` invocation talks to.
struct RunContext {
    const core::config::EnvironmentConfig& environment;
    const scm::ScmProvider& scm;
    const workflow::WorkflowLocator& locator;
    runtime::WorkflowEngine& engine;
    PlatformCapabilities capabilities;
    std::string invocation_id;
    bool install_signal_handlers = true;
};

// Resolves, plans and executes one `run` command. Returns the process exit status.
int run_command(const cli::RawRunOptions& raw, const RunContext& context);

}  // namespace popper::app
