#pragma once

#include <string>
#include <vector>
#include "app/run_config_resolver.hpp"
#include "core/config/environment.hpp"
#include "core/errors/popper_errors.hpp"
#include "protocol/run_config.hpp"
#include "protocol/run_outcome.hpp"
#include "scm/scm_provider.hpp"
#include "workflow/workflow_locator.hpp"

namespace popper::planner {

class InvocationPlanner {
public:
    InvocationPlanner(const core::config::EnvironmentConfig& environment,
                      const scm::ScmProvider& scm,
                      const workflow::WorkflowLocator& locator,
                      app::PlatformCapabilities capabilities);

    // Outside CI the plan is `base` alone. In CI it comes from the head
    // commit's directives, or from every workflow under the workspace when
    // the commit carries none.
    core::errors::Result<protocol::InvocationPlan> build_plan(const protocol::RunConfig& base) const;

    // Each payload is parsed with the `run` grammar and overlaid on `base`.
    core::errors::Result<protocol::InvocationPlan> plan_directives(
        const std::vector<std::string>& directives, const protocol::RunConfig& base) const;

    core::errors::Result<protocol::InvocationPlan> plan_recursive(
        const protocol::RunConfig& base) const;

private:
    const core::config::EnvironmentConfig& environment_;
    const scm::ScmProvider& scm_;
    const workflow::WorkflowLocator& locator_;
    app::PlatformCapabilities capabilities_;
};

}  // namespace popper::planner
