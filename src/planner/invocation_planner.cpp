#include "planner/invocation_planner.hpp"

#include <utility>
#include "app/cli_parser.hpp"
#include "core/logging/logger.hpp"
#include "scm/directive_scanner.hpp"

namespace popper::planner {

using core::errors::ErrorCategory;
using core::errors::PopperError;
using protocol::InvocationPlan;
using protocol::PlanMode;
using protocol::RunConfig;

InvocationPlanner::InvocationPlanner(const core::config::EnvironmentConfig& environment,
                                     const scm::ScmProvider& scm,
                                     const workflow::WorkflowLocator& locator,
                                     app::PlatformCapabilities capabilities)
    : environment_(environment), scm_(scm), locator_(locator), capabilities_(capabilities) {}

core::errors::Result<InvocationPlan> InvocationPlanner::build_plan(const RunConfig& base) const {
    if (!environment_.ci) {
        InvocationPlan plan;
        plan.mode = PlanMode::Single;
        plan.runs.push_back(base);
        return plan;
    }

    LOG_INFO("Running in CI environment...");
    const scm::DirectiveScanner scanner(scm_);
    auto scanned = scanner.scan();
    if (core::errors::is_error(scanned)) {
        return core::errors::get_error(scanned);
    }
    const auto& scan = core::errors::get_value(scanned);
    if (!scan.marker_found) {
        // No directive at all: run every workflow in the workspace.
        return plan_recursive(base);
    }
    if (scan.directives.empty()) {
        return PopperError{ErrorCategory::Input,
                           "Commit message contains popper:run[ without a directive payload.",
                           "malformed_directive",
                           "Use popper:run[ACTION --option value] in the commit message."};
    }
    return plan_directives(scan.directives, base);
}

core::errors::Result<InvocationPlan> InvocationPlanner::plan_directives(
    const std::vector<std::string>& directives, const RunConfig& base) const {
    InvocationPlan plan;
    plan.mode = PlanMode::Directives;
    for (const auto& directive : directives) {
        auto parsed = app::cli::parse_run_arguments(app::cli::split_arguments(directive));
        if (core::errors::is_error(parsed)) {
            const auto& err = core::errors::get_error(parsed);
            return PopperError{err.category,
                               "Invalid directive popper:run[" + directive + "]: " + err.message,
                               err.code, err.hint};
        }
        const auto& raw = core::errors::get_value(parsed);
        if (raw.help) {
            return PopperError{ErrorCategory::Input,
                               "Invalid directive popper:run[" + directive + "]: --help is not a run.",
                               "malformed_directive"};
        }

        auto validated = app::validate_run_config(app::resolve_run_config(raw, base), capabilities_);
        if (core::errors::is_error(validated)) {
            const auto& err = core::errors::get_error(validated);
            return PopperError{err.category,
                               "Invalid directive popper:run[" + directive + "]: " + err.message,
                               err.code, err.hint};
        }
        LOG_DEBUG("Planner: directive [" + directive + "] accepted");
        plan.runs.push_back(core::errors::get_value(validated));
    }
    return plan;
}

core::errors::Result<InvocationPlan> InvocationPlanner::plan_recursive(const RunConfig& base) const {
    auto discovered = locator_.discover(base.workspace);
    if (core::errors::is_error(discovered)) {
        return core::errors::get_error(discovered);
    }

    InvocationPlan plan;
    plan.mode = PlanMode::Recursive;
    for (const auto& wfile : core::errors::get_value(discovered)) {
        RunConfig config = base;
        config.wfile = wfile;
        plan.runs.push_back(std::move(config));
    }
    if (plan.runs.empty()) {
        LOG_WARN("No workflow files found under " + base.workspace.string() + ".");
    }
    return plan;
}

}  // namespace popper::planner
