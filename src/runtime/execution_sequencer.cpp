#include "runtime/execution_sequencer.hpp"

#include <optional>
#include <string>
#include "core/logging/logger.hpp"

namespace popper::runtime {

using protocol::RunConfig;
using protocol::RunOutcome;

namespace {

EngineRequest make_request(const RunConfig& config, const std::filesystem::path& workflow) {
    EngineRequest request;
    request.workflow = workflow;
    request.action = config.action;
    request.with_dependencies = config.with_dependencies;
    request.skip = config.skip;
    request.runtime = config.runtime;
    request.parallel = config.parallel;
    request.reuse = config.reuse;
    request.skip_clone = config.skip_clone;
    request.skip_pull = config.skip_pull;
    request.workspace = config.workspace;
    request.verbosity = config.verbosity;
    return request;
}

// Pre and post workflows always run in full.
EngineRequest make_side_request(const RunConfig& config, const std::filesystem::path& workflow) {
    EngineRequest request = make_request(config, workflow);
    request.action.reset();
    request.with_dependencies = false;
    return request;
}

}  // namespace

ExecutionSequencer::ExecutionSequencer(WorkflowEngine& engine,
                                       const workflow::WorkflowLocator& locator,
                                       const core::config::EnvironmentConfig& environment)
    : engine_(engine), locator_(locator), environment_(environment) {}

core::errors::Result<RunOutcome> ExecutionSequencer::run_stage(const std::string& stage,
                                                               const EngineRequest& request,
                                                               const bool dry_run) {
    if (dry_run) {
        LOG_INFO("[dry-run] " + stage + ": " + describe(request));
        return RunOutcome::success();
    }
    LOG_ACTION_INFO("Running " + stage + ": " + describe(request));
    return engine_.execute(request);
}

core::errors::Result<RunOutcome> ExecutionSequencer::run(const RunConfig& config) {
    // 1. Resolve every workflow up front so nothing runs if one is missing.
    auto resolved = locator_.resolve(config.wfile);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path wfile = core::errors::get_value(resolved);

    std::optional<std::filesystem::path> pre_wfile;
    if (environment_.pre_workflow.has_value()) {
        auto pre = locator_.resolve(environment_.pre_workflow);
        if (core::errors::is_error(pre)) {
            return core::errors::get_error(pre);
        }
        pre_wfile = core::errors::get_value(pre);
    }
    std::optional<std::filesystem::path> post_wfile;
    if (environment_.post_workflow.has_value()) {
        auto post = locator_.resolve(environment_.post_workflow);
        if (core::errors::is_error(post)) {
            return core::errors::get_error(post);
        }
        post_wfile = core::errors::get_value(post);
    }

    LOG_INFO("Found and running workflow at " + wfile.string());
    if (config.parallel) {
        LOG_WARN("Using --parallel may result in interleaved output. "
                 "You may use --quiet flag to avoid confusion.");
    }

    // 2-4. pre -> main -> post, stopping at the first failure.
    RunOutcome outcome = RunOutcome::success();
    if (pre_wfile.has_value()) {
        auto pre = run_stage("pre-workflow", make_side_request(config, pre_wfile.value()),
                             config.dry_run);
        if (core::errors::is_error(pre)) {
            return core::errors::get_error(pre);
        }
        outcome = core::errors::get_value(pre);
    }

    if (outcome.succeeded()) {
        auto primary = run_stage("workflow", make_request(config, wfile), config.dry_run);
        if (core::errors::is_error(primary)) {
            return core::errors::get_error(primary);
        }
        outcome = core::errors::get_value(primary);
    }

    if (outcome.succeeded() && post_wfile.has_value()) {
        auto post = run_stage("post-workflow", make_side_request(config, post_wfile.value()),
                              config.dry_run);
        if (core::errors::is_error(post)) {
            return core::errors::get_error(post);
        }
        outcome = core::errors::get_value(post);
    }

    // 5. Failure interception
    if (!outcome.succeeded()) {
        if (!config.on_failure.has_value()) {
            LOG_ERROR("\"" + outcome.failed_target + "\" failed with exit status " +
                      std::to_string(outcome.exit_status) + ".");
            return outcome;
        }

        LOG_WARN("\"" + outcome.failed_target + "\" failed with exit status " +
                 std::to_string(outcome.exit_status) + "; running on-failure action \"" +
                 config.on_failure.value() + "\".");
        EngineRequest fallback = make_request(config, wfile);
        fallback.action = config.on_failure;
        fallback.skip.clear();
        auto recovered = run_stage("on-failure", fallback, config.dry_run);
        if (core::errors::is_error(recovered)) {
            return core::errors::get_error(recovered);
        }
        outcome = core::errors::get_value(recovered);
        outcome.from_fallback = true;
        if (!outcome.succeeded()) {
            LOG_ERROR("On-failure action \"" + config.on_failure.value() +
                      "\" failed with exit status " + std::to_string(outcome.exit_status) + ".");
            return outcome;
        }
        LOG_INFO("Action \"" + config.on_failure.value() + "\" finished successfully.");
        return outcome;
    }

    // 6. Completion logging
    if (config.action.has_value()) {
        LOG_INFO("Action \"" + config.action.value() + "\" finished successfully.");
    } else {
        LOG_INFO("Workflow \"" + wfile.string() + "\" finished successfully.");
    }
    return outcome;
}

}  // namespace popper::runtime
