#include "runtime/workflow_engine.hpp"

#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace popper::runtime {

using protocol::RunOutcome;

std::vector<std::string> engine_arguments(const EngineRequest& request) {
    std::vector<std::string> args = {"--wfile", request.workflow.string()};
    if (request.action.has_value()) {
        args.push_back("--action");
        args.push_back(request.action.value());
    }
    if (request.with_dependencies) {
        args.push_back("--with-dependencies");
    }
    for (const auto& skipped : request.skip) {
        args.push_back("--skip");
        args.push_back(skipped);
    }
    args.push_back("--runtime");
    args.push_back(protocol::to_string(request.runtime));
    if (request.parallel) args.push_back("--parallel");
    if (request.reuse) args.push_back("--reuse");
    if (request.skip_clone) args.push_back("--skip-clone");
    if (request.skip_pull) args.push_back("--skip-pull");
    if (request.verbosity == protocol::Verbosity::Debug) {
        args.push_back("--debug");
    } else if (request.verbosity == protocol::Verbosity::Info) {
        args.push_back("--quiet");
    }
    args.push_back("--workspace");
    args.push_back(request.workspace.string());
    return args;
}

std::string describe(const EngineRequest& request) {
    std::string text = "workflow=" + request.workflow.string();
    if (request.action.has_value()) {
        text += " action=" + request.action.value();
        if (request.with_dependencies) {
            text += " (with dependencies)";
        }
    }
    if (!request.skip.empty()) {
        text += " skip=";
        bool first = true;
        for (const auto& skipped : request.skip) {
            text += (first ? "" : ",") + skipped;
            first = false;
        }
    }
    text += " runtime=" + protocol::to_string(request.runtime);
    return text;
}

ProcessWorkflowEngine::ProcessWorkflowEngine(std::string engine_command)
    : engine_command_(std::move(engine_command)) {}

core::errors::Result<RunOutcome> ProcessWorkflowEngine::execute(const EngineRequest& request) {
    tools::ProcessRequest process;
    process.argv.push_back(engine_command_);
    const auto args = engine_arguments(request);
    process.argv.insert(process.argv.end(), args.begin(), args.end());
    process.working_directory = request.workspace;
    process.capture_output = false;

    LOG_DEBUG("Engine: " + engine_command_ + " " + describe(request));
    auto result = runner_.run(process);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& capture = core::errors::get_value(result);
    LOG_DEBUG("Engine exited with status " + std::to_string(capture.exit_code) + " after " +
              std::to_string(static_cast<long long>(capture.duration_ms)) + " ms");
    if (capture.exit_code == tools::kExitCommandNotFound) {
        LOG_WARN("Engine exited with status 127; check that " + engine_command_ +
                 " is installed or set POPPER_ENGINE.");
    }
    if (capture.exit_code != 0) {
        const std::string target = request.action.has_value()
                                       ? request.action.value()
                                       : request.workflow.string();
        return RunOutcome::failure(capture.exit_code, target);
    }
    return RunOutcome::success();
}

}  // namespace popper::runtime
