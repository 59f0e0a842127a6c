#include "app/run_command.hpp"

#include <iostream>
#include <optional>
#include "core/logging/logger.hpp"
#include "planner/invocation_planner.hpp"
#include "runtime/execution_sequencer.hpp"
#include "runtime/interrupt_context.hpp"
#include "session/run_journal.hpp"

namespace popper::app {

using core::errors::PopperError;
using protocol::RunConfig;

namespace {

int report_fatal(const std::string& stage, const PopperError& err) {
    LOG_ERROR(stage + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    return core::errors::exit_code_for(err);
}

std::string summarize(const RunConfig& config) {
    std::string text = "wfile=" + (config.wfile.has_value() ? config.wfile->string() : "<default>");
    if (config.action.has_value()) {
        text += " action=" + config.action.value();
    }
    if (config.with_dependencies) {
        text += " with-dependencies";
    }
    for (const auto& skipped : config.skip) {
        text += " skip=" + skipped;
    }
    if (config.on_failure.has_value()) {
        text += " on-failure=" + config.on_failure.value();
    }
    text += " runtime=" + protocol::to_string(config.runtime);
    if (config.parallel) text += " parallel";
    if (config.dry_run) text += " dry-run";
    return text;
}

void journal_warn(const core::errors::Result<std::filesystem::path>& written) {
    if (core::errors::is_error(written)) {
        const auto& err = core::errors::get_error(written);
        LOG_WARN("Journal write failed [" + err.code + "]: " + err.message);
    }
}

}  // namespace

int run_command(const cli::RawRunOptions& raw, const RunContext& context) {
    if (raw.help) {
        std::cout << cli::usage_text();
        return core::errors::kExitSuccess;
    }

    // 1. Argument Resolver
    RunConfig defaults;
    defaults.workspace = context.scm.root_folder();
    auto resolved = validate_run_config(resolve_run_config(raw, defaults), context.capabilities);
    if (core::errors::is_error(resolved)) {
        return report_fatal("Invalid arguments", core::errors::get_error(resolved));
    }
    const RunConfig base = core::errors::get_value(resolved);

    auto logging_applied = apply_logging(base);
    if (core::errors::is_error(logging_applied)) {
        return report_fatal("Invalid arguments", core::errors::get_error(logging_applied));
    }

    // 2-3. Scanner + Planner
    const planner::InvocationPlanner invocation_planner(context.environment, context.scm, context.locator,
                                                        context.capabilities);
    auto planned = invocation_planner.build_plan(base);
    if (core::errors::is_error(planned)) {
        return report_fatal("Planning failed", core::errors::get_error(planned));
    }
    const auto& plan = core::errors::get_value(planned);

    LOG_INFO("Invocation plan (" + protocol::to_string(plan.mode) + "): " +
             std::to_string(plan.runs.size()) + " run(s)");
    for (std::size_t i = 0; i < plan.runs.size(); ++i) {
        LOG_INFO("  [" + std::to_string(i + 1) + "] " + summarize(plan.runs[i]));
    }

    std::optional<session::RunJournal> journal;
    if (context.environment.journal_dir.has_value()) {
        journal.emplace(context.environment.journal_dir.value(), context.invocation_id);
        journal_warn(journal->write_plan(plan));
    }

    // Interrupt state is fixed before the first run starts.
    runtime::InterruptContext interrupt;
    for (const auto& config : plan.runs) {
        interrupt.parallel = interrupt.parallel || config.parallel;
    }
    if (context.install_signal_handlers) {
        if (runtime::install_interrupt_handler(interrupt)) {
            LOG_DEBUG(std::string("Interrupt handler installed (parallel=") +
                      (runtime::current_interrupt_context().parallel ? "true" : "false") + ")");
        } else {
            LOG_WARN("Unable to install interrupt handler.");
        }
    }

    // 4. Execution Sequencer, one run at a time
    runtime::ExecutionSequencer sequencer(context.engine, context.locator, context.environment);
    int exit_status = core::errors::kExitSuccess;
    std::size_t executed = 0;
    for (std::size_t i = 0; i < plan.runs.size(); ++i) {
        const RunConfig& config = plan.runs[i];
        auto applied = apply_logging(config);
        if (core::errors::is_error(applied)) {
            exit_status = report_fatal("Invalid arguments", core::errors::get_error(applied));
            break;
        }

        auto ran = sequencer.run(config);
        if (core::errors::is_error(ran)) {
            exit_status = report_fatal("Run " + std::to_string(i + 1) + " aborted",
                                       core::errors::get_error(ran));
            break;
        }
        ++executed;
        const auto& outcome = core::errors::get_value(ran);
        if (journal.has_value()) {
            journal_warn(journal->write_outcome(i, config, outcome));
        }
        if (!outcome.succeeded()) {
            exit_status = outcome.exit_status != 0 ? outcome.exit_status : 1;
            if (i + 1 < plan.runs.size()) {
                LOG_WARN("Stopping after failed run " + std::to_string(i + 1) + "; " +
                         std::to_string(plan.runs.size() - i - 1) + " run(s) not executed.");
            }
            break;
        }
    }

    if (journal.has_value()) {
        journal_warn(journal->write_final(exit_status, executed));
    }
    return exit_status;
}

}  // namespace popper::app
