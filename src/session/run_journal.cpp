#include "session/run_journal.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace popper::session {

using core::errors::ErrorCategory;
using core::errors::PopperError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json config_to_json(const protocol::RunConfig& config) {
    json payload;
    payload["action"] = config.action.has_value() ? config.action.value() : "";
    payload["wfile"] = config.wfile.has_value() ? config.wfile->string() : "";
    payload["workspace"] = config.workspace.string();
    payload["runtime"] = protocol::to_string(config.runtime);
    payload["parallel"] = config.parallel;
    payload["dry_run"] = config.dry_run;
    payload["reuse"] = config.reuse;
    payload["skip_clone"] = config.skip_clone;
    payload["skip_pull"] = config.skip_pull;
    payload["with_dependencies"] = config.with_dependencies;
    payload["skip"] = json::array();
    for (const auto& skipped : config.skip) {
        payload["skip"].push_back(skipped);
    }
    payload["on_failure"] = config.on_failure.has_value() ? config.on_failure.value() : "";
    payload["verbosity"] = protocol::to_string(config.verbosity);
    return payload;
}

}  // namespace

RunJournal::RunJournal(std::filesystem::path journal_dir, std::string invocation_id)
    : journal_dir_(std::move(journal_dir)), invocation_id_(std::move(invocation_id)) {}

core::errors::Result<std::filesystem::path> RunJournal::journal_path() const {
    if (invocation_id_.empty()) {
        return PopperError{ErrorCategory::Input, "Invocation ID cannot be empty.",
                           "invalid_invocation_id"};
    }

    std::error_code ec;
    std::filesystem::create_directories(journal_dir_, ec);
    if (ec) {
        return PopperError{ErrorCategory::Internal,
                           "Unable to create journal directory: " + journal_dir_.string(),
                           "journal_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(journal_dir_, ec) || ec) {
        return PopperError{ErrorCategory::Input,
                           "Journal path is not a directory: " + journal_dir_.string(),
                           "invalid_journal_dir"};
    }

    return journal_dir_ / (invocation_id_ + ".jsonl");
}

core::errors::Result<std::filesystem::path> RunJournal::append_event(
    const std::string& event_json) const {
    auto path_result = journal_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return PopperError{ErrorCategory::Internal,
                           "Unable to open journal file: " + path.string(),
                           "journal_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return PopperError{ErrorCategory::Internal,
                           "Unable to write journal event: " + path.string(),
                           "journal_write_failed"};
    }

    return path;
}

core::errors::Result<std::filesystem::path> RunJournal::write_plan(
    const protocol::InvocationPlan& plan) const {
    json payload;
    payload["mode"] = protocol::to_string(plan.mode);
    payload["runs"] = json::array();
    for (const auto& config : plan.runs) {
        payload["runs"].push_back(config_to_json(config));
    }

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "plan";
    event["invocation_id"] = invocation_id_;
    event["payload"] = payload;
    return append_event(event.dump());
}

core::errors::Result<std::filesystem::path> RunJournal::write_outcome(
    const std::size_t index, const protocol::RunConfig& config,
    const protocol::RunOutcome& outcome) const {
    json payload;
    payload["index"] = index;
    payload["config"] = config_to_json(config);
    payload["status"] = protocol::to_string(outcome.status);
    payload["exit_status"] = outcome.exit_status;
    payload["failed_target"] = outcome.failed_target;
    payload["from_fallback"] = outcome.from_fallback;

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "outcome";
    event["invocation_id"] = invocation_id_;
    event["payload"] = payload;
    return append_event(event.dump());
}

core::errors::Result<std::filesystem::path> RunJournal::write_final(
    const int exit_status, const std::size_t runs_executed) const {
    json payload;
    payload["exit_status"] = exit_status;
    payload["runs_executed"] = runs_executed;

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "final";
    event["invocation_id"] = invocation_id_;
    event["payload"] = payload;
    return append_event(event.dump());
}

}  // namespace popper::session
