#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include "core/errors/popper_errors.hpp"
#include "protocol/run_config.hpp"
#include "protocol/run_outcome.hpp"

namespace popper::session {

// Appends one JSON object per line to <journal_dir>/<invocation_id>.jsonl.
class RunJournal {
public:
    RunJournal(std::filesystem::path journal_dir, std::string invocation_id);

    core::errors::Result<std::filesystem::path> write_plan(
        const protocol::InvocationPlan& plan) const;

    core::errors::Result<std::filesystem::path> write_outcome(
        std::size_t index, const protocol::RunConfig& config,
        const protocol::RunOutcome& outcome) const;

    core::errors::Result<std::filesystem::path> write_final(int exit_status,
                                                            std::size_t runs_executed) const;

    core::errors::Result<std::filesystem::path> journal_path() const;

private:
    core::errors::Result<std::filesystem::path> append_event(const std::string& event_json) const;

    std::filesystem::path journal_dir_;
    std::string invocation_id_;
};

}  // namespace popper::session
