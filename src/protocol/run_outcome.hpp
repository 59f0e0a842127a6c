#pragma once

#include <string>
#include <vector>
#include <utility>
#include "protocol/run_config.hpp"

namespace popper::protocol {

enum class OutcomeStatus {
    Succeeded,
    Failed
};

// Result of one RunConfig execution. Failures carry the engine's exit status
// and the action or workflow that failed.
struct RunOutcome {
    OutcomeStatus status = OutcomeStatus::Succeeded;
    int exit_status = 0;
    std::string failed_target;
    bool from_fallback = false;

    bool succeeded() const { return status == OutcomeStatus::Succeeded; }

    static RunOutcome success() { return RunOutcome{}; }

    static RunOutcome failure(const int exit_status, std::string target) {
        RunOutcome outcome;
        outcome.status = OutcomeStatus::Failed;
        outcome.exit_status = exit_status;
        outcome.failed_target = std::move(target);
        return outcome;
    }
};

enum class PlanMode {
    Single,
    Directives,
    Recursive
};

// Ordered runs for one command invocation.
struct InvocationPlan {
    PlanMode mode = PlanMode::Single;
    std::vector<RunConfig> runs;
};

inline std::string to_string(const OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Succeeded:
            return "succeeded";
        case OutcomeStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

inline std::string to_string(const PlanMode mode) {
    switch (mode) {
        case PlanMode::Single:
            return "single";
        case PlanMode::Directives:
            return "directives";
        case PlanMode::Recursive:
            return "recursive";
        default:
            return "unknown";
    }
}

}  // namespace popper::protocol
