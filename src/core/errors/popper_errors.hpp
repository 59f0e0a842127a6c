#pragma once
#include <string>
#include <variant>

namespace popper::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., conflicting flags, malformed directive, missing workflow file
        Execution,  // E.g., the engine could not run a workflow
        Scm,        // E.g., git failed while reading the head commit
        Internal    // E.g., fork/pipe failure
    };

    // The standardized error payload
    struct PopperError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // Process exit statuses reserved by the orchestrator. Any other non-zero
    // status comes straight from the workflow engine.
    constexpr int kExitSuccess = 0;
    constexpr int kExitInputError = 2;
    constexpr int kExitInternalError = 3;

    // 2. Propagation strategy: a Result holds either a value of type T, OR a PopperError.
    template <typename T>
    using Result = std::variant<T, PopperError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<PopperError>(result);
    }

    template <typename T>
    const PopperError& get_error(const Result<T>& result) {
        return std::get<PopperError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Scm:       return "scm";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

    // Maps a fatal error to the process exit status.
    inline int exit_code_for(const PopperError& error) {
        return error.category == ErrorCategory::Internal ? kExitInternalError
                                                         : kExitInputError;
    }

} // namespace popper::core::errors
