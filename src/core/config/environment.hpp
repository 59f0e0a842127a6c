#pragma once

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace popper::core::config {

// Looks up one environment variable; std::nullopt when it is not set.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

inline constexpr const char* kCiVariable = "CI";
inline constexpr const char* kPreWorkflowVariable = "POPPER_PRE_WORKFLOW_PATH";
inline constexpr const char* kPostWorkflowVariable = "POPPER_POST_WORKFLOW_PATH";
inline constexpr const char* kEngineVariable = "POPPER_ENGINE";
inline constexpr const char* kJournalDirVariable = "POPPER_RUN_JOURNAL_DIR";
inline constexpr const char* kDefaultEngineCommand = "popper-engine";

struct EnvironmentConfig {
    bool ci = false;
    std::optional<std::filesystem::path> pre_workflow;
    std::optional<std::filesystem::path> post_workflow;
    std::string engine_command = kDefaultEngineCommand;
    std::optional<std::filesystem::path> journal_dir;
};

inline std::optional<std::string> process_env_lookup(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

// Empty values are treated as unset.
inline EnvironmentConfig load_environment_config(const EnvLookup& lookup = process_env_lookup) {
    auto non_empty = [&lookup](const char* name) -> std::optional<std::string> {
        auto value = lookup(name);
        if (!value.has_value() || value->empty()) {
            return std::nullopt;
        }
        return value;
    };

    EnvironmentConfig config;
    const auto ci = non_empty(kCiVariable);
    config.ci = ci.has_value() && ci.value() == "true";
    if (auto pre = non_empty(kPreWorkflowVariable)) {
        config.pre_workflow = std::filesystem::path(pre.value());
    }
    if (auto post = non_empty(kPostWorkflowVariable)) {
        config.post_workflow = std::filesystem::path(post.value());
    }
    if (auto engine = non_empty(kEngineVariable)) {
        config.engine_command = engine.value();
    }
    if (auto journal = non_empty(kJournalDirVariable)) {
        config.journal_dir = std::filesystem::path(journal.value());
    }
    return config;
}

}  // namespace popper::core::config
