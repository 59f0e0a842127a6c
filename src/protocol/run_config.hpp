#pragma once
#include <string>
#include <filesystem>
#include <optional>
#include <set>

namespace popper::protocol {

    enum class Runtime {
        Docker,
        Singularity
    };

    // Effective output level for one run. Debug overrides Info (--quiet).
    enum class Verbosity {
        Debug,
        ActionInfo,
        Info
    };

    // Canonical, validated parameters for one workflow execution.
    struct RunConfig {
        std::optional<std::string> action;
        std::optional<std::filesystem::path> wfile;
        std::filesystem::path workspace = std::filesystem::current_path();
        Runtime runtime = Runtime::Docker;
        bool parallel = false;
        bool dry_run = false;
        bool reuse = false;
        bool skip_clone = false;
        bool skip_pull = false;
        bool with_dependencies = false;
        std::set<std::string> skip;
        std::optional<std::string> on_failure;
        Verbosity verbosity = Verbosity::ActionInfo;
        std::optional<std::filesystem::path> log_file;

        bool operator==(const RunConfig& other) const {
            return action == other.action && wfile == other.wfile &&
                   workspace == other.workspace && runtime == other.runtime &&
                   parallel == other.parallel && dry_run == other.dry_run &&
                   reuse == other.reuse && skip_clone == other.skip_clone &&
                   skip_pull == other.skip_pull &&
                   with_dependencies == other.with_dependencies &&
                   skip == other.skip && on_failure == other.on_failure &&
                   verbosity == other.verbosity && log_file == other.log_file;
        }
        bool operator!=(const RunConfig& other) const { return !(*this == other); }
    };

    inline std::string to_string(const Runtime runtime) {
        switch (runtime) {
            case Runtime::Docker:
                return "docker";
            case Runtime::Singularity:
                return "singularity";
            default:
                return "unknown";
        }
    }

    inline std::optional<Runtime> parse_runtime(const std::string& value) {
        if (value == "docker") return Runtime::Docker;
        if (value == "singularity") return Runtime::Singularity;
        return std::nullopt;
    }

    inline std::string to_string(const Verbosity verbosity) {
        switch (verbosity) {
            case Verbosity::Debug:
                return "debug";
            case Verbosity::ActionInfo:
                return "action_info";
            case Verbosity::Info:
                return "info";
            default:
                return "unknown";
        }
    }

} // namespace popper::protocol
