#include "app/run_config_resolver.hpp"

#include <thread>

namespace popper::app {

using core::errors::ErrorCategory;
using core::errors::PopperError;
using protocol::RunConfig;
using protocol::Verbosity;

PlatformCapabilities detect_platform_capabilities() {
    PlatformCapabilities capabilities;
    // hardware_concurrency() is 0 when the platform cannot report threads.
    capabilities.concurrent_execution = std::thread::hardware_concurrency() > 0;
    return capabilities;
}

Verbosity resolve_verbosity(const bool debug, const bool quiet) {
    if (debug) {
        return Verbosity::Debug;
    }
    if (quiet) {
        return Verbosity::Info;
    }
    return Verbosity::ActionInfo;
}

core::logging::LogLevel to_log_level(const Verbosity verbosity) {
    switch (verbosity) {
        case Verbosity::Debug:
            return core::logging::LogLevel::DEBUG;
        case Verbosity::Info:
            return core::logging::LogLevel::INFO;
        case Verbosity::ActionInfo:
        default:
            return core::logging::LogLevel::ACTION_INFO;
    }
}

RunConfig resolve_run_config(const cli::RawRunOptions& raw, const RunConfig& base) {
    RunConfig config = base;
    if (raw.action) config.action = raw.action.value();
    if (raw.wfile) config.wfile = std::filesystem::path(raw.wfile.value());
    if (raw.workspace) config.workspace = std::filesystem::path(raw.workspace.value());
    if (raw.runtime) config.runtime = raw.runtime.value();
    if (raw.on_failure) config.on_failure = raw.on_failure.value();
    if (raw.log_file) config.log_file = std::filesystem::path(raw.log_file.value());
    if (!raw.skip.empty()) {
        config.skip = std::set<std::string>(raw.skip.begin(), raw.skip.end());
    }

    config.parallel = config.parallel || raw.parallel;
    config.dry_run = config.dry_run || raw.dry_run;
    config.reuse = config.reuse || raw.reuse;
    config.skip_clone = config.skip_clone || raw.skip_clone;
    config.skip_pull = config.skip_pull || raw.skip_pull;
    config.with_dependencies = config.with_dependencies || raw.with_dependencies;

    if (raw.debug || raw.quiet) {
        config.verbosity = resolve_verbosity(raw.debug, raw.quiet);
    }
    return config;
}

core::errors::Result<RunConfig> validate_run_config(
    const RunConfig& config, const PlatformCapabilities& capabilities) {
    if (config.parallel && !capabilities.concurrent_execution) {
        return PopperError{ErrorCategory::Input,
                           "--parallel is not supported on this platform.",
                           "parallel_unsupported",
                           "Run again without --parallel."};
    }
    if (config.with_dependencies && !config.action.has_value()) {
        return PopperError{ErrorCategory::Input,
                           "`--with-dependencies` can be used only with action argument.",
                           "dependencies_without_action"};
    }
    if (!config.skip.empty() && config.action.has_value()) {
        return PopperError{ErrorCategory::Input,
                           "`--skip` can't be used when action argument is passed.",
                           "skip_with_action"};
    }
    return config;
}

core::errors::Result<Verbosity> apply_logging(const RunConfig& config) {
    auto& logger = core::logging::Logger::get();
    logger.set_level(to_log_level(config.verbosity));
    if (config.log_file.has_value()) {
        if (!logger.attach_log_file(config.log_file.value())) {
            return PopperError{ErrorCategory::Input,
                               "Unable to open log file: " + config.log_file->string(),
                               "log_file_open_failed"};
        }
    }
    return config.verbosity;
}

}  // namespace popper::app
