#pragma once

#include "app/cli_parser.hpp"
#include "core/errors/popper_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/run_config.hpp"

namespace popper::app {

// What the host can do, detected once at startup.
struct PlatformCapabilities {
    bool concurrent_execution = true;
};

PlatformCapabilities detect_platform_capabilities();

protocol::Verbosity resolve_verbosity(bool debug, bool quiet);

core::logging::LogLevel to_log_level(protocol::Verbosity verbosity);

// Overlays every option given in `raw` on top of `base`.
protocol::RunConfig resolve_run_config(const cli::RawRunOptions& raw,
                                       const protocol::RunConfig& base);

// Rejects invalid flag combinations before anything is executed.
core::errors::Result<protocol::RunConfig> validate_run_config(
    const protocol::RunConfig& config, const PlatformCapabilities& capabilities);

// Applies the run's verbosity to the process logger and attaches its log file.
core::errors::Result<protocol::Verbosity> apply_logging(const protocol::RunConfig& config);

}  // namespace popper::app
