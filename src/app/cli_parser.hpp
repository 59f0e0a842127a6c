#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/popper_errors.hpp"
#include "protocol/run_config.hpp"

namespace popper::app::cli {

    // Options as written by the user. Unset fields were not given, so a
    // directive can overlay only what it names.
    struct RawRunOptions {
        std::optional<std::string> action;
        std::optional<std::string> wfile;
        std::optional<std::string> log_file;
        std::optional<std::string> on_failure;
        std::optional<std::string> workspace;
        std::optional<protocol::Runtime> runtime;
        std::vector<std::string> skip;
        bool debug = false;
        bool quiet = false;
        bool dry_run = false;
        bool parallel = false;
        bool reuse = false;
        bool skip_clone = false;
        bool skip_pull = false;
        bool with_dependencies = false;
        bool help = false;
    };

    // The `run` grammar, shared by the command line and commit directives.
    popper::core::errors::Result<RawRunOptions> parse_run_arguments(const std::vector<std::string>& args);

    // Full command line: argv[1] must be `run`.
    popper::core::errors::Result<RawRunOptions> parse_command_line(int argc, char* argv[]);

    // Splits a directive payload on whitespace.
    std::vector<std::string> split_arguments(const std::string& payload);

    std::string usage_text();
}
