#include "cli_parser.hpp"
#include <sstream>
#include <utility>

namespace popper::app::cli {

    using namespace popper::core::errors;

    namespace {

        // Splits `--name=value` into its two halves; plain tokens pass through.
        std::pair<std::string, std::optional<std::string>> split_inline_value(const std::string& token) {
            if (token.rfind("--", 0) != 0) {
                return {token, std::nullopt};
            }
            const auto eq = token.find('=');
            if (eq == std::string::npos) {
                return {token, std::nullopt};
            }
            return {token.substr(0, eq), token.substr(eq + 1)};
        }

        bool is_flag(const std::string& name) {
            return name == "--debug" || name == "--quiet" || name == "--dry-run" ||
                   name == "--parallel" || name == "--reuse" || name == "--skip-clone" ||
                   name == "--skip-pull" || name == "--with-dependencies" ||
                   name == "--help" || name == "-h";
        }

        bool is_valued_option(const std::string& name) {
            return name == "--wfile" || name == "--log-file" || name == "--on-failure" ||
                   name == "--runtime" || name == "--skip" || name == "--workspace";
        }

    } // namespace

    Result<RawRunOptions> parse_run_arguments(const std::vector<std::string>& args) {
        RawRunOptions raw;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto [name, inline_value] = split_inline_value(args[i]);

            if (is_flag(name)) {
                if (inline_value.has_value()) {
                    return PopperError{ErrorCategory::Input, "Option " + name + " does not take a value", "unexpected_value"};
                }
                if (name == "--debug") raw.debug = true;
                else if (name == "--quiet") raw.quiet = true;
                else if (name == "--dry-run") raw.dry_run = true;
                else if (name == "--parallel") raw.parallel = true;
                else if (name == "--reuse") raw.reuse = true;
                else if (name == "--skip-clone") raw.skip_clone = true;
                else if (name == "--skip-pull") raw.skip_pull = true;
                else if (name == "--with-dependencies") raw.with_dependencies = true;
                else raw.help = true;
                continue;
            }

            if (is_valued_option(name)) {
                std::string value;
                if (inline_value.has_value()) {
                    value = inline_value.value();
                } else if (i + 1 < args.size()) {
                    value = args[++i];
                } else {
                    return PopperError{ErrorCategory::Input, "Missing value for " + name, "missing_value"};
                }
                if (value.empty()) {
                    return PopperError{ErrorCategory::Input, "Empty value for " + name, "missing_value"};
                }

                if (name == "--wfile") raw.wfile = value;
                else if (name == "--log-file") raw.log_file = value;
                else if (name == "--on-failure") raw.on_failure = value;
                else if (name == "--workspace") raw.workspace = value;
                else if (name == "--skip") raw.skip.push_back(value);
                else {
                    auto runtime = popper::protocol::parse_runtime(value);
                    if (!runtime.has_value()) {
                        return PopperError{ErrorCategory::Input, "Invalid value for --runtime: " + value, "invalid_choice",
                                           "Choose from: docker, singularity."};
                    }
                    raw.runtime = runtime;
                }
                continue;
            }

            if (name.size() > 1 && name[0] == '-') {
                return PopperError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument",
                                   "Run 'popper run --help' for the list of options."};
            }

            // Positional: the target action
            if (raw.action.has_value()) {
                return PopperError{ErrorCategory::Input, "Unexpected extra argument: " + args[i], "unexpected_argument",
                                   "Only one action can be given per run."};
            }
            raw.action = args[i];
        }

        return raw;
    }

    Result<RawRunOptions> parse_command_line(int argc, char* argv[]) {
        if (argc < 2) {
            return PopperError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: popper run [ACTION] [OPTIONS]"};
        }

        std::string command = argv[1];
        if (command != "run") {
            return PopperError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'run' command
            args.push_back(argv[i]);
        }
        return parse_run_arguments(args);
    }

    std::vector<std::string> split_arguments(const std::string& payload) {
        std::vector<std::string> tokens;
        std::istringstream in(payload);
        std::string token;
        while (in >> token) {
            tokens.push_back(token);
        }
        return tokens;
    }

    std::string usage_text() {
        return
            "Usage: popper run [OPTIONS] [ACTION]\n"
            "\n"
            "  Runs a workflow, or a single ACTION from it.\n"
            "\n"
            "  By default the workflow is read from .github/main.workflow or\n"
            "  main.workflow. When CI=true, the head commit message is scanned for\n"
            "  popper:run[...] directives; without any, every workflow under the\n"
            "  workspace is run.\n"
            "\n"
            "Options:\n"
            "  --wfile PATH            Workflow file to run.\n"
            "  --debug                 Most verbose output (overrides --quiet).\n"
            "  --dry-run               Only print what would be executed.\n"
            "  --log-file PATH         Also write the log to PATH.\n"
            "  --on-failure ACTION     Run ACTION if the workflow fails.\n"
            "  --parallel              Execute actions in stages in parallel.\n"
            "  --quiet                 Do not print output generated by actions.\n"
            "  --reuse                 Reuse containers between executions.\n"
            "  --runtime [docker|singularity]\n"
            "                          Container runtime [default: docker].\n"
            "  --skip ACTION           Skip ACTION (repeatable).\n"
            "  --skip-clone            Assume action repositories are already cloned.\n"
            "  --skip-pull             Assume container images are cached.\n"
            "  --with-dependencies     Also run the dependencies of ACTION.\n"
            "  --workspace PATH        Workspace folder [default: repository root].\n"
            "  -h, --help              Show this message and exit.\n";
    }

} // namespace popper::app::cli
