#include <filesystem>
#include <string>
#include "app/cli_parser.hpp"
#include "app/run_command.hpp"
#include "app/run_config_resolver.hpp"
#include "core/config/environment.hpp"
#include "core/config/invocation_id.hpp"
#include "core/errors/popper_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/workflow_engine.hpp"
#include "scm/git_repository.hpp"
#include "workflow/workflow_locator.hpp"

int main(int argc, char* argv[]) {
    // 1. Generate a unique ID for this invocation
    const std::string invocation_id = popper::core::config::generate_invocation_id();
    popper::core::logging::Logger::get().set_invocation_id(invocation_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = popper::app::cli::parse_command_line(argc, argv);
    if (popper::core::errors::is_error(parsed)) {
        const auto& err = popper::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return popper::core::errors::kExitInputError;
    }

    // 3. Real collaborators
    const auto environment = popper::core::config::load_environment_config();
    const std::filesystem::path cwd = std::filesystem::current_path();
    const popper::scm::GitRepository repository(cwd);
    const popper::workflow::FilesystemWorkflowLocator locator(cwd);
    popper::runtime::ProcessWorkflowEngine engine(environment.engine_command);

    const popper::app::RunContext context{environment,
                                          repository,
                                          locator,
                                          engine,
                                          popper::app::detect_platform_capabilities(),
                                          invocation_id,
                                          true};

    const int exit_status =
        popper::app::run_command(popper::core::errors::get_value(parsed), context);
    popper::core::logging::Logger::get().detach_log_file();
    return exit_status;
}
