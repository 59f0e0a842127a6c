#pragma once

#include <filesystem>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/errors/popper_errors.hpp"

namespace popper::tools {

struct ProcessRequest {
    // argv[0] is looked up on PATH.
    std::vector<std::string> argv;
    std::filesystem::path working_directory = ".";
    // When false the child inherits stdout/stderr and nothing is captured.
    bool capture_output = true;
};

struct ProcessCapture {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Exit status reported when the program cannot be executed.
constexpr int kExitCommandNotFound = 127;

class ProcessRunner {
public:
    core::errors::Result<ProcessCapture> run(const ProcessRequest& request) const;
};

// pid of the child currently being waited on, or 0. The child is also the
// leader of its own process group. Read by the interrupt handler.
pid_t active_child_pid();

}  // namespace popper::tools
