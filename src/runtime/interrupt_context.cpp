#include "runtime/interrupt_context.hpp"

#include <csignal>
#include <signal.h>
#include <unistd.h>
#include "tools/process_runner.hpp"

namespace popper::runtime {

namespace {

volatile sig_atomic_t g_parallel = 0;

void handle_interrupt(const int signal_number) {
    // The engine leads its own group, so this reaches every process it spawned.
    const pid_t child = tools::active_child_pid();
    if (child > 0) {
        static_cast<void>(kill(-child, signal_number));
    }
    if (g_parallel != 0) {
        const char message[] = "\nInterrupted, stopping parallel workflow steps.\n";
        static_cast<void>(write(STDERR_FILENO, message, sizeof(message) - 1));
    } else {
        const char message[] = "\nInterrupted, stopping workflow execution.\n";
        static_cast<void>(write(STDERR_FILENO, message, sizeof(message) - 1));
    }
    _exit(128 + signal_number);
}

}  // namespace

bool install_interrupt_handler(const InterruptContext& context) {
    g_parallel = context.parallel ? 1 : 0;

    struct sigaction action {};
    action.sa_handler = handle_interrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    const bool int_ok = sigaction(SIGINT, &action, nullptr) == 0;
    const bool term_ok = sigaction(SIGTERM, &action, nullptr) == 0;
    return int_ok && term_ok;
}

InterruptContext current_interrupt_context() {
    InterruptContext context;
    context.parallel = g_parallel != 0;
    return context;
}

}  // namespace popper::runtime
