#pragma once

namespace popper::runtime {

// What the interrupt handler needs to know about the current invocation.
// Built once before the plan runs; read-only afterwards.
struct InterruptContext {
    bool parallel = false;
};

// Installs SIGINT/SIGTERM handlers that forward the signal to the running
// engine's process group and exit with 128 + signal. When `context.parallel`
// the message names the parallel workers being stopped.
// Returns false if a handler could not be installed.
bool install_interrupt_handler(const InterruptContext& context);

// Context registered by the last install_interrupt_handler() call.
InterruptContext current_interrupt_context();

}  // namespace popper::runtime
