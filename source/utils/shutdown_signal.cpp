#include "utils/shutdown_signal.hpp"

#include <csignal>

namespace shutdown_signal {

static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

void install_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

bool is_requested() {
    return shutdown_requested != 0;
}

void request() {
    shutdown_requested = 1;
}

} // namespace shutdown_signal
