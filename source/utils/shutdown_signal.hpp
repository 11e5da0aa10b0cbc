#ifndef PAGEMCP_SHUTDOWN_SIGNAL_HPP
#define PAGEMCP_SHUTDOWN_SIGNAL_HPP

// Process-wide graceful shutdown flag, set from SIGINT/SIGTERM.

namespace shutdown_signal {

// Install SIGINT and SIGTERM handlers that set the flag.
void install_handlers();

bool is_requested();

// Set the flag without a signal.
void request();

} // namespace shutdown_signal

#endif // PAGEMCP_SHUTDOWN_SIGNAL_HPP
