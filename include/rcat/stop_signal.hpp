#pragma once

namespace rcat {

// SIGTERM, SIGHUP and SIGINT only record a stop request; the event loop
// polls stop_requested() and leaves through its normal shutdown path.
void install_stop_signal_handlers();

bool stop_requested();
// Number of the signal that asked to stop, 0 if none.
int stop_signal();
void clear_stop_request();

} // namespace rcat
