#pragma once

namespace platform {

// Detach from the controlling terminal. Returns only in the daemon process.
void daemonize();

} // namespace platform
