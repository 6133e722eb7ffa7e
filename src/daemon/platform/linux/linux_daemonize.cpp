#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <print>
#include <unistd.h>

namespace platform {

void daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "longscribed: fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) {
        std::println(stderr, "longscribed: setsid() failed: {}", std::strerror(errno));
        _exit(1);
    }

    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    // Keep stderr: the daemon logs there and a service manager may capture it.
    if (!freopen("/dev/null", "r", stdin) || !freopen("/dev/null", "w", stdout)) {
        _exit(1);
    }
}

} // namespace platform
