#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

void daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) _exit(1);
    umask(022);

    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    if (chdir("/") < 0) _exit(1);

    if (!freopen("/dev/null", "r", stdin)) _exit(1);
    if (!freopen("/dev/null", "w", stdout)) _exit(1);
    if (!freopen("/dev/null", "w", stderr)) _exit(1);
}

} // namespace platform
