#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <unistd.h>

namespace platform {

namespace {

void redirect(int target, int flags) {
    int fd = ::open("/dev/null", flags);
    if (fd < 0) return;
    ::dup2(fd, target);
    if (fd != target) ::close(fd);
}

} // namespace

void daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "daemon: fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0); // parent exits

    if (setsid() < 0) {
        std::println(stderr, "daemon: setsid() failed: {}", std::strerror(errno));
        _exit(1);
    }

    // Second fork: never reacquire a controlling terminal.
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    std::fflush(stdout);
    std::fflush(stderr);
    redirect(STDIN_FILENO, O_RDONLY);
    redirect(STDOUT_FILENO, O_WRONLY);
    redirect(STDERR_FILENO, O_WRONLY);
}

} // namespace platform
