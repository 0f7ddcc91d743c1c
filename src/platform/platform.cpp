#include "platform.hpp"
#include <cerrno>
#include <csignal>
#include <unistd.h>

namespace platform {

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

bool process_exists(int pid) {
    if (pid <= 0) return false;
    if (kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

int parent_pid() {
    return static_cast<int>(getppid());
}

} // namespace platform
