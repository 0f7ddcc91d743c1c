#include "signals.hpp"
#include <core/utils.hpp>
#include <chrono>
#include <cerrno>
#include <stdexcept>

#include <poll.h>
#include <pthread.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace platform {

SignalWatcher::SignalWatcher(std::initializer_list<int> signals) {
    sigset_t mask;
    sigemptyset(&mask);
    for (int sig : signals) sigaddset(&mask, sig);

    int rc = pthread_sigmask(SIG_BLOCK, &mask, &old_mask_);
    if (rc != 0) {
        throw std::runtime_error("Failed to block termination signals: " + errno_message(rc));
    }

    fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd_ < 0) {
        int err = errno;
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
        throw std::runtime_error("Failed to create signalfd: " + errno_message(err));
    }
}

SignalWatcher::~SignalWatcher() {
    if (fd_ >= 0) close(fd_);
    pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
}

int SignalWatcher::take_pending() {
    struct signalfd_siginfo info;
    ssize_t n = read(fd_, &info, sizeof(info));
    if (n != static_cast<ssize_t>(sizeof(info))) return 0;
    return static_cast<int>(info.ssi_signo);
}

int SignalWatcher::wait(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        int sig = take_pending();
        if (sig != 0) return sig;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) return 0;

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ret = poll(&pfd, 1, static_cast<int>(remaining));
        if (ret < 0 && errno != EINTR) {
            throw std::runtime_error("poll on signalfd failed: " + errno_message(errno));
        }
    }
}

} // namespace platform
