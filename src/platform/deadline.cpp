#include "deadline.hpp"
#include "signals.hpp"
#include <core/utils.hpp>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <thread>

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace platform {

namespace {

// Shared between the waiter and a possibly abandoned worker; whichever
// lets go last closes the eventfd.
struct TaskState {
    int event_fd = -1;
    std::atomic<bool> done{false};
    std::exception_ptr error;

    ~TaskState() {
        if (event_fd >= 0) close(event_fd);
    }
};

} // namespace

DeadlineResult run_with_deadline(std::function<void()> task, int timeout_ms,
                                 SignalWatcher* signals) {
    auto state = std::make_shared<TaskState>();
    state->event_fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (state->event_fd < 0) {
        throw std::runtime_error("Failed to create eventfd: " + errno_message(errno));
    }

    std::thread([state, task = std::move(task)]() {
        try {
            task();
        } catch (...) {
            state->error = std::current_exception();  // rethrown by the waiter
        }
        state->done.store(true, std::memory_order_release);
        uint64_t one = 1;
        ssize_t n = write(state->event_fd, &one, sizeof(one));
        (void)n;  // the waiter also checks done
    }).detach();

    DeadlineResult result;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    for (;;) {
        if (state->done.load(std::memory_order_acquire)) {
            result.outcome = DeadlineOutcome::Completed;
            result.error = state->error;
            return result;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.outcome = DeadlineOutcome::TimedOut;
            return result;
        }

        struct pollfd fds[2];
        fds[0].fd = state->event_fd;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        nfds_t nfds = 1;
        if (signals) {
            fds[1].fd = signals->fd();
            fds[1].events = POLLIN;
            fds[1].revents = 0;
            nfds = 2;
        }

        int ret = poll(fds, nfds, static_cast<int>(remaining));
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("poll failed while waiting for task: " + errno_message(errno));
        }

        if (signals && (fds[1].revents & POLLIN)) {
            int sig = signals->take_pending();
            if (sig != 0) {
                result.outcome = DeadlineOutcome::Interrupted;
                result.signal = sig;
                return result;
            }
        }
    }
}

} // namespace platform
