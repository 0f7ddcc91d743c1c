#pragma once

#include <initializer_list>
#include <signal.h>

namespace platform {

// Turns asynchronous termination signals into a readable descriptor.
//
// The constructor blocks the given signals on the calling thread and opens
// a signalfd for them; threads started afterwards inherit the mask, so the
// signals are only ever observed by polling fd(). The destructor restores
// the previous mask.
class SignalWatcher {
public:
    explicit SignalWatcher(std::initializer_list<int> signals);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    int fd() const { return fd_; }

    // Consume one pending signal without blocking. Returns 0 if none.
    int take_pending();

    // Wait up to timeout_ms for a signal. Returns it, or 0 on timeout.
    int wait(int timeout_ms);

private:
    int fd_ = -1;
    sigset_t old_mask_;
};

} // namespace platform
