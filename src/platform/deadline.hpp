#pragma once

#include <exception>
#include <functional>

namespace platform {

class SignalWatcher;

enum class DeadlineOutcome {
    Completed,     // task returned or threw; see error
    TimedOut,      // task abandoned at the deadline
    Interrupted,   // a watched signal arrived first; see signal
};

struct DeadlineResult {
    DeadlineOutcome outcome = DeadlineOutcome::Completed;
    std::exception_ptr error;   // set when a completed task threw
    int signal = 0;
};

// Run task on its own thread and wait at most timeout_ms for it.
//
// On timeout or interruption the task is abandoned, never joined: it may be
// stuck in a call that cannot be cancelled. Anything it uses must therefore
// be owned by the task itself (capture shared_ptrs, not references).
// signals may be null.
DeadlineResult run_with_deadline(std::function<void()> task, int timeout_ms,
                                 SignalWatcher* signals);

} // namespace platform
