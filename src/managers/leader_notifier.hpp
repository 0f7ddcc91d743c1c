#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <platform/process.hpp>

// Tells the event-processing endpoint that this node became leader, by
// running a configured command. Strictly best effort: nothing it does may
// throw into, block, or otherwise alter the lock/exit protocol.
class LeaderNotifier {
public:
    // command: argv, empty disables notification.
    // output_log: where the child's stdout/stderr go (empty: /dev/null).
    // timeout_secs: how long the child may run before it is killed.
    LeaderNotifier(std::vector<std::string> command, std::string output_log, int timeout_secs);

    // Start the notifier. Returns immediately.
    void notify() noexcept;

    // Reap a finished notifier or kill one that overran its timeout.
    // Call periodically.
    void poll() noexcept;

    bool pending() const { return pending_; }

private:
    std::vector<std::string> command_;
    std::string output_log_;
    std::chrono::seconds timeout_;
    platform::ProcessHandle child_;
    std::chrono::steady_clock::time_point started_;
    bool pending_ = false;
};
