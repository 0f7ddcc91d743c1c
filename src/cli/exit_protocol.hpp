#pragma once

#include <ostream>
#include <string>
#include <core/log.hpp>

// Handshake tokens read by the cluster manager, one per invocation.
// They double as the process exit code of the one-shot paths.
enum class HandshakeStatus : int {
    Leader = 0,      // lock acquired, helper keeps running as watchdog
    NotLeader = 1,   // contended, already running, or liveness lost
    Error = 3,       // configuration or unexpected operational error
};

// The status side of the exit protocol. The token goes to `out` as a single
// character, flushed immediately; human-readable diagnostics go to `err`
// (and to the log).
class StatusChannel {
public:
    StatusChannel(std::ostream& out, std::ostream& err);

    // Write the token. Only the first call has any effect.
    void emit(HandshakeStatus status);

    // Emit (if nothing was emitted yet) and return the matching exit code.
    int finish(HandshakeStatus status);

    // "reclock-helper: <msg>" on stderr, and msg to the log at level.
    void diagnostic(const std::string& msg, LogLevel level = LogLevel::Error);

private:
    std::ostream& out_;
    std::ostream& err_;
    bool emitted_ = false;
};

inline int to_exit_code(HandshakeStatus status) {
    return static_cast<int>(status);
}
