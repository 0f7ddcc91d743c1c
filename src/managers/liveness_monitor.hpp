#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

class StorageSession;

namespace platform { class SignalWatcher; }

enum class MonitorOutcome {
    ParentExited,   // spawning process is gone: normal shutdown
    Signaled,       // termination request: normal shutdown
    LivenessLost,   // probe failed, timed out, or the lock file was replaced
};

struct MonitorResult {
    MonitorOutcome outcome = MonitorOutcome::LivenessLost;
    std::string reason;
    int signal = 0;
    bool abandoned_probe = false;   // a probe thread may still be running
};

struct MonitorOptions {
    int check_interval_ms = 1000;
    int liveness_timeout_ms = 10000;
    int parent_pid = 0;                 // <= 0 disables the parent watch
    std::function<void()> on_tick;      // once per iteration, after the checks
};

// The RUNNING state: once per check interval, run the liveness probe under
// a hard deadline and confirm the spawning process still exists. Returns
// when any of that stops being true, or a termination signal arrives. A
// single failed probe is final; nothing is retried.
class LivenessMonitor {
public:
    LivenessMonitor(std::shared_ptr<StorageSession> session, MonitorOptions options,
                    platform::SignalWatcher& signals);

    MonitorResult run();

private:
    std::optional<MonitorResult> check_once();
    bool parent_alive() const;

    std::shared_ptr<StorageSession> session_;
    MonitorOptions options_;
    platform::SignalWatcher& signals_;
    int initial_ppid_;
};

// Process exit code for a terminal monitor outcome.
int exit_code_for(MonitorOutcome outcome);
