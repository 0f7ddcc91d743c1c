#pragma once

#include <ostream>
#include <string>
#include <core/constants.hpp>
#include <storage/storage_session.hpp>

struct CliOptions {
    std::string config_path = DEFAULT_CONFIG_PATH;
    std::string pid_path = DEFAULT_PID_PATH;
    bool kill = false;
};

// One invocation of the helper. Handshake tokens go to `out`, diagnostics to
// `err`; run() returns the process exit code and never throws.
class ReclockCLI {
public:
    ReclockCLI(std::ostream& out, std::ostream& err,
               VolumeFactory factory = connect_volume);

    int run(const CliOptions& options);

    // Acquire the recovery lock and watch it until we can no longer prove
    // we hold it, the spawner goes away, or we are told to stop.
    int run_helper(const CliOptions& options);

    // Stop the instance recorded in the pid file.
    int run_kill(const std::string& pid_path);

    // Process whose disappearance ends the watch (default: our parent).
    void set_parent_pid(int pid) { parent_pid_ = pid; }

    // True if a worker thread was left blocked in the storage client; the
    // process must then exit without running static destructors.
    bool abandoned_work() const { return abandoned_work_; }

private:
    std::ostream& out_;
    std::ostream& err_;
    VolumeFactory factory_;
    int parent_pid_ = 0;
    bool abandoned_work_ = false;
};
