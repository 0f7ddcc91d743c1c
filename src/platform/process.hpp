#pragma once

#include <string>
#include <vector>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running. Reaps it once it has exited.
    bool running();

    // Wait for the process to exit. Returns exit code, or -1 if it was
    // killed by a signal or is still running when timeout_ms expires.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // SIGTERM, then SIGKILL if it is still around after grace_ms.
    void terminate(int grace_ms = 2000);

    int native_handle() const { return pid_; }

private:
    void record_status(int status);

    int pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& output_log);
};

// Spawn a child process. Its signal mask is cleared, stdin is /dev/null and
// stdout/stderr are appended to output_log (or /dev/null when empty), so the
// child can never write into our own stdout.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& output_log = "");

} // namespace platform
