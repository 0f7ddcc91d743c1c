#pragma once
#include <string>
#include <core/constants.hpp>
#include <core/types.hpp>

// Pid record doubling as the single-instance lock for this host.
//
// The record file is held with flock() for the lifetime of the running
// instance, so "someone is running" and "who" are answered by the same file:
// a locked record belongs to a live instance (the kernel drops the lock when
// the holder dies, even on crash), an unlocked one is stale.
//
// The pid is written separately via write_pid() once the recovery lock has
// been taken. The destructor removes the record before releasing the lock.
class PidFile {
public:
    explicit PidFile(std::string path);
    ~PidFile();

    PidFile(const PidFile&) = delete;
    PidFile& operator=(const PidFile&) = delete;

    // Take the record. Returns false if another live instance holds it
    // (holder_pid() then reports what it recorded). A stale record is
    // truncated and reused. Throws std::runtime_error on I/O failure.
    bool acquire();

    // Returns true if this instance holds the record.
    bool held() const { return fd_ >= 0; }

    // Record our pid. Requires held(). Throws std::runtime_error on failure.
    void write_pid(int pid);

    // Remove the record and drop the lock. Idempotent.
    void release();

    const std::string& path() const { return path_; }

    // Pid found in a record held by another instance (0 if none written yet).
    int holder_pid() const { return holder_pid_; }

    // Pid left behind by a dead instance, found during acquire() (0 if none).
    int stale_pid() const { return stale_pid_; }

private:
    std::string path_;
    int fd_ = -1;
    int holder_pid_ = 0;
    int stale_pid_ = 0;
};

// Pid stored in the record at path. 0 if absent or unparsable.
int read_pid_record(const std::string& path);

// Stop the instance owning the record at path: SIGTERM to the recorded pid,
// then remove the record. Returns the pid signalled, or 0 if no live
// instance was recorded (a stale record is still removed). An instance that
// holds the record but is still acquiring is given up to wait_ms to record
// its pid.
Result<int> kill_recorded_instance(const std::string& path,
                                   int wait_ms = KILL_PID_WAIT_MS);
