#pragma once

#include <string>
#include <vector>
#include <utility>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// One volfile server endpoint, tried in order by the storage client.
struct VolfileServer {
    std::string host;
    std::string proto = DEFAULT_VOLFILE_PROTO;
    int port = DEFAULT_VOLFILE_PORT;
};

// Configuration structures
struct ReclockConfig {
    std::vector<VolfileServer> volfile_servers;
    std::string reclock_path;                    // relative to the volume root
    std::string volume_name;
    std::string mount_path;                      // empty: talk to the volume through libgfapi
    std::string log_file = DEFAULT_LOG_FILE;
    int log_level = DEFAULT_LOG_LEVEL;
    int check_interval = DEFAULT_CHECK_INTERVAL_SECS;    // seconds between liveness probes
    int liveness_timeout = DEFAULT_LIVENESS_TIMEOUT_SECS; // hard deadline for a single probe
    int acquire_timeout = DEFAULT_ACQUIRE_TIMEOUT_SECS;   // connect + lock, bounded as well
    std::vector<std::string> notify_command;     // argv, empty disables the notifier
};
