#pragma once

// ── Well-known paths ────────────────────────────────────────
constexpr const char* DEFAULT_CONFIG_PATH  = "/etc/reclock/reclock.conf";
constexpr const char* DEFAULT_PID_PATH     = "/var/run/reclock/reclock.pid";
constexpr const char* DEFAULT_LOG_FILE     = "/var/log/reclock/reclock.log";
constexpr const char* PROGRAM_NAME         = "reclock-helper";
constexpr const char* PROGRAM_VERSION      = "1.0.0";

// ── Timing (seconds) ────────────────────────────────────────
constexpr int DEFAULT_CHECK_INTERVAL_SECS   = 1;
constexpr int DEFAULT_LIVENESS_TIMEOUT_SECS = 10;
constexpr int DEFAULT_ACQUIRE_TIMEOUT_SECS  = 30;
constexpr int MAX_TIMING_SECS               = 2147483;  // largest value whose milliseconds fit an int
constexpr int KILL_PID_WAIT_MS              = (DEFAULT_ACQUIRE_TIMEOUT_SECS + 5) * 1000;  // --kill vs. an instance still acquiring
constexpr int NOTIFIER_KILL_GRACE_MS        = 500;   // SIGTERM → SIGKILL for a stuck notifier

// ── Storage ─────────────────────────────────────────────────
constexpr const char* DEFAULT_VOLFILE_PROTO = "tcp";
constexpr int DEFAULT_VOLFILE_PORT          = 24007;
constexpr int DEFAULT_LOG_LEVEL             = 4;     // gluster GF_LOG_ERROR
constexpr unsigned RECLOCK_FILE_MODE        = 0600;
constexpr const char* CANARY_XATTR          = "user.reclock.canary";
constexpr const char* GFID_XATTR            = "glusterfs.gfid.string";

// ── Leadership notification ─────────────────────────────────
constexpr const char* NOTIFY_PROGRAM        = "midclt";
constexpr const char* NOTIFY_METHOD         = "ctdb.event.process";
constexpr const char* NOTIFY_PAYLOAD        = R"({"event": "LEADER", "status": "SUCCESS"})";
