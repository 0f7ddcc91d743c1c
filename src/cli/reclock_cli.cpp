#include "reclock_cli.hpp"
#include "exit_protocol.hpp"
#include <core/config.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <managers/leader_notifier.hpp>
#include <managers/liveness_monitor.hpp>
#include <platform/deadline.hpp>
#include <platform/platform.hpp>
#include <platform/signals.hpp>
#include <platform/singleton.hpp>
#include <fmt/format.h>
#include <csignal>
#include <cstring>
#include <memory>
#include <unistd.h>

ReclockCLI::ReclockCLI(std::ostream& out, std::ostream& err, VolumeFactory factory)
    : out_(out), err_(err), factory_(std::move(factory)),
      parent_pid_(platform::parent_pid()) {}

int ReclockCLI::run(const CliOptions& options) {
    if (options.kill) return run_kill(options.pid_path);
    return run_helper(options);
}

// ── Kill mode ───────────────────────────────────────────────

int ReclockCLI::run_kill(const std::string& pid_path) {
    StatusChannel status(out_, err_);
    auto result = kill_recorded_instance(pid_path);
    if (result.is_err()) {
        status.diagnostic(result.error);
        return to_exit_code(HandshakeStatus::Error);
    }
    if (result.value > 0) {
        status.diagnostic(fmt::format("sent SIGTERM to pid {}", result.value), LogLevel::Info);
    } else {
        status.diagnostic("no running instance recorded in " + pid_path, LogLevel::Info);
    }
    return 0;
}

// ── Helper mode ─────────────────────────────────────────────

int ReclockCLI::run_helper(const CliOptions& options) {
    StatusChannel status(out_, err_);

    try {
        // Before any thread exists, so every worker inherits the blocked mask
        platform::SignalWatcher signals({SIGTERM, SIGINT, SIGHUP});

        // ── ACQUIRING ───────────────────────────────────────
        auto config_result = Config::load(options.config_path);
        if (config_result.is_err()) {
            status.diagnostic(config_result.error);
            return status.finish(HandshakeStatus::Error);
        }
        const Config config = config_result.value;
        log_init(config.log_file(), config.log_level());
        log_info(fmt::format("starting, pid {}, volume {}, lock {}",
                             getpid(), config.volume_name(), config.reclock_path()));

        PidFile pid_file(options.pid_path);
        if (!pid_file.acquire()) {
            status.diagnostic(pid_file.holder_pid() > 0
                ? fmt::format("already running as pid {}", pid_file.holder_pid())
                : std::string("already running"), LogLevel::Info);
            return status.finish(HandshakeStatus::NotLeader);
        }
        if (pid_file.stale_pid() > 0) {
            log_info(fmt::format("reclaimed stale pid record of pid {}", pid_file.stale_pid()));
        }

        // Connect and lock on a worker so a hung volume or a termination
        // request cannot keep us here
        auto acquired = std::make_shared<std::shared_ptr<StorageSession>>();
        auto factory = factory_;
        auto attempt = platform::run_with_deadline(
            [acquired, config, factory]() {
                auto session = StorageSession::connect(config, factory);
                session->acquire_lock();
                *acquired = session;
            },
            config.acquire_timeout() * 1000, &signals);

        if (attempt.outcome == platform::DeadlineOutcome::TimedOut) {
            abandoned_work_ = true;
            status.diagnostic(fmt::format("timed out after {}s acquiring {}",
                                          config.acquire_timeout(), config.reclock_path()));
            return status.finish(HandshakeStatus::Error);
        }
        if (attempt.outcome == platform::DeadlineOutcome::Interrupted) {
            abandoned_work_ = true;
            status.diagnostic(fmt::format("received {} while acquiring {}",
                                          strsignal(attempt.signal), config.reclock_path()));
            return status.finish(HandshakeStatus::Error);
        }
        if (attempt.error) {
            try {
                std::rethrow_exception(attempt.error);
            } catch (const LockContention& e) {
                status.diagnostic(fmt::format("not leader: {}", e.what()), LogLevel::Info);
                return status.finish(HandshakeStatus::NotLeader);
            } catch (const StorageError& e) {
                status.diagnostic(e.what());
                return status.finish(HandshakeStatus::Error);
            } catch (const std::exception& e) {
                status.diagnostic(fmt::format("failed to acquire {}: {}", config.reclock_path(), e.what()));
                return status.finish(HandshakeStatus::Error);
            } catch (...) {
                status.diagnostic("failed to acquire " + config.reclock_path() + ": unknown error");
                return status.finish(HandshakeStatus::Error);
            }
        }
        std::shared_ptr<StorageSession> session = *acquired;

        // ── Handshake, then the pid record ──────────────────
        status.emit(HandshakeStatus::Leader);
        log_info(fmt::format("recovery lock {} acquired on {}",
                             config.reclock_path(), session->describe()));
        pid_file.write_pid(getpid());

        LeaderNotifier notifier(config.notify_command(), config.log_file(),
                                config.liveness_timeout());
        notifier.notify();

        // ── RUNNING ─────────────────────────────────────────
        MonitorOptions monitor_options;
        monitor_options.check_interval_ms = config.check_interval() * 1000;
        monitor_options.liveness_timeout_ms = config.liveness_timeout() * 1000;
        monitor_options.parent_pid = parent_pid_;
        monitor_options.on_tick = [&notifier]() { notifier.poll(); };

        LivenessMonitor monitor(session, monitor_options, signals);
        MonitorResult result = monitor.run();

        // ── TERMINATING ─────────────────────────────────────
        abandoned_work_ = result.abandoned_probe;
        if (result.outcome == MonitorOutcome::LivenessLost) {
            status.diagnostic("lost recovery lock: " + result.reason);
        } else {
            log_info("shutting down: " + result.reason);
        }
        return exit_code_for(result.outcome);
    } catch (const std::exception& e) {
        status.diagnostic(fmt::format("unexpected error: {}", e.what()));
        return status.finish(HandshakeStatus::Error);
    }
}
