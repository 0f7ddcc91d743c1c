#include "liveness_monitor.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/deadline.hpp>
#include <platform/platform.hpp>
#include <platform/signals.hpp>
#include <storage/storage_session.hpp>
#include <fmt/format.h>
#include <csignal>
#include <cstring>

// ── Construction ────────────────────────────────────────────

LivenessMonitor::LivenessMonitor(std::shared_ptr<StorageSession> session, MonitorOptions options,
                                 platform::SignalWatcher& signals)
    : session_(std::move(session)), options_(std::move(options)), signals_(signals),
      initial_ppid_(platform::parent_pid()) {}

// ── Loop ────────────────────────────────────────────────────

MonitorResult LivenessMonitor::run() {
    log_info(fmt::format("monitoring {} every {}ms (probe deadline {}ms, parent pid {})",
                         session_->reclock_path(), options_.check_interval_ms,
                         options_.liveness_timeout_ms, options_.parent_pid));

    for (;;) {
        if (auto result = check_once()) {
            return *result;
        }

        if (options_.on_tick) options_.on_tick();

        int sig = signals_.wait(options_.check_interval_ms);
        if (sig != 0) {
            MonitorResult result;
            result.outcome = MonitorOutcome::Signaled;
            result.signal = sig;
            result.reason = fmt::format("received {}", strsignal(sig));
            return result;
        }
    }
}

std::optional<MonitorResult> LivenessMonitor::check_once() {
    MonitorResult result;

    // The probe owns a reference to the session: it outlives us if abandoned
    auto session = session_;
    auto probe = platform::run_with_deadline(
        [session]() { session->liveness_probe(); },
        options_.liveness_timeout_ms, &signals_);

    switch (probe.outcome) {
        case platform::DeadlineOutcome::TimedOut:
            result.outcome = MonitorOutcome::LivenessLost;
            result.reason = fmt::format("liveness probe did not finish within {}ms",
                                        options_.liveness_timeout_ms);
            result.abandoned_probe = true;
            return result;

        case platform::DeadlineOutcome::Interrupted:
            result.outcome = MonitorOutcome::Signaled;
            result.signal = probe.signal;
            result.reason = fmt::format("received {} during liveness probe", strsignal(probe.signal));
            result.abandoned_probe = true;
            return result;

        case platform::DeadlineOutcome::Completed:
            break;
    }

    if (probe.error) {
        result.outcome = MonitorOutcome::LivenessLost;
        try {
            std::rethrow_exception(probe.error);
        } catch (const LivenessFailure& e) {
            result.reason = e.what();
        } catch (const StorageError& e) {
            result.reason = fmt::format("storage error: {}", e.what());
        } catch (const std::exception& e) {
            result.reason = fmt::format("unexpected probe failure: {}", e.what());
        } catch (...) {
            result.reason = "unexpected probe failure of unknown type";
        }
        return result;
    }

    if (!parent_alive()) {
        result.outcome = MonitorOutcome::ParentExited;
        result.reason = fmt::format("parent process {} has exited", options_.parent_pid);
        return result;
    }

    return std::nullopt;
}

bool LivenessMonitor::parent_alive() const {
    if (options_.parent_pid <= 0) return true;
    // Reparented: the spawner died even if its pid has been reused since
    if (options_.parent_pid == initial_ppid_ && platform::parent_pid() != initial_ppid_) {
        return false;
    }
    return platform::process_exists(options_.parent_pid);
}

int exit_code_for(MonitorOutcome outcome) {
    switch (outcome) {
        case MonitorOutcome::ParentExited:
        case MonitorOutcome::Signaled:
            return 0;
        case MonitorOutcome::LivenessLost:
            return 1;
    }
    return 1;
}
