#include "leader_notifier.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <exception>

LeaderNotifier::LeaderNotifier(std::vector<std::string> command, std::string output_log,
                               int timeout_secs)
    : command_(std::move(command)), output_log_(std::move(output_log)),
      timeout_(timeout_secs) {}

void LeaderNotifier::notify() noexcept {
    if (command_.empty() || pending_) return;

    try {
        std::vector<std::string> args(command_.begin() + 1, command_.end());
        child_ = platform::spawn(command_.front(), args, output_log_);
        if (!child_.valid()) {
            log_warning(fmt::format("leader notification: failed to start {}", command_.front()));
            return;
        }
        started_ = std::chrono::steady_clock::now();
        pending_ = true;
        log_debug(fmt::format("leader notification: started {} (pid {})",
                              command_.front(), child_.native_handle()));
    } catch (const std::exception& e) {
        log_warning(fmt::format("leader notification failed: {}", e.what()));
    }
}

void LeaderNotifier::poll() noexcept {
    if (!pending_) return;

    try {
        if (!child_.running()) {
            pending_ = false;
            int code = child_.wait(0);
            if (code != 0) {
                log_warning(fmt::format("leader notification: {} exited with {}",
                                        command_.front(), code));
            } else {
                log_info("leader notification delivered");
            }
            return;
        }

        if (std::chrono::steady_clock::now() - started_ >= timeout_) {
            log_warning(fmt::format("leader notification: {} still running after {}s, killing it",
                                    command_.front(), timeout_.count()));
            child_.terminate(NOTIFIER_KILL_GRACE_MS);
            pending_ = false;
        }
    } catch (const std::exception& e) {
        pending_ = false;
        log_warning(fmt::format("leader notification failed: {}", e.what()));
    }
}
