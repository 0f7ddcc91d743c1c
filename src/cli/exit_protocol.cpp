#include "exit_protocol.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

StatusChannel::StatusChannel(std::ostream& out, std::ostream& err)
    : out_(out), err_(err) {}

void StatusChannel::emit(HandshakeStatus status) {
    if (emitted_) {
        log_warning(fmt::format("handshake already sent, dropping status {}",
                                to_exit_code(status)));
        return;
    }
    emitted_ = true;
    out_ << to_exit_code(status) << std::flush;
    log_debug(fmt::format("handshake status {}", to_exit_code(status)));
}

int StatusChannel::finish(HandshakeStatus status) {
    if (!emitted_) emit(status);
    return to_exit_code(status);
}

void StatusChannel::diagnostic(const std::string& msg, LogLevel level) {
    reclock_log(level, msg);
    err_ << PROGRAM_NAME << ": " << msg << std::endl;
}
