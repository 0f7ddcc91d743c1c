#include "storage_session.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

std::shared_ptr<StorageSession> StorageSession::connect(const Config& config,
                                                        const VolumeFactory& factory) {
    auto volume = factory(config);
    if (!volume) {
        throw StorageError("No storage backend for volume " + config.volume_name());
    }
    log_info("connected to volume " + volume->describe());
    return std::make_shared<StorageSession>(std::move(volume), config.reclock_path());
}

StorageSession::StorageSession(std::unique_ptr<Volume> volume, std::string reclock_path)
    : volume_(std::move(volume)), reclock_path_(std::move(reclock_path)) {}

void StorageSession::acquire_lock() {
    if (lock_) return;

    auto file = volume_->open_or_create(reclock_path_, RECLOCK_FILE_MODE);
    file->lock_exclusive();

    // Identity is captured after the lock so it names the file we locked
    FileIdentity identity = volume_->identify(reclock_path_);
    if (identity.empty()) {
        throw StorageError("Empty identity for " + reclock_path_);
    }

    lock_ = LockHandle{std::move(file), std::move(identity)};
    log_info(fmt::format("locked {} (identity {})", reclock_path_, lock_->identity.token));
}

const FileIdentity& StorageSession::identity() const {
    static const FileIdentity none;
    return lock_ ? lock_->identity : none;
}

void StorageSession::liveness_probe() {
    if (!lock_) {
        throw LivenessFailure("Liveness probe without a held lock");
    }

    try {
        FileStat st = lock_->file->stat();
        if (st.nlink == 0) {
            throw LivenessFailure(fmt::format("{} was unlinked while locked", reclock_path_));
        }
    } catch (const StorageError& e) {
        throw LivenessFailure(fmt::format("Lock handle is no longer valid: {}", e.what()));
    }

    FileIdentity current;
    try {
        current = volume_->identify(reclock_path_);
    } catch (const StorageError& e) {
        throw LivenessFailure(fmt::format("Cannot resolve {}: {}", reclock_path_, e.what()));
    }
    if (current != lock_->identity) {
        throw LivenessFailure(fmt::format("{} was replaced: identity {} is now {}",
                                          reclock_path_, lock_->identity.token, current.token));
    }

    try {
        lock_->file->set_xattr(CANARY_XATTR, now_iso_ms());
        lock_->file->remove_xattr(CANARY_XATTR);
    } catch (const StorageError& e) {
        throw LivenessFailure(fmt::format("Write canary failed: {}", e.what()));
    }

    log_debug("liveness probe passed for " + reclock_path_);
}
