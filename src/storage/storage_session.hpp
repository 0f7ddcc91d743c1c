#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "volume.hpp"

class Config;

// What we own once the recovery lock is taken. Populated only by
// StorageSession::acquire_lock(); closing the file releases the lock.
struct LockHandle {
    std::unique_ptr<VolumeFile> file;
    FileIdentity identity;
};

using VolumeFactory = std::function<std::unique_ptr<Volume>(const Config&)>;

class StorageSession {
public:
    // Open a session against the configured volume. Throws StorageError.
    static std::shared_ptr<StorageSession> connect(const Config& config,
                                                   const VolumeFactory& factory = connect_volume);

    StorageSession(std::unique_ptr<Volume> volume, std::string reclock_path);

    StorageSession(const StorageSession&) = delete;
    StorageSession& operator=(const StorageSession&) = delete;

    // Open (creating with mode 0600 if absent) and exclusively lock the
    // recovery lock file, then record its identity.
    // Throws LockContention if someone else holds it, StorageError otherwise.
    void acquire_lock();

    bool locked() const { return lock_.has_value(); }

    // Prove the lock is still ours and the volume still answers:
    //  - stat the held handle,
    //  - re-resolve the path and compare identities,
    //  - set and remove a canary xattr through the handle.
    // Throws LivenessFailure.
    void liveness_probe();

    const std::string& reclock_path() const { return reclock_path_; }
    const FileIdentity& identity() const;
    std::string describe() const { return volume_->describe(); }

private:
    // Declared before lock_ so the handle closes before the session does
    std::unique_ptr<Volume> volume_;
    std::string reclock_path_;
    std::optional<LockHandle> lock_;
};
