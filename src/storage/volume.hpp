#pragma once

#include <cstdint>
#include <memory>
#include <string>

class Config;

// Stable identity of one file instance on the volume (GFID on gluster,
// dev:inode on a mount). Two different files never share a token, so a
// changed token means the path was deleted or replaced.
struct FileIdentity {
    std::string token;

    bool empty() const { return token.empty(); }
    bool operator==(const FileIdentity& other) const { return token == other.token; }
    bool operator!=(const FileIdentity& other) const { return token != other.token; }
};

struct FileStat {
    uint64_t size = 0;
    uint64_t nlink = 0;
};

// An open file on the volume. Closing it (destruction) releases any lock
// taken through it.
class VolumeFile {
public:
    virtual ~VolumeFile() = default;

    // Non-blocking exclusive lock on byte 0. Throws LockContention if another
    // holder has it, StorageError otherwise.
    virtual void lock_exclusive() = 0;

    // Stat through the handle. Throws StorageError if it is no longer valid.
    virtual FileStat stat() = 0;

    // Throw StorageError on failure.
    virtual void set_xattr(const std::string& name, const std::string& value) = 0;
    virtual void remove_xattr(const std::string& name) = 0;
};

// Session against a clustered volume: the only storage surface the helper
// needs. Paths are relative to the volume root.
class Volume {
public:
    virtual ~Volume() = default;

    // Open path read-write, creating it with mode if it does not exist.
    // Throws StorageError.
    virtual std::unique_ptr<VolumeFile> open_or_create(const std::string& path,
                                                       unsigned mode) = 0;

    // Resolve path to its current identity. Throws StorageError.
    virtual FileIdentity identify(const std::string& path) = 0;

    // For log messages.
    virtual std::string describe() const = 0;
};

// Connect to the volume the configuration names: through libgfapi and the
// volfile servers, or through mount_path when one is set.
// Throws StorageError.
std::unique_ptr<Volume> connect_volume(const Config& config);
