#pragma once

#include "volume.hpp"
#include <filesystem>

// Volume reached through a local mount of the clustered filesystem
// (FUSE client, NFS, or a plain directory in tests).
//
// Locks are open-file-description locks (F_OFD_SETLK): they belong to the
// handle rather than the process, so they survive other descriptors on the
// same file being closed and conflict between two handles of one process.
class PosixVolume : public Volume {
public:
    // Throws StorageError if root is not an accessible directory.
    PosixVolume(std::string volume_name, std::filesystem::path root);

    std::unique_ptr<VolumeFile> open_or_create(const std::string& path,
                                               unsigned mode) override;
    FileIdentity identify(const std::string& path) override;
    std::string describe() const override;

private:
    std::string volume_name_;
    std::filesystem::path root_;
};
