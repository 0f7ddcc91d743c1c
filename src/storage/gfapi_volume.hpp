#pragma once

#include "volume.hpp"
#include <string>

// libgfapi forward declarations
struct glfs;
typedef struct glfs glfs_t;

// Volume session through the gluster client library. Endpoint failover
// across volfile servers is libgfapi's job; we only list them in order.
class GfapiVolume : public Volume {
public:
    // glfs_new + glfs_set_volfile_server for every endpoint +
    // glfs_set_logging + glfs_init. Throws StorageError.
    explicit GfapiVolume(const Config& config);
    ~GfapiVolume() override;

    GfapiVolume(const GfapiVolume&) = delete;
    GfapiVolume& operator=(const GfapiVolume&) = delete;

    std::unique_ptr<VolumeFile> open_or_create(const std::string& path,
                                               unsigned mode) override;

    // The file's GFID via the glusterfs.gfid.string virtual xattr.
    FileIdentity identify(const std::string& path) override;

    std::string describe() const override;

private:
    glfs_t* fs_ = nullptr;
    std::string volume_name_;
    std::string servers_;
};
