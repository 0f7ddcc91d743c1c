#include "gfapi_volume.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <glusterfs/api/glfs.h>

namespace {

// Absolute path inside the volume, the form libgfapi expects.
std::string volume_path(const std::string& path) {
    return path.empty() || path.front() != '/' ? "/" + path : path;
}

class GfapiFile : public VolumeFile {
public:
    GfapiFile(glfs_fd_t* fd, std::string path) : fd_(fd), path_(std::move(path)) {}

    ~GfapiFile() override {
        if (fd_ && glfs_close(fd_) != 0) {
            log_warning(fmt::format("glfs_close on {} failed: {}", path_, errno_message(errno)));
        }
    }

    GfapiFile(const GfapiFile&) = delete;
    GfapiFile& operator=(const GfapiFile&) = delete;

    void lock_exclusive() override {
        struct flock fl = {};
        fl.l_type = F_WRLCK;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 1;
        if (glfs_posix_lock(fd_, F_SETLK, &fl) == 0) return;

        int err = errno;
        if (err == EAGAIN || err == EACCES || err == EWOULDBLOCK) {
            throw LockContention(fmt::format("{} is locked by another holder", path_));
        }
        throw StorageError(fmt::format("Failed to lock {}: {}", path_, errno_message(err)));
    }

    FileStat stat() override {
        struct stat st;
        if (glfs_fstat(fd_, &st) != 0) {
            throw StorageError(fmt::format("glfs_fstat on {} failed: {}", path_, errno_message(errno)));
        }
        FileStat out;
        out.size = static_cast<uint64_t>(st.st_size);
        out.nlink = static_cast<uint64_t>(st.st_nlink);
        return out;
    }

    void set_xattr(const std::string& name, const std::string& value) override {
        if (glfs_fsetxattr(fd_, name.c_str(), value.data(), value.size(), 0) != 0) {
            throw StorageError(fmt::format("Failed to set {} on {}: {}",
                                           name, path_, errno_message(errno)));
        }
    }

    void remove_xattr(const std::string& name) override {
        if (glfs_fremovexattr(fd_, name.c_str()) != 0) {
            throw StorageError(fmt::format("Failed to remove {} from {}: {}",
                                           name, path_, errno_message(errno)));
        }
    }

private:
    glfs_fd_t* fd_;
    std::string path_;
};

} // namespace

GfapiVolume::GfapiVolume(const Config& config) : volume_name_(config.volume_name()) {
    fs_ = glfs_new(volume_name_.c_str());
    if (!fs_) {
        throw StorageError(fmt::format("glfs_new({}) failed: {}", volume_name_, errno_message(errno)));
    }

    for (const auto& server : config.volfile_servers()) {
        if (!servers_.empty()) servers_ += ",";
        servers_ += fmt::format("{}://{}:{}", server.proto, server.host, server.port);
        if (glfs_set_volfile_server(fs_, server.proto.c_str(), server.host.c_str(), server.port) != 0) {
            int err = errno;
            glfs_fini(fs_);
            fs_ = nullptr;
            throw StorageError(fmt::format("Invalid volfile server {}: {}",
                                           server.host, errno_message(err)));
        }
    }

    if (!config.log_file().empty() &&
        glfs_set_logging(fs_, config.log_file().c_str(), config.log_level()) != 0) {
        // Only the client library's own log is affected
        log_warning(fmt::format("glfs_set_logging({}) failed: {}",
                                config.log_file(), errno_message(errno)));
    }

    if (glfs_init(fs_) != 0) {
        int err = errno;
        glfs_fini(fs_);
        fs_ = nullptr;
        throw StorageError(fmt::format("Failed to connect to volume {} via {}: {}",
                                       volume_name_, servers_, errno_message(err)));
    }
}

GfapiVolume::~GfapiVolume() {
    if (fs_) glfs_fini(fs_);
}

std::unique_ptr<VolumeFile> GfapiVolume::open_or_create(const std::string& path,
                                                        unsigned mode) {
    std::string full = volume_path(path);

    for (int attempt = 0; attempt < 2; ++attempt) {
        glfs_fd_t* fd = glfs_open(fs_, full.c_str(), O_RDWR);
        if (fd) return std::make_unique<GfapiFile>(fd, full);
        if (errno != ENOENT) {
            throw StorageError(fmt::format("Failed to open {}: {}", full, errno_message(errno)));
        }

        fd = glfs_creat(fs_, full.c_str(), O_RDWR | O_CREAT | O_EXCL, static_cast<mode_t>(mode));
        if (fd) return std::make_unique<GfapiFile>(fd, full);
        if (errno != EEXIST) {
            throw StorageError(fmt::format("Failed to create {}: {}", full, errno_message(errno)));
        }
    }
    throw StorageError(fmt::format("{} keeps appearing and disappearing", full));
}

FileIdentity GfapiVolume::identify(const std::string& path) {
    std::string full = volume_path(path);
    char buf[64];
    ssize_t n = glfs_getxattr(fs_, full.c_str(), GFID_XATTR, buf, sizeof(buf));
    if (n <= 0) {
        throw StorageError(fmt::format("Failed to resolve {}: {}", full,
                                       n < 0 ? errno_message(errno) : "empty gfid"));
    }
    std::string token(buf, static_cast<size_t>(n));
    while (!token.empty() && token.back() == '\0') token.pop_back();
    trim(token);
    return FileIdentity{token};
}

std::string GfapiVolume::describe() const {
    return fmt::format("{} via {}", volume_name_, servers_);
}
