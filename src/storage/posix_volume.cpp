#include "posix_volume.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/xattr.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

class PosixFile : public VolumeFile {
public:
    PosixFile(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

    ~PosixFile() override {
        if (fd_ >= 0) close(fd_);
    }

    PosixFile(const PosixFile&) = delete;
    PosixFile& operator=(const PosixFile&) = delete;

    void lock_exclusive() override {
        struct flock fl = {};
        fl.l_type = F_WRLCK;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 1;
        if (fcntl(fd_, F_OFD_SETLK, &fl) == 0) return;

        int err = errno;
        if (err == EAGAIN || err == EACCES || err == EWOULDBLOCK) {
            throw LockContention(fmt::format("{} is locked by another holder", path_));
        }
        throw StorageError(fmt::format("Failed to lock {}: {}", path_, errno_message(err)));
    }

    FileStat stat() override {
        struct stat st;
        if (fstat(fd_, &st) != 0) {
            throw StorageError(fmt::format("fstat on {} failed: {}", path_, errno_message(errno)));
        }
        FileStat out;
        out.size = static_cast<uint64_t>(st.st_size);
        out.nlink = static_cast<uint64_t>(st.st_nlink);
        return out;
    }

    void set_xattr(const std::string& name, const std::string& value) override {
        if (fsetxattr(fd_, name.c_str(), value.data(), value.size(), 0) != 0) {
            throw StorageError(fmt::format("Failed to set {} on {}: {}",
                                           name, path_, errno_message(errno)));
        }
    }

    void remove_xattr(const std::string& name) override {
        if (fremovexattr(fd_, name.c_str()) != 0) {
            throw StorageError(fmt::format("Failed to remove {} from {}: {}",
                                           name, path_, errno_message(errno)));
        }
    }

private:
    int fd_;
    std::string path_;
};

} // namespace

PosixVolume::PosixVolume(std::string volume_name, fs::path root)
    : volume_name_(std::move(volume_name)), root_(std::move(root)) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        throw StorageError(fmt::format("Volume {} is not mounted at {}{}", volume_name_,
                                       root_.string(), ec ? ": " + ec.message() : ""));
    }
}

std::unique_ptr<VolumeFile> PosixVolume::open_or_create(const std::string& path,
                                                        unsigned mode) {
    std::string full = (root_ / path).string();

    // Open first; create exclusively only if absent, and reopen if another
    // node created it between the two calls.
    for (int attempt = 0; attempt < 2; ++attempt) {
        int fd = open(full.c_str(), O_RDWR | O_CLOEXEC);
        if (fd >= 0) return std::make_unique<PosixFile>(fd, full);
        if (errno != ENOENT) {
            throw StorageError(fmt::format("Failed to open {}: {}", full, errno_message(errno)));
        }

        fd = open(full.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, static_cast<mode_t>(mode));
        if (fd >= 0) return std::make_unique<PosixFile>(fd, full);
        if (errno != EEXIST) {
            throw StorageError(fmt::format("Failed to create {}: {}", full, errno_message(errno)));
        }
    }
    throw StorageError(fmt::format("{} keeps appearing and disappearing", full));
}

FileIdentity PosixVolume::identify(const std::string& path) {
    std::string full = (root_ / path).string();
    struct stat st;
    if (::stat(full.c_str(), &st) != 0) {
        throw StorageError(fmt::format("Failed to resolve {}: {}", full, errno_message(errno)));
    }
    return FileIdentity{fmt::format("{}:{}", static_cast<unsigned long long>(st.st_dev),
                                    static_cast<unsigned long long>(st.st_ino))};
}

std::string PosixVolume::describe() const {
    return fmt::format("{} (mounted at {})", volume_name_, root_.string());
}
