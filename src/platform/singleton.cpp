#include "singleton.hpp"
#include "platform.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <stdexcept>

#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>

namespace {

int read_pid_fd(int fd) {
    char buf[32];
    ssize_t n = pread(fd, buf, sizeof(buf) - 1, 0);
    if (n <= 0) return 0;
    std::string text(buf, static_cast<size_t>(n));
    trim(text);
    int pid = safe_stoi(text, 0);
    return pid > 0 ? pid : 0;
}

// True if fd is still the file the path names. Another instance or a
// --kill may have unlinked our record and a new one taken its place.
bool same_file(int fd, const std::string& path) {
    struct stat fd_st, path_st;
    if (fstat(fd, &fd_st) != 0) return false;
    if (stat(path.c_str(), &path_st) != 0) return false;
    return fd_st.st_dev == path_st.st_dev && fd_st.st_ino == path_st.st_ino;
}

// Remove path only while it is still the file behind fd.
void unlink_if_same(int fd, const std::string& path) {
    if (same_file(fd, path)) unlink(path.c_str());
}

} // namespace

PidFile::PidFile(std::string path) : path_(std::move(path)) {}

PidFile::~PidFile() {
    release();
}

bool PidFile::acquire() {
    if (held()) return true;

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path_).parent_path(), ec);

    // Retry while the record we locked turns out to be unlinked already
    for (int attempt = 0; attempt < 5; ++attempt) {
        int fd = open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw std::runtime_error(fmt::format(
                "Failed to open pid record {}: {}", path_, errno_message(errno)));
        }

        if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
            int err = errno;
            if (err == EWOULDBLOCK) {
                holder_pid_ = read_pid_fd(fd);
                close(fd);
                return false;
            }
            close(fd);
            throw std::runtime_error(fmt::format(
                "Failed to lock pid record {}: {}", path_, errno_message(err)));
        }

        if (!same_file(fd, path_)) {
            close(fd);
            continue;
        }

        // Unlocked record left by an instance that is gone
        stale_pid_ = read_pid_fd(fd);
        if (ftruncate(fd, 0) != 0) {
            int err = errno;
            close(fd);
            throw std::runtime_error(fmt::format(
                "Failed to clear stale pid record {}: {}", path_, errno_message(err)));
        }

        fd_ = fd;
        return true;
    }

    throw std::runtime_error(fmt::format(
        "Pid record {} keeps being replaced, giving up", path_));
}

void PidFile::write_pid(int pid) {
    if (!held()) {
        throw std::runtime_error("Pid record " + path_ + " is not held");
    }
    std::string text = fmt::format("{}\n", pid);
    if (ftruncate(fd_, 0) != 0 ||
        pwrite(fd_, text.data(), text.size(), 0) != static_cast<ssize_t>(text.size())) {
        throw std::runtime_error(fmt::format(
            "Failed to write pid record {}: {}", path_, errno_message(errno)));
    }
}

void PidFile::release() {
    if (fd_ < 0) return;
    unlink_if_same(fd_, path_);
    close(fd_);  // flock is released automatically when fd is closed
    fd_ = -1;
}

int read_pid_record(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return 0;
    int pid = read_pid_fd(fd);
    close(fd);
    return pid;
}

Result<int> kill_recorded_instance(const std::string& path, int wait_ms) {
    int fd = open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) return Result<int>::Ok(0);
        return Result<int>::Err(fmt::format(
            "Failed to open pid record {}: {}", path, errno_message(errno)));
    }

    if (flock(fd, LOCK_EX | LOCK_NB) == 0) {
        // Nobody holds it: stale record, nothing to signal
        unlink_if_same(fd, path);
        close(fd);
        return Result<int>::Ok(0);
    }

    // Held but empty: the instance is still acquiring and writes its pid
    // once it is leader. Wait for that, or for it to give up.
    int pid = read_pid_fd(fd);
    for (int waited = 0; pid <= 0 && waited < wait_ms; waited += 100) {
        platform::sleep_ms(100);
        if (flock(fd, LOCK_EX | LOCK_NB) == 0) {
            unlink_if_same(fd, path);
            close(fd);
            return Result<int>::Ok(0);
        }
        pid = read_pid_fd(fd);
    }
    close(fd);
    if (pid <= 0) {
        return Result<int>::Err(fmt::format(
            "Pid record {} is held but no pid was written within {}ms", path, wait_ms));
    }

    if (kill(pid, SIGTERM) != 0) {
        int err = errno;
        if (err != ESRCH) {
            return Result<int>::Err(fmt::format(
                "Failed to signal pid {}: {}", pid, errno_message(err)));
        }
        pid = 0;  // exited between our lock probe and the signal
    }

    if (unlink(path.c_str()) != 0 && errno != ENOENT) {
        return Result<int>::Err(fmt::format(
            "Failed to remove pid record {}: {}", path, errno_message(errno)));
    }
    return Result<int>::Ok(pid);
}
