#pragma once

#include <filesystem>
#include <system_error>
#ifdef __unix__
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace segdl {

// Advisory, non-blocking exclusive lock on a file path.
// Unix uses flock() on the target itself (created if missing). Elsewhere, or
// when the descriptor cannot be opened, a sibling "<target>.lock" directory
// acts as the lock. locked() reports whether acquisition succeeded.
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& target)
        : target_(target) {
        acquire();
    }

    ~FileLock() { release(); }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return locked_; }

private:
    void acquire();
    void release();

    std::filesystem::path target_;
    bool locked_{false};
#ifdef __unix__
    int fd_{-1};
#endif
    bool used_dir_lock_{false};
    std::filesystem::path dir_lock_path_;
};

inline void FileLock::acquire() {
#ifdef __unix__
    fd_ = ::open(target_.c_str(), O_CREAT | O_RDWR, 0644);
    if (fd_ >= 0) {
        if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) {
            locked_ = true;
        } else {
            ::close(fd_);
            fd_ = -1;
        }
        // held by someone else: do not fall back to the directory lock
        return;
    }
#endif
    dir_lock_path_ = target_.string() + ".lock";
    std::error_code ec;
    if (std::filesystem::create_directory(dir_lock_path_, ec)) {
        locked_ = true;
        used_dir_lock_ = true;
    }
}

inline void FileLock::release() {
    if (!locked_) return;
#ifdef __unix__
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
#endif
    if (used_dir_lock_) {
        std::error_code ec;
        std::filesystem::remove(dir_lock_path_, ec);
    }
    locked_ = false;
}

}  // namespace segdl
