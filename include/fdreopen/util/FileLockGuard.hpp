#pragma once
/// @file FileLockGuard.hpp
/// @brief RAII guard for whole-file fcntl locks (internal implementation)

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <system_error>

namespace FdReopen {
namespace detail {

/// @brief RAII guard for a POSIX fcntl lock over an entire file
///
/// Used by FdStream to keep one writeAll() from interleaving with writes of another
/// process appending to the same file. Blocks (F_SETLKW) until the lock is granted.
///
/// @note fcntl locks are per process: threads of one process do not exclude each other.
///       Inside a process the Reopen mutex already serialises writers.
class FileLockGuard {
  public:
    enum class Mode {
        Shared,   ///< F_RDLCK
        Exclusive ///< F_WRLCK
    };

    FileLockGuard() = default;

    /// @brief Acquires the lock
    /// @param fd File descriptor to lock
    /// @param mode Lock mode
    /// @param ec Error code (set on failure)
    FileLockGuard(int fd, Mode mode, std::error_code& ec) { lock(fd, mode, ec); }

    ~FileLockGuard() { unlockIgnore(); }

    FileLockGuard(const FileLockGuard&) = delete;
    FileLockGuard& operator=(const FileLockGuard&) = delete;

    FileLockGuard(FileLockGuard&& other) noexcept : fd_(other.fd_), locked_(other.locked_) {
        other.fd_ = -1;
        other.locked_ = false;
    }

    FileLockGuard& operator=(FileLockGuard&& other) noexcept {
        if (this != &other) {
            unlockIgnore();
            fd_ = other.fd_;
            locked_ = other.locked_;
            other.fd_ = -1;
            other.locked_ = false;
        }
        return *this;
    }

    /// @brief Acquires the lock, releasing any lock held before
    /// @return true on success
    bool lock(int fd, Mode mode, std::error_code& ec) {
        ec.clear();
        unlockIgnore();

        if (fd < 0) {
            ec = std::make_error_code(std::errc::bad_file_descriptor);
            return false;
        }

        struct flock fl = makeFlock((mode == Mode::Shared) ? F_RDLCK : F_WRLCK);
        int rc;
        do {
            rc = ::fcntl(fd, F_SETLKW, &fl);
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }

        fd_ = fd;
        locked_ = true;
        return true;
    }

    /// @brief Releases the lock, ignoring errors
    void unlockIgnore() noexcept {
        if (!locked_)
            return;
        struct flock fl = makeFlock(F_UNLCK);
        ::fcntl(fd_, F_SETLK, &fl);
        locked_ = false;
        fd_ = -1;
    }

    bool locked() const noexcept { return locked_; }

  private:
    static struct flock makeFlock(short type) noexcept {
        struct flock fl{};
        fl.l_type = type;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 0; // 0 = entire file
        return fl;
    }

    int fd_ = -1;
    bool locked_ = false;
};

} // namespace detail
} // namespace FdReopen
