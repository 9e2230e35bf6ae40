#pragma once
/// @file UniqueFd.hpp
/// @brief Owning wrapper for a POSIX file descriptor (internal implementation)

#include <errno.h>
#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>
#include <system_error>

namespace FdReopen {
namespace detail {

/// @brief Owning wrapper for a POSIX file descriptor
///
/// Closes the descriptor on destruction or on reset(). Every FdStream owns exactly
/// one UniqueFd, so dropping the stream during a reopen closes the rotated file.
///
/// @note This class is for internal library use.
class UniqueFd {
  public:
    UniqueFd() noexcept = default;

    /// @brief Takes ownership of @p fd
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}

    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other)
            reset(other.release());
        return *this;
    }

    /// @brief Opens @p path with close-on-exec set
    /// @param path File path
    /// @param flags open(2) flags
    /// @param mode Permission bits used when the file is created
    /// @param ec Error code (errno on failure)
    /// @return Owning descriptor, invalid on failure
    static UniqueFd open(const std::string& path, int flags, mode_t mode, std::error_code& ec) {
        ec.clear();
#ifdef O_CLOEXEC
        flags |= O_CLOEXEC;
#endif
        int fd;
        do {
            fd = ::open(path.c_str(), flags, mode);
        } while (fd < 0 && errno == EINTR);
        if (fd < 0) {
            ec = std::error_code(errno, std::generic_category());
            return UniqueFd();
        }
        return UniqueFd(fd);
    }

    int get() const noexcept { return fd_; }

    bool valid() const noexcept { return fd_ >= 0; }

    explicit operator bool() const noexcept { return valid(); }

    /// @brief Gives up ownership without closing
    /// @return The descriptor previously held (-1 if none)
    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    /// @brief Closes the held descriptor and adopts @p newFd
    void reset(int newFd = -1) noexcept {
        // close() 실패는 되돌릴 방법이 없으므로 무시한다. EINTR 후 재시도하면
        // 이미 다른 스레드가 재사용한 fd를 닫을 수 있다.
        if (fd_ >= 0 && fd_ != newFd)
            ::close(fd_);
        fd_ = newFd;
    }

  private:
    int fd_ = -1;
};

} // namespace detail
} // namespace FdReopen
