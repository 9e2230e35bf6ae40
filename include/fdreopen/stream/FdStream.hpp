#pragma once
/// @file FdStream.hpp
/// @brief ByteStream over a POSIX file descriptor

#include "../util/UniqueFd.hpp"
#include "ByteStream.hpp"

#include <fcntl.h>
#include <sys/types.h>

#include <functional>
#include <memory>
#include <string>
#include <system_error>

namespace FdReopen {

/// @brief How FdStream::open() opens a file
struct FdOpenOptions {
    int flags = O_CREAT | O_WRONLY | O_APPEND; ///< open(2) flags (O_CLOEXEC is always added)
    mode_t mode = 0644;                         ///< Permission bits for a created file
    bool createDirs = true;                     ///< Create missing parent directories
    bool lockWrites = false; ///< Hold an exclusive fcntl lock for each writeAll()
    bool syncOnFlush = false; ///< flush() calls fsync()

    /// @brief Append-only log file, created if missing
    static FdOpenOptions append() { return FdOpenOptions(); }

    /// @brief Existing file, read-only
    static FdOpenOptions readOnly() {
        FdOpenOptions o;
        o.flags = O_RDONLY;
        o.createDirs = false;
        return o;
    }
};

/// @brief ByteStream that owns a file descriptor
///
/// Single operations map to one read(2)/write(2)/readv(2)/writev(2) call, retried on EINTR.
/// The descriptor is closed when the stream is destroyed, which is what a Reopen does
/// with the previous instance after a successful reopen.
class FdStream : public ByteStream {
  public:
    /// @brief Adopts an already open descriptor
    explicit FdStream(detail::UniqueFd fd, FdOpenOptions options = FdOpenOptions(),
                      std::string path = std::string());

    ~FdStream() override = default;

    FdStream(const FdStream&) = delete;
    FdStream& operator=(const FdStream&) = delete;

    /// @brief Opens @p path
    /// @param path File path
    /// @param options Open flags and behaviour
    /// @param ec Error code set on failure
    /// @return Open stream, nullptr on failure
    static std::unique_ptr<FdStream> open(const std::string& path, const FdOpenOptions& options,
                                          std::error_code& ec);

    static std::unique_ptr<FdStream> openAppend(const std::string& path, std::error_code& ec) {
        return open(path, FdOpenOptions::append(), ec);
    }

    static std::unique_ptr<FdStream> openRead(const std::string& path, std::error_code& ec) {
        return open(path, FdOpenOptions::readOnly(), ec);
    }

    int fd() const noexcept { return fd_.get(); }
    const std::string& path() const noexcept { return path_; }
    const FdOpenOptions& options() const noexcept { return options_; }

    size_t read(char* buf, size_t len, std::error_code& ec) override;
    size_t write(const char* buf, size_t len, std::error_code& ec) override;
    bool flush(std::error_code& ec) override;
    size_t readVectored(const struct iovec* iov, int iovcnt, std::error_code& ec) override;
    size_t writeVectored(const struct iovec* iov, int iovcnt, std::error_code& ec) override;
    bool writeAll(const char* buf, size_t len, std::error_code& ec) override;

  private:
    bool checkOpen(std::error_code& ec) const;

    detail::UniqueFd fd_;
    FdOpenOptions options_;
    std::string path_;
};

/// @brief Factory signature accepted by Reopen<FdStream>
using FdStreamFactory = std::function<std::unique_ptr<FdStream>(std::error_code&)>;

/// @brief Factory that opens @p path again on every call
///
/// The usual logrotate setup: after the file was renamed, the next call creates a new
/// file under the original name.
FdStreamFactory fileFactory(std::string path, FdOpenOptions options = FdOpenOptions());

} // namespace FdReopen
