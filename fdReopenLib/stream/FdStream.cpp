#include <fdreopen/stream/FdStream.hpp>
#include <fdreopen/util/Error.hpp>
#include <fdreopen/util/FileLockGuard.hpp>

#include <errno.h>
#include <unistd.h>

#include <filesystem>
#include <utility>

namespace FdReopen {

namespace fs = std::filesystem;

namespace {

std::error_code lastError() {
    return std::error_code(errno, std::generic_category());
}

/// @brief Runs a syscall returning ssize_t, retrying on EINTR
template <typename Call> size_t retrySyscall(Call call, std::error_code& ec) {
    ec.clear();
    for (;;) {
        ssize_t n = call();
        if (n >= 0)
            return static_cast<size_t>(n);
        if (errno == EINTR)
            continue;
        ec = lastError();
        return 0;
    }
}

} // namespace

FdStream::FdStream(detail::UniqueFd fd, FdOpenOptions options, std::string path)
    : fd_(std::move(fd)), options_(std::move(options)), path_(std::move(path)) {}

std::unique_ptr<FdStream> FdStream::open(const std::string& path, const FdOpenOptions& options,
                                         std::error_code& ec) {
    ec.clear();

    // 로그 로테이션 도구가 디렉토리째 정리하는 경우가 있으므로 재오픈 시점에도 상위 디렉토리를 만든다.
    if (options.createDirs && (options.flags & O_CREAT)) {
        fs::path dir = fs::path(path).parent_path();
        if (!dir.empty()) {
            std::error_code fec;
            if (!fs::exists(dir, fec)) {
                if (fec) {
                    ec = fec;
                    return nullptr;
                }
                fs::create_directories(dir, fec);
                if (fec) {
                    ec = fec;
                    return nullptr;
                }
            } else if (!fs::is_directory(dir, fec)) {
                ec = std::make_error_code(std::errc::not_a_directory);
                return nullptr;
            }
        }
    }

    detail::UniqueFd fd = detail::UniqueFd::open(path, options.flags, options.mode, ec);
    if (!fd)
        return nullptr;
    return std::make_unique<FdStream>(std::move(fd), options, path);
}

bool FdStream::checkOpen(std::error_code& ec) const {
    ec.clear();
    if (!fd_) {
        ec = make_error_code(Errc::NotOpen);
        return false;
    }
    return true;
}

size_t FdStream::read(char* buf, size_t len, std::error_code& ec) {
    if (!checkOpen(ec))
        return 0;
    int fd = fd_.get();
    return retrySyscall([&] { return ::read(fd, buf, len); }, ec);
}

size_t FdStream::write(const char* buf, size_t len, std::error_code& ec) {
    if (!checkOpen(ec))
        return 0;
    int fd = fd_.get();
    return retrySyscall([&] { return ::write(fd, buf, len); }, ec);
}

bool FdStream::flush(std::error_code& ec) {
    if (!checkOpen(ec))
        return false;
    if (!options_.syncOnFlush)
        return true;
    if (::fsync(fd_.get()) < 0) {
        ec = lastError();
        return false;
    }
    return true;
}

size_t FdStream::readVectored(const struct iovec* iov, int iovcnt, std::error_code& ec) {
    if (!checkOpen(ec))
        return 0;
    int fd = fd_.get();
    return retrySyscall([&] { return ::readv(fd, iov, iovcnt); }, ec);
}

size_t FdStream::writeVectored(const struct iovec* iov, int iovcnt, std::error_code& ec) {
    if (!checkOpen(ec))
        return 0;
    int fd = fd_.get();
    return retrySyscall([&] { return ::writev(fd, iov, iovcnt); }, ec);
}

bool FdStream::writeAll(const char* buf, size_t len, std::error_code& ec) {
    if (!checkOpen(ec))
        return false;
    if (!options_.lockWrites)
        return ByteStream::writeAll(buf, len, ec);

    // 다른 프로세스가 같은 로그 파일에 append하는 경우 레코드가 섞이지 않도록 한다.
    // lock을 무시하는 writer까지 막을 수는 없다.
    detail::FileLockGuard lk(fd_.get(), detail::FileLockGuard::Mode::Exclusive, ec);
    if (ec)
        return false;
    return ByteStream::writeAll(buf, len, ec);
}

FdStreamFactory fileFactory(std::string path, FdOpenOptions options) {
    return [path = std::move(path), options](std::error_code& ec) {
        return FdStream::open(path, options, ec);
    };
}

} // namespace FdReopen
