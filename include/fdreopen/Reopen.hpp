#pragma once
/// @file Reopen.hpp
/// @brief ByteStream proxy that can replace its underlying stream on request

#include "Handle.hpp"
#include "ReopenLock.hpp"
#include "stream/ByteStream.hpp"
#include "util/Error.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace FdReopen {

/// @brief Counters of reopens performed by one Reopen
struct ReopenStatus {
    size_t attempts = 0;       ///< Factory calls made for reopens (construction excluded)
    size_t failures = 0;       ///< Attempts whose factory call failed
    std::error_code lastError; ///< Factory's own error of the latest attempt, cleared when one succeeds
};

/// @brief ByteStream proxy that can reopen the stream it wraps
///
/// Built from a factory that opens a new instance of the stream. After a Handle asks for
/// it, the current instance is replaced by a fresh one from the factory at the start of
/// the next operation.
///
/// Scheduling:
/// - Each operation, single or bulk, checks for a pending request once, at its start, and
///   keeps the same stream until it returns. writeAll() never spreads one buffer over two
///   files, readExact() never mixes bytes of two streams.
/// - lock() defers reopening across several operations.
///
/// Errors:
/// - If the factory fails during a reopen, the operation does no I/O and returns the
///   factory's error tagged with reopenCategory() (see makeReopenError()). It still
///   compares equal to the factory's condition. The old stream stays installed and the
///   request is dropped; the next Handle::reopen() asks again.
/// - Errors of the underlying stream are returned unchanged.
/// - isReopenError() tells the two apart.
///
/// Operations are serialised by an internal mutex. Handle::reopen() never takes it.
///
/// @tparam T Stream type, derived from ByteStream
template <typename T> class Reopen : public ByteStream {
    static_assert(std::is_base_of<ByteStream, T>::value, "Reopen<T> requires T to be a ByteStream");

  public:
    /// @brief Opens a new instance of the stream; null result or set @p ec means failure
    using Factory = std::function<std::unique_ptr<T>(std::error_code& ec)>;

    /// @brief Exclusive access to the current stream
    ///
    /// Holds the Reopen mutex: other threads block on the Reopen until it is released,
    /// and calling the Reopen from the holding thread deadlocks.
    class Borrowed {
      public:
        Borrowed() = default;

        T* get() const noexcept { return stream_; }
        T* operator->() const noexcept { return stream_; }
        T& operator*() const noexcept { return *stream_; }
        explicit operator bool() const noexcept { return stream_ != nullptr; }

      private:
        friend class Reopen;

        Borrowed(std::unique_lock<std::mutex> lock, T* stream)
            : lock_(std::move(lock)), stream_(stream) {}

        std::unique_lock<std::mutex> lock_;
        T* stream_ = nullptr;
    };

    /// @brief Opens the first stream and builds the proxy
    /// @param factory Called now and on every reopen
    /// @param ec Factory error on failure
    /// @return New proxy, nullptr on failure
    static std::unique_ptr<Reopen> create(Factory factory, std::error_code& ec) {
        return withHandle(Handle::stub(), std::move(factory), ec);
    }

    /// @brief Like create(), but controlled by an existing Handle
    ///
    /// Useful when the Handle has to exist first, e.g. it is registered to a signal before
    /// the log file can be opened. Sharing one Handle between several Reopen objects does
    /// not work: the first one to notice the request consumes it.
    static std::unique_ptr<Reopen> withHandle(const Handle& handle, Factory factory,
                                              std::error_code& ec) {
        ec.clear();
        if (!factory) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return nullptr;
        }
        std::unique_ptr<T> first = openStream(factory, ec);
        if (!first)
            return nullptr;
        return std::make_unique<Reopen>(PrivateTag(), handle.flag_, std::move(factory),
                                        std::move(first));
    }

    ~Reopen() override = default;

    Reopen(const Reopen&) = delete;
    Reopen& operator=(const Reopen&) = delete;

    /// @brief Returns a Handle that triggers reopening of this object
    Handle handle() const { return Handle(signal_); }

    /// @brief Defers reopening until the returned guard is released
    ReopenLock lock() { return ReopenLock(suppressed_); }

    /// @brief Performs a pending reopen and grants direct access to the stream
    /// @param ec Reopen failure (reopenCategory()) if the reopen failed
    /// @return Access object, empty on failure
    Borrowed borrow(std::error_code& ec) {
        std::unique_lock<std::mutex> lk(mutex_);
        if (!prepare(ec))
            return Borrowed();
        return Borrowed(std::move(lk), fd_.get());
    }

    /// @brief Snapshot of reopen counters
    ReopenStatus status() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return status_;
    }

    // =========================================================================
    // Single operations
    // =========================================================================

    size_t read(char* buf, size_t len, std::error_code& ec) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!prepare(ec))
            return 0;
        return fd_->read(buf, len, ec);
    }

    size_t write(const char* buf, size_t len, std::error_code& ec) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!prepare(ec))
            return 0;
        return fd_->write(buf, len, ec);
    }

    bool flush(std::error_code& ec) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!prepare(ec))
            return false;
        return fd_->flush(ec);
    }

    size_t readVectored(const struct iovec* iov, int iovcnt, std::error_code& ec) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!prepare(ec))
            return 0;
        return fd_->readVectored(iov, iovcnt, ec);
    }

    size_t writeVectored(const struct iovec* iov, int iovcnt, std::error_code& ec) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!prepare(ec))
            return 0;
        return fd_->writeVectored(iov, iovcnt, ec);
    }

    // =========================================================================
    // Bulk operations (one check at entry, the stream's own implementation after it)
    // =========================================================================

    bool readExact(char* buf, size_t len, std::error_code& ec) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!prepare(ec))
            return false;
        return fd_->readExact(buf, len, ec);
    }

    /// @note End of stream is final only for the current instance: after a reopen the
    ///       new stream may be readable again.
    size_t readToEnd(std::vector<char>& out, std::error_code& ec) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!prepare(ec))
            return 0;
        return fd_->readToEnd(out, ec);
    }

    size_t readToString(std::string& out, std::error_code& ec) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!prepare(ec))
            return 0;
        return fd_->readToString(out, ec);
    }

    bool writeAll(const char* buf, size_t len, std::error_code& ec) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!prepare(ec))
            return false;
        return fd_->writeAll(buf, len, ec);
    }

  private:
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

  public:
    /// @brief Use create() or withHandle()
    Reopen(PrivateTag, std::shared_ptr<std::atomic<bool>> signal, Factory factory,
           std::unique_ptr<T> first)
        : signal_(std::move(signal)), factory_(std::move(factory)), fd_(std::move(first)) {}

  private:
    static std::unique_ptr<T> openStream(const Factory& factory, std::error_code& ec) {
        ec.clear();
        std::unique_ptr<T> fd = factory(ec);
        if (ec)
            return nullptr;
        if (!fd)
            ec = make_error_code(Errc::NotOpen);
        return fd;
    }

    /// @brief Entry check of every operation; caller holds mutex_
    /// @return false if a reopen was due and failed
    bool prepare(std::error_code& ec) {
        ec.clear();
        if (suppressed_.load() != 0)
            return true;
        // exchange로 읽기와 해제를 한 번에 수행해야 요청 하나당 시도가 한 번으로 제한된다.
        if (!signal_->exchange(false))
            return true;

        ++status_.attempts;
        std::unique_ptr<T> fresh = openStream(factory_, ec);
        if (!fresh) {
            ++status_.failures;
            status_.lastError = ec;
            ec = makeReopenError(ec);
            return false;
        }
        status_.lastError.clear();
        fd_ = std::move(fresh);
        return true;
    }

    std::shared_ptr<std::atomic<bool>> signal_;
    std::atomic<size_t> suppressed_{0};
    Factory factory_;

    mutable std::mutex mutex_;
    std::unique_ptr<T> fd_;
    ReopenStatus status_;
};

} // namespace FdReopen
