#pragma once
/// @file ReopenSink.hpp
/// @brief spdlog sink writing through a Reopen

#include "../Reopen.hpp"
#include "../stream/FdStream.hpp"

#include <spdlog/details/null_mutex.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>

namespace FdReopen {

/// @brief spdlog sink for log files that get rotated externally
///
/// Every formatted record goes out with one writeAll(), so a record always lands whole in
/// one file. Write failures (including a failed reopen) are thrown as spdlog::spdlog_ex,
/// which spdlog hands to the logger's error handler.
///
/// @tparam Mutex spdlog sink mutex (std::mutex or spdlog::details::null_mutex)
/// @tparam T Stream type wrapped by the Reopen
template <typename Mutex, typename T = FdStream>
class ReopenSink : public spdlog::sinks::base_sink<Mutex> {
  public:
    explicit ReopenSink(std::shared_ptr<Reopen<T>> stream) : stream_(std::move(stream)) {}

    const std::shared_ptr<Reopen<T>>& stream() const noexcept { return stream_; }

  protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        this->formatter_->format(msg, formatted);
        std::error_code ec;
        if (!stream_->writeAll(formatted.data(), formatted.size(), ec))
            throw spdlog::spdlog_ex("fdreopen sink: write failed: " + ec.message());
    }

    void flush_() override {
        std::error_code ec;
        if (!stream_->flush(ec))
            throw spdlog::spdlog_ex("fdreopen sink: flush failed: " + ec.message());
    }

  private:
    std::shared_ptr<Reopen<T>> stream_;
};

template <typename T = FdStream> using ReopenSinkMt = ReopenSink<std::mutex, T>;
template <typename T = FdStream> using ReopenSinkSt = ReopenSink<spdlog::details::null_mutex, T>;

/// @brief Logger writing to @p path, reopened whenever its Handle is triggered
/// @param name Logger name
/// @param path Log file path (opened in append mode)
/// @param handle Handle that triggers reopening, typically from Handle::stub()
/// @param ec Error from the first open
/// @return Logger, nullptr on failure
inline std::shared_ptr<spdlog::logger> makeReopenLogger(const std::string& name,
                                                        const std::string& path, const Handle& handle,
                                                        std::error_code& ec,
                                                        FdOpenOptions options = FdOpenOptions()) {
    std::shared_ptr<Reopen<FdStream>> file =
        Reopen<FdStream>::withHandle(handle, fileFactory(path, std::move(options)), ec);
    if (!file)
        return nullptr;
    return std::make_shared<spdlog::logger>(name,
                                            std::make_shared<ReopenSinkMt<>>(std::move(file)));
}

} // namespace FdReopen
