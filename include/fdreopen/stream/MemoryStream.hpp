#pragma once
/// @file MemoryStream.hpp
/// @brief In-memory ByteStream over a shared buffer

#include "ByteStream.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace FdReopen {

/// @brief ByteStream reading from and appending to a std::string
///
/// The buffer is shared, so the contents can be inspected after a Reopen has dropped
/// the stream. Reads start at the beginning and advance a private cursor; writes always
/// append. Not synchronised: concurrent use of one buffer needs outside locking.
class MemoryStream : public ByteStream {
  public:
    MemoryStream() : buffer_(std::make_shared<std::string>()) {}

    explicit MemoryStream(std::string contents)
        : buffer_(std::make_shared<std::string>(std::move(contents))) {}

    explicit MemoryStream(std::shared_ptr<std::string> buffer) : buffer_(std::move(buffer)) {
        if (!buffer_)
            buffer_ = std::make_shared<std::string>();
    }

    size_t read(char* buf, size_t len, std::error_code& ec) override {
        ec.clear();
        size_t n = std::min(len, buffer_->size() - std::min(pos_, buffer_->size()));
        if (n > 0) {
            std::memcpy(buf, buffer_->data() + pos_, n);
            pos_ += n;
        }
        return n;
    }

    size_t write(const char* buf, size_t len, std::error_code& ec) override {
        ec.clear();
        buffer_->append(buf, len);
        return len;
    }

    const std::string& contents() const noexcept { return *buffer_; }
    const std::shared_ptr<std::string>& buffer() const noexcept { return buffer_; }

    /// @brief Bytes not read yet
    size_t remaining() const noexcept { return buffer_->size() - std::min(pos_, buffer_->size()); }

  private:
    std::shared_ptr<std::string> buffer_;
    size_t pos_ = 0;
};

} // namespace FdReopen
