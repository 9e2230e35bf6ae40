#pragma once
/// @file ByteStream.hpp
/// @brief Byte stream interface shared by the wrapper and the streams it wraps

#include <sys/uio.h>

#include <fmt/format.h>

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace FdReopen {

/// @brief Readable/writable byte stream
///
/// Implementations provide the single operations read() and write(). The bulk operations
/// have default implementations built on them, and an implementation may override them
/// when it can do better (see FdStream::writeAll()).
///
/// Every operation reports failures through @p ec and clears it on success.
class ByteStream {
  public:
    virtual ~ByteStream() = default;

    // =========================================================================
    // Single operations
    // =========================================================================

    /// @brief Reads at most @p len bytes
    /// @return Bytes read, 0 at end of stream or on error
    virtual size_t read(char* buf, size_t len, std::error_code& ec) = 0;

    /// @brief Writes at most @p len bytes
    /// @return Bytes accepted, 0 on error
    virtual size_t write(const char* buf, size_t len, std::error_code& ec) = 0;

    /// @brief Pushes buffered data to its destination (no-op by default)
    virtual bool flush(std::error_code& ec);

    /// @brief Scatter read; the default fills only the first non-empty buffer
    virtual size_t readVectored(const struct iovec* iov, int iovcnt, std::error_code& ec);

    /// @brief Gather write; the default writes only the first non-empty buffer
    virtual size_t writeVectored(const struct iovec* iov, int iovcnt, std::error_code& ec);

    // =========================================================================
    // Bulk operations
    // =========================================================================

    /// @brief Fills @p buf completely
    /// @return false on error; Errc::UnexpectedEof if the stream ends first
    virtual bool readExact(char* buf, size_t len, std::error_code& ec);

    /// @brief Appends everything up to end of stream to @p out
    /// @return Bytes appended (data read before an error stays in @p out)
    virtual size_t readToEnd(std::vector<char>& out, std::error_code& ec);

    /// @brief readToEnd() into a string
    virtual size_t readToString(std::string& out, std::error_code& ec);

    /// @brief Writes all of @p buf
    /// @return false on error; Errc::WriteZero if the stream stops accepting data
    virtual bool writeAll(const char* buf, size_t len, std::error_code& ec);

    bool writeString(std::string_view text, std::error_code& ec) {
        return writeAll(text.data(), text.size(), ec);
    }

    /// @brief Formats with fmt and writes the result with a single writeAll()
    template <typename... Args>
    bool writeFormatted(std::error_code& ec, fmt::format_string<Args...> format, Args&&... args) {
        fmt::memory_buffer out;
        fmt::format_to(std::back_inserter(out), format, std::forward<Args>(args)...);
        return writeAll(out.data(), out.size(), ec);
    }
};

} // namespace FdReopen
