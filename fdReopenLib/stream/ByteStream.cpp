#include <fdreopen/stream/ByteStream.hpp>
#include <fdreopen/util/Error.hpp>

namespace FdReopen {

namespace {

constexpr size_t kReadChunk = 4096;

bool interrupted(const std::error_code& ec) {
    return ec == std::errc::interrupted;
}

template <typename Container>
size_t readUntilEof(ByteStream& stream, Container& out, std::error_code& ec) {
    size_t total = 0;
    char chunk[kReadChunk];
    for (;;) {
        size_t n = stream.read(chunk, sizeof(chunk), ec);
        if (ec) {
            if (interrupted(ec))
                continue;
            return total;
        }
        if (n == 0)
            return total;
        out.insert(out.end(), chunk, chunk + n);
        total += n;
    }
}

const struct iovec* firstNonEmpty(const struct iovec* iov, int iovcnt) {
    for (int i = 0; i < iovcnt; ++i) {
        if (iov[i].iov_len > 0)
            return &iov[i];
    }
    return nullptr;
}

} // namespace

bool ByteStream::flush(std::error_code& ec) {
    ec.clear();
    return true;
}

size_t ByteStream::readVectored(const struct iovec* iov, int iovcnt, std::error_code& ec) {
    const struct iovec* target = firstNonEmpty(iov, iovcnt);
    if (!target) {
        ec.clear();
        return 0;
    }
    return read(static_cast<char*>(target->iov_base), target->iov_len, ec);
}

size_t ByteStream::writeVectored(const struct iovec* iov, int iovcnt, std::error_code& ec) {
    const struct iovec* target = firstNonEmpty(iov, iovcnt);
    if (!target) {
        ec.clear();
        return 0;
    }
    return write(static_cast<const char*>(target->iov_base), target->iov_len, ec);
}

bool ByteStream::readExact(char* buf, size_t len, std::error_code& ec) {
    ec.clear();
    size_t done = 0;
    while (done < len) {
        size_t n = read(buf + done, len - done, ec);
        if (ec) {
            if (interrupted(ec))
                continue;
            return false;
        }
        if (n == 0) {
            ec = make_error_code(Errc::UnexpectedEof);
            return false;
        }
        done += n;
    }
    return true;
}

size_t ByteStream::readToEnd(std::vector<char>& out, std::error_code& ec) {
    ec.clear();
    return readUntilEof(*this, out, ec);
}

size_t ByteStream::readToString(std::string& out, std::error_code& ec) {
    ec.clear();
    return readUntilEof(*this, out, ec);
}

bool ByteStream::writeAll(const char* buf, size_t len, std::error_code& ec) {
    ec.clear();
    size_t done = 0;
    while (done < len) {
        size_t n = write(buf + done, len - done, ec);
        if (ec) {
            if (interrupted(ec))
                continue;
            return false;
        }
        if (n == 0) {
            ec = make_error_code(Errc::WriteZero);
            return false;
        }
        done += n;
    }
    return true;
}

} // namespace FdReopen
