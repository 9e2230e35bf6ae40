#include <fdreopen/util/Error.hpp>

#include <errno.h>

#include <string>

namespace FdReopen {

namespace {

class Category : public std::error_category {
  public:
    const char* name() const noexcept override { return "fdreopen"; }

    std::string message(int val) const override {
        switch (static_cast<Errc>(val)) {
        case Errc::UnexpectedEof:
            return "stream ended before the requested amount of data was read";
        case Errc::WriteZero:
            return "underlying stream accepted zero bytes";
        case Errc::InvalidSignal:
            return "signal cannot be used to trigger a reopen";
        case Errc::TooManyBindings:
            return "no free slot left for another signal binding";
        case Errc::NotOpen:
            return "stream is not open";
        }
        return "unknown fdreopen error";
    }
};

class ReopenCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "fdreopen.reopen"; }

    std::string message(int val) const override {
        if (val < 0)
            return "reopen failed: " + errorCategory().message(-val);
        return "reopen failed: " + std::generic_category().message(val);
    }

    std::error_condition default_error_condition(int val) const noexcept override {
        if (val < 0)
            return std::error_condition(-val, errorCategory());
        return std::error_condition(val, std::generic_category());
    }
};

} // namespace

const std::error_category& errorCategory() noexcept {
    static const Category category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return std::error_code(static_cast<int>(e), errorCategory());
}

const std::error_category& reopenCategory() noexcept {
    static const ReopenCategory category;
    return category;
}

std::error_code makeReopenError(const std::error_code& cause) noexcept {
    if (!cause || cause.category() == reopenCategory())
        return cause;
    if (cause.category() == errorCategory())
        return std::error_code(-cause.value(), reopenCategory());
    // POSIX system_category values are errno values as well.
    if (cause.category() == std::generic_category() || cause.category() == std::system_category())
        return std::error_code(cause.value(), reopenCategory());

    std::error_condition condition = cause.default_error_condition();
    if (condition.category() == std::generic_category())
        return std::error_code(condition.value(), reopenCategory());
    return std::error_code(EIO, reopenCategory());
}

} // namespace FdReopen
