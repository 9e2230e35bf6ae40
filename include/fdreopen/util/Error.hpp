#pragma once
/// @file Error.hpp
/// @brief Library-specific error codes

#include <system_error>
#include <type_traits>

namespace FdReopen {

/// @brief Error conditions raised by the library itself
///
/// Failures coming from the operating system or from a user factory are passed through
/// untouched; these codes only cover conditions the library detects on its own.
enum class Errc {
    UnexpectedEof = 1, ///< Stream ended before a readExact() buffer was filled
    WriteZero,         ///< Underlying write accepted zero bytes during writeAll()
    InvalidSignal,     ///< Signal number cannot be caught or is out of range
    TooManyBindings,   ///< Signal registry slot table is full
    NotOpen            ///< Operation on a stream that holds no descriptor
};

/// @brief Category shared by all Errc values (name: "fdreopen")
const std::error_category& errorCategory() noexcept;

/// @brief Builds an error_code in errorCategory()
std::error_code make_error_code(Errc e) noexcept;

/// @brief Category of the codes a Reopen returns when reopening failed (name: "fdreopen.reopen")
///
/// The value is the factory's errno; Errc values are stored negated. Each code maps back
/// to the factory's condition, so a reopen failure still compares equal to it
/// (`ec == std::errc::permission_denied`), while the category tells it apart from an
/// error of the stream itself.
const std::error_category& reopenCategory() noexcept;

/// @brief Tags a factory error as a reopen failure
///
/// Codes that are neither errno values nor Errc become EIO in reopenCategory();
/// Reopen::status() keeps the factory's code unchanged.
std::error_code makeReopenError(const std::error_code& cause) noexcept;

/// @brief Whether @p ec was returned because a reopen failed
inline bool isReopenError(const std::error_code& ec) noexcept {
    return ec.category() == reopenCategory();
}

} // namespace FdReopen

namespace std {
template <> struct is_error_code_enum<FdReopen::Errc> : true_type {};
} // namespace std
