#pragma once
/// @file SignalRegistry.hpp
/// @brief Binds Handles to POSIX signals

#include "../Handle.hpp"

#include <cstddef>
#include <mutex>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace FdReopen {

/// @brief Process-wide table of signal to Handle bindings
///
/// The first binding of a signal installs a handler (SA_RESTART | SA_SIGINFO). The handler
/// only performs atomic loads and Handle::reopen(), then calls the handler that was
/// installed before, so existing handlers keep working. It stays installed after the
/// last binding of its signal is removed.
///
/// - Several Handles may be bound to one signal and one Handle to several signals.
/// - Bindings keep their Handle alive; an orphaned Handle (its Reopen destroyed) is harmless
///   but occupies a slot until removed.
///
/// @note If another thread receives the signal while the handler is being installed, the
///       signal may be lost. Registering before starting threads avoids that.
class SignalRegistry {
  public:
    /// @brief Upper bound on simultaneous bindings
    static constexpr size_t kMaxBindings = 128;

    /// @brief The process-wide registry (never destroyed, bindings stay valid at exit)
    static SignalRegistry& instance();

    SignalRegistry(const SignalRegistry&) = delete;
    SignalRegistry& operator=(const SignalRegistry&) = delete;

    /// @brief Makes delivery of @p signo call @p handle.reopen()
    /// @param signo Signal number (SIGKILL and SIGSTOP are rejected)
    /// @param handle Handle to trigger
    /// @param ec Errc::InvalidSignal, Errc::TooManyBindings or the sigaction/sigprocmask error
    /// @return Binding id, 0 on failure
    SignalId add(int signo, const Handle& handle, std::error_code& ec);

    /// @brief Removes a binding
    ///
    /// Unknown or already removed ids are ignored. Returns after any handler run that might
    /// still see the binding has finished.
    ///
    /// @return true if a binding was removed
    bool remove(SignalId id);

    /// @brief Number of live bindings, optionally only those of @p signo
    size_t bindingCount(int signo = 0) const;

  private:
    struct Binding {
        int signo;
        size_t slot;
        Handle handle;
    };

    SignalRegistry() = default;

    bool ensureInstalled(int signo, std::error_code& ec);

    mutable std::mutex mutex_;
    std::unordered_map<SignalId, Binding> bindings_;
    std::vector<bool> slotUsed_ = std::vector<bool>(kMaxBindings, false);
    std::vector<bool> installed_;
    SignalId nextId_ = 1;
};

} // namespace FdReopen
