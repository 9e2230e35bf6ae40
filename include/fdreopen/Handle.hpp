#pragma once
/// @file Handle.hpp
/// @brief Trigger used to ask a Reopen to recreate its stream

#include <atomic>
#include <cstdint>
#include <memory>
#include <system_error>

namespace FdReopen {

template <typename T> class Reopen;
class SignalRegistry;

/// @brief Identifies one signal binding made through SignalRegistry (0 is never issued)
using SignalId = std::uint64_t;

/// @brief Requests a reopen from its companion Reopen object
///
/// A Handle is a shared reference to the pending flag of a Reopen. Copies are
/// interchangeable and cheap. A Handle never reaches the stream itself, so reopen() may be
/// called from any thread or from a signal handler.
///
/// A Handle stays valid after its Reopen is destroyed; reopen() then has no effect.
class Handle {
    static_assert(ATOMIC_BOOL_LOCK_FREE == 2, "reopen() must stay async-signal-safe");

  public:
    // No move operations: a moved-from Handle keeps its flag.
    Handle(const Handle&) = default;
    Handle& operator=(const Handle&) = default;
    ~Handle() = default;

    /// @brief Creates a Handle not yet attached to any Reopen
    /// @see Reopen::withHandle()
    static Handle stub() { return Handle(std::make_shared<std::atomic<bool>>(false)); }

    /// @brief Marks the companion Reopen for reopening on its next operation
    /// @note Async-signal-safe: one atomic store, no allocation, no lock.
    void reopen() const noexcept { flag_->store(true); }

    /// @brief Whether a requested reopen has not been performed yet
    bool pending() const noexcept { return flag_->load(); }

    /// @brief Whether both handles control the same Reopen
    bool sameTarget(const Handle& other) const noexcept { return flag_ == other.flag_; }

    /// @brief Calls reopen() whenever @p signo is delivered to the process
    /// @return Binding id for SignalRegistry::remove(), 0 on failure
    /// @see SignalRegistry::add()
    SignalId registerSignal(int signo, std::error_code& ec) const;

  private:
    template <typename T> friend class Reopen;
    friend class SignalRegistry;

    explicit Handle(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace FdReopen
