#pragma once
/// @file ReopenLock.hpp
/// @brief RAII guard that defers automatic reopening

#include <atomic>
#include <cstddef>

namespace FdReopen {

/// @brief Suppresses automatic reopening while alive
///
/// Obtained from Reopen::lock(). Guards nest: reopening resumes once the last one is
/// released. A reopen requested meanwhile stays pending and is performed by the first
/// operation that starts after the release; releasing never does any I/O itself.
///
/// The guard must not outlive the Reopen it came from.
class ReopenLock {
  public:
    ReopenLock() = default;

    explicit ReopenLock(std::atomic<size_t>& counter) noexcept : counter_(&counter) {
        counter_->fetch_add(1);
    }

    ~ReopenLock() { unlock(); }

    ReopenLock(const ReopenLock&) = delete;
    ReopenLock& operator=(const ReopenLock&) = delete;

    ReopenLock(ReopenLock&& other) noexcept : counter_(other.counter_) { other.counter_ = nullptr; }

    ReopenLock& operator=(ReopenLock&& other) noexcept {
        if (this != &other) {
            unlock();
            counter_ = other.counter_;
            other.counter_ = nullptr;
        }
        return *this;
    }

    /// @brief Releases early; later calls and the destructor do nothing
    void unlock() noexcept {
        if (counter_) {
            counter_->fetch_sub(1);
            counter_ = nullptr;
        }
    }

    bool locked() const noexcept { return counter_ != nullptr; }

  private:
    std::atomic<size_t>* counter_ = nullptr;
};

} // namespace FdReopen
