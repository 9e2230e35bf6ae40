#include <fdreopen/signal/SignalRegistry.hpp>
#include <fdreopen/util/Error.hpp>

#include <errno.h>
#include <pthread.h>
#include <signal.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <thread>

namespace FdReopen {

namespace {

// Everything below is read by the signal handler, so it is static storage, written only
// with the registry mutex held and read with lock-free atomics.
static_assert(ATOMIC_INT_LOCK_FREE == 2, "signal handler needs lock-free atomics");
static_assert(ATOMIC_POINTER_LOCK_FREE == 2, "signal handler needs lock-free atomics");

struct Slot {
    std::atomic<int> signo{0};
    std::atomic<std::atomic<bool>*> flag{nullptr};
};

Slot g_slots[SignalRegistry::kMaxBindings];

/// Handlers that were installed before ours, indexed by signal number
struct sigaction g_previous[NSIG];

/// Handler invocations currently running
std::atomic<int> g_inFlight{0};

void chainPrevious(int signo, siginfo_t* info, void* context) {
    const struct sigaction& prev = g_previous[signo];
    // SIG_DFL/SIG_IGN are dispositions, not functions, even when SA_SIGINFO is set.
    if (prev.sa_handler == SIG_DFL || prev.sa_handler == SIG_IGN)
        return;
    if (prev.sa_flags & SA_SIGINFO)
        prev.sa_sigaction(signo, info, context);
    else
        prev.sa_handler(signo);
}

void onSignal(int signo, siginfo_t* info, void* context) {
    int savedErrno = errno;

    g_inFlight.fetch_add(1);
    for (Slot& slot : g_slots) {
        if (slot.signo.load() != signo)
            continue;
        std::atomic<bool>* flag = slot.flag.load();
        if (flag)
            flag->store(true);
    }
    g_inFlight.fetch_sub(1);

    chainPrevious(signo, info, context);
    errno = savedErrno;
}

bool validSignal(int signo) {
    return signo > 0 && signo < NSIG && signo != SIGKILL && signo != SIGSTOP;
}

/// @brief Blocks one signal in the calling thread; restores the mask on destruction
class ScopedSignalBlock {
  public:
    ScopedSignalBlock(int signo, std::error_code& ec) {
        ec.clear();
        sigset_t block;
        sigemptyset(&block);
        sigaddset(&block, signo);
        int rc = ::pthread_sigmask(SIG_BLOCK, &block, &old_);
        if (rc != 0) {
            ec = std::error_code(rc, std::generic_category());
            return;
        }
        active_ = true;
    }

    ~ScopedSignalBlock() {
        if (active_)
            ::pthread_sigmask(SIG_SETMASK, &old_, nullptr);
    }

    ScopedSignalBlock(const ScopedSignalBlock&) = delete;
    ScopedSignalBlock& operator=(const ScopedSignalBlock&) = delete;

  private:
    sigset_t old_;
    bool active_ = false;
};

} // namespace

SignalRegistry& SignalRegistry::instance() {
    // Never destroyed: the handler outlives static destruction and reads the flags the
    // bindings own, so they must stay allocated until the process is gone.
    static SignalRegistry* registry = new SignalRegistry();
    return *registry;
}

bool SignalRegistry::ensureInstalled(int signo, std::error_code& ec) {
    ec.clear();
    if (installed_.empty())
        installed_.assign(NSIG, false);
    if (installed_[signo])
        return true;

    // 설치 도중 현재 스레드로 시그널이 오면 이전 핸들러 정보가 비어 있는 상태로
    // 체인 호출이 일어날 수 있으므로, 설치 구간 동안 해당 시그널을 막아 둔다.
    ScopedSignalBlock block(signo, ec);
    if (ec)
        return false;

    if (::sigaction(signo, nullptr, &g_previous[signo]) != 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }

    struct sigaction action{};
    action.sa_sigaction = &onSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART | SA_SIGINFO | SA_NOCLDSTOP;
    if (::sigaction(signo, &action, nullptr) != 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }

    installed_[signo] = true;
    spdlog::debug("fdreopen: installed handler for signal {}", signo);
    return true;
}

SignalId SignalRegistry::add(int signo, const Handle& handle, std::error_code& ec) {
    ec.clear();
    if (!validSignal(signo)) {
        ec = make_error_code(Errc::InvalidSignal);
        return 0;
    }

    std::lock_guard<std::mutex> lk(mutex_);

    size_t slot = kMaxBindings;
    for (size_t i = 0; i < kMaxBindings; ++i) {
        if (!slotUsed_[i]) {
            slot = i;
            break;
        }
    }
    if (slot == kMaxBindings) {
        ec = make_error_code(Errc::TooManyBindings);
        return 0;
    }

    if (!ensureInstalled(signo, ec))
        return 0;

    SignalId id = nextId_++;
    bindings_.emplace(id, Binding{signo, slot, handle});
    slotUsed_[slot] = true;

    // flag를 먼저 채우고 signo를 나중에 공개해야 핸들러가 반쯤 채워진 슬롯을 보지 않는다.
    g_slots[slot].flag.store(handle.flag_.get());
    g_slots[slot].signo.store(signo);

    spdlog::debug("fdreopen: bound signal {} (binding {}, slot {})", signo, id, slot);
    return id;
}

bool SignalRegistry::remove(SignalId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = bindings_.find(id);
    if (it == bindings_.end())
        return false;

    Slot& slot = g_slots[it->second.slot];
    slot.signo.store(0);
    slot.flag.store(nullptr);
    // 이미 flag 포인터를 읽은 핸들러가 끝날 때까지 Handle(= flag 소유권)을 놓지 않는다.
    while (g_inFlight.load() != 0)
        std::this_thread::yield();

    slotUsed_[it->second.slot] = false;
    spdlog::debug("fdreopen: unbound signal {} (binding {})", it->second.signo, id);
    bindings_.erase(it);
    return true;
}

size_t SignalRegistry::bindingCount(int signo) const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (signo == 0)
        return bindings_.size();
    size_t n = 0;
    for (const auto& entry : bindings_) {
        if (entry.second.signo == signo)
            ++n;
    }
    return n;
}

SignalId Handle::registerSignal(int signo, std::error_code& ec) const {
    return SignalRegistry::instance().add(signo, *this, ec);
}

} // namespace FdReopen
