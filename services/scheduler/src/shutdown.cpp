#include "../include/shutdown.hpp"
#include <cerrno>
#include <system_error>

static_assert(std::atomic<bool>::is_always_lock_free, "shutdown flag must be usable from a signal handler");
static_assert(std::atomic<int>::is_always_lock_free, "signal number must be usable from a signal handler");

namespace {
std::atomic<ShutdownCoordinator*> g_active{nullptr};
#if SCHEDULER_HAVE_SIGACTION
const int kSignals[3] = {SIGINT, SIGTERM, SIGQUIT};
#endif
} // namespace

bool ShutdownCoordinator::signals_supported() {
    return SCHEDULER_HAVE_SIGACTION != 0;
}

bool ShutdownCoordinator::install() {
#if SCHEDULER_HAVE_SIGACTION
    if (installed_) return true;
    g_active.store(this);
    struct sigaction sa {};
    sa.sa_handler = &ShutdownCoordinator::on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    for (int i = 0; i < 3; ++i) {
        if (sigaction(kSignals[i], &sa, &previous_[i]) != 0) {
            int err = errno;
            for (int j = 0; j < i; ++j) sigaction(kSignals[j], &previous_[j], nullptr);
            ShutdownCoordinator* self = this;
            g_active.compare_exchange_strong(self, nullptr);
            throw std::system_error(err, std::generic_category(), "sigaction");
        }
    }
    installed_ = true;
    return true;
#else
    return false;
#endif
}

ShutdownCoordinator::~ShutdownCoordinator() {
#if SCHEDULER_HAVE_SIGACTION
    if (installed_) {
        for (int i = 0; i < 3; ++i) sigaction(kSignals[i], &previous_[i], nullptr);
    }
#endif
    ShutdownCoordinator* self = this;
    g_active.compare_exchange_strong(self, nullptr);
}

void ShutdownCoordinator::on_signal(int sig) {
    ShutdownCoordinator* c = g_active.load();
    if (!c) return;
    if (c->flag_.load()) return;
    // Record the signal before publishing the flag so an observer of the flag
    // always sees which signal set it.
    int none = 0;
    if (c->signal_.compare_exchange_strong(none, sig)) c->flag_.store(true);
}

bool ShutdownCoordinator::request() noexcept {
    bool expected = false;
    return flag_.compare_exchange_strong(expected, true);
}

bool ShutdownCoordinator::requested() const noexcept {
    return flag_.load();
}

int ShutdownCoordinator::signal_number() const noexcept {
    return signal_.load();
}
