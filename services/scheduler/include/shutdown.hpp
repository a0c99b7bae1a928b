#pragma once
#include <atomic>
#include <csignal>

#if defined(__unix__) || defined(__APPLE__)
#define SCHEDULER_HAVE_SIGACTION 1
#include <signal.h>
#else
#define SCHEDULER_HAVE_SIGACTION 0
#endif

// Turns SIGINT/SIGTERM/SIGQUIT into a flag the polling loop checks between
// iterations. Only one coordinator receives signals at a time: the one that
// called install() last.
class ShutdownCoordinator {
public:
    ShutdownCoordinator() = default;
    ~ShutdownCoordinator();

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    // False where the platform has no POSIX signal handling.
    static bool signals_supported();

    // Registers the handlers. Returns false when signals are unsupported;
    // throws std::system_error if registration fails.
    bool install();

    // True only for the call that flips the flag.
    bool request() noexcept;
    bool requested() const noexcept;

    // Signal number that triggered the request, 0 for a manual request.
    int signal_number() const noexcept;

private:
    static void on_signal(int sig);

    std::atomic<bool> flag_{false};
    std::atomic<int> signal_{0};
    bool installed_{false};
#if SCHEDULER_HAVE_SIGACTION
    struct sigaction previous_[3] {};
#endif
};
