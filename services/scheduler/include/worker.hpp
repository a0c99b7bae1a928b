#pragma once
#include "delayed_job.hpp"
#include "dispatch_sink.hpp"
#include "logger.hpp"
#include "notifier.hpp"
#include "shutdown.hpp"
#include "timestamp_store.hpp"
#include "worker_identity.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Moves delayed jobs whose due time has passed into the immediate-execution
// queue, every interval, until shutdown is requested.
class SchedulerWorker {
public:
    using Interval = std::chrono::duration<double>;
    using Sleeper = std::function<void(Interval)>;

    static constexpr double kDefaultIntervalSeconds = 5.0;

    SchedulerWorker(TimestampStore& store, DispatchSink& sink, Notifier& notifier, Logger& logger,
                    ShutdownCoordinator& shutdown, WorkerIdentity identity = WorkerIdentity::current());

    // Blocks until shutdown is requested. The flag is checked before each
    // drain and before each sleep, never during a drain.
    void run(Interval interval = Interval(kDefaultIntervalSeconds));

    // Dispatches every job due at or before horizon, earliest timestamp first,
    // until the store reports nothing left. Exceptions from the store, the
    // hook or the sink propagate. Returns the number of jobs this call
    // dispatched. Throws std::logic_error when called from a hook or sink
    // while this worker is already draining on the same thread.
    std::size_t drain_due(const DueTimestamp& horizon = std::nullopt);

    // Dispatches every job stored under exactly ts.
    std::size_t drain_timestamp(Instant ts);

    // Idempotent; only the first request is logged.
    void shutdown();
    bool shutdown_requested() const;

    const std::string& id() const { return identity_.id; }
    std::string status() const;
    std::size_t dispatched_count() const { return dispatched_.load(); }

    // Replaces the inter-cycle sleep, e.g. in tests.
    void set_sleeper(Sleeper sleeper);

private:
    class DrainGuard;

    std::size_t drain_timestamp_locked(Instant ts);
    void update_status(const std::string& status);
    void register_signal_handlers();
    bool observe_shutdown();

    TimestampStore& store_;
    DispatchSink& sink_;
    Notifier& notifier_;
    Logger& logger_;
    ShutdownCoordinator& shutdown_;
    const WorkerIdentity identity_;
    Sleeper sleep_;

    std::mutex drain_mtx_;
    std::atomic<std::thread::id> drain_owner_{};
    mutable std::mutex status_mtx_;
    std::string status_;
    std::atomic<bool> shutdown_logged_{false};
    std::atomic<std::size_t> dispatched_{0};
};
