#include "../include/worker.hpp"
#include "../include/util.hpp"
#include <stdexcept>
#include <thread>

// Holds drain_mtx_ and records the owning thread so a hook or sink that calls
// back into the worker fails instead of deadlocking.
class SchedulerWorker::DrainGuard {
public:
    explicit DrainGuard(SchedulerWorker& w) : w_(w) {
        if (w_.drain_owner_.load() == std::this_thread::get_id()) {
            throw std::logic_error("drain re-entered from a hook or dispatch sink");
        }
        w_.drain_mtx_.lock();
        w_.drain_owner_.store(std::this_thread::get_id());
    }
    ~DrainGuard() {
        w_.drain_owner_.store(std::thread::id());
        w_.drain_mtx_.unlock();
    }

    DrainGuard(const DrainGuard&) = delete;
    DrainGuard& operator=(const DrainGuard&) = delete;

private:
    SchedulerWorker& w_;
};

SchedulerWorker::SchedulerWorker(TimestampStore& store, DispatchSink& sink, Notifier& notifier, Logger& logger,
                                 ShutdownCoordinator& shutdown, WorkerIdentity identity)
    : store_(store),
      sink_(sink),
      notifier_(notifier),
      logger_(logger),
      shutdown_(shutdown),
      identity_(std::move(identity)),
      sleep_([](Interval d) { std::this_thread::sleep_for(d); }) {}

void SchedulerWorker::set_sleeper(Sleeper sleeper) {
    sleep_ = std::move(sleeper);
}

void SchedulerWorker::run(Interval interval) {
    update_status("Starting");
    register_signal_handlers();

    while (true) {
        if (observe_shutdown()) break;
        drain_due(std::nullopt);
        if (observe_shutdown()) break;
        update_status("Waiting");
        sleep_(interval);
    }
}

std::size_t SchedulerWorker::drain_due(const DueTimestamp& horizon) {
    DrainGuard guard(*this);
    std::size_t dispatched = 0;
    std::optional<Instant> ts;
    while ((ts = store_.next_due_timestamp(horizon))) {
        update_status("Processing Delayed Items");
        dispatched += drain_timestamp_locked(*ts);
    }
    return dispatched;
}

std::size_t SchedulerWorker::drain_timestamp(Instant ts) {
    DrainGuard guard(*this);
    return drain_timestamp_locked(ts);
}

std::size_t SchedulerWorker::drain_timestamp_locked(Instant ts) {
    std::size_t dispatched = 0;
    while (auto job = store_.pop_job(ts)) {
        logger_.log(LogLevel::Notice,
                    "Queueing {class} scheduled to {datetime} in {queue} queue with args {args}",
                    {{"class", job->task},
                     {"queue", job->queue},
                     {"args", job->args.dump()},
                     {"datetime", format_datetime(ts)}});

        notifier_.before_delayed_enqueue({job->queue, job->task, job->args});

        // Once popped the job is gone from the store; a throw here loses it.
        sink_.dispatch(job->queue, job->task, job->args);
        ++dispatched_;
        ++dispatched;
    }
    return dispatched;
}

void SchedulerWorker::shutdown() {
    if (shutdown_.request() && !shutdown_logged_.exchange(true)) {
        logger_.log(LogLevel::Notice, "Shutting down");
    }
}

bool SchedulerWorker::shutdown_requested() const {
    return shutdown_.requested();
}

bool SchedulerWorker::observe_shutdown() {
    if (!shutdown_.requested()) return false;
    // Signal handlers cannot log, so the loop reports signal-driven shutdowns.
    if (!shutdown_logged_.exchange(true)) {
        logger_.log(LogLevel::Notice, "Shutting down", {{"signal", std::to_string(shutdown_.signal_number())}});
    }
    return true;
}

std::string SchedulerWorker::status() const {
    std::lock_guard<std::mutex> lock(status_mtx_);
    return status_;
}

void SchedulerWorker::update_status(const std::string& status) {
    {
        std::lock_guard<std::mutex> lock(status_mtx_);
        if (status_ == status) return;
        status_ = status;
    }
    logger_.log(LogLevel::Debug, "Status: {status}", {{"status", status}});
}

void SchedulerWorker::register_signal_handlers() {
    if (!ShutdownCoordinator::signals_supported()) {
        logger_.log(LogLevel::Warning, "Signal handling unavailable; stop this worker by killing the process");
        return;
    }
    shutdown_.install();
    logger_.log(LogLevel::Debug, "Registered signals");
}
