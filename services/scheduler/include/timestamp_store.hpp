#pragma once
#include "delayed_job.hpp"
#include <cstddef>
#include <optional>

// Time-ordered storage of delayed jobs.
class TimestampStore {
public:
    virtual ~TimestampStore() = default;

    // Earliest timestamp holding at least one job at or before horizon.
    // An unset horizon is resolved against the store clock on every call.
    virtual std::optional<Instant> next_due_timestamp(const DueTimestamp& horizon) = 0;

    // Atomically removes and returns one job stored under exactly ts.
    virtual std::optional<ScheduledJob> pop_job(Instant ts) = 0;

    virtual void schedule(Instant at, const ScheduledJob& job) = 0;
    virtual std::size_t pending_count() = 0;
    virtual std::size_t pending_at(Instant ts) = 0;
};
