#pragma once
#include "timestamp_store.hpp"
#include <deque>
#include <map>
#include <mutex>

class InMemoryTimestampStore : public TimestampStore {
public:
    explicit InMemoryTimestampStore(Clock clock = {});

    std::optional<Instant> next_due_timestamp(const DueTimestamp& horizon) override;
    std::optional<ScheduledJob> pop_job(Instant ts) override;
    void schedule(Instant at, const ScheduledJob& job) override;
    std::size_t pending_count() override;
    std::size_t pending_at(Instant ts) override;

private:
    Clock clock_;
    std::mutex mtx_;
    std::map<Instant, std::deque<ScheduledJob>> by_time_; // never holds an empty deque
};
