#include "../include/memory_store.hpp"
#include "../include/util.hpp"

InMemoryTimestampStore::InMemoryTimestampStore(Clock clock)
    : clock_(clock ? std::move(clock) : Clock(now_instant)) {}

std::optional<Instant> InMemoryTimestampStore::next_due_timestamp(const DueTimestamp& horizon) {
    Instant bound = horizon ? *horizon : clock_();
    std::lock_guard<std::mutex> lock(mtx_);
    if (by_time_.empty()) return std::nullopt;
    auto it = by_time_.begin();
    if (it->first > bound) return std::nullopt;
    return it->first;
}

std::optional<ScheduledJob> InMemoryTimestampStore::pop_job(Instant ts) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = by_time_.find(ts);
    if (it == by_time_.end()) return std::nullopt;
    ScheduledJob job = std::move(it->second.front());
    it->second.pop_front();
    if (it->second.empty()) by_time_.erase(it);
    return job;
}

void InMemoryTimestampStore::schedule(Instant at, const ScheduledJob& job) {
    validate_job(job);
    std::lock_guard<std::mutex> lock(mtx_);
    by_time_[at].push_back(job);
}

std::size_t InMemoryTimestampStore::pending_count() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t n = 0;
    for (const auto& kv : by_time_) n += kv.second.size();
    return n;
}

std::size_t InMemoryTimestampStore::pending_at(Instant ts) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = by_time_.find(ts);
    return it == by_time_.end() ? 0 : it->second.size();
}
