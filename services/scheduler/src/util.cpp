#include "../include/util.hpp"
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <stdexcept>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

Instant now_instant() {
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

Instant instant_from_epoch(long long seconds) {
    return Instant(std::chrono::seconds(seconds));
}

long long epoch_seconds(Instant t) {
    return static_cast<long long>(t.time_since_epoch().count());
}

std::string format_datetime(Instant t) {
    std::time_t tt = static_cast<std::time_t>(epoch_seconds(t));
    std::tm tm{};
    char buf[32];
    if (localtime_r(&tt, &tm) == nullptr ||
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
        return "@" + std::to_string(epoch_seconds(t));
    }
    return std::string(buf);
}

void validate_job(const ScheduledJob& job) {
    if (job.queue.empty()) throw std::invalid_argument("job queue name is empty");
    if (job.task.empty()) throw std::invalid_argument("job task identifier is empty");
    if (!job.args.is_array()) throw std::invalid_argument("job args must be a JSON array");
}

double parse_seconds(const std::string& text) {
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("not a number of seconds: '" + text + "'");
    }
    if (used != text.size() || !std::isfinite(v) || v < 0.0) {
        throw std::invalid_argument("not a number of seconds: '" + text + "'");
    }
    return v;
}

Instant due_at(long long epoch) {
    if (epoch < 0 || epoch > kMaxDueEpochSeconds) {
        throw std::invalid_argument("due time out of range: " + std::to_string(epoch));
    }
    return instant_from_epoch(epoch);
}

Instant due_in(Instant now, double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        throw std::invalid_argument("delay must be a non-negative number of seconds");
    }
    long long base = epoch_seconds(now);
    // Both bounds are far below 2^53, so the comparison is exact.
    if (seconds > static_cast<double>(kMaxDueEpochSeconds - base)) {
        throw std::invalid_argument("delay too large: due time would pass 9999-12-31");
    }
    return due_at(base + std::llround(seconds));
}

long long parse_epoch(const std::string& text) {
    std::size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (text.empty() || used != text.size()) {
        throw std::invalid_argument("not a whole number of epoch seconds: '" + text + "'");
    }
    return v;
}
