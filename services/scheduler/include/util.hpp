#pragma once
#include "delayed_job.hpp"
#include <string>

std::string getenv_or(const char* key, const std::string& def);

Instant now_instant();
Instant instant_from_epoch(long long seconds);
long long epoch_seconds(Instant t);

// "YYYY-MM-DD HH:MM:SS" in local time.
std::string format_datetime(Instant t);

// Throws std::invalid_argument when the job cannot be stored or dispatched.
void validate_job(const ScheduledJob& job);

// Parses a non-negative number of seconds, fractions allowed.
double parse_seconds(const std::string& text);

// Latest due time accepted for a job: 9999-12-31 23:59:59 UTC.
constexpr long long kMaxDueEpochSeconds = 253402300799LL;

// Absolute due time from epoch seconds. Throws std::invalid_argument outside
// [0, kMaxDueEpochSeconds].
Instant due_at(long long epoch);

// now + seconds, rounded to the nearest second. Throws std::invalid_argument
// when seconds is negative, not finite, or lands past kMaxDueEpochSeconds.
Instant due_in(Instant now, double seconds);

// Parses a whole number of epoch seconds; the entire text must be consumed.
long long parse_epoch(const std::string& text);
