#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Wall-clock instant at second resolution.
using Instant = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

// Search bound for due jobs. std::nullopt means "now" and is resolved by the
// store on every query, not once per drain.
using DueTimestamp = std::optional<Instant>;

using Clock = std::function<Instant()>;

struct ScheduledJob {
    std::string queue;  // destination queue name
    std::string task;   // task identifier (class name on the consumer side)
    nlohmann::json args = nlohmann::json::array(); // opaque, passed through unmodified
};
