#pragma once
#include <string>
#include <vector>

struct SchedulerConfig {
    std::string db_path{"./data/scheduler.db"};
    std::string queue_url{"http://localhost:7000"};
    double interval_s{5.0};
    int http_port{0};          // 0 disables the control server
    bool verbose{false};
    bool memory_store{false};
    long dispatch_timeout_ms{10000};
};

// Reads SCHEDULER_* / QUEUE_URL environment variables over the defaults.
SchedulerConfig config_from_env();

// Applies recognised flags and returns the ones it did not consume.
// Throws std::invalid_argument on a malformed value or a missing operand.
std::vector<std::string> apply_flags(SchedulerConfig& cfg, const std::vector<std::string>& args);
