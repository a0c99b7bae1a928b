#pragma once
#include "delayed_job.hpp"
#include <optional>
#include <string>
#include <vector>

// Exit code for every usage error: missing or unknown subcommand, bad flags.
constexpr int kExitUsage = 2;

enum class Command { Run, Drain, Schedule, Status };

std::optional<Command> parse_command(const std::string& name);

struct ScheduleRequest {
    ScheduledJob job;
    Instant at;
};

// Parses `schedule` operands: --queue, --class, --args and exactly one of
// --at <epoch> or --in <secs>. Throws std::invalid_argument on anything else.
ScheduleRequest parse_schedule_args(const std::vector<std::string>& args, Instant now);
