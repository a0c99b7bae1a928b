#include "../include/cli.hpp"
#include "../include/util.hpp"
#include <stdexcept>

std::optional<Command> parse_command(const std::string& name) {
    if (name == "run") return Command::Run;
    if (name == "drain") return Command::Drain;
    if (name == "schedule") return Command::Schedule;
    if (name == "status") return Command::Status;
    return std::nullopt;
}

ScheduleRequest parse_schedule_args(const std::vector<std::string>& args, Instant now) {
    ScheduleRequest req;
    std::string at, in;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (i + 1 >= args.size()) throw std::invalid_argument("unexpected or incomplete argument: " + a);
        if (a == "--queue") req.job.queue = args[++i];
        else if (a == "--class") req.job.task = args[++i];
        else if (a == "--args") {
            try {
                req.job.args = nlohmann::json::parse(args[++i]);
            } catch (const nlohmann::json::exception& e) {
                throw std::invalid_argument(std::string("--args is not valid JSON: ") + e.what());
            }
        }
        else if (a == "--at") at = args[++i];
        else if (a == "--in") in = args[++i];
        else throw std::invalid_argument("unexpected argument: " + a);
    }
    if (at.empty() == in.empty()) throw std::invalid_argument("exactly one of --at or --in is required");
    req.at = !at.empty() ? due_at(parse_epoch(at)) : due_in(now, parse_seconds(in));
    validate_job(req.job);
    return req;
}
