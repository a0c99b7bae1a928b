#include "../include/config.hpp"
#include "../include/util.hpp"
#include <stdexcept>

static int parse_port(const std::string& text) {
    std::size_t used = 0;
    int port = -1;
    try {
        port = std::stoi(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != text.size() || port < 0 || port > 65535) {
        throw std::invalid_argument("invalid port: '" + text + "'");
    }
    return port;
}

static long parse_timeout_ms(const std::string& text) {
    std::size_t used = 0;
    long v = -1;
    try {
        v = std::stol(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != text.size() || v <= 0) {
        throw std::invalid_argument("invalid timeout: '" + text + "'");
    }
    return v;
}

static bool truthy(const std::string& v) {
    return !v.empty() && v != "0" && v != "false" && v != "no";
}

SchedulerConfig config_from_env() {
    SchedulerConfig cfg;
    cfg.db_path = getenv_or("SCHEDULER_DB_PATH", cfg.db_path);
    cfg.queue_url = getenv_or("QUEUE_URL", cfg.queue_url);
    std::string v = getenv_or("SCHEDULER_INTERVAL", "");
    if (!v.empty()) cfg.interval_s = parse_seconds(v);
    v = getenv_or("SCHEDULER_PORT", "");
    if (!v.empty()) cfg.http_port = parse_port(v);
    cfg.verbose = truthy(getenv_or("SCHEDULER_VERBOSE", ""));
    v = getenv_or("SCHEDULER_DISPATCH_TIMEOUT_MS", "");
    if (!v.empty()) cfg.dispatch_timeout_ms = parse_timeout_ms(v);
    return cfg;
}

std::vector<std::string> apply_flags(SchedulerConfig& cfg, const std::vector<std::string>& args) {
    std::vector<std::string> rest;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        auto operand = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw std::invalid_argument("missing value for " + a);
            return args[++i];
        };
        if (a == "--db") cfg.db_path = operand();
        else if (a == "--queue-url") cfg.queue_url = operand();
        else if (a == "--interval") cfg.interval_s = parse_seconds(operand());
        else if (a == "--port") cfg.http_port = parse_port(operand());
        else if (a == "--dispatch-timeout-ms") cfg.dispatch_timeout_ms = parse_timeout_ms(operand());
        else if (a == "--verbose") cfg.verbose = true;
        else if (a == "--memory") cfg.memory_store = true;
        else rest.push_back(a);
    }
    return rest;
}
