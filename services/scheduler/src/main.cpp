#include "../include/cli.hpp"
#include "../include/config.hpp"
#include "../include/control_server.hpp"
#include "../include/dispatch_sink.hpp"
#include "../include/logger.hpp"
#include "../include/memory_store.hpp"
#include "../include/notifier.hpp"
#include "../include/shutdown.hpp"
#include "../include/sqlite_store.hpp"
#include "../include/util.hpp"
#include "../include/worker.hpp"
#include "../include/worker_identity.hpp"
#include <curl/curl.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

static void usage() {
    std::cerr << "scheduler usage:\n"
              << "  run      [--db <file>] [--queue-url <url>] [--interval <secs>] [--port <n>] [--memory] [--verbose]\n"
              << "  drain    [--db <file>] [--queue-url <url>] [--verbose]\n"
              << "  schedule --queue <name> --class <task> [--args <json array>] (--at <epoch> | --in <secs>) [--db <file>]\n"
              << "  status   [--db <file>]\n";
}

static std::unique_ptr<TimestampStore> open_store(const SchedulerConfig& cfg) {
    if (cfg.memory_store) return std::make_unique<InMemoryTimestampStore>();
    std::filesystem::path p(cfg.db_path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    return std::make_unique<SqliteTimestampStore>(cfg.db_path);
}

static int cmd_schedule(TimestampStore& store, const std::vector<std::string>& args) {
    ScheduleRequest req;
    try {
        req = parse_schedule_args(args, now_instant());
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        usage();
        return kExitUsage;
    }
    store.schedule(req.at, req.job);
    std::cout << "[OK] Scheduled " << req.job.task << " on " << req.job.queue << " for " << format_datetime(req.at) << "\n";
    return 0;
}

int main(int argc, char** argv) {
    std::optional<Command> cmd = argc < 2 ? std::nullopt : parse_command(argv[1]);
    if (!cmd) { usage(); return kExitUsage; }
    try {
        SchedulerConfig cfg = config_from_env();
        std::vector<std::string> rest;
        try {
            rest = apply_flags(cfg, std::vector<std::string>(argv + 2, argv + argc));
        } catch (const std::invalid_argument& e) {
            std::cerr << "[ERROR] " << e.what() << "\n";
            usage();
            return kExitUsage;
        }

        WorkerIdentity identity = WorkerIdentity::current();
        ConsoleLogger logger("scheduler " + identity.id, cfg.verbose ? LogLevel::Debug : LogLevel::Notice);
        std::unique_ptr<TimestampStore> store = open_store(cfg);

        if (*cmd == Command::Schedule) return cmd_schedule(*store, rest);
        if (!rest.empty()) { usage(); return kExitUsage; }

        if (*cmd == Command::Status) {
            std::cout << "Worker " << identity.id << ": " << store->pending_count() << " delayed job(s) pending\n";
            return 0;
        }

        curl_global_init(CURL_GLOBAL_DEFAULT);
        QueueDispatchSink sink(QueueClient(cfg.queue_url, cfg.dispatch_timeout_ms));
        Notifier notifier;
        ShutdownCoordinator shutdown;
        SchedulerWorker worker(*store, sink, notifier, logger, shutdown, identity);

        if (*cmd == Command::Drain) {
            std::size_t dispatched = worker.drain_due();
            std::cout << "[OK] Dispatched jobs: " << dispatched << "\n";
            curl_global_cleanup();
            return 0;
        }

        logger.log(LogLevel::Notice, "Starting with interval {interval}s, queue at {url}",
                   {{"interval", std::to_string(cfg.interval_s)}, {"url", cfg.queue_url}});
        ControlServer control(worker, *store, logger);
        if (cfg.http_port > 0) control.start(cfg.http_port);
        worker.run(SchedulerWorker::Interval(cfg.interval_s));
        control.stop();
        curl_global_cleanup();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
