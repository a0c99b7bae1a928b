#pragma once
#include "logger.hpp"
#include "timestamp_store.hpp"
#include "worker.hpp"
#include <string>

struct MHD_Daemon;

// HTTP control surface for a running worker:
//   GET  /status    identity, phase, pending and dispatched counts
//   POST /schedule  {"queue","class","args","at"|"in"}
//   POST /drain     one drain pass now
//   POST /shutdown  cooperative stop
class ControlServer {
public:
    struct Response {
        int status{200};
        std::string body;
    };

    ControlServer(SchedulerWorker& worker, TimestampStore& store, Logger& logger);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Throws std::runtime_error if the daemon cannot bind.
    void start(int port);
    void stop();

    Response handle(const std::string& method, const std::string& path, const std::string& body);

private:
    Response schedule(const std::string& body);
    Response drain();

    SchedulerWorker& worker_;
    TimestampStore& store_;
    Logger& logger_;
    MHD_Daemon* daemon_{nullptr};
};
