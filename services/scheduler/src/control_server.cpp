#include "../include/control_server.hpp"
#include "../include/util.hpp"
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <sys/select.h>
#include <sys/socket.h>
#include <microhttpd.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

namespace {

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

MhdResult send_response(struct MHD_Connection* conn, int status, const std::string& body) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, "application/json");
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

MhdResult on_request(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                     const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    auto* server = static_cast<ControlServer*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }
    if (*upload_data_size) {
        ci->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }
    ControlServer::Response r = server->handle(ci->method, ci->url, ci->body);
    return send_response(connection, r.status, r.body);
}

void on_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                  enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

ControlServer::Response error_response(int status, const std::string& message) {
    return {status, json({{"error", message}}).dump()};
}

} // namespace

ControlServer::ControlServer(SchedulerWorker& worker, TimestampStore& store, Logger& logger)
    : worker_(worker), store_(store), logger_(logger) {}

ControlServer::~ControlServer() {
    stop();
}

void ControlServer::start(int port) {
    if (daemon_) return;
    daemon_ = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, (uint16_t)port, nullptr, nullptr,
                               &on_request, this,
                               MHD_OPTION_NOTIFY_COMPLETED, &on_completed, nullptr,
                               MHD_OPTION_END);
    if (!daemon_) throw std::runtime_error("Failed to start control server on port " + std::to_string(port));
    logger_.log(LogLevel::Notice, "Control server listening on port {port}", {{"port", std::to_string(port)}});
}

void ControlServer::stop() {
    if (!daemon_) return;
    MHD_stop_daemon(daemon_);
    daemon_ = nullptr;
}

ControlServer::Response ControlServer::handle(const std::string& method, const std::string& path,
                                              const std::string& body) {
    try {
        if (method == "GET" && path == "/status") {
            json out = {
                {"id", worker_.id()},
                {"status", worker_.status()},
                {"shutdown", worker_.shutdown_requested()},
                {"pending", store_.pending_count()},
                {"dispatched", worker_.dispatched_count()}
            };
            return {200, out.dump()};
        }
        if (method == "POST" && path == "/schedule") return schedule(body);
        if (method == "POST" && path == "/drain") return drain();
        if (method == "POST" && path == "/shutdown") {
            worker_.shutdown();
            return {200, json({{"ok", true}}).dump()};
        }
        return error_response(404, "not found");
    } catch (const std::exception& e) {
        return error_response(500, e.what());
    }
}

ControlServer::Response ControlServer::schedule(const std::string& body) {
    Instant at;
    ScheduledJob job;
    try {
        auto j = json::parse(body);
        job.queue = j.at("queue").get<std::string>();
        job.task = j.at("class").get<std::string>();
        job.args = j.value("args", json::array());
        if (j.contains("at")) {
            const json& v = j.at("at");
            if (!v.is_number_integer()) return error_response(400, "'at' must be a whole number of epoch seconds");
            if (v.is_number_unsigned() && v.get<unsigned long long>() > (unsigned long long)kMaxDueEpochSeconds) {
                return error_response(400, "due time out of range");
            }
            at = due_at(v.get<long long>());
        } else if (j.contains("in")) {
            const json& v = j.at("in");
            if (!v.is_number()) return error_response(400, "'in' must be a number of seconds");
            at = due_in(now_instant(), v.get<double>());
        } else {
            return error_response(400, "one of 'at' or 'in' is required");
        }
        validate_job(job);
    } catch (const json::exception& e) {
        return error_response(400, e.what());
    } catch (const std::invalid_argument& e) {
        return error_response(400, e.what());
    }
    store_.schedule(at, job);
    return {200, json({{"ok", true}, {"at", epoch_seconds(at)}}).dump()};
}

ControlServer::Response ControlServer::drain() {
    std::size_t dispatched = worker_.drain_due(std::nullopt);
    json out = {{"ok", true}, {"dispatched", dispatched}};
    return {200, out.dump()};
}
