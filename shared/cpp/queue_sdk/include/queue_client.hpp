#pragma once
#include <string>
#include <nlohmann/json.hpp>

// Client for the immediate-execution queue service.
class QueueClient {
public:
    explicit QueueClient(std::string base_url, long timeout_ms = 10000);

    // POSTs the job to <base>/enqueue. Throws std::runtime_error on transport
    // failure or a non-2xx answer.
    void enqueue(const std::string& queue, const std::string& task, const nlohmann::json& args);

    static nlohmann::json enqueue_body(const std::string& queue, const std::string& task, const nlohmann::json& args);

    const std::string& base_url() const { return base_; }

private:
    std::string base_;
    long timeout_ms_;
};
