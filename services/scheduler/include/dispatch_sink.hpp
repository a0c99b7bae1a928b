#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "../../../shared/cpp/queue_sdk/include/queue_client.hpp"

// Hands a job to the immediate-execution queue. Throws on failure; callers
// do not retry.
class DispatchSink {
public:
    virtual ~DispatchSink() = default;
    virtual void dispatch(const std::string& queue, const std::string& task, const nlohmann::json& args) = 0;
};

class QueueDispatchSink : public DispatchSink {
public:
    explicit QueueDispatchSink(QueueClient client);
    void dispatch(const std::string& queue, const std::string& task, const nlohmann::json& args) override;

private:
    QueueClient client_;
};
