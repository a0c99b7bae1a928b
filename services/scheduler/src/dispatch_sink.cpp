#include "../include/dispatch_sink.hpp"

QueueDispatchSink::QueueDispatchSink(QueueClient client) : client_(std::move(client)) {}

void QueueDispatchSink::dispatch(const std::string& queue, const std::string& task, const nlohmann::json& args) {
    client_.enqueue(queue, task, args);
}
