#pragma once
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct BeforeDelayedEnqueue {
    std::string queue;
    std::string task;
    nlohmann::json args;
};

// One-way event emission. Handlers observe; nothing they return is used.
class Notifier {
public:
    using Handler = std::function<void(const BeforeDelayedEnqueue&)>;

    // Handlers run inside a worker drain. They may subscribe further handlers
    // but must not start another drain on the same worker; that throws
    // std::logic_error out of the running drain.
    void on_before_delayed_enqueue(Handler handler);

    // Handlers run on the caller's thread in subscription order. An exception
    // from a handler propagates to the caller.
    void before_delayed_enqueue(const BeforeDelayedEnqueue& event) const;

private:
    mutable std::mutex mtx_;
    std::vector<Handler> handlers_;
};
