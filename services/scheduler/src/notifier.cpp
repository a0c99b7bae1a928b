#include "../include/notifier.hpp"

void Notifier::on_before_delayed_enqueue(Handler handler) {
    std::lock_guard<std::mutex> lock(mtx_);
    handlers_.push_back(std::move(handler));
}

void Notifier::before_delayed_enqueue(const BeforeDelayedEnqueue& event) const {
    // Copy so a handler may subscribe without deadlocking.
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        handlers = handlers_;
    }
    for (const auto& h : handlers) {
        if (h) h(event);
    }
}
