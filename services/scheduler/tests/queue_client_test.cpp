#include "../../../shared/cpp/queue_sdk/include/queue_client.hpp"
#include "../include/dispatch_sink.hpp"
#include <gtest/gtest.h>

using json = nlohmann::json;

TEST(QueueClient, BuildsEnqueueBody) {
    json body = QueueClient::enqueue_body("emails", "Send", json::array({"x", 2}));
    EXPECT_EQ(body, json({{"queue", "emails"}, {"class", "Send"}, {"args", json::array({"x", 2})}}));
}

TEST(QueueClient, NullArgsBecomeAnEmptyList) {
    json body = QueueClient::enqueue_body("q", "T", json());
    EXPECT_EQ(body["args"], json::array());
}

TEST(QueueClient, TrimsTrailingSlash) {
    QueueClient c("http://localhost:7000/");
    EXPECT_EQ(c.base_url(), "http://localhost:7000");
}

TEST(QueueDispatchSink, UnreachableQueueThrows) {
    // Port 1 on loopback refuses connections.
    QueueDispatchSink sink(QueueClient("http://127.0.0.1:1", 2000));
    EXPECT_THROW(sink.dispatch("q", "T", json::array()), std::runtime_error);
}
