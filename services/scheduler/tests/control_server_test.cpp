#include "../include/control_server.hpp"
#include "../include/memory_store.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <thread>

using json = nlohmann::json;

class ControlServerTest : public ::testing::Test {
protected:
    InMemoryTimestampStore store;
    RecordingSink sink;
    Notifier notifier;
    RecordingLogger logger;
    ShutdownCoordinator shutdown;
    SchedulerWorker worker{store, sink, notifier, logger, shutdown, WorkerIdentity{"ctl", 7, "ctl:7"}};
    ControlServer server{worker, store, logger};
};

TEST_F(ControlServerTest, ReportsStatus) {
    auto r = server.handle("GET", "/status", "");
    ASSERT_EQ(r.status, 200);
    auto j = json::parse(r.body);
    EXPECT_EQ(j["id"], "ctl:7");
    EXPECT_EQ(j["pending"], 0);
    EXPECT_EQ(j["shutdown"], false);
}

TEST_F(ControlServerTest, SchedulesAndDrainsDueJobs) {
    long long past = epoch_seconds(now_instant()) - 60;
    auto r = server.handle("POST", "/schedule",
                           json({{"queue", "emails"}, {"class", "Send"}, {"args", json::array({"x"})}, {"at", past}}).dump());
    ASSERT_EQ(r.status, 200) << r.body;
    EXPECT_EQ(json::parse(r.body)["at"], past);
    EXPECT_EQ(store.pending_count(), 1u);

    r = server.handle("POST", "/drain", "");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(json::parse(r.body)["dispatched"], 1);
    ASSERT_EQ(sink.jobs.size(), 1u);
    EXPECT_EQ(sink.jobs[0].queue, "emails");
    EXPECT_EQ(sink.jobs[0].args, json::array({"x"}));
}

TEST_F(ControlServerTest, RelativeScheduleStaysPending) {
    auto r = server.handle("POST", "/schedule", R"({"queue":"q","class":"Later","in":3600})");
    ASSERT_EQ(r.status, 200) << r.body;
    server.handle("POST", "/drain", "");
    EXPECT_TRUE(sink.jobs.empty());
    EXPECT_EQ(store.pending_count(), 1u);
}

TEST_F(ControlServerTest, RejectsBadScheduleRequests) {
    EXPECT_EQ(server.handle("POST", "/schedule", "{").status, 400);
    EXPECT_EQ(server.handle("POST", "/schedule", R"({"queue":"q","class":"A"})").status, 400);
    EXPECT_EQ(server.handle("POST", "/schedule", R"({"queue":"","class":"A","at":1})").status, 400);
    EXPECT_EQ(server.handle("POST", "/schedule", R"({"queue":"q","class":"A","args":{},"at":1})").status, 400);
    EXPECT_EQ(store.pending_count(), 0u);
}

TEST_F(ControlServerTest, DrainFailureIsReported) {
    store.schedule(now_instant() - std::chrono::seconds(1), make_job("q", "A", json::array()));
    sink.fail_next = true;
    auto r = server.handle("POST", "/drain", "");
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(json::parse(r.body)["error"], "queue unavailable");
}

TEST_F(ControlServerTest, ShutdownRequestIsIdempotent) {
    EXPECT_EQ(server.handle("POST", "/shutdown", "").status, 200);
    EXPECT_EQ(server.handle("POST", "/shutdown", "").status, 200);
    EXPECT_TRUE(worker.shutdown_requested());
    EXPECT_EQ(logger.count("Shutting down"), 1u);
}

TEST_F(ControlServerTest, UnknownRouteIsNotFound) {
    EXPECT_EQ(server.handle("GET", "/nope", "").status, 404);
    EXPECT_EQ(server.handle("GET", "/drain", "").status, 404);
}

TEST_F(ControlServerTest, RejectsDelaysPastTheCalendar) {
    auto r = server.handle("POST", "/schedule", json({{"queue", "q"}, {"class", "A"}, {"in", 1e300}}).dump());
    EXPECT_EQ(r.status, 400) << r.body;
    EXPECT_EQ(store.pending_count(), 0u);

    r = server.handle("POST", "/schedule", json({{"queue", "q"}, {"class", "A"}, {"in", -1}}).dump());
    EXPECT_EQ(r.status, 400) << r.body;
    EXPECT_EQ(store.pending_count(), 0u);

    // Nothing was stored under a wrapped-around past timestamp.
    r = server.handle("POST", "/drain", "");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(json::parse(r.body)["dispatched"], 0);
    EXPECT_TRUE(sink.jobs.empty());
}

TEST_F(ControlServerTest, AbsoluteDueTimeMustBeAWholeInRangeEpoch) {
    auto r = server.handle("POST", "/schedule", json({{"queue", "q"}, {"class", "A"}, {"at", 1.5}}).dump());
    EXPECT_EQ(r.status, 400) << r.body;
    r = server.handle("POST", "/schedule", json({{"queue", "q"}, {"class", "A"}, {"at", "1700000000"}}).dump());
    EXPECT_EQ(r.status, 400) << r.body;
    r = server.handle("POST", "/schedule", json({{"queue", "q"}, {"class", "A"}, {"at", -1}}).dump());
    EXPECT_EQ(r.status, 400) << r.body;
    r = server.handle("POST", "/schedule",
                      json({{"queue", "q"}, {"class", "A"}, {"at", kMaxDueEpochSeconds + 1}}).dump());
    EXPECT_EQ(r.status, 400) << r.body;
    r = server.handle("POST", "/schedule",
                      json({{"queue", "q"}, {"class", "A"}, {"at", 18446744073709551615ULL}}).dump());
    EXPECT_EQ(r.status, 400) << r.body;
    EXPECT_EQ(store.pending_count(), 0u);

    r = server.handle("POST", "/schedule", json({{"queue", "q"}, {"class", "A"}, {"at", kMaxDueEpochSeconds}}).dump());
    ASSERT_EQ(r.status, 200) << r.body;
    EXPECT_EQ(json::parse(r.body)["at"], kMaxDueEpochSeconds);
}

TEST_F(ControlServerTest, RelativeDelayRoundsToTheNearestSecond) {
    long long before = epoch_seconds(now_instant());
    auto r = server.handle("POST", "/schedule", json({{"queue", "q"}, {"class", "A"}, {"in", 100.6}}).dump());
    ASSERT_EQ(r.status, 200) << r.body;
    long long at = json::parse(r.body)["at"].get<long long>();
    long long after = epoch_seconds(now_instant());
    EXPECT_GE(at, before + 101);
    EXPECT_LE(at, after + 101);
}

TEST_F(ControlServerTest, DrainCountsOnlyItsOwnDispatches) {
    store.schedule(now_instant() - std::chrono::seconds(5), make_job("q", "A", json::array()));

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    bool first = true;
    sink.before_dispatch = [&] {
        if (!first) return;
        first = false;
        entered.set_value();
        released.wait();
    };

    auto loop_drain = std::async(std::launch::async, [&] { return worker.drain_due(); });
    entered.get_future().wait();

    auto http_drain = std::async(std::launch::async, [&] { return server.handle("POST", "/drain", ""); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    release.set_value();

    EXPECT_EQ(loop_drain.get(), 1u);
    auto r = http_drain.get();
    ASSERT_EQ(r.status, 200) << r.body;
    EXPECT_EQ(json::parse(r.body)["dispatched"], 0);
    EXPECT_EQ(sink.jobs.size(), 1u);
}
