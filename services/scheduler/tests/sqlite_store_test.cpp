#include "../include/sqlite_store.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <set>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

class SqliteStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = std::filesystem::temp_directory_path() /
                ("scheduler_test_" + std::to_string(getpid()) + "_" + info->name() + ".db");
        remove_files();
    }

    void TearDown() override { remove_files(); }

    void remove_files() {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(path_.string() + suffix, ec);
        }
    }

    std::filesystem::path path_;
    FakeClock clock;
};

TEST_F(SqliteStoreTest, StoresAndPopsJobsPerTimestamp) {
    SqliteTimestampStore store(path_.string(), clock.fn());
    Instant t = clock.now - std::chrono::seconds(60);
    store.schedule(t, make_job("emails", "Send", json::array({"x", {{"k", 1}}})));
    store.schedule(t, make_job("emails", "Send", json::array({"y"})));

    EXPECT_EQ(store.pending_count(), 2u);
    EXPECT_EQ(store.pending_at(t), 2u);
    EXPECT_EQ(store.next_due_timestamp(std::nullopt), t);

    auto a = store.pop_job(t);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->queue, "emails");
    EXPECT_EQ(a->task, "Send");
    EXPECT_EQ(a->args, json::array({"x", {{"k", 1}}}));
    auto b = store.pop_job(t);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->args, json::array({"y"}));
    EXPECT_FALSE(store.pop_job(t).has_value());
    EXPECT_FALSE(store.next_due_timestamp(std::nullopt).has_value());
}

TEST_F(SqliteStoreTest, HorizonExcludesLaterTimestamps) {
    SqliteTimestampStore store(path_.string(), clock.fn());
    store.schedule(clock.now + std::chrono::seconds(10), make_job("q", "Later", json::array()));
    store.schedule(clock.now - std::chrono::seconds(10), make_job("q", "Earlier", json::array()));

    EXPECT_EQ(store.next_due_timestamp(std::nullopt), clock.now - std::chrono::seconds(10));
    EXPECT_FALSE(store.next_due_timestamp(clock.now - std::chrono::seconds(11)).has_value());
    EXPECT_EQ(store.next_due_timestamp(clock.now + std::chrono::seconds(10)), clock.now - std::chrono::seconds(10));
}

TEST_F(SqliteStoreTest, JobsSurviveReopening) {
    {
        SqliteTimestampStore store(path_.string(), clock.fn());
        store.schedule(clock.now, make_job("q", "Persisted", json::array({42})));
    }
    SqliteTimestampStore reopened(path_.string(), clock.fn());
    EXPECT_EQ(reopened.pending_count(), 1u);
    auto job = reopened.pop_job(clock.now);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->task, "Persisted");
    EXPECT_EQ(job->args, json::array({42}));
}

TEST_F(SqliteStoreTest, ConcurrentConnectionsNeverReceiveTheSameJob) {
    const int kJobs = 50;
    {
        SqliteTimestampStore store(path_.string(), clock.fn());
        for (int i = 0; i < kJobs; ++i) store.schedule(clock.now, make_job("q", "Job", json::array({i})));
    }

    std::vector<int> got_a, got_b;
    auto drain = [&](std::vector<int>& out) {
        SqliteTimestampStore store(path_.string(), clock.fn());
        while (auto job = store.pop_job(clock.now)) out.push_back(job->args.at(0).get<int>());
    };
    std::thread ta(drain, std::ref(got_a));
    std::thread tb(drain, std::ref(got_b));
    ta.join();
    tb.join();

    std::set<int> all(got_a.begin(), got_a.end());
    all.insert(got_b.begin(), got_b.end());
    EXPECT_EQ(got_a.size() + got_b.size(), (std::size_t)kJobs);
    EXPECT_EQ(all.size(), (std::size_t)kJobs);
}

TEST_F(SqliteStoreTest, RejectsInvalidJobs) {
    SqliteTimestampStore store(path_.string(), clock.fn());
    EXPECT_THROW(store.schedule(clock.now, make_job("", "A", json::array())), std::invalid_argument);
    EXPECT_EQ(store.pending_count(), 0u);
}

TEST(SqliteStoreOpen, FailsForUnreachablePath) {
    EXPECT_THROW(SqliteTimestampStore("/nonexistent-dir/for/scheduler/test.db"), std::runtime_error);
}
