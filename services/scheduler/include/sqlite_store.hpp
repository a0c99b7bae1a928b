#pragma once
#include "timestamp_store.hpp"
#include <mutex>
#include <string>

// Durable store shared by any number of worker processes. pop_job runs in an
// IMMEDIATE transaction so each job is handed to exactly one caller.
class SqliteTimestampStore : public TimestampStore {
public:
    explicit SqliteTimestampStore(const std::string& db_path, Clock clock = {});
    ~SqliteTimestampStore();

    SqliteTimestampStore(const SqliteTimestampStore&) = delete;
    SqliteTimestampStore& operator=(const SqliteTimestampStore&) = delete;

    std::optional<Instant> next_due_timestamp(const DueTimestamp& horizon) override;
    std::optional<ScheduledJob> pop_job(Instant ts) override;
    void schedule(Instant at, const ScheduledJob& job) override;
    std::size_t pending_count() override;
    std::size_t pending_at(Instant ts) override;

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    [[noreturn]] void fail(const std::string& what);

    Clock clock_;
    std::mutex mtx_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* next_due_stmt_ {nullptr};
    struct sqlite3_stmt* first_at_stmt_ {nullptr};
    struct sqlite3_stmt* delete_by_id_stmt_ {nullptr};
    struct sqlite3_stmt* count_stmt_ {nullptr};
    struct sqlite3_stmt* count_at_stmt_ {nullptr};
};
