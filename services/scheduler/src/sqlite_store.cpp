#include "../include/sqlite_store.hpp"
#include "../include/util.hpp"
#include <sqlite3.h>
#include <stdexcept>

namespace {

struct StmtReset {
    sqlite3_stmt* st;
    explicit StmtReset(sqlite3_stmt* s) : st(s) {}
    ~StmtReset() {
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
    }
};

std::string column_text(sqlite3_stmt* st, int idx) {
    const unsigned char* p = sqlite3_column_text(st, idx);
    return p ? std::string(reinterpret_cast<const char*>(p), sqlite3_column_bytes(st, idx)) : std::string();
}

void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

} // namespace

SqliteTimestampStore::SqliteTimestampStore(const std::string& db_path, Clock clock)
    : clock_(clock ? std::move(clock) : Clock(now_instant)) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite DB: " + db_path + ": " + msg);
    }
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteTimestampStore::~SqliteTimestampStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteTimestampStore::init() {
    // Other workers may hold the write lock while popping.
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS delayed_jobs (\n"
         "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  due_at INTEGER NOT NULL,\n"
         "  queue TEXT NOT NULL,\n"
         "  task TEXT NOT NULL,\n"
         "  args TEXT NOT NULL\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_delayed_jobs_due_at ON delayed_jobs(due_at, id);");
}

void SqliteTimestampStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void SqliteTimestampStore::fail(const std::string& what) {
    throw std::runtime_error("SQLite error: " + what + ": " + sqlite3_errmsg(db_));
}

void SqliteTimestampStore::prepare_statements() {
    auto prepare = [&](const char* sql, sqlite3_stmt** out) {
        if (sqlite3_prepare_v2(db_, sql, -1, out, nullptr) != SQLITE_OK) {
            fail(std::string("prepare failed for '") + sql + "'");
        }
    };
    prepare("INSERT INTO delayed_jobs (due_at, queue, task, args) VALUES (?, ?, ?, ?);", &insert_stmt_);
    prepare("SELECT MIN(due_at) FROM delayed_jobs WHERE due_at <= ?;", &next_due_stmt_);
    prepare("SELECT id, queue, task, args FROM delayed_jobs WHERE due_at = ? ORDER BY id LIMIT 1;", &first_at_stmt_);
    prepare("DELETE FROM delayed_jobs WHERE id = ?;", &delete_by_id_stmt_);
    prepare("SELECT COUNT(*) FROM delayed_jobs;", &count_stmt_);
    prepare("SELECT COUNT(*) FROM delayed_jobs WHERE due_at = ?;", &count_at_stmt_);
}

void SqliteTimestampStore::close_statements() {
    for (sqlite3_stmt** st : {&insert_stmt_, &next_due_stmt_, &first_at_stmt_,
                              &delete_by_id_stmt_, &count_stmt_, &count_at_stmt_}) {
        if (*st) { sqlite3_finalize(*st); *st = nullptr; }
    }
}

std::optional<Instant> SqliteTimestampStore::next_due_timestamp(const DueTimestamp& horizon) {
    Instant bound = horizon ? *horizon : clock_();
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset reset(next_due_stmt_);
    sqlite3_bind_int64(next_due_stmt_, 1, epoch_seconds(bound));
    if (sqlite3_step(next_due_stmt_) != SQLITE_ROW) fail("next due timestamp query failed");
    if (sqlite3_column_type(next_due_stmt_, 0) == SQLITE_NULL) return std::nullopt;
    return instant_from_epoch(sqlite3_column_int64(next_due_stmt_, 0));
}

std::optional<ScheduledJob> SqliteTimestampStore::pop_job(Instant ts) {
    std::lock_guard<std::mutex> lock(mtx_);
    exec("BEGIN IMMEDIATE;");
    try {
        ScheduledJob job;
        sqlite3_int64 id = 0;
        {
            StmtReset reset(first_at_stmt_);
            sqlite3_bind_int64(first_at_stmt_, 1, epoch_seconds(ts));
            int rc = sqlite3_step(first_at_stmt_);
            if (rc == SQLITE_DONE) {
                exec("COMMIT;");
                return std::nullopt;
            }
            if (rc != SQLITE_ROW) fail("select due job failed");
            id = sqlite3_column_int64(first_at_stmt_, 0);
            job.queue = column_text(first_at_stmt_, 1);
            job.task = column_text(first_at_stmt_, 2);
            job.args = nlohmann::json::parse(column_text(first_at_stmt_, 3));
        }
        {
            StmtReset reset(delete_by_id_stmt_);
            sqlite3_bind_int64(delete_by_id_stmt_, 1, id);
            if (sqlite3_step(delete_by_id_stmt_) != SQLITE_DONE) fail("delete popped job failed");
        }
        exec("COMMIT;");
        return job;
    } catch (...) {
        // The job stays stored; the caller still sees the original error.
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

void SqliteTimestampStore::schedule(Instant at, const ScheduledJob& job) {
    validate_job(job);
    std::string args = job.args.dump();
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset reset(insert_stmt_);
    sqlite3_bind_int64(insert_stmt_, 1, epoch_seconds(at));
    bind_text(insert_stmt_, 2, job.queue);
    bind_text(insert_stmt_, 3, job.task);
    bind_text(insert_stmt_, 4, args);
    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) fail("insert delayed job failed");
}

std::size_t SqliteTimestampStore::pending_count() {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset reset(count_stmt_);
    if (sqlite3_step(count_stmt_) != SQLITE_ROW) fail("count query failed");
    return static_cast<std::size_t>(sqlite3_column_int64(count_stmt_, 0));
}

std::size_t SqliteTimestampStore::pending_at(Instant ts) {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset reset(count_at_stmt_);
    sqlite3_bind_int64(count_at_stmt_, 1, epoch_seconds(ts));
    if (sqlite3_step(count_at_stmt_) != SQLITE_ROW) fail("count query failed");
    return static_cast<std::size_t>(sqlite3_column_int64(count_at_stmt_, 0));
}
