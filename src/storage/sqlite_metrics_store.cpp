/**
 * @file sqlite_metrics_store.cpp
 * @brief SqliteMetricsStore: metrics persistence on embedded SQLite.
 * @author Dimitris Kafetzis
 */

#include "storage/metrics_store.hpp"

#include <sqlite3.h>

#include <string>

namespace adaptive_scheduler {

namespace {

constexpr const char* SCHEMA_SQL = R"sql(
CREATE TABLE IF NOT EXISTS metrics (
    id            INTEGER PRIMARY KEY AUTOINCREMENT,
    task_id       TEXT    NOT NULL,
    provider_id   TEXT    NOT NULL,
    timestamp_us  INTEGER NOT NULL,
    latency       REAL    NOT NULL DEFAULT 0,
    cpu_usage     REAL    NOT NULL DEFAULT 0,
    ram_usage     REAL    NOT NULL DEFAULT 0,
    throughput    REAL    NOT NULL DEFAULT 0,
    error_rate    REAL    NOT NULL DEFAULT 0,
    queue_depth   INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_metrics_provider_ts ON metrics(provider_id, timestamp_us);
CREATE INDEX IF NOT EXISTS idx_metrics_task_ts     ON metrics(task_id, timestamp_us);
CREATE INDEX IF NOT EXISTS idx_metrics_ts          ON metrics(timestamp_us);

CREATE TABLE IF NOT EXISTS metric_metadata (
    metric_id  INTEGER NOT NULL,
    key        TEXT    NOT NULL,
    value      TEXT    NOT NULL,
    PRIMARY KEY (metric_id, key)
);

CREATE TABLE IF NOT EXISTS provider_summaries (
    provider_id      TEXT PRIMARY KEY,
    total_tasks      INTEGER NOT NULL DEFAULT 0,
    avg_latency      REAL    NOT NULL DEFAULT 0,
    avg_cpu          REAL    NOT NULL DEFAULT 0,
    avg_ram          REAL    NOT NULL DEFAULT 0,
    error_rate       REAL    NOT NULL DEFAULT 0,
    last_updated_us  INTEGER NOT NULL DEFAULT 0
);
)sql";

/**
 * @brief Owning wrapper around a prepared statement.
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] bool ok() const noexcept { return rc_ == SQLITE_OK; }
    [[nodiscard]] std::string error() const { return sqlite3_errmsg(db_); }

    void bind(int idx, const std::string& value) {
        sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bind(int idx, int64_t value) { sqlite3_bind_int64(stmt_, idx, value); }
    void bind(int idx, double value) { sqlite3_bind_double(stmt_, idx, value); }

    int step() { return sqlite3_step(stmt_); }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    [[nodiscard]] std::string text(int col) const {
        const auto* raw = sqlite3_column_text(stmt_, col);
        return raw ? std::string{reinterpret_cast<const char*>(raw)} : std::string{};
    }
    [[nodiscard]] int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    [[nodiscard]] double real(int col) const { return sqlite3_column_double(stmt_, col); }
    [[nodiscard]] bool is_null(int col) const {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
    int rc_;
};

Error sql_error(sqlite3* db, const std::string& context) {
    return Error{context + ": " + sqlite3_errmsg(db)};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<std::unique_ptr<SqliteMetricsStore>> SqliteMetricsStore::open(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{"cannot create " + path.parent_path().string() + ": " + ec.message()};
        }
    }

    sqlite3* db = nullptr;
    if (sqlite3_open(path.string().c_str(), &db) != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        return Error{"cannot open metrics database " + path.string() + ": " + message};
    }
    sqlite3_busy_timeout(db, 2000);

    std::unique_ptr<SqliteMetricsStore> store(new SqliteMetricsStore(db, path));
    if (auto schema = store->initialize_schema(); !schema) {
        return schema.error();
    }
    return Result<std::unique_ptr<SqliteMetricsStore>>{std::move(store)};
}

SqliteMetricsStore::SqliteMetricsStore(sqlite3* db, std::filesystem::path path)
    : db_(db), path_(std::move(path)) {}

SqliteMetricsStore::~SqliteMetricsStore() {
    sqlite3_close(db_);
}

bool SqliteMetricsStore::in_transaction() {
    std::lock_guard lock(mutex_);
    return sqlite3_get_autocommit(db_) == 0;
}

Result<void> SqliteMetricsStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        return Error{std::string{"sqlite exec failed: "} + message};
    }
    return {};
}

Result<void> SqliteMetricsStore::initialize_schema() {
    std::lock_guard lock(mutex_);
    if (auto r = exec("PRAGMA journal_mode=WAL;"); !r) return r;
    return exec(SCHEMA_SQL);
}

// ─────────────────────────────────────────────
// Writes
// ─────────────────────────────────────────────

Result<void> SqliteMetricsStore::append(const std::vector<MetricRecord>& records) {
    if (records.empty()) return {};

    std::lock_guard lock(mutex_);
    if (auto r = exec("BEGIN IMMEDIATE;"); !r) return r;

    auto rollback = [this](Error error) -> Result<void> {
        (void)exec("ROLLBACK;");
        return error;
    };

    Statement insert(db_,
        "INSERT INTO metrics (task_id, provider_id, timestamp_us, latency, cpu_usage,"
        " ram_usage, throughput, error_rate, queue_depth)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    Statement insert_meta(db_,
        "INSERT OR REPLACE INTO metric_metadata (metric_id, key, value) VALUES (?, ?, ?)");
    if (!insert.ok()) return rollback(sql_error(db_, "prepare metrics insert"));
    if (!insert_meta.ok()) return rollback(sql_error(db_, "prepare metadata insert"));

    for (const auto& rec : records) {
        insert.reset();
        insert.bind(1, rec.task_id);
        insert.bind(2, rec.provider_id);
        insert.bind(3, to_unix_micros(rec.timestamp));
        insert.bind(4, rec.latency);
        insert.bind(5, rec.cpu_usage);
        insert.bind(6, rec.ram_usage);
        insert.bind(7, rec.throughput);
        insert.bind(8, rec.error_rate);
        insert.bind(9, static_cast<int64_t>(rec.queue_depth));
        if (insert.step() != SQLITE_DONE) {
            return rollback(sql_error(db_, "insert metric for " + rec.task_id));
        }

        const int64_t metric_id = sqlite3_last_insert_rowid(db_);
        for (const auto& [key, value] : rec.metadata) {
            insert_meta.reset();
            insert_meta.bind(1, metric_id);
            insert_meta.bind(2, key);
            insert_meta.bind(3, value);
            if (insert_meta.step() != SQLITE_DONE) {
                return rollback(sql_error(db_, "insert metadata '" + key + "'"));
            }
        }

        if (auto r = upsert_summary(rec); !r) {
            return rollback(r.error());
        }
    }

    return commit();
}

Result<void> SqliteMetricsStore::commit() {
    if (auto r = exec("COMMIT;"); !r) {
        // A failed COMMIT can leave the transaction open
        if (!sqlite3_get_autocommit(db_)) (void)exec("ROLLBACK;");
        return r;
    }
    return {};
}

Result<void> SqliteMetricsStore::upsert_summary(const MetricRecord& record) {
    ProviderSummary summary{.provider_id = record.provider_id};

    Statement select(db_,
        "SELECT total_tasks, avg_latency, avg_cpu, avg_ram, error_rate"
        " FROM provider_summaries WHERE provider_id = ?");
    if (!select.ok()) return sql_error(db_, "prepare summary select");
    select.bind(1, record.provider_id);
    if (select.step() == SQLITE_ROW) {
        summary.total_tasks = static_cast<uint64_t>(select.int64(0));
        summary.avg_latency = select.real(1);
        summary.avg_cpu = select.real(2);
        summary.avg_ram = select.real(3);
        summary.error_rate = select.real(4);
    }

    accumulate(summary, record);

    Statement upsert(db_,
        "INSERT INTO provider_summaries (provider_id, total_tasks, avg_latency, avg_cpu,"
        " avg_ram, error_rate, last_updated_us) VALUES (?, ?, ?, ?, ?, ?, ?)"
        " ON CONFLICT(provider_id) DO UPDATE SET total_tasks = excluded.total_tasks,"
        " avg_latency = excluded.avg_latency, avg_cpu = excluded.avg_cpu,"
        " avg_ram = excluded.avg_ram, error_rate = excluded.error_rate,"
        " last_updated_us = excluded.last_updated_us");
    if (!upsert.ok()) return sql_error(db_, "prepare summary upsert");
    upsert.bind(1, summary.provider_id);
    upsert.bind(2, static_cast<int64_t>(summary.total_tasks));
    upsert.bind(3, summary.avg_latency);
    upsert.bind(4, summary.avg_cpu);
    upsert.bind(5, summary.avg_ram);
    upsert.bind(6, summary.error_rate);
    upsert.bind(7, to_unix_micros(summary.last_updated));
    if (upsert.step() != SQLITE_DONE) {
        return sql_error(db_, "upsert summary for " + summary.provider_id);
    }
    return {};
}

Result<uint64_t> SqliteMetricsStore::delete_older_than(Timestamp cutoff) {
    std::lock_guard lock(mutex_);
    if (auto r = exec("BEGIN IMMEDIATE;"); !r) return r.error();

    const int64_t cutoff_us = to_unix_micros(cutoff);

    Statement delete_meta(db_,
        "DELETE FROM metric_metadata WHERE metric_id IN"
        " (SELECT id FROM metrics WHERE timestamp_us < ?)");
    Statement delete_rows(db_, "DELETE FROM metrics WHERE timestamp_us < ?");
    if (!delete_meta.ok() || !delete_rows.ok()) {
        auto error = sql_error(db_, "prepare retention sweep");
        (void)exec("ROLLBACK;");
        return error;
    }

    delete_meta.bind(1, cutoff_us);
    delete_rows.bind(1, cutoff_us);
    if (delete_meta.step() != SQLITE_DONE || delete_rows.step() != SQLITE_DONE) {
        auto error = sql_error(db_, "retention sweep");
        (void)exec("ROLLBACK;");
        return error;
    }
    const auto removed = static_cast<uint64_t>(sqlite3_changes(db_));

    if (auto r = commit(); !r) return r.error();
    return removed;
}

// ─────────────────────────────────────────────
// Reads
// ─────────────────────────────────────────────

Result<std::vector<MetricRecord>> SqliteMetricsStore::query(const MetricQuery& q) {
    std::string sql =
        "SELECT id, task_id, provider_id, timestamp_us, latency, cpu_usage, ram_usage,"
        " throughput, error_rate, queue_depth FROM metrics WHERE 1 = 1";
    if (q.provider) sql += " AND provider_id = ?";
    if (q.task) sql += " AND task_id = ?";
    if (q.start) sql += " AND timestamp_us >= ?";
    if (q.end) sql += " AND timestamp_us <= ?";
    sql += " ORDER BY timestamp_us DESC, id DESC LIMIT ?";

    std::lock_guard lock(mutex_);
    Statement select(db_, sql);
    if (!select.ok()) return sql_error(db_, "prepare metrics query");

    int idx = 1;
    if (q.provider) select.bind(idx++, *q.provider);
    if (q.task) select.bind(idx++, *q.task);
    if (q.start) select.bind(idx++, to_unix_micros(*q.start));
    if (q.end) select.bind(idx++, to_unix_micros(*q.end));
    select.bind(idx, static_cast<int64_t>(q.limit));

    Statement meta(db_, "SELECT key, value FROM metric_metadata WHERE metric_id = ?");
    if (!meta.ok()) return sql_error(db_, "prepare metadata query");

    std::vector<MetricRecord> out;
    int rc;
    while ((rc = select.step()) == SQLITE_ROW) {
        MetricRecord rec;
        const int64_t id = select.int64(0);
        rec.task_id = select.text(1);
        rec.provider_id = select.text(2);
        rec.timestamp = from_unix_micros(select.int64(3));
        rec.latency = select.real(4);
        rec.cpu_usage = select.real(5);
        rec.ram_usage = select.real(6);
        rec.throughput = select.real(7);
        rec.error_rate = select.real(8);
        rec.queue_depth = static_cast<uint32_t>(select.int64(9));

        meta.reset();
        meta.bind(1, id);
        while (meta.step() == SQLITE_ROW) {
            rec.metadata.emplace(meta.text(0), meta.text(1));
        }
        out.push_back(std::move(rec));
    }
    if (rc != SQLITE_DONE) return sql_error(db_, "metrics query");
    return out;
}

Result<std::optional<ProviderSummary>> SqliteMetricsStore::summary(const ProviderId& provider) {
    std::lock_guard lock(mutex_);
    Statement select(db_,
        "SELECT total_tasks, avg_latency, avg_cpu, avg_ram, error_rate, last_updated_us"
        " FROM provider_summaries WHERE provider_id = ?");
    if (!select.ok()) return sql_error(db_, "prepare summary query");
    select.bind(1, provider);

    int rc = select.step();
    if (rc == SQLITE_DONE) return std::optional<ProviderSummary>{};
    if (rc != SQLITE_ROW) return sql_error(db_, "summary query");

    return std::optional<ProviderSummary>{ProviderSummary{
        .provider_id = provider,
        .total_tasks = static_cast<uint64_t>(select.int64(0)),
        .avg_latency = select.real(1),
        .avg_cpu = select.real(2),
        .avg_ram = select.real(3),
        .error_rate = select.real(4),
        .last_updated = from_unix_micros(select.int64(5)),
    }};
}

Result<std::vector<ProviderSummary>> SqliteMetricsStore::summaries() {
    std::lock_guard lock(mutex_);
    Statement select(db_,
        "SELECT provider_id, total_tasks, avg_latency, avg_cpu, avg_ram, error_rate,"
        " last_updated_us FROM provider_summaries ORDER BY provider_id");
    if (!select.ok()) return sql_error(db_, "prepare summaries query");

    std::vector<ProviderSummary> out;
    int rc;
    while ((rc = select.step()) == SQLITE_ROW) {
        out.push_back(ProviderSummary{
            .provider_id = select.text(0),
            .total_tasks = static_cast<uint64_t>(select.int64(1)),
            .avg_latency = select.real(2),
            .avg_cpu = select.real(3),
            .avg_ram = select.real(4),
            .error_rate = select.real(5),
            .last_updated = from_unix_micros(select.int64(6)),
        });
    }
    if (rc != SQLITE_DONE) return sql_error(db_, "summaries query");
    return out;
}

Result<MetricsStoreStats> SqliteMetricsStore::stats() {
    std::lock_guard lock(mutex_);
    Statement select(db_,
        "SELECT COUNT(*), COUNT(DISTINCT provider_id), COUNT(DISTINCT task_id),"
        " MIN(timestamp_us), MAX(timestamp_us) FROM metrics");
    if (!select.ok()) return sql_error(db_, "prepare stats query");
    if (select.step() != SQLITE_ROW) return sql_error(db_, "stats query");

    MetricsStoreStats out;
    out.record_count = static_cast<uint64_t>(select.int64(0));
    out.provider_count = static_cast<uint64_t>(select.int64(1));
    out.task_count = static_cast<uint64_t>(select.int64(2));
    if (!select.is_null(3)) out.oldest = from_unix_micros(select.int64(3));
    if (!select.is_null(4)) out.newest = from_unix_micros(select.int64(4));
    return out;
}

}  // namespace adaptive_scheduler
