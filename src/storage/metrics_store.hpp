/**
 * @file metrics_store.hpp
 * @brief Metrics persistence interface with SQLite and in-memory backends.
 * @author Dimitris Kafetzis
 *
 * The store owns MetricRecords and the per-provider summaries derived from
 * them. Summary updates are read-modify-write under the store's own lock,
 * so callers never coordinate writes themselves.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "storage/metric_record.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

struct sqlite3;

namespace adaptive_scheduler {

/**
 * @brief Filter for MetricRecord queries. Unset fields do not filter.
 */
struct MetricQuery {
    std::optional<ProviderId> provider;
    std::optional<TaskId> task;
    std::optional<Timestamp> start;
    std::optional<Timestamp> end;
    size_t limit{1000};
};

struct MetricsStoreStats {
    uint64_t record_count{0};
    uint64_t provider_count{0};
    uint64_t task_count{0};
    std::optional<Timestamp> oldest;
    std::optional<Timestamp> newest;
};

/**
 * @brief Abstract metrics persistence.
 *
 * Virtual because the backend is chosen once at startup (SQLite in
 * production, in-memory in tests) and every call does I/O anyway.
 */
class IMetricsStore {
public:
    virtual ~IMetricsStore() = default;

    /// Insert a batch and fold each record into its provider summary.
    virtual Result<void> append(const std::vector<MetricRecord>& records) = 0;

    /// Matching records, newest first, at most query.limit of them.
    virtual Result<std::vector<MetricRecord>> query(const MetricQuery& query) = 0;

    virtual Result<std::optional<ProviderSummary>> summary(const ProviderId& provider) = 0;
    virtual Result<std::vector<ProviderSummary>> summaries() = 0;

    /// Retention sweep. Returns the number of records removed.
    virtual Result<uint64_t> delete_older_than(Timestamp cutoff) = 0;

    virtual Result<MetricsStoreStats> stats() = 0;
};

// ─────────────────────────────────────────────
// SqliteMetricsStore
// ─────────────────────────────────────────────

/**
 * @brief Durable store on an embedded SQLite database.
 *
 * Tables: metrics, metric_metadata, provider_summaries. Timestamps are
 * stored as integer microseconds since the Unix epoch.
 */
class SqliteMetricsStore final : public IMetricsStore {
public:
    /// Open (creating if needed) the database and its schema.
    static Result<std::unique_ptr<SqliteMetricsStore>> open(const std::filesystem::path& path);

    ~SqliteMetricsStore() override;

    SqliteMetricsStore(const SqliteMetricsStore&) = delete;
    SqliteMetricsStore& operator=(const SqliteMetricsStore&) = delete;

    Result<void> append(const std::vector<MetricRecord>& records) override;
    Result<std::vector<MetricRecord>> query(const MetricQuery& query) override;
    Result<std::optional<ProviderSummary>> summary(const ProviderId& provider) override;
    Result<std::vector<ProviderSummary>> summaries() override;
    Result<uint64_t> delete_older_than(Timestamp cutoff) override;
    Result<MetricsStoreStats> stats() override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    /// True while the connection holds an open transaction.
    [[nodiscard]] bool in_transaction();

private:
    SqliteMetricsStore(sqlite3* db, std::filesystem::path path);

    Result<void> exec(const char* sql);
    /// COMMIT, rolling back when the commit itself fails.
    Result<void> commit();
    Result<void> initialize_schema();
    Result<void> upsert_summary(const MetricRecord& record);

    sqlite3* db_;
    std::filesystem::path path_;
    std::mutex mutex_;
};

// ─────────────────────────────────────────────
// InMemoryMetricsStore
// ─────────────────────────────────────────────

/**
 * @brief Non-durable store for tests and --mock runs.
 *
 * set_failing(true) makes every call return an Error, which lets tests
 * exercise the callers' degradation paths.
 */
class InMemoryMetricsStore final : public IMetricsStore {
public:
    Result<void> append(const std::vector<MetricRecord>& records) override;
    Result<std::vector<MetricRecord>> query(const MetricQuery& query) override;
    Result<std::optional<ProviderSummary>> summary(const ProviderId& provider) override;
    Result<std::vector<ProviderSummary>> summaries() override;
    Result<uint64_t> delete_older_than(Timestamp cutoff) override;
    Result<MetricsStoreStats> stats() override;

    void set_failing(bool failing);
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<MetricRecord> records_;
    std::map<ProviderId, ProviderSummary> summaries_;
    bool failing_{false};
};

}  // namespace adaptive_scheduler
