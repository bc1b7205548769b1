/**
 * @file audit_log.hpp
 * @brief Audit boundary for adaptation decisions.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace adaptive_scheduler {

struct AuditEvent {
    std::string actor;
    std::string action;
    std::string resource;
    std::string result;
    std::optional<ProviderId> provider;
    std::map<std::string, std::string> details;
};

/**
 * @brief Destination for audit events.
 *
 * Implementations may throw; callers treat emission as best effort.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;
    virtual void record(const AuditEvent& event) = 0;
};

class NullAuditSink final : public IAuditSink {
public:
    void record(const AuditEvent& /*event*/) override {}
};

/**
 * @brief Writes each audit event as one NDJSON line through an ILogSink.
 *
 *   {"ts":"...","event":"audit","actor":"...","action":"...",
 *    "resource":"...","result":"...","provider":"...","details":{...}}
 */
class AuditLog final : public IAuditSink {
public:
    explicit AuditLog(std::unique_ptr<ILogSink> sink);

    void record(const AuditEvent& event) override;
    void flush();

    [[nodiscard]] uint64_t recorded() const;

private:
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    uint64_t recorded_{0};
};

/// Render an event as a single JSON object (no trailing newline).
[[nodiscard]] std::string to_json(const AuditEvent& event, std::string_view timestamp);

}  // namespace adaptive_scheduler
