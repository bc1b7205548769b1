/**
 * @file audit_log.cpp
 * @brief AuditLog implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/audit_log.hpp"

#include <sstream>

namespace adaptive_scheduler {

std::string to_json(const AuditEvent& event, std::string_view timestamp) {
    std::ostringstream oss;
    oss << R"({"ts":")" << timestamp << "\""
        << R"(,"event":"audit")"
        << R"(,"actor":")" << escape_json(event.actor) << "\""
        << R"(,"action":")" << escape_json(event.action) << "\""
        << R"(,"resource":")" << escape_json(event.resource) << "\""
        << R"(,"result":")" << escape_json(event.result) << "\"";
    if (event.provider) {
        oss << R"(,"provider":")" << escape_json(*event.provider) << "\"";
    }
    oss << R"(,"details":{)";
    bool first = true;
    for (const auto& [key, value] : event.details) {
        if (!first) oss << ',';
        first = false;
        oss << '"' << escape_json(key) << R"(":")" << escape_json(value) << '"';
    }
    oss << "}}";
    return oss.str();
}

AuditLog::AuditLog(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void AuditLog::record(const AuditEvent& event) {
    auto line = to_json(event, iso8601_now());
    std::lock_guard lock(write_mutex_);
    sink_->write(line);
    ++recorded_;
}

void AuditLog::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

uint64_t AuditLog::recorded() const {
    std::lock_guard lock(write_mutex_);
    return recorded_;
}

}  // namespace adaptive_scheduler
