/**
 * @file control_queue.cpp
 * @brief ControlQueue implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/control_queue.hpp"

#include "orchestrator/adaptation_orchestrator.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <random>
#include <system_error>
#include <thread>
#include <vector>

namespace adaptive_scheduler {

namespace {

constexpr std::string_view REQUEST_SUFFIX = ".request.toml";
constexpr std::string_view RESULT_SUFFIX = ".result.toml";

bool ends_with(const std::string& s, std::string_view suffix) {
    return s.size() >= suffix.size()
        && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string make_request_id() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "%08x", static_cast<unsigned>(rng()));
    return std::to_string(to_unix_micros(std::chrono::system_clock::now())) + "-" + suffix;
}

Result<void> write_atomically(const std::filesystem::path& path, const toml::table& doc) {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return Error{"Cannot open " + tmp.string() + " for writing"};
        out << doc << '\n';
        out.flush();
        if (!out) return Error{"Write to " + tmp.string() + " failed"};
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        Error error{"Cannot publish " + path.string() + ": " + ec.message()};
        std::filesystem::remove(tmp, ec);
        return error;
    }
    return {};
}

}  // anonymous namespace

ControlQueue::ControlQueue(std::filesystem::path dir, Logger& logger)
    : dir_(std::move(dir)), logger_(logger) {}

std::filesystem::path ControlQueue::request_path(const std::string& id) const {
    return dir_ / (id + std::string{REQUEST_SUFFIX});
}

std::filesystem::path ControlQueue::result_path(const std::string& id) const {
    return dir_ / (id + std::string{RESULT_SUFFIX});
}

// ─────────────────────────────────────────────
// Client side
// ─────────────────────────────────────────────

Result<std::string> ControlQueue::submit(const AdaptationRequest& request) {
    if (request.task_id.empty()) return Error{"Adaptation request needs a task id"};

    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) return Error{"Cannot create " + dir_.string() + ": " + ec.message()};

    toml::table doc{
        {"task_id", request.task_id},
        {"reason", request.reason},
        {"submitted_at", to_unix_micros(std::chrono::system_clock::now())},
    };
    if (request.alternative) doc.insert_or_assign("alternative", *request.alternative);

    const auto id = make_request_id();
    if (auto written = write_atomically(request_path(id), doc); !written) {
        return written.error();
    }
    return id;
}

Result<AdaptationResult> ControlQueue::await_result(const std::string& id,
                                                    std::chrono::milliseconds timeout,
                                                    std::chrono::milliseconds poll) {
    const auto path = result_path(id);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (!std::filesystem::exists(path)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            // Withdraw the request so a daemon started later does not act on it
            std::error_code ec;
            std::filesystem::remove(request_path(id), ec);
            return Error{"No daemon answered request " + id + " within "
                         + std::to_string(timeout.count()) + "ms"};
        }
        std::this_thread::sleep_for(poll);
    }

    AdaptationResult result;
    try {
        auto tbl = toml::parse_file(path.string());
        result.success = tbl["success"].value_or(false);
        result.reason = tbl["reason"].value_or(std::string{});
        result.timestamp = from_unix_micros(tbl["timestamp"].value_or(int64_t{0}));
        if (auto* details = tbl["details"].as_table()) {
            for (const auto& [key, node] : *details) {
                result.details.emplace(std::string{key.str()}, node.value_or(std::string{}));
            }
        }
    } catch (const toml::parse_error& err) {
        return Error{"Result " + id + " parse error: " + std::string{err.description()}};
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
    return result;
}

// ─────────────────────────────────────────────
// Daemon side
// ─────────────────────────────────────────────

Result<void> ControlQueue::answer(const std::string& id, const AdaptationResult& result) {
    toml::table details;
    for (const auto& [key, value] : result.details) details.insert_or_assign(key, value);

    toml::table doc{
        {"success", result.success},
        {"reason", result.reason},
        {"timestamp", to_unix_micros(result.timestamp)},
    };
    doc.insert_or_assign("details", std::move(details));
    return write_atomically(result_path(id), doc);
}

size_t ControlQueue::process(AdaptationOrchestrator& orchestrator) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir_, ec)) return 0;

    std::vector<std::string> ids;
    for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
        const auto name = entry.path().filename().string();
        if (ends_with(name, REQUEST_SUFFIX)) {
            ids.push_back(name.substr(0, name.size() - REQUEST_SUFFIX.size()));
        }
    }
    if (ec) {
        logger_.warn("Cannot scan control directory " + dir_.string() + ": " + ec.message());
        return 0;
    }
    std::sort(ids.begin(), ids.end());

    size_t handled = 0;
    for (const auto& id : ids) {
        const auto path = request_path(id);

        AdaptationResult result;
        try {
            auto tbl = toml::parse_file(path.string());
            AdaptationRequest request;
            request.task_id = tbl["task_id"].value_or(std::string{});
            request.reason = tbl["reason"].value_or(std::string{"manual"});
            if (auto alt = tbl["alternative"].value<std::string>()) request.alternative = *alt;

            if (request.task_id.empty()) {
                result = AdaptationResult{.success = false,
                                          .reason = "invalid_request",
                                          .details = {{"error", "missing task_id"}}};
            } else {
                logger_.info("Control request " + id + ": adapt " + request.task_id
                             + " (" + request.reason + ")");
                result = orchestrator.trigger_adaptation(request.task_id, request.reason,
                                                         request.alternative);
            }
        } catch (const toml::parse_error& err) {
            result = AdaptationResult{.success = false,
                                      .reason = "invalid_request",
                                      .details = {{"error", std::string{err.description()}}}};
        }

        if (auto r = answer(id, result); !r) {
            logger_.warn("Cannot answer control request " + id + ": " + r.error().message);
        }
        std::filesystem::remove(path, ec);
        if (ec) {
            logger_.warn("Cannot remove control request " + id + ": " + ec.message());
        }
        ++handled;
    }
    return handled;
}

size_t ControlQueue::pending() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir_, ec)) return 0;

    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
        if (ends_with(entry.path().filename().string(), REQUEST_SUFFIX)) ++count;
    }
    return count;
}

}  // namespace adaptive_scheduler
