/**
 * @file control_queue.hpp
 * @brief File drop box that hands manual adaptation requests to a running daemon.
 * @author Dimitris Kafetzis
 *
 * The active-task table lives in the daemon's process, so a one-shot CLI
 * cannot switch a task by itself. The CLI writes "<id>.request.toml" into
 * the control directory, the daemon's main loop runs it through
 * AdaptationOrchestrator::trigger_adaptation and answers with
 * "<id>.result.toml". Both files are written to a ".tmp" name first and
 * renamed into place.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "routing/adaptive_router.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace adaptive_scheduler {

class AdaptationOrchestrator;

struct AdaptationRequest {
    TaskId task_id;
    std::string reason;
    std::optional<ProviderId> alternative;
};

class ControlQueue {
public:
    ControlQueue(std::filesystem::path dir, Logger& logger);

    // ── Client side ──────────────────────────

    /// Queue @p request; returns the id its result will carry.
    Result<std::string> submit(const AdaptationRequest& request);

    /// Wait for the daemon's answer to @p id, consuming the result file.
    Result<AdaptationResult> await_result(const std::string& id,
                                          std::chrono::milliseconds timeout,
                                          std::chrono::milliseconds poll = std::chrono::milliseconds{50});

    // ── Daemon side ──────────────────────────

    /// Answer every pending request in submission order. Returns the count handled.
    size_t process(AdaptationOrchestrator& orchestrator);

    [[nodiscard]] size_t pending() const;
    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }

private:
    std::filesystem::path request_path(const std::string& id) const;
    std::filesystem::path result_path(const std::string& id) const;
    Result<void> answer(const std::string& id, const AdaptationResult& result);

    std::filesystem::path dir_;
    Logger& logger_;
};

}  // namespace adaptive_scheduler
