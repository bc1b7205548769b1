/**
 * @file probe.hpp
 * @brief Resource probe interface and concrete implementations.
 * @author Dimitris Kafetzis
 *
 * Provides LinuxProbe (reads from /proc) and MockProbe (testing). A probe
 * takes exactly one reading per call; caching, history and state derivation
 * belong to ResourceMonitor.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string_view>

namespace adaptive_scheduler {

/**
 * @brief Runtime-selected source of resource readings.
 *
 * The monitor owns one probe chosen at startup (Linux or mock), so a virtual
 * interface is used instead of templating the monitor on the probe type.
 */
class IResourceProbe {
public:
    virtual ~IResourceProbe() = default;

    virtual Result<ResourceSample> read() = 0;
    [[nodiscard]] virtual std::string_view name() const = 0;
};

// ─────────────────────────────────────────────
// LinuxProbe
// ─────────────────────────────────────────────

/**
 * @brief Reads CPU and memory usage from Linux pseudo-filesystems.
 *
 * Data sources:
 *   /proc/stat     aggregate CPU jiffies (usage is a delta between reads)
 *   /proc/meminfo  MemTotal and MemAvailable
 *
 * The first read reports the average since boot.
 */
class LinuxProbe final : public IResourceProbe {
public:
    explicit LinuxProbe(std::filesystem::path proc_root = "/proc");

    Result<ResourceSample> read() override;
    [[nodiscard]] std::string_view name() const override { return "linux"; }

    struct CpuTimes {
        uint64_t user{0}, nice{0}, system{0}, idle{0};
        uint64_t iowait{0}, irq{0}, softirq{0}, steal{0};
    };

private:
    std::filesystem::path proc_root_;
    std::mutex mutex_;
    CpuTimes prev_cpu_{};
};

// ─────────────────────────────────────────────
// MockProbe
// ─────────────────────────────────────────────

/**
 * @brief Scripted probe for tests and demos.
 *
 * Returns a static sample, or a queued sequence when one has been pushed.
 * Once the sequence is exhausted the last queued sample repeats.
 */
class MockProbe final : public IResourceProbe {
public:
    MockProbe();

    Result<ResourceSample> read() override;
    [[nodiscard]] std::string_view name() const override { return "mock"; }

    void set_cpu(float percent);
    void set_memory_percent(float percent);
    void set_usage(float cpu_percent, float mem_percent);
    void push_sample(ResourceSample sample);
    void set_failing(bool failing);

    [[nodiscard]] size_t read_count() const;

private:
    mutable std::mutex mutex_;
    ResourceSample static_sample_;
    std::deque<ResourceSample> sequence_;
    bool failing_{false};
    size_t reads_{0};
};

static_assert(ResourceProbeLike<LinuxProbe>);
static_assert(ResourceProbeLike<MockProbe>);

}  // namespace adaptive_scheduler
