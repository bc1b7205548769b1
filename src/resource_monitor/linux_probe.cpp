/**
 * @file linux_probe.cpp
 * @brief LinuxProbe: reads CPU and memory usage from /proc.
 * @author Dimitris Kafetzis
 */

#include "resource_monitor/probe.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>
#include <string>

namespace adaptive_scheduler {

using CpuTimes = LinuxProbe::CpuTimes;

// ─────────────────────────────────────────────
// Internal helpers for /proc parsing
// ─────────────────────────────────────────────
namespace {

/**
 * @brief Parse the aggregate CPU line from /proc/stat.
 * Format: "cpu user nice system idle iowait irq softirq steal ..."
 */
bool parse_cpu_line(const std::string& line, CpuTimes& times) {
    if (!line.starts_with("cpu ")) return false;
    std::istringstream iss(line);
    std::string label;
    iss >> label >> times.user >> times.nice >> times.system >> times.idle
        >> times.iowait >> times.irq >> times.softirq >> times.steal;
    return !iss.fail() || iss.eof();
}

float compute_cpu_percent(const CpuTimes& prev, const CpuTimes& curr) {
    auto total = [](const CpuTimes& t) {
        return t.user + t.nice + t.system + t.idle + t.iowait + t.irq + t.softirq + t.steal;
    };
    auto active = [](const CpuTimes& t) {
        return t.user + t.nice + t.system + t.irq + t.softirq + t.steal;
    };

    uint64_t total_delta = total(curr) - total(prev);
    if (total_delta == 0) return 0.0f;
    uint64_t active_delta = active(curr) - active(prev);
    return 100.0f * static_cast<float>(active_delta) / static_cast<float>(total_delta);
}

struct MemInfo {
    uint64_t total_kb{0};
    uint64_t available_kb{0};
};

MemInfo parse_meminfo(const std::filesystem::path& path) {
    MemInfo info;
    std::ifstream ifs(path);
    std::string line;
    while (std::getline(ifs, line)) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            iss >> info.total_kb;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            iss >> info.available_kb;
        }
    }
    return info;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// LinuxProbe implementation
// ─────────────────────────────────────────────

LinuxProbe::LinuxProbe(std::filesystem::path proc_root)
    : proc_root_(std::move(proc_root)) {}

Result<ResourceSample> LinuxProbe::read() {
    std::ifstream stat(proc_root_ / "stat");
    std::string first_line;
    if (!stat.is_open() || !std::getline(stat, first_line)) {
        return Error{"cannot read " + (proc_root_ / "stat").string()};
    }

    CpuTimes curr;
    if (!parse_cpu_line(first_line, curr)) {
        return Error{"unexpected /proc/stat format: " + first_line};
    }

    auto mem = parse_meminfo(proc_root_ / "meminfo");
    if (mem.total_kb == 0) {
        return Error{"MemTotal missing from " + (proc_root_ / "meminfo").string()};
    }

    ResourceSample sample;
    sample.timestamp = std::chrono::system_clock::now();
    {
        std::lock_guard lock(mutex_);
        sample.cpu_percent = compute_cpu_percent(prev_cpu_, curr);
        prev_cpu_ = curr;
    }

    uint64_t available_kb = std::min(mem.available_kb, mem.total_kb);
    sample.mem_total_bytes = mem.total_kb * 1024;
    sample.mem_available_bytes = available_kb * 1024;
    sample.mem_used_bytes = sample.mem_total_bytes - sample.mem_available_bytes;
    sample.mem_percent = 100.0f * static_cast<float>(sample.mem_used_bytes)
                       / static_cast<float>(sample.mem_total_bytes);
    return sample;
}

}  // namespace adaptive_scheduler
