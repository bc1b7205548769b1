/**
 * @file mock_probe.cpp
 * @brief MockProbe implementation: scripted resource samples for testing.
 * @author Dimitris Kafetzis
 */

#include "resource_monitor/probe.hpp"

#include <chrono>

namespace adaptive_scheduler {

namespace {

constexpr uint64_t MOCK_TOTAL_BYTES = 8ULL * 1024 * 1024 * 1024;  // 8 GB

void apply_memory_percent(ResourceSample& sample, float percent) {
    sample.mem_percent = percent;
    sample.mem_total_bytes = MOCK_TOTAL_BYTES;
    sample.mem_used_bytes = static_cast<uint64_t>(
        static_cast<double>(MOCK_TOTAL_BYTES) * static_cast<double>(percent) / 100.0);
    sample.mem_available_bytes = MOCK_TOTAL_BYTES - sample.mem_used_bytes;
}

}  // anonymous namespace

MockProbe::MockProbe() {
    // Lightly loaded host by default
    static_sample_.cpu_percent = 10.0f;
    apply_memory_percent(static_sample_, 20.0f);
}

Result<ResourceSample> MockProbe::read() {
    std::lock_guard lock(mutex_);
    ++reads_;
    if (failing_) {
        return Error{"mock probe configured to fail"};
    }

    ResourceSample sample = static_sample_;
    if (!sequence_.empty()) {
        sample = sequence_.front();
        if (sequence_.size() > 1) {
            sequence_.pop_front();
        }
    }
    if (sample.timestamp == Timestamp{}) {
        sample.timestamp = std::chrono::system_clock::now();
    }
    return sample;
}

void MockProbe::set_cpu(float percent) {
    std::lock_guard lock(mutex_);
    sequence_.clear();
    static_sample_.cpu_percent = percent;
}

void MockProbe::set_memory_percent(float percent) {
    std::lock_guard lock(mutex_);
    sequence_.clear();
    apply_memory_percent(static_sample_, percent);
}

void MockProbe::set_usage(float cpu_percent, float mem_percent) {
    std::lock_guard lock(mutex_);
    sequence_.clear();
    static_sample_.cpu_percent = cpu_percent;
    apply_memory_percent(static_sample_, mem_percent);
}

void MockProbe::push_sample(ResourceSample sample) {
    std::lock_guard lock(mutex_);
    sequence_.push_back(std::move(sample));
}

void MockProbe::set_failing(bool failing) {
    std::lock_guard lock(mutex_);
    failing_ = failing;
}

size_t MockProbe::read_count() const {
    std::lock_guard lock(mutex_);
    return reads_;
}

}  // namespace adaptive_scheduler
