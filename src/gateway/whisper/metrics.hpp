#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

struct MetricsSnapshot {
    uint64_t requests_total = 0;
    uint64_t errors_total = 0;
    uint64_t processing_time_ms = 0;
};

// Cumulative call counters, updated lock-free from any caller thread.
class Metrics {
public:
    void record(std::chrono::milliseconds elapsed, bool failed) {
        requests_total_.fetch_add(1, std::memory_order_relaxed);
        if (failed) errors_total_.fetch_add(1, std::memory_order_relaxed);
        auto ms = elapsed.count() > 0 ? static_cast<uint64_t>(elapsed.count()) : 0;
        processing_time_ms_.fetch_add(ms, std::memory_order_relaxed);
    }

    MetricsSnapshot snapshot() const {
        return {
            .requests_total = requests_total_.load(std::memory_order_relaxed),
            .errors_total = errors_total_.load(std::memory_order_relaxed),
            .processing_time_ms = processing_time_ms_.load(std::memory_order_relaxed),
        };
    }

private:
    std::atomic<uint64_t> requests_total_{0};
    std::atomic<uint64_t> errors_total_{0};
    std::atomic<uint64_t> processing_time_ms_{0};
};
