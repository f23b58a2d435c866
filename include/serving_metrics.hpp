#ifndef SERVING_METRICS_HPP
#define SERVING_METRICS_HPP

#include "common_types.hpp"
#include <atomic>
#include <cstddef>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace matchcast {

// Serving counters, all lock-free
struct ServingCounters {
    // Requests
    std::atomic<uint64_t> requests{0};
    std::atomic<uint64_t> requests_failed{0};
    std::atomic<uint64_t> canary_served{0};
    std::atomic<uint64_t> canary_failures{0};

    // Cache
    std::atomic<uint64_t> cache_hits{0};
    std::atomic<uint64_t> cache_misses{0};
    std::atomic<uint64_t> cache_swept{0};

    // Shadow logging
    std::atomic<uint64_t> shadow_enqueued{0};
    std::atomic<uint64_t> shadow_written{0};
    std::atomic<uint64_t> shadow_dropped{0};
    std::atomic<uint64_t> shadow_log_failures{0};
    std::atomic<uint64_t> shadow_abandoned{0};
    std::atomic<uint64_t> shadow_kl_undefined{0};

    // Calibration
    std::atomic<uint64_t> calibration_events{0};
    std::atomic<uint64_t> calibration_alerts{0};

    // Arbitrage
    std::atomic<uint64_t> quotes_stale{0};
    std::atomic<uint64_t> arbitrage_found{0};

    // Latency (microseconds)
    std::atomic<double> last_request_latency_us{0.0};
    std::atomic<double> max_request_latency_us{0.0};
};

// Time-series data point
struct MetricSnapshot {
    int64_t timestamp_ns;
    uint64_t requests;
    uint64_t requests_failed;
    uint64_t canary_served;
    uint64_t cache_hits;
    uint64_t cache_misses;
    uint64_t shadow_written;
    uint64_t shadow_dropped;
    uint64_t shadow_abandoned;
    uint64_t shadow_kl_undefined;
    uint64_t calibration_alerts;
    uint64_t quotes_stale;
    uint64_t arbitrage_found;
    double last_request_latency_us;
};

// Metrics collector with circular snapshot history
class ServingMetrics {
public:
    explicit ServingMetrics(size_t history_size = 10000)
        : history_size_(history_size) {
    }

    ServingCounters& counters() { return counters_; }
    const ServingCounters& counters() const { return counters_; }

    static void increment(std::atomic<uint64_t>& counter, uint64_t by = 1) {
        counter.fetch_add(by, std::memory_order_acq_rel);
    }

    void record_latency(double latency_us) {
        counters_.last_request_latency_us.store(latency_us, std::memory_order_release);

        double current_max = counters_.max_request_latency_us.load(std::memory_order_acquire);
        while (latency_us > current_max &&
               !counters_.max_request_latency_us.compare_exchange_weak(
                   current_max, latency_us, std::memory_order_acq_rel)) {
        }
    }

    MetricSnapshot snapshot() const {
        MetricSnapshot snap;
        snap.timestamp_ns = to_nanos(matchcast::now());
        snap.requests = counters_.requests.load(std::memory_order_acquire);
        snap.requests_failed = counters_.requests_failed.load(std::memory_order_acquire);
        snap.canary_served = counters_.canary_served.load(std::memory_order_acquire);
        snap.cache_hits = counters_.cache_hits.load(std::memory_order_acquire);
        snap.cache_misses = counters_.cache_misses.load(std::memory_order_acquire);
        snap.shadow_written = counters_.shadow_written.load(std::memory_order_acquire);
        snap.shadow_dropped = counters_.shadow_dropped.load(std::memory_order_acquire);
        snap.shadow_abandoned = counters_.shadow_abandoned.load(std::memory_order_acquire);
        snap.shadow_kl_undefined = counters_.shadow_kl_undefined.load(std::memory_order_acquire);
        snap.calibration_alerts = counters_.calibration_alerts.load(std::memory_order_acquire);
        snap.quotes_stale = counters_.quotes_stale.load(std::memory_order_acquire);
        snap.arbitrage_found = counters_.arbitrage_found.load(std::memory_order_acquire);
        snap.last_request_latency_us = counters_.last_request_latency_us.load(std::memory_order_acquire);
        return snap;
    }

    // Take snapshot for time-series
    void take_snapshot() {
        MetricSnapshot snap = snapshot();

        std::lock_guard<std::mutex> lock(snapshots_mutex_);
        snapshots_.push_back(snap);

        // Keep only recent history
        if (snapshots_.size() > history_size_) {
            snapshots_.pop_front();
        }
    }

    std::vector<MetricSnapshot> get_recent_snapshots(size_t count = 1000) const {
        std::lock_guard<std::mutex> lock(snapshots_mutex_);

        size_t start = (snapshots_.size() > count) ? (snapshots_.size() - count) : 0;
        return std::vector<MetricSnapshot>(
            snapshots_.begin() + static_cast<std::ptrdiff_t>(start),
            snapshots_.end()
        );
    }

    // Export to CSV
    bool export_to_csv(const std::string& filename) const {
        std::lock_guard<std::mutex> lock(snapshots_mutex_);
        std::ofstream file(filename);
        if (!file.is_open()) {
            return false;
        }

        // Header
        file << "timestamp_ns,requests,requests_failed,canary_served,"
             << "cache_hits,cache_misses,shadow_written,shadow_dropped,"
             << "shadow_abandoned,shadow_kl_undefined,calibration_alerts,"
             << "quotes_stale,arbitrage_found,latency_us\n";

        // Data
        for (const auto& snap : snapshots_) {
            file << snap.timestamp_ns << ","
                 << snap.requests << ","
                 << snap.requests_failed << ","
                 << snap.canary_served << ","
                 << snap.cache_hits << ","
                 << snap.cache_misses << ","
                 << snap.shadow_written << ","
                 << snap.shadow_dropped << ","
                 << snap.shadow_abandoned << ","
                 << snap.shadow_kl_undefined << ","
                 << snap.calibration_alerts << ","
                 << snap.quotes_stale << ","
                 << snap.arbitrage_found << ","
                 << snap.last_request_latency_us << "\n";
        }
        return file.good();
    }

private:
    size_t history_size_;
    ServingCounters counters_;

    std::deque<MetricSnapshot> snapshots_;
    mutable std::mutex snapshots_mutex_;
};

} // namespace matchcast

#endif // SERVING_METRICS_HPP
