#pragma once

#include "bounded_queue.hpp"
#include "common_types.hpp"
#include "errors.hpp"
#include "model_registry.hpp"
#include "scoreline_model.hpp"
#include "serving_metrics.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace matchcast {

// ============================================================================
// Shadow Log Entry (one production vs canary comparison)
// ============================================================================

struct ShadowLogEntry {
    FixtureId fixture_id;
    ModelVersionId production_version;
    ModelVersionId canary_version;
    std::map<std::string, double> production;
    std::map<std::string, double> canary;
    double l1;
    std::optional<double> kl;          // nullopt: canary assigns 0 where production does not
    Bucket served_bucket;
    Timestamp created_at;

    ShadowLogEntry()
        : production_version(0), canary_version(0), l1(0.0), served_bucket(Bucket::A) {}
};

// ============================================================================
// Shadow Comparison (what the request thread hands to the logger)
// ============================================================================
// Holds the two surfaces by shared pointer; the divergence and the log entry
// are built on the writer thread.

struct ShadowComparison {
    std::shared_ptr<const MarketProbability> production;
    std::shared_ptr<const MarketProbability> canary;
    Bucket served_bucket;
    Timestamp created_at;

    ShadowComparison() : served_bucket(Bucket::A) {}
};

// ============================================================================
// Divergence metrics
// ============================================================================
//   L1 = Σ |p_m - q_m| over the union of market codes (missing code counts as 0)
//   KL = Σ_{q_m > 0} p_m * ln(p_m / q_m), undefined if ∃ m: q_m = 0 < p_m

struct Divergence {
    double l1;
    std::optional<double> kl;
};

inline Divergence divergence(const std::map<std::string, double>& production,
                             const std::map<std::string, double>& canary) {
    std::set<std::string> codes;
    for (const auto& [code, p] : production) codes.insert(code);
    for (const auto& [code, q] : canary) codes.insert(code);

    Divergence d{0.0, 0.0};
    double kl = 0.0;
    bool kl_defined = true;

    for (const auto& code : codes) {
        auto pit = production.find(code);
        auto qit = canary.find(code);
        const double p = pit == production.end() ? 0.0 : pit->second;
        const double q = qit == canary.end() ? 0.0 : qit->second;

        d.l1 += std::abs(p - q);

        if (q > 0.0) {
            if (p > 0.0) {
                kl += p * std::log(p / q);
            }
        } else if (p > 0.0) {
            kl_defined = false;
        }
    }

    if (kl_defined) {
        d.kl = kl;
    } else {
        d.kl.reset();
    }
    return d;
}

inline ShadowLogEntry make_shadow_entry(const ShadowComparison& comparison) {
    ShadowLogEntry entry;
    entry.fixture_id = comparison.production->fixture_id;
    entry.production_version = comparison.production->model_version;
    entry.canary_version = comparison.canary->model_version;
    entry.production = comparison.production->probabilities;
    entry.canary = comparison.canary->probabilities;

    const Divergence d = divergence(entry.production, entry.canary);
    entry.l1 = d.l1;
    entry.kl = d.kl;
    entry.served_bucket = comparison.served_bucket;
    entry.created_at = comparison.created_at;
    return entry;
}

// ============================================================================
// Shadow Log Sink (persistence target, may fail transiently)
// ============================================================================

class ShadowLogSink {
public:
    virtual ~ShadowLogSink() = default;
    // false (or an exception) is a transient failure and is retried
    virtual bool write(const ShadowLogEntry& entry) = 0;
};

// ============================================================================
// Shadow Logger (fire-and-forget with bounded retry)
// ============================================================================
// Request threads only push comparisons into a drop-oldest ring; one writer
// thread turns them into entries and drains them into the sink. Overflow,
// undefined KL, failed attempts and abandoned entries are counted in
// ServingMetrics.

class ShadowLogger {
public:
    ShadowLogger(ShadowLogSink& sink, ServingMetrics& metrics,
                 size_t capacity = 1024, int max_attempts = 3,
                 std::chrono::milliseconds retry_backoff = std::chrono::milliseconds(5))
        : sink_(sink), metrics_(metrics), queue_(capacity),
          max_attempts_(max_attempts > 0 ? max_attempts : 1),
          retry_backoff_(retry_backoff), running_(false) {}

    ~ShadowLogger() {
        stop();
    }

    ShadowLogger(const ShadowLogger&) = delete;
    ShadowLogger& operator=(const ShadowLogger&) = delete;

    void start() {
        if (running_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        writer_ = std::thread([this]() { run(); });
    }

    // Drains what is queued, then stops the writer
    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        queue_.close();
        if (writer_.joinable()) {
            writer_.join();
        }
    }

    // Never blocks the caller
    void submit(ShadowComparison comparison) {
        ServingMetrics::increment(metrics_.counters().shadow_enqueued);
        if (!queue_.push(std::move(comparison))) {
            ServingMetrics::increment(metrics_.counters().shadow_dropped);
        }
    }

    // Blocks until every submitted entry has been written or abandoned
    void flush() {
        if (running_.load(std::memory_order_acquire)) {
            queue_.wait_drained();
        }
    }

    size_t pending() const { return queue_.size(); }

private:
    void run() {
        for (;;) {
            auto comparison = queue_.pop(std::chrono::milliseconds(50));
            if (!comparison) {
                if (queue_.closed() && queue_.size() == 0) {
                    return;
                }
                continue;
            }
            const ShadowLogEntry entry = make_shadow_entry(*comparison);
            if (!entry.kl) {
                // Data-quality signal: canary rules out an outcome production allows
                ServingMetrics::increment(metrics_.counters().shadow_kl_undefined);
            }
            write_with_retry(entry);
            comparison.reset();
            queue_.done();
        }
    }

    void write_with_retry(const ShadowLogEntry& entry) {
        for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
            bool ok = false;
            try {
                ok = sink_.write(entry);
            } catch (const std::exception& e) {
                std::cerr << "shadow log: write failed for " << entry.fixture_id
                          << " (attempt " << attempt << "): " << e.what() << "\n";
            }
            if (ok) {
                ServingMetrics::increment(metrics_.counters().shadow_written);
                return;
            }
            ServingMetrics::increment(metrics_.counters().shadow_log_failures);
            if (attempt < max_attempts_) {
                std::this_thread::sleep_for(retry_backoff_ * attempt);
            }
        }
        ServingMetrics::increment(metrics_.counters().shadow_abandoned);
    }

    ShadowLogSink& sink_;
    ServingMetrics& metrics_;
    BoundedQueue<ShadowComparison> queue_;
    int max_attempts_;
    std::chrono::milliseconds retry_backoff_;
    std::atomic<bool> running_;
    std::thread writer_;
};

// ============================================================================
// Shadow Evaluator
// ============================================================================
// Production and canary surfaces come from two independent calls to the same
// pure provider; nothing is shared between them until they are joined into
// the log entry.

class ShadowEvaluator {
public:
    using SurfaceProvider = std::function<MarketProbability(const ModelVersion&)>;
    using SurfacePtr = std::shared_ptr<const MarketProbability>;

    struct Result {
        SurfacePtr served;
        Bucket served_bucket;
        SurfacePtr production;
        SurfacePtr canary;             // null when there is no canary or it failed
    };

    ShadowEvaluator(ShadowLogger& logger, ServingMetrics& metrics, const TimeSource& clock)
        : logger_(logger), metrics_(metrics), clock_(clock) {}

    Result evaluate(const ServingView& view, Bucket bucket, const SurfaceProvider& surface_for) {
        Result result;
        result.production = std::make_shared<const MarketProbability>(surface_for(view.active));
        result.served = result.production;
        result.served_bucket = Bucket::A;

        if (!view.canary) {
            return result;
        }

        try {
            result.canary = std::make_shared<const MarketProbability>(surface_for(*view.canary));
        } catch (const PredictionError& e) {
            // A broken canary never fails the request; production is served
            ServingMetrics::increment(metrics_.counters().canary_failures);
            std::cerr << "shadow: canary " << view.canary->id << " failed: " << e.what() << "\n";
            return result;
        }

        if (bucket == Bucket::B) {
            result.served = result.canary;
            result.served_bucket = Bucket::B;
            ServingMetrics::increment(metrics_.counters().canary_served);
        }

        ShadowComparison comparison;
        comparison.production = result.production;
        comparison.canary = result.canary;
        comparison.served_bucket = result.served_bucket;
        comparison.created_at = clock_.now();
        logger_.submit(std::move(comparison));
        return result;
    }

private:
    ShadowLogger& logger_;
    ServingMetrics& metrics_;
    const TimeSource& clock_;
};

} // namespace matchcast
