#pragma once

#include "arbitrage_scanner.hpp"
#include "calibration_tracker.hpp"
#include "common_types.hpp"
#include "errors.hpp"
#include "model_registry.hpp"
#include "prediction_cache.hpp"
#include "scoreline_model.hpp"
#include "service_config.hpp"
#include "serving_log.hpp"
#include "serving_metrics.hpp"
#include "shadow_evaluator.hpp"
#include "signal_source.hpp"
#include "traffic_splitter.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace matchcast {

// ============================================================================
// Prediction Service (request façade)
// ============================================================================
//
// Request path:
//   registry.serving_view(model) -> splitter.assign(device) ->
//   shadow evaluate(prod, canary) with cache get-or-compute per version ->
//   metrics + trace
//
// The service owns the cache, the assignment store and the shadow logger.
// Registry, scanner and tracker are shared with the job scheduler and the
// admin surface and are owned by the caller.

class PredictionService {
public:
    PredictionService(const ServiceConfig& config,
                      ModelRegistry& registry,
                      const SignalSource& signals,
                      ArbitrageScanner& scanner,
                      CalibrationTracker& tracker,
                      ShadowLogSink& shadow_sink,
                      ServingMetrics& metrics,
                      const TimeSource& clock,
                      PredictionTraceLog* trace = nullptr)
        : config_(config),
          registry_(registry),
          signals_(signals),
          scanner_(scanner),
          tracker_(tracker),
          metrics_(metrics),
          clock_(clock),
          trace_(trace),
          model_(),
          cache_(clock, config.cache_ttl()),
          splitter_(clock, config.hash_salt),
          shadow_logger_(shadow_sink, metrics, config.shadow_queue_capacity,
                         config.shadow_max_attempts,
                         std::chrono::milliseconds(config.shadow_retry_backoff_ms)),
          evaluator_(shadow_logger_, metrics, clock),
          pool_(static_cast<size_t>(config.worker_threads)),
          stopped_(false)
    {
        shadow_logger_.start();
    }

    ~PredictionService() {
        shutdown();
    }

    PredictionService(const PredictionService&) = delete;
    PredictionService& operator=(const PredictionService&) = delete;

    // Waits for in-flight requests, then drains the shadow queue
    void shutdown() {
        if (stopped_.exchange(true)) {
            return;
        }
        pool_.join();
        shadow_logger_.stop();
    }

    // ========================================================================
    // Serving
    // ========================================================================

    MarketProbability get_market_probabilities(const FixtureId& fixture_id, const DeviceId& device_id) {
        const auto start = std::chrono::steady_clock::now();
        ServingMetrics::increment(metrics_.counters().requests);

        try {
            if (fixture_id.empty()) {
                throw PredictionError(ErrorCode::InvalidSignal, "empty fixture id");
            }
            const ServingView view = registry_.serving_view(config_.model_name);
            const ABAssignment assignment = splitter_.assign(device_id, view.config);

            std::map<ModelVersionId, bool> from_cache;
            auto surface_for = [&](const ModelVersion& version) {
                return surface(fixture_id, version, from_cache[version.id]);
            };
            ShadowEvaluator::Result result = evaluator_.evaluate(view, assignment.bucket, surface_for);

            remember(*result.production);
            if (result.canary) {
                remember(*result.canary);
            }

            const double latency_us = std::chrono::duration<double, std::micro>(
                std::chrono::steady_clock::now() - start).count();
            metrics_.record_latency(latency_us);
            if (trace_ != nullptr) {
                trace_->log_served(fixture_id, device_id, result.served->model_version,
                                   result.served_bucket, from_cache[result.served->model_version],
                                   latency_us);
            }
            return *result.served;
        } catch (const PredictionError& e) {
            ServingMetrics::increment(metrics_.counters().requests_failed);
            if (trace_ != nullptr) {
                trace_->log_failure(fixture_id, to_string(e.code()), e.what());
            }
            throw;
        }
    }

    // Runs on the worker pool; errors surface through the future
    std::future<MarketProbability> get_market_probabilities_async(const FixtureId& fixture_id,
                                                                  const DeviceId& device_id) {
        auto task = std::make_shared<std::packaged_task<MarketProbability()>>(
            [this, fixture_id, device_id]() {
                return get_market_probabilities(fixture_id, device_id);
            });
        std::future<MarketProbability> result = task->get_future();
        post([task]() { (*task)(); });
        return result;
    }

    // Runs work on the request pool; the task must not throw
    void post(std::function<void()> task) {
        boost::asio::post(pool_, std::move(task));
    }

    std::vector<ArbitrageOpportunity> get_arbitrage_opportunities(
            const std::optional<FixtureId>& fixture_id = std::nullopt) {
        return scanner_.scan(fixture_id);
    }

    std::optional<OddsComparison> compare_odds(const FixtureId& fixture_id, const std::string& market) {
        return scanner_.compare(fixture_id, market);
    }

    bool upsert_quote(const BookmakerOddsQuote& quote) {
        return scanner_.upsert(quote);
    }

    // ========================================================================
    // Model administration
    // ========================================================================

    ModelVersion promote_model(ModelVersionId version_id) {
        registry_.promote(version_id);
        persist_registry();
        const ModelVersion promoted = registry_.get(version_id);
        if (trace_ != nullptr) {
            trace_->log_admin("promote", promoted.id, promoted.name);
        }
        std::cout << "Promoted " << promoted.name << " " << promoted.version
                  << " (id " << promoted.id << ")" << std::endl;
        return promoted;
    }

    // Promotes only if the registry is still at expected_revision; nullopt
    // means another admin change landed first
    std::optional<ModelVersion> promote_model_if(ModelVersionId version_id, uint64_t expected_revision) {
        if (!registry_.promote_if(version_id, expected_revision)) {
            return std::nullopt;
        }
        persist_registry();
        const ModelVersion promoted = registry_.get(version_id);
        if (trace_ != nullptr) {
            trace_->log_admin("promote", promoted.id, promoted.name);
        }
        std::cout << "Promoted " << promoted.name << " " << promoted.version
                  << " (id " << promoted.id << ", revision " << expected_revision << ")" << std::endl;
        return promoted;
    }

    uint64_t registry_revision() const {
        return registry_.revision();
    }

    ModelVersion rollback_model(const std::string& name) {
        const ModelVersion restored = registry_.rollback(name);
        persist_registry();
        if (trace_ != nullptr) {
            trace_->log_admin("rollback", restored.id, restored.name);
        }
        std::cout << "Rolled back " << name << " to " << restored.version
                  << " (id " << restored.id << ")" << std::endl;
        return restored;
    }

    ModelVersion get_active_model(const std::string& name) const {
        return registry_.get_active(name);
    }

    void set_canary(ModelVersionId version_id, double percentage) {
        registry_.set_canary(version_id, percentage);
        persist_registry();
        if (trace_ != nullptr) {
            trace_->log_admin("set_canary", version_id, registry_.get(version_id).name);
        }
    }

    // Moves the canary share without changing the canary version
    void set_canary_percentage(double percentage) {
        registry_.set_canary_percentage(percentage);
        persist_registry();
        if (trace_ != nullptr) {
            const auto canary = registry_.ab_config().canary_version;
            trace_->log_admin("set_canary_percentage", canary ? *canary : 0, config_.model_name);
        }
    }

    void clear_canary() {
        registry_.clear_canary();
        persist_registry();
        if (trace_ != nullptr) {
            trace_->log_admin("clear_canary", 0, config_.model_name);
        }
    }

    // ========================================================================
    // Calibration
    // ========================================================================

    std::vector<ModelMetricsDaily> get_daily_calibration(ModelVersionId version_id,
                                                         DayIndex from_day, DayIndex to_day) {
        registry_.get(version_id);     // ModelNotFound for unknown ids
        return tracker_.daily(version_id, from_day, to_day);
    }

    // Turns the latest surface of every version that predicted the fixture
    // into a CalibrationEvent. Returns the number of new events.
    size_t settle(const FixtureId& fixture_id, Outcome outcome) {
        std::map<ModelVersionId, ServedOutcome> served;
        {
            std::lock_guard<std::mutex> lock(served_mutex_);
            auto it = served_.find(fixture_id);
            if (it == served_.end()) {
                return 0;
            }
            served = std::move(it->second);
            served_.erase(it);
        }

        size_t recorded = 0;
        for (const auto& [version, probs] : served) {
            CalibrationEvent event;
            event.fixture_id = fixture_id;
            event.model_version = version;
            event.p_home = probs.p_home;
            event.p_draw = probs.p_draw;
            event.p_away = probs.p_away;
            event.outcome = outcome;
            event.created_at = clock_.now();
            if (tracker_.record(event)) {
                ++recorded;
                ServingMetrics::increment(metrics_.counters().calibration_events);
            }
        }
        return recorded;
    }

    // Fixtures still waiting for a result
    size_t unsettled_count() const {
        std::lock_guard<std::mutex> lock(served_mutex_);
        return served_.size();
    }

    // ========================================================================
    // Periodic job bodies
    // ========================================================================

    std::vector<CalibrationAlert> run_calibration(CalibrationAlertLog* log = nullptr) {
        const DayIndex as_of = day_of(clock_.now());
        std::vector<CalibrationAlert> alerts = tracker_.run_once(as_of);
        if (!alerts.empty()) {
            ServingMetrics::increment(metrics_.counters().calibration_alerts, alerts.size());
        }
        for (const auto& alert : alerts) {
            std::cerr << "calibration: version " << alert.model_version << " " << alert.metric
                      << " " << alert.observed << " breaches " << alert.threshold << "\n";
            if (log != nullptr) {
                log->log_alert(alert);
            }
        }
        if (log != nullptr) {
            log->log_run(as_of, tracker_.versions().size(), alerts.size());
        }
        return alerts;
    }

    std::vector<ArbitrageOpportunity> run_arbitrage(ArbitrageLog* log = nullptr) {
        std::vector<ArbitrageOpportunity> found = scanner_.refresh();
        if (log != nullptr) {
            for (const auto& opp : found) {
                log->log_opportunity(opp);
            }
        }
        scanner_.prune(clock_.now());
        return found;
    }

    // Returns the number of purged cache entries. Fixtures served longer ago
    // than the unsettled horizon are forgotten in the same pass.
    size_t run_cache_sweep() {
        const size_t purged = cache_.sweep();
        ServingMetrics::increment(metrics_.counters().cache_swept, purged);

        const size_t forgotten = evict_unsettled(
            clock_.now() - std::chrono::duration_cast<Clock::duration>(config_.unsettled_horizon()));
        if (forgotten > 0) {
            std::cerr << "settlement: dropped " << forgotten
                      << " fixtures never settled within the horizon\n";
        }
        return purged;
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    PredictionCache& cache() { return cache_; }
    TrafficSplitter& splitter() { return splitter_; }
    ShadowLogger& shadow_logger() { return shadow_logger_; }
    ServingMetrics& metrics() { return metrics_; }
    const ServiceConfig& config() const { return config_; }

private:
    MarketProbability surface(const FixtureId& fixture_id, const ModelVersion& version, bool& from_cache) {
        if (auto hit = cache_.get(fixture_id, version.id)) {
            ServingMetrics::increment(metrics_.counters().cache_hits);
            from_cache = true;
            return *hit;
        }
        ServingMetrics::increment(metrics_.counters().cache_misses);
        from_cache = false;

        MarketProbability computed = model_.predict(fixture_id, signals_.fetch(fixture_id),
                                                    version.id, version.params,
                                                    clock_.now(), cache_.ttl());
        return cache_.put(std::move(computed));
    }

    // Only the 1X2 triple is needed to settle
    struct ServedOutcome {
        double p_home;
        double p_draw;
        double p_away;
        Timestamp served_at;
    };

    void remember(const MarketProbability& surface) {
        const ServedOutcome probs{surface.get("1"), surface.get("X"), surface.get("2"), clock_.now()};
        std::lock_guard<std::mutex> lock(served_mutex_);
        served_[surface.fixture_id][surface.model_version] = probs;
    }

    // A fixture is dropped once its most recent serve is older than cutoff
    size_t evict_unsettled(Timestamp cutoff) {
        std::lock_guard<std::mutex> lock(served_mutex_);
        size_t removed = 0;
        for (auto it = served_.begin(); it != served_.end();) {
            Timestamp latest = Timestamp::min();
            for (const auto& [version, probs] : it->second) {
                latest = std::max(latest, probs.served_at);
            }
            if (latest < cutoff) {
                it = served_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void persist_registry() {
        if (!registry_.save()) {
            std::cerr << "registry: failed to persist state to " << config_.registry_state_path << "\n";
        }
    }

    ServiceConfig config_;
    ModelRegistry& registry_;
    const SignalSource& signals_;
    ArbitrageScanner& scanner_;
    CalibrationTracker& tracker_;
    ServingMetrics& metrics_;
    const TimeSource& clock_;
    PredictionTraceLog* trace_;

    ScorelineModel model_;
    PredictionCache cache_;
    TrafficSplitter splitter_;
    ShadowLogger shadow_logger_;
    ShadowEvaluator evaluator_;

    std::map<FixtureId, std::map<ModelVersionId, ServedOutcome>> served_;
    mutable std::mutex served_mutex_;

    boost::asio::thread_pool pool_;
    std::atomic<bool> stopped_;
};

} // namespace matchcast
