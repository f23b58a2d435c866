#pragma once

#include "common_types.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace matchcast {

// ============================================================================
// Calibration Tracking
// ============================================================================
//
// Per settled event:
//   brier   = (p_H - 1[H])² + (p_D - 1[D])² + (p_A - 1[A])²
//   correct = argmax(p) == outcome           (ties resolve H, then D, then A)
//
// ECE (class-wise, equal-width buckets over [0, 1]):
//   every event contributes three (p, y) pairs, one per outcome
//   ECE = Σ_b (n_b / N) * |mean(y)_b - mean(p)_b|
//
// ModelMetricsDaily rows are derived only from the events of their UTC day and
// can be rebuilt at any time. Gate breaches are returned as alerts; they never
// interrupt serving and never trigger promotion or rollback by themselves.

struct CalibrationEvent {
    FixtureId fixture_id;
    ModelVersionId model_version;
    double p_home;
    double p_draw;
    double p_away;
    Outcome outcome;
    Timestamp created_at;

    CalibrationEvent()
        : model_version(0), p_home(0.0), p_draw(0.0), p_away(0.0),
          outcome(Outcome::HOME) {}
};

struct ModelMetricsDaily {
    ModelVersionId model_version;
    DayIndex day;
    uint64_t served;
    uint64_t correct;
    double brier_sum;
    double ece;

    ModelMetricsDaily()
        : model_version(0), day(0), served(0), correct(0), brier_sum(0.0), ece(0.0) {}

    double accuracy() const { return served > 0 ? static_cast<double>(correct) / served : 0.0; }
    double mean_brier() const { return served > 0 ? brier_sum / served : 0.0; }
};

struct RollingCalibration {
    ModelVersionId model_version;
    DayIndex from_day;
    DayIndex to_day;
    uint64_t served;
    uint64_t correct;
    double accuracy;
    double mean_brier;
    double ece;
};

struct CalibrationGates {
    double accuracy_floor;
    double ece_ceil;
    int window_days;
    uint64_t min_samples;      // No verdict below this many events in the window

    CalibrationGates()
        : accuracy_floor(0.45), ece_ceil(0.08), window_days(7), min_samples(50) {}
};

// Non-fatal gate breach (CalibrationGateBreached)
struct CalibrationAlert {
    ModelVersionId model_version;
    std::string metric;        // "accuracy" or "ece"
    double observed;
    double threshold;
    DayIndex from_day;
    DayIndex to_day;
    uint64_t samples;
};

class CalibrationTracker {
public:
    static constexpr size_t DEFAULT_BINS = 10;

    explicit CalibrationTracker(CalibrationGates gates = CalibrationGates(),
                                size_t ece_bins = DEFAULT_BINS)
        : gates_(gates), bins_(ece_bins > 0 ? ece_bins : DEFAULT_BINS) {}

    const CalibrationGates& gates() const { return gates_; }

    // ========================================================================
    // Scoring primitives
    // ========================================================================

    static double brier(const CalibrationEvent& e) {
        const double yh = e.outcome == Outcome::HOME ? 1.0 : 0.0;
        const double yd = e.outcome == Outcome::DRAW ? 1.0 : 0.0;
        const double ya = e.outcome == Outcome::AWAY ? 1.0 : 0.0;
        return (e.p_home - yh) * (e.p_home - yh) +
               (e.p_draw - yd) * (e.p_draw - yd) +
               (e.p_away - ya) * (e.p_away - ya);
    }

    static Outcome predicted(const CalibrationEvent& e) {
        if (e.p_home >= e.p_draw && e.p_home >= e.p_away) return Outcome::HOME;
        if (e.p_draw >= e.p_away) return Outcome::DRAW;
        return Outcome::AWAY;
    }

    static double expected_calibration_error(const std::vector<const CalibrationEvent*>& events,
                                             size_t bins) {
        if (events.empty() || bins == 0) {
            return 0.0;
        }

        std::vector<double> conf_sum(bins, 0.0);
        std::vector<double> hit_sum(bins, 0.0);
        std::vector<uint64_t> count(bins, 0);

        auto add = [&](double p, bool hit) {
            size_t idx = static_cast<size_t>(p * static_cast<double>(bins));
            idx = std::min(idx, bins - 1);
            conf_sum[idx] += p;
            hit_sum[idx] += hit ? 1.0 : 0.0;
            ++count[idx];
        };

        for (const CalibrationEvent* e : events) {
            add(e->p_home, e->outcome == Outcome::HOME);
            add(e->p_draw, e->outcome == Outcome::DRAW);
            add(e->p_away, e->outcome == Outcome::AWAY);
        }

        const double total = static_cast<double>(events.size() * 3);
        double ece = 0.0;
        for (size_t b = 0; b < bins; ++b) {
            if (count[b] == 0) continue;
            const double n = static_cast<double>(count[b]);
            ece += (n / total) * std::abs(hit_sum[b] / n - conf_sum[b] / n);
        }
        return ece;
    }

    // ========================================================================
    // Ingestion
    // ========================================================================

    // Returns false if an event for (fixture, version) already exists
    bool record(const CalibrationEvent& event) {
        const double ps[] = {event.p_home, event.p_draw, event.p_away};
        for (double p : ps) {
            if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
                throw PredictionError(ErrorCode::InvalidSignal,
                                      "calibration probability outside [0, 1]");
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (!seen_.insert({event.model_version, event.fixture_id}).second) {
            return false;
        }
        const DayKey key{event.model_version, day_of(event.created_at)};
        events_[key].push_back(event);
        dirty_.insert(key);
        versions_.insert(event.model_version);
        return true;
    }

    // ========================================================================
    // Daily rollups
    // ========================================================================

    ModelMetricsDaily recompute_day(ModelVersionId version, DayIndex day) {
        std::lock_guard<std::mutex> lock(mutex_);
        return recompute_locked({version, day});
    }

    // Rows for days in [from_day, to_day] that have events, oldest first
    std::vector<ModelMetricsDaily> daily(ModelVersionId version, DayIndex from_day, DayIndex to_day) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ModelMetricsDaily> out;
        auto it = events_.lower_bound({version, from_day});
        for (; it != events_.end() && it->first.first == version && it->first.second <= to_day; ++it) {
            if (dirty_.count(it->first) > 0) {
                out.push_back(recompute_locked(it->first));
            } else {
                out.push_back(daily_.at(it->first));
            }
        }
        return out;
    }

    // Window of window_days ending at as_of_day inclusive
    RollingCalibration rolling(ModelVersionId version, int window_days, DayIndex as_of_day) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rolling_locked(version, window_days, as_of_day);
    }

    std::vector<CalibrationAlert> check_gates(ModelVersionId version, DayIndex as_of_day) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return check_gates_locked(version, as_of_day);
    }

    // Periodic job body: rebuild dirty days, then evaluate gates per version
    std::vector<CalibrationAlert> run_once(DayIndex as_of_day) {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::set<DayKey> dirty = dirty_;
        for (const auto& key : dirty) {
            recompute_locked(key);
        }

        std::vector<CalibrationAlert> alerts;
        for (ModelVersionId version : versions_) {
            auto v_alerts = check_gates_locked(version, as_of_day);
            alerts.insert(alerts.end(), v_alerts.begin(), v_alerts.end());
        }
        return alerts;
    }

    std::set<ModelVersionId> versions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return versions_;
    }

    size_t event_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_.size();
    }

private:
    using DayKey = std::pair<ModelVersionId, DayIndex>;

    ModelMetricsDaily recompute_locked(const DayKey& key) {
        ModelMetricsDaily row;
        row.model_version = key.first;
        row.day = key.second;

        std::vector<const CalibrationEvent*> day_events;
        auto it = events_.find(key);
        if (it != events_.end()) {
            for (const auto& e : it->second) {
                ++row.served;
                if (predicted(e) == e.outcome) ++row.correct;
                row.brier_sum += brier(e);
                day_events.push_back(&e);
            }
        }
        row.ece = expected_calibration_error(day_events, bins_);

        daily_[key] = row;
        dirty_.erase(key);
        return row;
    }

    RollingCalibration rolling_locked(ModelVersionId version, int window_days, DayIndex as_of_day) const {
        RollingCalibration r{};
        r.model_version = version;
        r.to_day = as_of_day;
        r.from_day = as_of_day - std::max(window_days, 1) + 1;

        std::vector<const CalibrationEvent*> window;
        double brier_sum = 0.0;
        auto it = events_.lower_bound({version, r.from_day});
        for (; it != events_.end() && it->first.first == version && it->first.second <= r.to_day; ++it) {
            for (const auto& e : it->second) {
                ++r.served;
                if (predicted(e) == e.outcome) ++r.correct;
                brier_sum += brier(e);
                window.push_back(&e);
            }
        }

        r.accuracy = r.served > 0 ? static_cast<double>(r.correct) / r.served : 0.0;
        r.mean_brier = r.served > 0 ? brier_sum / r.served : 0.0;
        r.ece = expected_calibration_error(window, bins_);
        return r;
    }

    std::vector<CalibrationAlert> check_gates_locked(ModelVersionId version, DayIndex as_of_day) const {
        std::vector<CalibrationAlert> alerts;
        const RollingCalibration r = rolling_locked(version, gates_.window_days, as_of_day);
        if (r.served == 0 || r.served < gates_.min_samples) {
            return alerts;
        }
        if (r.accuracy < gates_.accuracy_floor) {
            alerts.push_back({version, "accuracy", r.accuracy, gates_.accuracy_floor,
                              r.from_day, r.to_day, r.served});
        }
        if (r.ece > gates_.ece_ceil) {
            alerts.push_back({version, "ece", r.ece, gates_.ece_ceil,
                              r.from_day, r.to_day, r.served});
        }
        return alerts;
    }

    CalibrationGates gates_;
    size_t bins_;

    std::map<DayKey, std::vector<CalibrationEvent>> events_;
    std::map<DayKey, ModelMetricsDaily> daily_;
    std::set<DayKey> dirty_;
    std::set<std::pair<ModelVersionId, FixtureId>> seen_;
    std::set<ModelVersionId> versions_;

    mutable std::mutex mutex_;
};

} // namespace matchcast
