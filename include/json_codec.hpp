#pragma once

#include "arbitrage_scanner.hpp"
#include "calibration_tracker.hpp"
#include "common_types.hpp"
#include "decimal.hpp"
#include "model_registry.hpp"
#include "scoreline_model.hpp"
#include "serving_metrics.hpp"
#include "shadow_evaluator.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace matchcast {

// ============================================================================
// JSON encoding of served and derived records
// ============================================================================
// Timestamps are nanoseconds since the epoch, days are UTC day indices and
// money fields are decimal strings with two places.

using json = nlohmann::json;

inline void to_json(json& j, const MarketProbability& m) {
    j = json{
        {"fixture_id", m.fixture_id},
        {"model_version", m.model_version},
        {"probabilities", m.probabilities},
        {"expected_goals_home", m.expected_goals_home},
        {"expected_goals_away", m.expected_goals_away},
        {"confidence", m.confidence},
        {"truncation_mass", m.truncation_mass},
        {"computed_at", to_nanos(m.computed_at)},
        {"expires_at", to_nanos(m.expires_at)}
    };
}

inline void to_json(json& j, const ShadowLogEntry& e) {
    j = json{
        {"fixture_id", e.fixture_id},
        {"production_version", e.production_version},
        {"canary_version", e.canary_version},
        {"production", e.production},
        {"canary", e.canary},
        {"l1", e.l1},
        {"served_bucket", std::string(1, to_char(e.served_bucket))},
        {"created_at", to_nanos(e.created_at)}
    };
    if (e.kl) {
        j["kl"] = *e.kl;
    } else {
        j["kl"] = nullptr;
    }
}

inline void to_json(json& j, const ModelMetricsDaily& m) {
    j = json{
        {"model_version", m.model_version},
        {"day", m.day},
        {"served", m.served},
        {"correct", m.correct},
        {"accuracy", m.accuracy()},
        {"brier_sum", m.brier_sum},
        {"mean_brier", m.mean_brier()},
        {"ece", m.ece}
    };
}

inline void to_json(json& j, const CalibrationAlert& a) {
    j = json{
        {"model_version", a.model_version},
        {"metric", a.metric},
        {"observed", a.observed},
        {"threshold", a.threshold},
        {"from_day", a.from_day},
        {"to_day", a.to_day},
        {"samples", a.samples}
    };
}

inline void to_json(json& j, const OutcomePrice& p) {
    j = json{
        {"outcome", p.outcome},
        {"bookmaker", p.bookmaker},
        {"odds", p.odds},
        {"timestamp", to_nanos(p.timestamp)}
    };
}

inline void to_json(json& j, const StakeAllocation& s) {
    j = json{
        {"outcome", s.outcome},
        {"bookmaker", s.bookmaker},
        {"odds", to_fixed_string(s.odds, ODDS_PLACES)},
        {"stake", to_fixed_string(s.stake)},
        {"payout", to_fixed_string(s.payout)}
    };
}

inline void to_json(json& j, const ArbitrageOpportunity& o) {
    j = json{
        {"fixture_id", o.fixture_id},
        {"market", o.market},
        {"best_odds", o.best_odds},
        {"implied_probability_sum", o.implied_probability_sum},
        {"profit_pct", o.profit_pct},
        {"total_stake", to_fixed_string(o.total_stake)},
        {"stakes", o.stakes},
        {"guaranteed_profit", to_fixed_string(o.guaranteed_profit)},
        {"detected_at", to_nanos(o.detected_at)}
    };
}

inline void to_json(json& j, const OddsComparison& c) {
    j = json{
        {"fixture_id", c.fixture_id},
        {"market", c.market},
        {"bookmaker_count", c.bookmaker_count},
        {"best", c.best},
        {"worst", c.worst},
        {"average", c.average},
        {"margin_pct", c.margin_pct}
    };
}

inline void to_json(json& j, const MetricSnapshot& s) {
    j = json{
        {"timestamp", s.timestamp_ns},
        {"requests", s.requests},
        {"requests_failed", s.requests_failed},
        {"canary_served", s.canary_served},
        {"cache_hits", s.cache_hits},
        {"cache_misses", s.cache_misses},
        {"shadow_written", s.shadow_written},
        {"shadow_dropped", s.shadow_dropped},
        {"shadow_abandoned", s.shadow_abandoned},
        {"shadow_kl_undefined", s.shadow_kl_undefined},
        {"calibration_alerts", s.calibration_alerts},
        {"quotes_stale", s.quotes_stale},
        {"arbitrage_found", s.arbitrage_found},
        {"latency", s.last_request_latency_us}
    };
}

// Quotes arrive from ingestion as JSON; timestamp defaults to receipt time
inline BookmakerOddsQuote quote_from_json(const json& j, Timestamp received_at) {
    BookmakerOddsQuote q;
    q.fixture_id = j.at("fixture_id").get<std::string>();
    q.bookmaker = j.at("bookmaker").get<std::string>();
    q.market = j.at("market").get<std::string>();
    q.outcome = j.at("outcome").get<std::string>();
    q.odds = j.at("odds").get<double>();
    q.timestamp = j.contains("timestamp") ? from_nanos(j.at("timestamp").get<int64_t>())
                                          : received_at;
    return q;
}

} // namespace matchcast
