#pragma once

#include "common_types.hpp"
#include <mutex>
#include <optional>
#include <unordered_map>

namespace matchcast {

// ============================================================================
// Fixture Signals (model inputs, produced by external ingestion)
// ============================================================================

struct FixtureSignals {
    // Rolling expected goals per match
    double home_xg_for;
    double home_xg_against;
    double away_xg_for;
    double away_xg_against;

    // Elo ratings before kickoff
    double home_elo;
    double away_elo;

    // Aggregate referee bias, positive favours the home side (typically -0.2 .. 0.2)
    double referee_bias;

    // Multiplier on both scoring rates (1.0 = neutral, < 1 for heavy rain / wind)
    double weather_goal_factor;

    Timestamp kickoff;

    FixtureSignals()
        : home_xg_for(0.0), home_xg_against(0.0),
          away_xg_for(0.0), away_xg_against(0.0),
          home_elo(1500.0), away_elo(1500.0),
          referee_bias(0.0), weather_goal_factor(1.0),
          kickoff() {}
};

// ============================================================================
// Signal Source (query interface onto ingested data, keyed by fixture)
// ============================================================================

class SignalSource {
public:
    virtual ~SignalSource() = default;
    virtual std::optional<FixtureSignals> fetch(const FixtureId& fixture_id) const = 0;
};

// Backing store for tests, the benchmark and the demo server.
// Signals are frozen once the fixture has kicked off.
class InMemorySignalSource : public SignalSource {
public:
    explicit InMemorySignalSource(const TimeSource& clock) : clock_(clock) {}

    // Returns false when the stored fixture has already kicked off
    bool upsert(const FixtureId& fixture_id, const FixtureSignals& signals) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = signals_.find(fixture_id);
        if (it != signals_.end() && clock_.now() >= it->second.kickoff) {
            return false;
        }
        signals_[fixture_id] = signals;
        return true;
    }

    std::optional<FixtureSignals> fetch(const FixtureId& fixture_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = signals_.find(fixture_id);
        if (it == signals_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    const TimeSource& clock_;
    std::unordered_map<FixtureId, FixtureSignals> signals_;
    mutable std::mutex mutex_;
};

} // namespace matchcast
