#pragma once

#include "common_types.hpp"
#include "elo.hpp"
#include "errors.hpp"
#include "market_catalog.hpp"
#include "signal_source.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace matchcast {

// ============================================================================
// Scoreline Probability Model (Dixon-Coles style)
// ============================================================================
//
// Expected goals:
//   attack  = xg_for / league_avg,  defence = xg_against / league_avg
//   λ_home  = home_attack * away_defence * league_avg * home_advantage
//   λ_away  = away_attack * home_defence * league_avg
//   Elo tilt:      λ_home *= exp(w_elo * (E - 0.5)),  λ_away *= exp(-w_elo * (E - 0.5))
//   Referee bias:  λ_home *= exp(w_ref * b),          λ_away *= exp(-w_ref * b)
//   Weather:       both *= weather_goal_factor
//
// Grid:
//   P(h, a) = τ(h, a) * Pois(h; λ_home) * Pois(a; λ_away),  h, a ∈ [0, max_goals]
//   τ(0,0) = 1 - λμρ,  τ(0,1) = 1 + λρ,  τ(1,0) = 1 + μρ,  τ(1,1) = 1 - ρ
//
// The grid is renormalised after truncation so it always sums to 1.
// Every function here is pure: same signals + same parameters give
// bit-identical output.

struct ModelParameters {
    double rho;                  // Low-score correlation (typically -0.2 .. 0)
    double home_advantage;       // Multiplier on home scoring rate
    double league_avg_goals;     // League average goals per team per match
    double elo_weight;           // Strength of the Elo tilt
    double referee_weight;       // Strength of the referee tilt
    int max_goals;               // Grid truncation per side

    ModelParameters()
        : rho(-0.10), home_advantage(1.10), league_avg_goals(1.40),
          elo_weight(0.60), referee_weight(0.50), max_goals(10) {}
};

struct ExpectedGoals {
    double home;
    double away;
};

// One prediction surface
struct MarketProbability {
    FixtureId fixture_id;
    ModelVersionId model_version;
    std::map<std::string, double> probabilities;   // market code -> p ∈ [0, 1]
    double expected_goals_home;
    double expected_goals_away;
    double confidence;                              // max(P(1), P(X), P(2))
    double truncation_mass;
    Timestamp computed_at;
    Timestamp expires_at;

    MarketProbability()
        : model_version(0), expected_goals_home(0.0), expected_goals_away(0.0),
          confidence(0.0), truncation_mass(0.0) {}

    double get(const std::string& code) const {
        auto it = probabilities.find(code);
        return it == probabilities.end() ? 0.0 : it->second;
    }

    bool same_surface(const MarketProbability& other) const {
        return fixture_id == other.fixture_id &&
               model_version == other.model_version &&
               probabilities == other.probabilities;
    }
};

class ScorelineModel {
public:
    static constexpr double MAX_EXPECTED_GOALS = 8.0;
    static constexpr double MIN_EXPECTED_GOALS = 1e-3;
    static constexpr int MAX_GRID_GOALS = 20;

    explicit ScorelineModel(const MarketCatalog& catalog = MarketCatalog::standard())
        : catalog_(catalog) {}

    // ========================================================================
    // Input validation
    // ========================================================================

    static void validate(const FixtureSignals& s) {
        const double xg[] = {s.home_xg_for, s.home_xg_against, s.away_xg_for, s.away_xg_against};
        for (double v : xg) {
            if (!std::isfinite(v) || v <= 0.0) {
                throw PredictionError(ErrorCode::InvalidSignal,
                                      "expected goals must be positive and finite");
            }
        }
        if (!std::isfinite(s.home_elo) || !std::isfinite(s.away_elo)) {
            throw PredictionError(ErrorCode::InvalidSignal, "Elo rating is not finite");
        }
        if (!std::isfinite(s.referee_bias)) {
            throw PredictionError(ErrorCode::InvalidSignal, "referee bias is not finite");
        }
        if (!std::isfinite(s.weather_goal_factor) || s.weather_goal_factor <= 0.0) {
            throw PredictionError(ErrorCode::InvalidSignal, "weather factor must be positive");
        }
    }

    static void validate(const ModelParameters& p) {
        if (!std::isfinite(p.rho) || !std::isfinite(p.elo_weight) ||
            !std::isfinite(p.referee_weight)) {
            throw PredictionError(ErrorCode::InvalidSignal, "model parameter is not finite");
        }
        if (!(p.home_advantage > 0.0) || !(p.league_avg_goals > 0.0)) {
            throw PredictionError(ErrorCode::InvalidSignal,
                                  "home advantage and league average must be positive");
        }
        if (p.max_goals < 1 || p.max_goals > MAX_GRID_GOALS) {
            throw PredictionError(ErrorCode::InvalidSignal, "max_goals out of range");
        }
    }

    // ========================================================================
    // Expected goals from signals
    // ========================================================================

    static ExpectedGoals expected_goals(const FixtureSignals& s, const ModelParameters& p) {
        const double avg = p.league_avg_goals;
        const double home_attack = s.home_xg_for / avg;
        const double home_defence = s.home_xg_against / avg;
        const double away_attack = s.away_xg_for / avg;
        const double away_defence = s.away_xg_against / avg;

        double lambda_home = home_attack * away_defence * avg * p.home_advantage;
        double lambda_away = away_attack * home_defence * avg;

        // Ratings already include home advantage through home_advantage above
        const double e_home = EloRating::expected_score(s.home_elo, s.away_elo, false);
        lambda_home *= std::exp(p.elo_weight * (e_home - 0.5));
        lambda_away *= std::exp(-p.elo_weight * (e_home - 0.5));

        lambda_home *= std::exp(p.referee_weight * s.referee_bias);
        lambda_away *= std::exp(-p.referee_weight * s.referee_bias);

        lambda_home *= s.weather_goal_factor;
        lambda_away *= s.weather_goal_factor;

        return {std::clamp(lambda_home, MIN_EXPECTED_GOALS, MAX_EXPECTED_GOALS),
                std::clamp(lambda_away, MIN_EXPECTED_GOALS, MAX_EXPECTED_GOALS)};
    }

    // ========================================================================
    // Scoreline grid
    // ========================================================================

    static ScoreGrid build_grid(double lambda_home, double lambda_away, const ModelParameters& p) {
        const int n = p.max_goals;
        const std::vector<double> home_pmf = poisson_pmf(lambda_home, n);
        const std::vector<double> away_pmf = poisson_pmf(lambda_away, n);

        ScoreGrid grid(n);
        double raw_sum = 0.0;
        for (int h = 0; h <= n; ++h) {
            for (int a = 0; a <= n; ++a) {
                const double cell = tau(h, a, lambda_home, lambda_away, p.rho) *
                                    home_pmf[static_cast<size_t>(h)] *
                                    away_pmf[static_cast<size_t>(a)];
                grid.at(h, a) = cell;
                raw_sum += cell;
            }
        }

        grid.truncation_mass = std::max(0.0, 1.0 - raw_sum);

        // Truncation error is absorbed by renormalising
        if (raw_sum > 0.0) {
            for (double& cell : grid.cells) {
                cell /= raw_sum;
            }
        }
        return grid;
    }

    // ========================================================================
    // Full prediction surface
    // ========================================================================

    MarketProbability predict(const FixtureId& fixture_id,
                              const std::optional<FixtureSignals>& signals,
                              ModelVersionId version,
                              const ModelParameters& params,
                              Timestamp computed_at,
                              Duration ttl) const {
        if (!signals) {
            throw PredictionError(ErrorCode::InsufficientInput,
                                  "no signals for fixture " + fixture_id);
        }
        validate(*signals);
        validate(params);

        const ExpectedGoals xg = expected_goals(*signals, params);
        const ScoreGrid grid = build_grid(xg.home, xg.away, params);

        MarketProbability out;
        out.fixture_id = fixture_id;
        out.model_version = version;
        out.probabilities = catalog_.evaluate(grid);
        out.expected_goals_home = xg.home;
        out.expected_goals_away = xg.away;
        out.confidence = std::max({out.get("1"), out.get("X"), out.get("2")});
        out.truncation_mass = grid.truncation_mass;
        out.computed_at = computed_at;
        out.expires_at = computed_at + std::chrono::duration_cast<Clock::duration>(ttl);
        return out;
    }

    const MarketCatalog& catalog() const { return catalog_; }

private:
    static std::vector<double> poisson_pmf(double lambda, int n) {
        std::vector<double> pmf(static_cast<size_t>(n + 1));
        pmf[0] = std::exp(-lambda);
        for (int k = 1; k <= n; ++k) {
            pmf[static_cast<size_t>(k)] = pmf[static_cast<size_t>(k - 1)] * lambda / k;
        }
        return pmf;
    }

    static double tau(int h, int a, double lambda, double mu, double rho) {
        double t = 1.0;
        if (h == 0 && a == 0) t = 1.0 - lambda * mu * rho;
        else if (h == 0 && a == 1) t = 1.0 + lambda * rho;
        else if (h == 1 && a == 0) t = 1.0 + mu * rho;
        else if (h == 1 && a == 1) t = 1.0 - rho;
        return std::max(t, 0.0);
    }

    const MarketCatalog& catalog_;
};

} // namespace matchcast
