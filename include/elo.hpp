#pragma once

#include "common_types.hpp"
#include <cmath>
#include <algorithm>

namespace matchcast {

// ============================================================================
// Elo Ratings (football variant)
// ============================================================================
// Expected score: E = 1 / (1 + 10^((R_opp - R_team - H) / 400))
//   H = home advantage in rating points when the team plays at home
// Update:        R' = R + K * G * (S - E)
//   S = 1 / 0.5 / 0 for win / draw / loss
//   G = goal difference multiplier (1, 1.5, 1.75, 2 for 1, 2, 3, 4+ goals)
//
// The serving path only reads ratings; updates are applied by ingestion.

class EloRating {
public:
    static constexpr double DEFAULT_RATING = 1500.0;
    static constexpr double K_FACTOR = 20.0;
    static constexpr double K_FACTOR_IMPORTANT = 30.0;
    static constexpr double HOME_ADVANTAGE = 100.0;

    struct MatchUpdate {
        double home_before;
        double away_before;
        double home_after;
        double away_after;
        double home_expected;
    };

    static double expected_score(double team_rating, double opponent_rating,
                                 bool is_home = false) {
        double diff = opponent_rating - team_rating;
        if (is_home) {
            diff -= HOME_ADVANTAGE;
        }
        return 1.0 / (1.0 + std::pow(10.0, diff / 400.0));
    }

    static double goal_difference_multiplier(int goal_diff) {
        switch (std::min(std::abs(goal_diff), 4)) {
            case 0:
            case 1: return 1.0;
            case 2: return 1.5;
            case 3: return 1.75;
            default: return 2.0;
        }
    }

    static double new_rating(double current, double expected, double actual,
                             double k_factor, int goal_diff) {
        return current + k_factor * goal_difference_multiplier(goal_diff) *
                         (actual - expected);
    }

    static MatchUpdate update_after_match(double home_rating, double away_rating,
                                          int home_goals, int away_goals,
                                          bool is_important = false) {
        const double k = is_important ? K_FACTOR_IMPORTANT : K_FACTOR;
        const double e_home = expected_score(home_rating, away_rating, true);
        const double e_away = 1.0 - e_home;

        double s_home = 0.5;
        if (home_goals > away_goals) s_home = 1.0;
        else if (home_goals < away_goals) s_home = 0.0;

        const int gd = home_goals - away_goals;

        MatchUpdate u;
        u.home_before = home_rating;
        u.away_before = away_rating;
        u.home_after = new_rating(home_rating, e_home, s_home, k, gd);
        u.away_after = new_rating(away_rating, e_away, 1.0 - s_home, k, gd);
        u.home_expected = e_home;
        return u;
    }
};

} // namespace matchcast
