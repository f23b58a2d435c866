#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace matchcast {

// ============================================================================
// Scoreline Grid
// ============================================================================
// Row-major (home goals x away goals) over 0..max_goals on both axes.

struct ScoreGrid {
    int max_goals;
    std::vector<double> cells;
    double truncation_mass;            // Mass lost beyond max_goals before renormalising

    ScoreGrid() : max_goals(0), truncation_mass(0.0) {}

    explicit ScoreGrid(int n)
        : max_goals(n)
        , cells(static_cast<size_t>((n + 1) * (n + 1)), 0.0)
        , truncation_mass(0.0) {}

    double at(int home, int away) const {
        return cells[static_cast<size_t>(home * (max_goals + 1) + away)];
    }

    double& at(int home, int away) {
        return cells[static_cast<size_t>(home * (max_goals + 1) + away)];
    }

    // Sum in increasing goal order
    double total() const {
        double sum = 0.0;
        for (int h = 0; h <= max_goals; ++h) {
            for (int a = 0; a <= max_goals; ++a) {
                sum += at(h, a);
            }
        }
        return sum;
    }
};

// ============================================================================
// Market Definitions (declarative predicate table)
// ============================================================================
// A market is a predicate over (home_goals, away_goals). Its probability is
// the sum of grid cells satisfying the predicate. Markets sharing an
// exclusive group partition the scoreline space and must sum to 1.
//
// A conditional market also carries a condition; its probability is
// P(predicate and condition) / P(condition), and 0.5 when the condition has
// no mass (stakes are void, as in draw no bet).

using ScorePredicate = std::function<bool(int home, int away)>;

struct MarketDefinition {
    std::string code;
    std::string group;
    bool exclusive;                    // Group members are mutually exclusive and exhaustive
    ScorePredicate predicate;
    ScorePredicate condition;          // empty for unconditional markets
};

class MarketCatalog {
public:
    MarketCatalog() = default;

    void add(const std::string& code, const std::string& group, bool exclusive,
             ScorePredicate predicate) {
        definitions_.push_back({code, group, exclusive, std::move(predicate), ScorePredicate()});
    }

    void add_conditional(const std::string& code, const std::string& group, bool exclusive,
                         ScorePredicate predicate, ScorePredicate condition) {
        definitions_.push_back({code, group, exclusive, std::move(predicate), std::move(condition)});
    }

    const std::vector<MarketDefinition>& definitions() const { return definitions_; }

    size_t size() const { return definitions_.size(); }

    // group -> member codes, for groups flagged exclusive
    std::map<std::string, std::vector<std::string>> exclusive_groups() const {
        std::map<std::string, std::vector<std::string>> groups;
        for (const auto& def : definitions_) {
            if (def.exclusive) {
                groups[def.group].push_back(def.code);
            }
        }
        return groups;
    }

    std::map<std::string, double> evaluate(const ScoreGrid& grid) const {
        std::map<std::string, double> out;
        for (const auto& def : definitions_) {
            double p = 0.0;
            double given = 0.0;
            for (int h = 0; h <= grid.max_goals; ++h) {
                for (int a = 0; a <= grid.max_goals; ++a) {
                    if (def.condition && !def.condition(h, a)) {
                        continue;
                    }
                    given += grid.at(h, a);
                    if (def.predicate(h, a)) {
                        p += grid.at(h, a);
                    }
                }
            }
            if (def.condition) {
                p = given > 0.0 ? p / given : 0.5;
            }
            out[def.code] = std::clamp(p, 0.0, 1.0);
        }
        return out;
    }

    // Full football catalog built once per process
    static const MarketCatalog& standard() {
        static const MarketCatalog catalog = build_standard();
        return catalog;
    }

private:
    static std::string half_line(int k) {
        return std::to_string(k) + ".5";
    }

    static std::string signed_half_line(int k, bool negative) {
        return std::string(negative ? "-" : "+") + half_line(k);
    }

    static MarketCatalog build_standard() {
        MarketCatalog c;

        // Match result
        c.add("1", "1X2", true, [](int h, int a) { return h > a; });
        c.add("X", "1X2", true, [](int h, int a) { return h == a; });
        c.add("2", "1X2", true, [](int h, int a) { return h < a; });

        // Double chance (overlapping, sums to 2)
        c.add("DC_1X", "DC", false, [](int h, int a) { return h >= a; });
        c.add("DC_12", "DC", false, [](int h, int a) { return h != a; });
        c.add("DC_X2", "DC", false, [](int h, int a) { return h <= a; });

        // Draw no bet: the draw voids the stake
        auto no_draw = [](int h, int a) { return h != a; };
        c.add_conditional("DNB_HOME", "DNB", true, [](int h, int a) { return h > a; }, no_draw);
        c.add_conditional("DNB_AWAY", "DNB", true, [](int h, int a) { return h < a; }, no_draw);

        // Total goals over/under 0.5 .. 6.5
        for (int k = 0; k <= 6; ++k) {
            const std::string group = "OU_" + half_line(k);
            c.add("O" + half_line(k), group, true, [k](int h, int a) { return h + a > k; });
            c.add("U" + half_line(k), group, true, [k](int h, int a) { return h + a <= k; });
        }

        // Team totals 0.5 .. 3.5
        for (int k = 0; k <= 3; ++k) {
            const std::string home_group = "HOME_OU_" + half_line(k);
            c.add("HOME_O" + half_line(k), home_group, true, [k](int h, int) { return h > k; });
            c.add("HOME_U" + half_line(k), home_group, true, [k](int h, int) { return h <= k; });

            const std::string away_group = "AWAY_OU_" + half_line(k);
            c.add("AWAY_O" + half_line(k), away_group, true, [k](int, int a) { return a > k; });
            c.add("AWAY_U" + half_line(k), away_group, true, [k](int, int a) { return a <= k; });
        }

        // Both teams to score
        c.add("BTTS_YES", "BTTS", true, [](int h, int a) { return h > 0 && a > 0; });
        c.add("BTTS_NO", "BTTS", true, [](int h, int a) { return h == 0 || a == 0; });

        // Exact total goals
        for (int k = 0; k <= 6; ++k) {
            c.add("TG_" + std::to_string(k), "TG", true, [k](int h, int a) { return h + a == k; });
        }
        c.add("TG_7+", "TG", true, [](int h, int a) { return h + a >= 7; });

        // Odd / even total
        c.add("ODD", "ODD_EVEN", true, [](int h, int a) { return (h + a) % 2 == 1; });
        c.add("EVEN", "ODD_EVEN", true, [](int h, int a) { return (h + a) % 2 == 0; });

        // Clean sheets
        c.add("CS_HOME_YES", "CS_HOME", true, [](int, int a) { return a == 0; });
        c.add("CS_HOME_NO", "CS_HOME", true, [](int, int a) { return a > 0; });
        c.add("CS_AWAY_YES", "CS_AWAY", true, [](int h, int) { return h == 0; });
        c.add("CS_AWAY_NO", "CS_AWAY", true, [](int h, int) { return h > 0; });

        // Win to nil
        c.add("WTN_HOME", "WTN", false, [](int h, int a) { return h > 0 && a == 0; });
        c.add("WTN_AWAY", "WTN", false, [](int h, int a) { return a > 0 && h == 0; });

        // Asian handicap half lines, home perspective
        for (int k = 0; k <= 2; ++k) {
            // Home -k.5: home wins by more than k
            const std::string minus = signed_half_line(k, true);
            c.add("AH_H" + minus, "AH_" + minus, true, [k](int h, int a) { return h - a > k; });
            c.add("AH_A" + signed_half_line(k, false), "AH_" + minus, true,
                  [k](int h, int a) { return h - a <= k; });

            // Home +k.5: home does not lose by more than k
            const std::string plus = signed_half_line(k, false);
            c.add("AH_H" + plus, "AH_" + plus, true, [k](int h, int a) { return a - h <= k; });
            c.add("AH_A" + signed_half_line(k, true), "AH_" + plus, true,
                  [k](int h, int a) { return a - h > k; });
        }

        // Winning margin
        c.add("WM_H1", "WM", true, [](int h, int a) { return h - a == 1; });
        c.add("WM_H2", "WM", true, [](int h, int a) { return h - a == 2; });
        c.add("WM_H3+", "WM", true, [](int h, int a) { return h - a >= 3; });
        c.add("WM_X", "WM", true, [](int h, int a) { return h == a; });
        c.add("WM_A1", "WM", true, [](int h, int a) { return a - h == 1; });
        c.add("WM_A2", "WM", true, [](int h, int a) { return a - h == 2; });
        c.add("WM_A3+", "WM", true, [](int h, int a) { return a - h >= 3; });

        // Correct score 0..5 x 0..5, remainder in SCORE_OTHER
        for (int h = 0; h <= 5; ++h) {
            for (int a = 0; a <= 5; ++a) {
                c.add("SCORE_" + std::to_string(h) + "_" + std::to_string(a), "SCORE", true,
                      [h, a](int hh, int aa) { return hh == h && aa == a; });
            }
        }
        c.add("SCORE_OTHER", "SCORE", true, [](int h, int a) { return h > 5 || a > 5; });

        // Result & total goals 2.5
        c.add("1&O2.5", "1X2_OU_2.5", true, [](int h, int a) { return h > a && h + a > 2; });
        c.add("1&U2.5", "1X2_OU_2.5", true, [](int h, int a) { return h > a && h + a <= 2; });
        c.add("X&O2.5", "1X2_OU_2.5", true, [](int h, int a) { return h == a && h + a > 2; });
        c.add("X&U2.5", "1X2_OU_2.5", true, [](int h, int a) { return h == a && h + a <= 2; });
        c.add("2&O2.5", "1X2_OU_2.5", true, [](int h, int a) { return h < a && h + a > 2; });
        c.add("2&U2.5", "1X2_OU_2.5", true, [](int h, int a) { return h < a && h + a <= 2; });

        // Result & both teams to score
        c.add("1&BTTS_YES", "1X2_BTTS", true, [](int h, int a) { return h > a && a > 0; });
        c.add("1&BTTS_NO", "1X2_BTTS", true, [](int h, int a) { return h > a && a == 0; });
        c.add("X&BTTS_YES", "1X2_BTTS", true, [](int h, int a) { return h == a && h > 0; });
        c.add("X&BTTS_NO", "1X2_BTTS", true, [](int h, int a) { return h == a && h == 0; });
        c.add("2&BTTS_YES", "1X2_BTTS", true, [](int h, int a) { return h < a && h > 0; });
        c.add("2&BTTS_NO", "1X2_BTTS", true, [](int h, int a) { return h < a && h == 0; });

        // Both teams to score & total goals
        c.add("BTTS&O2.5", "BTTS_OU", false, [](int h, int a) { return h > 0 && a > 0 && h + a > 2; });
        c.add("BTTS&U2.5", "BTTS_OU", false, [](int h, int a) { return h > 0 && a > 0 && h + a <= 2; });
        c.add("BTTS&O1.5", "BTTS_OU", false, [](int h, int a) { return h > 0 && a > 0; });

        // Total goals in [lo, hi]; ranges overlap
        const std::vector<std::pair<int, int>> ranges = {
            {0, 1}, {1, 2}, {1, 3}, {2, 3}, {2, 4}, {2, 5}, {3, 4}, {3, 5}, {3, 6}, {4, 6}
        };
        for (const auto& [lo, hi] : ranges) {
            c.add("MG_" + std::to_string(lo) + "_" + std::to_string(hi), "MG", false,
                  [lo = lo, hi = hi](int h, int a) { return h + a >= lo && h + a <= hi; });
        }
        c.add("MG_7+", "MG", false, [](int h, int a) { return h + a >= 7; });

        // Double chance combinations, priced on the joint scoreline event
        auto dc_1x = [](int h, int a) { return h >= a; };
        auto dc_x2 = [](int h, int a) { return h <= a; };
        auto dc_12 = [](int h, int a) { return h != a; };
        auto btts = [](int h, int a) { return h > 0 && a > 0; };
        c.add("DC_1X&O1.5", "DC_COMBO", false, [dc_1x](int h, int a) { return dc_1x(h, a) && h + a > 1; });
        c.add("DC_X2&O1.5", "DC_COMBO", false, [dc_x2](int h, int a) { return dc_x2(h, a) && h + a > 1; });
        c.add("DC_1X&BTTS_YES", "DC_COMBO", false,
              [dc_1x, btts](int h, int a) { return dc_1x(h, a) && btts(h, a); });
        c.add("DC_X2&BTTS_YES", "DC_COMBO", false,
              [dc_x2, btts](int h, int a) { return dc_x2(h, a) && btts(h, a); });
        c.add("DC_1X&BTTS_YES&O1.5", "DC_COMBO", false,
              [dc_1x, btts](int h, int a) { return dc_1x(h, a) && btts(h, a) && h + a > 1; });
        c.add("DC_X2&BTTS_YES&O1.5", "DC_COMBO", false,
              [dc_x2, btts](int h, int a) { return dc_x2(h, a) && btts(h, a) && h + a > 1; });
        c.add("DC_1X&BTTS_YES&O2.5", "DC_COMBO", false,
              [dc_1x, btts](int h, int a) { return dc_1x(h, a) && btts(h, a) && h + a > 2; });
        c.add("DC_X2&BTTS_YES&O2.5", "DC_COMBO", false,
              [dc_x2, btts](int h, int a) { return dc_x2(h, a) && btts(h, a) && h + a > 2; });
        c.add("DC_12&BTTS_YES&O2.5", "DC_COMBO", false,
              [dc_12, btts](int h, int a) { return dc_12(h, a) && btts(h, a) && h + a > 2; });
        c.add("HOME_O1.5&AWAY_O0.5&BTTS_YES&O2.5", "TEAM_COMBO", false,
              [](int h, int a) { return h > 1 && a > 0 && h + a > 2; });

        return c;
    }

    std::vector<MarketDefinition> definitions_;
};

} // namespace matchcast
