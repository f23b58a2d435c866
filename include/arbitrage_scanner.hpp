#pragma once

#include "common_types.hpp"
#include "decimal.hpp"
#include "errors.hpp"
#include "serving_metrics.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace matchcast {

// ============================================================================
// Bookmaker quotes and derived records
// ============================================================================

struct BookmakerOddsQuote {
    FixtureId fixture_id;
    std::string bookmaker;
    std::string market;        // "1X2", "OU_2.5", "BTTS", "DNB", ...
    std::string outcome;       // lower case: "home", "draw", "over", "yes", ...
    double odds;               // decimal odds, > 1.0
    Timestamp timestamp;

    BookmakerOddsQuote() : odds(0.0) {}
};

struct OutcomePrice {
    std::string outcome;
    std::string bookmaker;
    double odds;
    Timestamp timestamp;
};

struct StakeAllocation {
    std::string outcome;
    std::string bookmaker;
    Decimal odds;
    Decimal stake;
    Decimal payout;
};

struct ArbitrageOpportunity {
    FixtureId fixture_id;
    std::string market;
    std::vector<OutcomePrice> best_odds;     // one per outcome, ordered by outcome
    double implied_probability_sum;
    double profit_pct;
    Decimal total_stake;
    std::vector<StakeAllocation> stakes;
    Decimal guaranteed_profit;
    Timestamp detected_at;

    ArbitrageOpportunity() : implied_probability_sum(0.0), profit_pct(0.0) {}
};

struct OddsComparison {
    FixtureId fixture_id;
    std::string market;
    size_t bookmaker_count;
    std::map<std::string, OutcomePrice> best;
    std::map<std::string, OutcomePrice> worst;
    std::map<std::string, double> average;
    double margin_pct;         // (Σ 1/avg_odds - 1) * 100

    OddsComparison() : bookmaker_count(0), margin_pct(0.0) {}
};

struct ArbitrageSettings {
    Duration freshness;
    Decimal total_stake;
    double min_profit_pct;

    ArbitrageSettings()
        : freshness(std::chrono::seconds(300)), total_stake(100), min_profit_pct(0.0) {}
};

// ============================================================================
// Arbitrage Scanner
// ============================================================================
//
// For one (fixture, market) with best decimal odds o_i per outcome:
//   sum      = Σ 1/o_i
//   profit % = (1/sum - 1) * 100            (opportunity iff sum < 1)
//   stake_i  = S * (1/o_i) / sum            (largest-remainder cents, Σ stake_i = S)
//   payout_i = stake_i * o_i                (rounded to cents)
//   guaranteed profit = min_i payout_i - Σ stake_i
//
// A market whose guaranteed profit is not positive after cent rounding is
// not reported.
//
// Quotes older than the freshness threshold never take part and are counted
// as stale on every scan that meets them.

class ArbitrageScanner {
public:
    ArbitrageScanner(const TimeSource& clock, ServingMetrics& metrics,
                     ArbitrageSettings settings = ArbitrageSettings())
        : clock_(clock), metrics_(metrics), settings_(settings) {}

    ArbitrageScanner(const ArbitrageScanner&) = delete;
    ArbitrageScanner& operator=(const ArbitrageScanner&) = delete;

    const ArbitrageSettings& settings() const { return settings_; }

    // Outcomes a market must cover; empty optional means "any two or more"
    static std::optional<std::vector<std::string>> required_outcomes(const std::string& market) {
        if (market == "1X2") return std::vector<std::string>{"away", "draw", "home"};
        if (market == "BTTS") return std::vector<std::string>{"no", "yes"};
        if (market == "DNB") return std::vector<std::string>{"away", "home"};
        if (market.compare(0, 2, "OU") == 0) return std::vector<std::string>{"over", "under"};
        return std::nullopt;
    }

    // ========================================================================
    // Ingestion
    // ========================================================================

    // Returns false when an equal or newer quote is already stored
    bool upsert(BookmakerOddsQuote quote) {
        if (!std::isfinite(quote.odds) || quote.odds <= 1.0) {
            throw PredictionError(ErrorCode::InvalidSignal,
                                  "odds must be greater than 1.0 (" + quote.bookmaker + ")");
        }
        if (quote.fixture_id.empty() || quote.bookmaker.empty() ||
            quote.market.empty() || quote.outcome.empty()) {
            throw PredictionError(ErrorCode::InvalidSignal, "quote is missing an identifier");
        }
        std::transform(quote.outcome.begin(), quote.outcome.end(), quote.outcome.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        std::lock_guard<std::mutex> lock(mutex_);
        auto& market = quotes_[quote.fixture_id][quote.market];
        const QuoteKey key{quote.outcome, quote.bookmaker};
        auto it = market.find(key);
        if (it != market.end() && it->second.timestamp >= quote.timestamp) {
            return false;
        }
        dirty_.insert({quote.fixture_id, quote.market});
        market[key] = std::move(quote);
        return true;
    }

    size_t quote_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& [fixture, markets] : quotes_) {
            for (const auto& [market, quotes] : markets) {
                n += quotes.size();
            }
        }
        return n;
    }

    // Drops quotes that can no longer take part in any scan
    size_t prune(Timestamp as_of) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto fit = quotes_.begin(); fit != quotes_.end();) {
            for (auto mit = fit->second.begin(); mit != fit->second.end();) {
                for (auto qit = mit->second.begin(); qit != mit->second.end();) {
                    if (is_stale(qit->second, as_of)) {
                        qit = mit->second.erase(qit);
                        ++removed;
                    } else {
                        ++qit;
                    }
                }
                mit = mit->second.empty() ? fit->second.erase(mit) : std::next(mit);
            }
            fit = fit->second.empty() ? quotes_.erase(fit) : std::next(fit);
        }
        return removed;
    }

    // ========================================================================
    // Scanning
    // ========================================================================

    std::vector<ArbitrageOpportunity> scan(const std::optional<FixtureId>& fixture_id = std::nullopt) {
        return scan(fixture_id, clock_.now());
    }

    // Sorted by profit descending
    std::vector<ArbitrageOpportunity> scan(const std::optional<FixtureId>& fixture_id, Timestamp as_of) {
        std::vector<ArbitrageOpportunity> out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [fixture, markets] : quotes_) {
                if (fixture_id && fixture != *fixture_id) continue;
                for (const auto& [market, quotes] : markets) {
                    auto opp = evaluate_locked(fixture, market, quotes, as_of);
                    if (opp) {
                        out.push_back(std::move(*opp));
                    }
                }
            }
        }
        sort_by_profit(out);
        return out;
    }

    // Re-evaluates markets whose quotes changed since the last refresh and
    // markets that currently hold an opportunity (their quotes may have aged
    // out). Returns opportunities that are new or whose prices moved.
    std::vector<ArbitrageOpportunity> refresh() {
        const Timestamp as_of = clock_.now();
        std::vector<ArbitrageOpportunity> changed;

        std::lock_guard<std::mutex> lock(mutex_);
        std::set<MarketKey> targets = dirty_;
        for (const auto& [key, opp] : current_) {
            targets.insert(key);
        }
        dirty_.clear();

        for (const auto& key : targets) {
            std::optional<ArbitrageOpportunity> opp;
            auto fit = quotes_.find(key.first);
            if (fit != quotes_.end()) {
                auto mit = fit->second.find(key.second);
                if (mit != fit->second.end()) {
                    opp = evaluate_locked(key.first, key.second, mit->second, as_of);
                }
            }

            auto cur = current_.find(key);
            if (!opp) {
                if (cur != current_.end()) current_.erase(cur);
                continue;
            }
            if (cur == current_.end() || !same_prices(cur->second, *opp)) {
                ServingMetrics::increment(metrics_.counters().arbitrage_found);
                changed.push_back(*opp);
            }
            current_[key] = std::move(*opp);
        }

        sort_by_profit(changed);
        return changed;
    }

    // Opportunities held since the last refresh
    std::vector<ArbitrageOpportunity> current(const std::optional<FixtureId>& fixture_id = std::nullopt) const {
        std::vector<ArbitrageOpportunity> out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [key, opp] : current_) {
                if (!fixture_id || key.first == *fixture_id) {
                    out.push_back(opp);
                }
            }
        }
        sort_by_profit(out);
        return out;
    }

    // ========================================================================
    // Odds comparison (best / worst / average and bookmaker margin)
    // ========================================================================

    std::optional<OddsComparison> compare(const FixtureId& fixture_id, const std::string& market) {
        return compare(fixture_id, market, clock_.now());
    }

    std::optional<OddsComparison> compare(const FixtureId& fixture_id, const std::string& market,
                                          Timestamp as_of) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto fit = quotes_.find(fixture_id);
        if (fit == quotes_.end()) return std::nullopt;
        auto mit = fit->second.find(market);
        if (mit == fit->second.end()) return std::nullopt;

        OddsComparison cmp;
        cmp.fixture_id = fixture_id;
        cmp.market = market;

        std::set<std::string> bookmakers;
        std::map<std::string, std::pair<double, size_t>> totals;
        uint64_t stale = 0;
        for (const auto& [key, q] : mit->second) {
            if (is_stale(q, as_of)) {
                ++stale;
                continue;
            }
            bookmakers.insert(q.bookmaker);
            const OutcomePrice price{q.outcome, q.bookmaker, q.odds, q.timestamp};

            auto best = cmp.best.find(q.outcome);
            if (best == cmp.best.end() || q.odds > best->second.odds) {
                cmp.best[q.outcome] = price;
            }
            auto worst = cmp.worst.find(q.outcome);
            if (worst == cmp.worst.end() || q.odds < worst->second.odds) {
                cmp.worst[q.outcome] = price;
            }
            auto& t = totals[q.outcome];
            t.first += q.odds;
            ++t.second;
        }
        if (stale > 0) {
            ServingMetrics::increment(metrics_.counters().quotes_stale, stale);
        }
        if (bookmakers.empty()) {
            return std::nullopt;
        }

        double implied = 0.0;
        for (const auto& [outcome, t] : totals) {
            const double avg = t.first / static_cast<double>(t.second);
            cmp.average[outcome] = avg;
            implied += 1.0 / avg;
        }
        cmp.bookmaker_count = bookmakers.size();
        cmp.margin_pct = (implied - 1.0) * 100.0;
        return cmp;
    }

private:
    using QuoteKey = std::pair<std::string, std::string>;     // (outcome, bookmaker)
    using MarketKey = std::pair<FixtureId, std::string>;      // (fixture, market)
    using MarketQuotes = std::map<QuoteKey, BookmakerOddsQuote>;

    bool is_stale(const BookmakerOddsQuote& q, Timestamp as_of) const {
        return as_of - q.timestamp > std::chrono::duration_cast<Clock::duration>(settings_.freshness);
    }

    std::optional<ArbitrageOpportunity> evaluate_locked(const FixtureId& fixture_id,
                                                        const std::string& market,
                                                        const MarketQuotes& quotes,
                                                        Timestamp as_of) {
        // Map order is (outcome, bookmaker), so on equal odds the first
        // bookmaker by name is kept
        std::map<std::string, OutcomePrice> best;
        uint64_t stale = 0;
        for (const auto& [key, q] : quotes) {
            if (is_stale(q, as_of)) {
                ++stale;
                continue;
            }
            auto it = best.find(q.outcome);
            if (it == best.end() || q.odds > it->second.odds) {
                best[q.outcome] = OutcomePrice{q.outcome, q.bookmaker, q.odds, q.timestamp};
            }
        }
        if (stale > 0) {
            ServingMetrics::increment(metrics_.counters().quotes_stale, stale);
        }

        std::vector<OutcomePrice> legs;
        const auto required = required_outcomes(market);
        if (required) {
            for (const auto& outcome : *required) {
                auto it = best.find(outcome);
                if (it == best.end()) {
                    return std::nullopt;
                }
                legs.push_back(it->second);
            }
        } else {
            if (best.size() < 2) {
                return std::nullopt;
            }
            for (const auto& [outcome, price] : best) {
                legs.push_back(price);
            }
        }

        Decimal sum = 0;
        std::vector<Decimal> odds;
        for (const auto& leg : legs) {
            odds.push_back(decimal_odds(leg.odds));
            sum += Decimal(1) / odds.back();
        }
        if (sum >= 1) {
            return std::nullopt;
        }

        const double profit_pct = to_double((Decimal(1) / sum - 1) * 100);
        if (profit_pct < settings_.min_profit_pct) {
            return std::nullopt;
        }

        const std::vector<Decimal> stakes = allocate_stakes(odds, sum);

        ArbitrageOpportunity opp;
        opp.fixture_id = fixture_id;
        opp.market = market;
        opp.implied_probability_sum = to_double(sum);
        opp.profit_pct = profit_pct;
        opp.total_stake = 0;
        opp.detected_at = as_of;

        Decimal min_payout = 0;
        for (size_t i = 0; i < legs.size(); ++i) {
            StakeAllocation alloc;
            alloc.outcome = legs[i].outcome;
            alloc.bookmaker = legs[i].bookmaker;
            alloc.odds = odds[i];
            alloc.stake = stakes[i];
            alloc.payout = to_cents(alloc.stake * odds[i]);
            if (i == 0 || alloc.payout < min_payout) {
                min_payout = alloc.payout;
            }
            opp.total_stake += alloc.stake;
            opp.stakes.push_back(std::move(alloc));
        }

        // Cent rounding can eat a thin margin entirely
        opp.guaranteed_profit = min_payout - opp.total_stake;
        if (opp.guaranteed_profit <= 0) {
            return std::nullopt;
        }
        opp.best_odds = std::move(legs);
        return opp;
    }

    // Splits the total stake (in cents) across legs in proportion to 1/o_i.
    // Each leg gets the floor of its exact share and the leftover cents go to
    // the largest remainders, so the stakes always add up to the total.
    std::vector<Decimal> allocate_stakes(const std::vector<Decimal>& odds, const Decimal& sum) const {
        const Decimal total_cents = boost::multiprecision::round(settings_.total_stake * 100);
        std::vector<Decimal> cents(odds.size());
        std::vector<Decimal> remainders(odds.size());
        Decimal allocated = 0;
        for (size_t i = 0; i < odds.size(); ++i) {
            const Decimal exact = total_cents * (Decimal(1) / odds[i]) / sum;
            cents[i] = boost::multiprecision::floor(exact);
            remainders[i] = exact - cents[i];
            allocated += cents[i];
        }

        std::vector<size_t> order(odds.size());
        for (size_t i = 0; i < order.size(); ++i) order[i] = i;
        std::stable_sort(order.begin(), order.end(), [&remainders](size_t a, size_t b) {
            return remainders[a] > remainders[b];
        });

        const long leftover = Decimal(total_cents - allocated).convert_to<long>();
        for (long k = 0; k < leftover && !order.empty(); ++k) {
            cents[order[static_cast<size_t>(k) % order.size()]] += 1;
        }

        std::vector<Decimal> stakes;
        stakes.reserve(cents.size());
        for (const auto& c : cents) {
            stakes.push_back(c / 100);
        }
        return stakes;
    }

    static bool same_prices(const ArbitrageOpportunity& a, const ArbitrageOpportunity& b) {
        if (a.best_odds.size() != b.best_odds.size()) return false;
        for (size_t i = 0; i < a.best_odds.size(); ++i) {
            if (a.best_odds[i].outcome != b.best_odds[i].outcome ||
                a.best_odds[i].bookmaker != b.best_odds[i].bookmaker ||
                a.best_odds[i].odds != b.best_odds[i].odds) {
                return false;
            }
        }
        return true;
    }

    static void sort_by_profit(std::vector<ArbitrageOpportunity>& opps) {
        std::stable_sort(opps.begin(), opps.end(),
                         [](const ArbitrageOpportunity& a, const ArbitrageOpportunity& b) {
                             return a.profit_pct > b.profit_pct;
                         });
    }

    const TimeSource& clock_;
    ServingMetrics& metrics_;
    ArbitrageSettings settings_;

    std::map<FixtureId, std::map<std::string, MarketQuotes>> quotes_;
    std::set<MarketKey> dirty_;
    std::map<MarketKey, ArbitrageOpportunity> current_;
    mutable std::mutex mutex_;
};

} // namespace matchcast
