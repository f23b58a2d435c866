#include <gtest/gtest.h>
#include "arbitrage_scanner.hpp"

using namespace matchcast;

class ArbitrageScannerTest : public ::testing::Test {
protected:
    BookmakerOddsQuote quote(const std::string& fixture, const std::string& book,
                             const std::string& market, const std::string& outcome,
                             double odds, Timestamp ts) const {
        BookmakerOddsQuote q;
        q.fixture_id = fixture;
        q.bookmaker = book;
        q.market = market;
        q.outcome = outcome;
        q.odds = odds;
        q.timestamp = ts;
        return q;
    }

    void seed_three_way(const std::string& fixture = "FX-1") {
        const Timestamp t = clock.now();
        scanner.upsert(quote(fixture, "northbet", "1X2", "home", 2.10, t));
        scanner.upsert(quote(fixture, "eastline", "1X2", "draw", 3.80, t));
        scanner.upsert(quote(fixture, "southpool", "1X2", "away", 4.20, t));
        // Worse prices that must not be picked
        scanner.upsert(quote(fixture, "eastline", "1X2", "home", 1.95, t));
        scanner.upsert(quote(fixture, "northbet", "1X2", "draw", 3.40, t));
    }

    ManualTimeSource clock{from_nanos(1'790'000'000'000'000'000LL)};
    ServingMetrics metrics;
    ArbitrageScanner scanner{clock, metrics};
};

TEST_F(ArbitrageScannerTest, ThreeWayOpportunity) {
    seed_three_way();
    const auto opps = scanner.scan();
    ASSERT_EQ(opps.size(), 1u);
    const ArbitrageOpportunity& o = opps[0];

    EXPECT_EQ(o.fixture_id, "FX-1");
    EXPECT_EQ(o.market, "1X2");
    EXPECT_NEAR(o.implied_probability_sum, 1 / 2.10 + 1 / 3.80 + 1 / 4.20, 1e-9);
    EXPECT_NEAR(o.implied_probability_sum, 0.977444, 1e-6);
    EXPECT_NEAR(o.profit_pct, 2.3077, 1e-4);
    EXPECT_EQ(o.detected_at, clock.now());

    ASSERT_EQ(o.best_odds.size(), 3u);
    ASSERT_EQ(o.stakes.size(), 3u);

    // Outcomes in canonical order: away, draw, home
    EXPECT_EQ(o.stakes[0].outcome, "away");
    EXPECT_EQ(o.stakes[0].bookmaker, "southpool");
    EXPECT_EQ(to_fixed_string(o.stakes[0].stake), "24.36");
    EXPECT_EQ(to_fixed_string(o.stakes[0].payout), "102.31");

    EXPECT_EQ(o.stakes[1].outcome, "draw");
    EXPECT_EQ(o.stakes[1].bookmaker, "eastline");
    EXPECT_EQ(to_fixed_string(o.stakes[1].stake), "26.92");
    EXPECT_EQ(to_fixed_string(o.stakes[1].payout), "102.30");

    EXPECT_EQ(o.stakes[2].outcome, "home");
    EXPECT_EQ(o.stakes[2].bookmaker, "northbet");
    EXPECT_EQ(to_fixed_string(o.stakes[2].stake), "48.72");
    EXPECT_EQ(to_fixed_string(o.stakes[2].payout), "102.31");

    EXPECT_EQ(to_fixed_string(o.total_stake), "100.00");
    EXPECT_EQ(to_fixed_string(o.guaranteed_profit), "2.30");
}

TEST_F(ArbitrageScannerTest, EveryPayoutCoversTheStake) {
    seed_three_way();
    const auto o = scanner.scan().at(0);
    for (const auto& s : o.stakes) {
        EXPECT_GT(s.payout, o.total_stake);
        EXPECT_GE(s.payout - o.total_stake, o.guaranteed_profit);
    }
}

TEST_F(ArbitrageScannerTest, StakesAddUpToTotalAfterCentRounding) {
    // Rounding each leg on its own would stake 100.01 here
    const Timestamp t = clock.now();
    scanner.upsert(quote("FX-10", "a", "1X2", "home", 2.00, t));
    scanner.upsert(quote("FX-10", "b", "1X2", "draw", 3.58, t));
    scanner.upsert(quote("FX-10", "c", "1X2", "away", 4.58, t));

    const auto opps = scanner.scan();
    ASSERT_EQ(opps.size(), 1u);
    const ArbitrageOpportunity& o = opps[0];

    Decimal staked = 0;
    for (const auto& s : o.stakes) {
        staked += s.stake;
    }
    EXPECT_EQ(to_fixed_string(staked), "100.00");
    EXPECT_EQ(to_fixed_string(o.total_stake), "100.00");

    EXPECT_EQ(to_fixed_string(o.stakes[0].stake), "21.88");
    EXPECT_EQ(to_fixed_string(o.stakes[1].stake), "28.00");
    EXPECT_EQ(to_fixed_string(o.stakes[2].stake), "50.12");
    EXPECT_EQ(to_fixed_string(o.stakes[0].payout), "100.21");
    EXPECT_EQ(to_fixed_string(o.guaranteed_profit), "0.21");

    for (const auto& s : o.stakes) {
        EXPECT_GE(s.payout - staked, o.guaranteed_profit);
    }
}

TEST_F(ArbitrageScannerTest, MarginLostToRoundingIsNotReported) {
    // Implied sum is just under 1 but one leg pays back 99.99 on 100.00
    const Timestamp t = clock.now();
    scanner.upsert(quote("FX-11", "a", "BTTS", "no", 1.969, t));
    scanner.upsert(quote("FX-11", "b", "BTTS", "yes", 2.032, t));
    EXPECT_TRUE(scanner.scan().empty());
    EXPECT_TRUE(scanner.refresh().empty());
}

TEST_F(ArbitrageScannerTest, NoOpportunityWhenBookIsOverround) {
    const Timestamp t = clock.now();
    scanner.upsert(quote("FX-2", "northbet", "1X2", "home", 1.90, t));
    scanner.upsert(quote("FX-2", "northbet", "1X2", "draw", 3.40, t));
    scanner.upsert(quote("FX-2", "northbet", "1X2", "away", 4.00, t));
    EXPECT_TRUE(scanner.scan().empty());
}

TEST_F(ArbitrageScannerTest, ExactlyFairBookIsNotAnOpportunity) {
    const Timestamp t = clock.now();
    scanner.upsert(quote("FX-3", "a", "OU_2.5", "over", 2.0, t));
    scanner.upsert(quote("FX-3", "b", "OU_2.5", "under", 2.0, t));
    EXPECT_TRUE(scanner.scan().empty());
}

TEST_F(ArbitrageScannerTest, MissingOutcomeMeansNoOpportunity) {
    const Timestamp t = clock.now();
    scanner.upsert(quote("FX-4", "a", "1X2", "home", 5.0, t));
    scanner.upsert(quote("FX-4", "b", "1X2", "away", 5.0, t));
    EXPECT_TRUE(scanner.scan().empty());
}

TEST_F(ArbitrageScannerTest, UnknownMarketNeedsTwoOutcomes) {
    const Timestamp t = clock.now();
    scanner.upsert(quote("FX-5", "a", "FIRST_SCORER", "kane", 3.5, t));
    EXPECT_TRUE(scanner.scan().empty());

    scanner.upsert(quote("FX-5", "b", "FIRST_SCORER", "salah", 3.5, t));
    const auto opps = scanner.scan();
    ASSERT_EQ(opps.size(), 1u);
    EXPECT_EQ(opps[0].stakes.size(), 2u);
}

TEST_F(ArbitrageScannerTest, StaleQuotesAreExcludedAndCounted) {
    seed_three_way();
    clock.advance(std::chrono::seconds(300));
    EXPECT_EQ(scanner.scan().size(), 1u);
    EXPECT_EQ(metrics.counters().quotes_stale.load(), 0u);

    clock.advance(std::chrono::seconds(1));
    EXPECT_TRUE(scanner.scan().empty());
    EXPECT_EQ(metrics.counters().quotes_stale.load(), 5u);

    EXPECT_EQ(scanner.prune(clock.now()), 5u);
    EXPECT_EQ(scanner.quote_count(), 0u);
}

TEST_F(ArbitrageScannerTest, NewerQuoteSupersedesOlder) {
    const Timestamp t = clock.now();
    EXPECT_TRUE(scanner.upsert(quote("FX-1", "northbet", "1X2", "home", 2.10, t)));
    EXPECT_FALSE(scanner.upsert(quote("FX-1", "northbet", "1X2", "home", 9.00, t)));
    EXPECT_FALSE(scanner.upsert(quote("FX-1", "northbet", "1X2", "home", 9.00,
                                      t - std::chrono::seconds(1))));
    EXPECT_TRUE(scanner.upsert(quote("FX-1", "northbet", "1X2", "home", 2.05,
                                     t + std::chrono::seconds(1))));
    EXPECT_EQ(scanner.quote_count(), 1u);

    clock.advance(std::chrono::seconds(1));
    const auto cmp = scanner.compare("FX-1", "1X2");
    ASSERT_TRUE(cmp.has_value());
    EXPECT_DOUBLE_EQ(cmp->best.at("home").odds, 2.05);
}

TEST_F(ArbitrageScannerTest, InvalidQuotesRejected) {
    const Timestamp t = clock.now();
    EXPECT_THROW(scanner.upsert(quote("FX-1", "a", "1X2", "home", 1.0, t)), PredictionError);
    EXPECT_THROW(scanner.upsert(quote("FX-1", "a", "1X2", "home", 0.5, t)), PredictionError);
    EXPECT_THROW(scanner.upsert(quote("FX-1", "a", "1X2", "home", std::nan(""), t)), PredictionError);
    EXPECT_THROW(scanner.upsert(quote("", "a", "1X2", "home", 2.0, t)), PredictionError);
    EXPECT_THROW(scanner.upsert(quote("FX-1", "", "1X2", "home", 2.0, t)), PredictionError);
    EXPECT_EQ(scanner.quote_count(), 0u);
}

TEST_F(ArbitrageScannerTest, OutcomeIsCaseInsensitive) {
    const Timestamp t = clock.now();
    scanner.upsert(quote("FX-6", "a", "BTTS", "YES", 2.20, t));
    scanner.upsert(quote("FX-6", "b", "BTTS", "No", 2.20, t));
    const auto opps = scanner.scan();
    ASSERT_EQ(opps.size(), 1u);
    EXPECT_EQ(opps[0].stakes[0].outcome, "no");
    EXPECT_EQ(opps[0].stakes[1].outcome, "yes");
}

TEST_F(ArbitrageScannerTest, EqualOddsPreferFirstBookmakerByName) {
    const Timestamp t = clock.now();
    scanner.upsert(quote("FX-7", "zeta", "DNB", "home", 2.10, t));
    scanner.upsert(quote("FX-7", "alpha", "DNB", "home", 2.10, t));
    scanner.upsert(quote("FX-7", "mid", "DNB", "away", 2.10, t));
    const auto opps = scanner.scan();
    ASSERT_EQ(opps.size(), 1u);
    EXPECT_EQ(opps[0].stakes[1].outcome, "home");
    EXPECT_EQ(opps[0].stakes[1].bookmaker, "alpha");
}

TEST_F(ArbitrageScannerTest, MinimumProfitFilter) {
    ArbitrageSettings settings;
    settings.min_profit_pct = 3.0;
    ArbitrageScanner strict(clock, metrics, settings);
    const Timestamp t = clock.now();
    strict.upsert(quote("FX-1", "a", "1X2", "home", 2.10, t));
    strict.upsert(quote("FX-1", "b", "1X2", "draw", 3.80, t));
    strict.upsert(quote("FX-1", "c", "1X2", "away", 4.20, t));
    EXPECT_TRUE(strict.scan().empty());
}

TEST_F(ArbitrageScannerTest, ResultsSortedByProfitAndFilteredByFixture) {
    seed_three_way("FX-1");
    const Timestamp t = clock.now();
    scanner.upsert(quote("FX-8", "a", "OU_2.5", "over", 2.30, t));
    scanner.upsert(quote("FX-8", "b", "OU_2.5", "under", 2.30, t));

    const auto all = scanner.scan();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].fixture_id, "FX-8");
    EXPECT_GT(all[0].profit_pct, all[1].profit_pct);

    const auto one = scanner.scan(FixtureId("FX-1"));
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0].fixture_id, "FX-1");
}

TEST_F(ArbitrageScannerTest, RefreshReportsOnlyNewOrChanged) {
    seed_three_way();
    EXPECT_EQ(scanner.refresh().size(), 1u);
    EXPECT_EQ(metrics.counters().arbitrage_found.load(), 1u);
    EXPECT_EQ(scanner.current().size(), 1u);

    // Nothing moved
    EXPECT_TRUE(scanner.refresh().empty());

    // A worse quote does not change the best prices
    scanner.upsert(quote("FX-1", "westbook", "1X2", "away", 3.90, clock.now()));
    EXPECT_TRUE(scanner.refresh().empty());

    // A better one does
    scanner.upsert(quote("FX-1", "westbook", "1X2", "away", 4.50,
                         clock.now() + std::chrono::seconds(1)));
    clock.advance(std::chrono::seconds(1));
    const auto changed = scanner.refresh();
    ASSERT_EQ(changed.size(), 1u);
    EXPECT_EQ(changed[0].stakes[0].bookmaker, "westbook");
    EXPECT_EQ(metrics.counters().arbitrage_found.load(), 2u);

    // Everything ages out
    clock.advance(std::chrono::minutes(10));
    EXPECT_TRUE(scanner.refresh().empty());
    EXPECT_TRUE(scanner.current().empty());
}

TEST_F(ArbitrageScannerTest, CompareOdds) {
    const Timestamp t = clock.now();
    scanner.upsert(quote("FX-9", "a", "1X2", "home", 2.00, t));
    scanner.upsert(quote("FX-9", "b", "1X2", "home", 2.20, t));
    scanner.upsert(quote("FX-9", "a", "1X2", "draw", 3.20, t));
    scanner.upsert(quote("FX-9", "b", "1X2", "draw", 3.40, t));
    scanner.upsert(quote("FX-9", "a", "1X2", "away", 3.60, t));
    scanner.upsert(quote("FX-9", "b", "1X2", "away", 4.00, t));

    const auto cmp = scanner.compare("FX-9", "1X2");
    ASSERT_TRUE(cmp.has_value());
    EXPECT_EQ(cmp->bookmaker_count, 2u);
    EXPECT_EQ(cmp->best.at("home").bookmaker, "b");
    EXPECT_EQ(cmp->worst.at("home").bookmaker, "a");
    EXPECT_NEAR(cmp->average.at("home"), 2.10, 1e-12);
    EXPECT_NEAR(cmp->average.at("draw"), 3.30, 1e-12);
    EXPECT_NEAR(cmp->average.at("away"), 3.80, 1e-12);
    EXPECT_NEAR(cmp->margin_pct, (1 / 2.10 + 1 / 3.30 + 1 / 3.80 - 1) * 100, 1e-6);

    EXPECT_FALSE(scanner.compare("FX-9", "BTTS").has_value());
    EXPECT_FALSE(scanner.compare("FX-404", "1X2").has_value());
}

TEST(DecimalTest, QuantizeHalfAwayFromZero) {
    EXPECT_EQ(to_fixed_string(Decimal("1.005")), "1.01");
    EXPECT_EQ(to_fixed_string(Decimal("1.004")), "1.00");
    EXPECT_EQ(to_fixed_string(Decimal("-1.005")), "-1.01");
    EXPECT_EQ(to_fixed_string(decimal_odds(2.1), ODDS_PLACES), "2.1000");
    EXPECT_EQ(decimal_odds(2.1), Decimal("2.1"));
    EXPECT_NEAR(to_double(Decimal("102.31")), 102.31, 1e-12);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
