#include <gtest/gtest.h>
#include "scoreline_model.hpp"
#include "market_catalog.hpp"
#include "elo.hpp"
#include <cmath>
#include <set>

using namespace matchcast;

// Test fixture for the scoreline model and market catalog
class ScorelineModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        signals.home_xg_for = 1.80;
        signals.home_xg_against = 1.05;
        signals.away_xg_for = 1.25;
        signals.away_xg_against = 1.40;
        signals.home_elo = 1680.0;
        signals.away_elo = 1590.0;
        signals.referee_bias = 0.03;
        signals.weather_goal_factor = 0.97;
        t0 = from_nanos(1'790'000'000'000'000'000LL);
    }

    MarketProbability predict(const ModelParameters& p = ModelParameters()) const {
        return model.predict("FX-1", signals, 7, p, t0, std::chrono::seconds(60));
    }

    ScorelineModel model;
    FixtureSignals signals;
    Timestamp t0;
};

TEST_F(ScorelineModelTest, NeutralSignalsGiveLeagueAverageRates) {
    FixtureSignals neutral;
    neutral.home_xg_for = 1.40;
    neutral.home_xg_against = 1.40;
    neutral.away_xg_for = 1.40;
    neutral.away_xg_against = 1.40;

    const ExpectedGoals xg = ScorelineModel::expected_goals(neutral, ModelParameters());
    EXPECT_NEAR(xg.home, 1.40 * 1.10, 1e-12);
    EXPECT_NEAR(xg.away, 1.40, 1e-12);
}

TEST_F(ScorelineModelTest, StrongerHomeEloRaisesHomeRate) {
    const ExpectedGoals base = ScorelineModel::expected_goals(signals, ModelParameters());
    FixtureSignals tilted = signals;
    tilted.home_elo += 200.0;
    const ExpectedGoals more = ScorelineModel::expected_goals(tilted, ModelParameters());
    EXPECT_GT(more.home, base.home);
    EXPECT_LT(more.away, base.away);
}

TEST_F(ScorelineModelTest, ExpectedGoalsAreClamped) {
    FixtureSignals extreme = signals;
    extreme.home_xg_for = 40.0;
    extreme.away_xg_against = 40.0;
    const ExpectedGoals xg = ScorelineModel::expected_goals(extreme, ModelParameters());
    EXPECT_DOUBLE_EQ(xg.home, ScorelineModel::MAX_EXPECTED_GOALS);
}

TEST_F(ScorelineModelTest, GridSumsToOneAfterTruncation) {
    const ModelParameters params;
    const ScoreGrid grid = ScorelineModel::build_grid(2.9, 2.6, params);
    EXPECT_NEAR(grid.total(), 1.0, 1e-9);
    EXPECT_GT(grid.truncation_mass, 0.0);
    EXPECT_LT(grid.truncation_mass, 0.01);

    for (double cell : grid.cells) {
        EXPECT_GE(cell, 0.0);
        EXPECT_LE(cell, 1.0);
    }
}

TEST_F(ScorelineModelTest, LowScoreCorrectionNeverGoesNegative) {
    ModelParameters params;
    params.rho = -0.9;     // tau(0,1) = 1 + lambda * rho < 0 for large lambda
    const ScoreGrid grid = ScorelineModel::build_grid(3.0, 3.0, params);
    EXPECT_GE(grid.at(0, 1), 0.0);
    EXPECT_GE(grid.at(1, 0), 0.0);
    EXPECT_NEAR(grid.total(), 1.0, 1e-9);
}

TEST_F(ScorelineModelTest, EveryProbabilityInUnitInterval) {
    const MarketProbability m = predict();
    EXPECT_EQ(m.probabilities.size(), MarketCatalog::standard().size());
    for (const auto& [code, p] : m.probabilities) {
        EXPECT_GE(p, 0.0) << code;
        EXPECT_LE(p, 1.0) << code;
    }
}

TEST_F(ScorelineModelTest, ExclusiveGroupsSumToOne) {
    const MarketProbability m = predict();
    const auto groups = MarketCatalog::standard().exclusive_groups();
    ASSERT_FALSE(groups.empty());

    for (const auto& [group, codes] : groups) {
        double sum = 0.0;
        for (const auto& code : codes) {
            sum += m.get(code);
        }
        EXPECT_NEAR(sum, 1.0, 1e-6) << group;
    }
    EXPECT_EQ(groups.count("DNB"), 1u);
    EXPECT_EQ(groups.count("1X2"), 1u);
}

TEST_F(ScorelineModelTest, DrawNoBetIsConditionalOnNoDraw) {
    const MarketProbability m = predict();
    const double decisive = m.get("1") + m.get("2");
    EXPECT_NEAR(m.get("DNB_HOME"), m.get("1") / decisive, 1e-9);
    EXPECT_NEAR(m.get("DNB_AWAY"), m.get("2") / decisive, 1e-9);
}

TEST_F(ScorelineModelTest, ConditionalMarketWithoutMassIsEven) {
    MarketCatalog catalog;
    catalog.add_conditional("DNB_HOME", "DNB", true,
                            [](int h, int a) { return h > a; },
                            [](int h, int a) { return h != a; });
    ScoreGrid grid(2);
    grid.at(0, 0) = 0.6;
    grid.at(1, 1) = 0.4;
    EXPECT_DOUBLE_EQ(catalog.evaluate(grid).at("DNB_HOME"), 0.5);
}

TEST_F(ScorelineModelTest, MultiGoalRangesAndCombos) {
    const MarketProbability m = predict();
    EXPECT_NEAR(m.get("MG_0_1"), m.get("TG_0") + m.get("TG_1"), 1e-9);
    EXPECT_NEAR(m.get("MG_2_4"), m.get("TG_2") + m.get("TG_3") + m.get("TG_4"), 1e-9);
    EXPECT_NEAR(m.get("MG_7+"), m.get("TG_7+"), 1e-9);
    EXPECT_NEAR(m.get("BTTS&O1.5"), m.get("BTTS_YES"), 1e-9);

    // A joint event never exceeds either of its legs
    EXPECT_LE(m.get("DC_1X&O1.5"), m.get("DC_1X") + 1e-12);
    EXPECT_LE(m.get("DC_1X&O1.5"), m.get("O1.5") + 1e-12);
    EXPECT_LE(m.get("DC_X2&BTTS_YES&O2.5"), m.get("DC_X2&BTTS_YES") + 1e-12);
    EXPECT_NEAR(m.get("DC_1X&BTTS_YES&O2.5") + m.get("DC_X2&BTTS_YES&O2.5"),
                m.get("BTTS&O2.5") + (m.get("X&BTTS_YES") - m.get("SCORE_1_1")), 1e-9);
    EXPECT_NEAR(m.get("DC_1X&BTTS_YES&O1.5"), m.get("DC_1X&BTTS_YES"), 1e-9);
}

TEST_F(ScorelineModelTest, DerivedMarketsAreConsistent) {
    const MarketProbability m = predict();
    EXPECT_NEAR(m.get("DC_1X"), m.get("1") + m.get("X"), 1e-9);
    EXPECT_NEAR(m.get("DC_12"), m.get("1") + m.get("2"), 1e-9);
    EXPECT_NEAR(m.get("WTN_HOME") + m.get("SCORE_0_0"), m.get("CS_HOME_YES"), 1e-9);
    EXPECT_NEAR(m.get("AH_H-0.5"), m.get("1"), 1e-9);
    EXPECT_NEAR(m.get("AH_A+0.5"), m.get("DC_X2"), 1e-9);
    EXPECT_NEAR(m.get("WM_X"), m.get("X"), 1e-9);
    EXPECT_NEAR(m.get("BTTS&O2.5") + m.get("BTTS&U2.5"), m.get("BTTS_YES"), 1e-9);
    EXPECT_NEAR(m.get("TG_0"), m.get("SCORE_0_0"), 1e-9);
    EXPECT_NEAR(m.get("U0.5"), m.get("TG_0"), 1e-9);
}

TEST_F(ScorelineModelTest, CatalogCodesAreUnique) {
    std::set<std::string> codes;
    for (const auto& def : MarketCatalog::standard().definitions()) {
        EXPECT_TRUE(codes.insert(def.code).second) << def.code;
    }
    EXPECT_GE(codes.size(), 100u);
}

TEST_F(ScorelineModelTest, ConfidenceIsLargest1X2Probability) {
    const MarketProbability m = predict();
    EXPECT_DOUBLE_EQ(m.confidence, std::max({m.get("1"), m.get("X"), m.get("2")}));
    EXPECT_EQ(m.expires_at - m.computed_at, std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(60)));
}

TEST_F(ScorelineModelTest, PredictionIsDeterministic) {
    const MarketProbability a = predict();
    const MarketProbability b = predict();
    EXPECT_TRUE(a.same_surface(b));
    EXPECT_EQ(a.probabilities, b.probabilities);
}

TEST_F(ScorelineModelTest, ParametersChangeTheSurface) {
    ModelParameters other;
    other.rho = -0.02;
    other.home_advantage = 1.25;
    const MarketProbability a = predict();
    const MarketProbability b = predict(other);
    EXPECT_NE(a.get("1"), b.get("1"));
}

TEST_F(ScorelineModelTest, MissingSignalsIsInsufficientInput) {
    try {
        model.predict("FX-404", std::nullopt, 7, ModelParameters(), t0, std::chrono::seconds(60));
        FAIL() << "expected InsufficientInput";
    } catch (const PredictionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InsufficientInput);
    }
}

TEST_F(ScorelineModelTest, InvalidSignalsAreRejected) {
    FixtureSignals bad = signals;
    bad.away_xg_for = 0.0;
    try {
        model.predict("FX-1", bad, 7, ModelParameters(), t0, std::chrono::seconds(60));
        FAIL() << "expected InvalidSignal";
    } catch (const PredictionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidSignal);
    }

    bad = signals;
    bad.weather_goal_factor = -1.0;
    EXPECT_THROW(model.predict("FX-1", bad, 7, ModelParameters(), t0, std::chrono::seconds(60)),
                 PredictionError);

    bad = signals;
    bad.home_elo = std::nan("");
    EXPECT_THROW(model.predict("FX-1", bad, 7, ModelParameters(), t0, std::chrono::seconds(60)),
                 PredictionError);
}

TEST_F(ScorelineModelTest, InvalidParametersAreRejected) {
    ModelParameters p;
    p.max_goals = 0;
    EXPECT_THROW(predict(p), PredictionError);

    p = ModelParameters();
    p.league_avg_goals = 0.0;
    EXPECT_THROW(predict(p), PredictionError);
}

// Elo helpers

TEST(EloRatingTest, ExpectedScoreWithHomeAdvantage) {
    EXPECT_DOUBLE_EQ(EloRating::expected_score(1500.0, 1500.0), 0.5);
    EXPECT_NEAR(EloRating::expected_score(1500.0, 1500.0, true), 0.6400650, 1e-6);
}

TEST(EloRatingTest, UpdateAfterHomeWin) {
    const auto u = EloRating::update_after_match(1500.0, 1500.0, 1, 0);
    EXPECT_NEAR(u.home_after, 1507.1987, 1e-3);
    EXPECT_NEAR(u.away_after, 1492.8013, 1e-3);
    EXPECT_NEAR(u.home_after + u.away_after, 3000.0, 1e-9);
}

TEST(EloRatingTest, GoalDifferenceMultiplier) {
    EXPECT_DOUBLE_EQ(EloRating::goal_difference_multiplier(0), 1.0);
    EXPECT_DOUBLE_EQ(EloRating::goal_difference_multiplier(-2), 1.5);
    EXPECT_DOUBLE_EQ(EloRating::goal_difference_multiplier(3), 1.75);
    EXPECT_DOUBLE_EQ(EloRating::goal_difference_multiplier(6), 2.0);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
