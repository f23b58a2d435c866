#include <gtest/gtest.h>
#include "shadow_evaluator.hpp"
#include <atomic>
#include <cmath>
#include <memory>
#include <mutex>
#include <vector>

using namespace matchcast;

// ============================================================================
// Test sinks
// ============================================================================

class RecordingSink : public ShadowLogSink {
public:
    bool write(const ShadowLogEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
        return true;
    }

    std::vector<ShadowLogEntry> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<ShadowLogEntry> entries_;
};

// Fails the first `failures` attempts, then succeeds
class FlakySink : public ShadowLogSink {
public:
    explicit FlakySink(int failures) : remaining_(failures) {}

    bool write(const ShadowLogEntry&) override {
        ++attempts;
        if (remaining_ > 0) {
            --remaining_;
            return false;
        }
        return true;
    }

    std::atomic<int> attempts{0};

private:
    std::atomic<int> remaining_;
};

class ThrowingSink : public ShadowLogSink {
public:
    bool write(const ShadowLogEntry&) override {
        throw std::runtime_error("disk full");
    }
};

// ============================================================================
// Divergence
// ============================================================================

TEST(DivergenceTest, IdenticalSurfacesHaveZeroDivergence) {
    const std::map<std::string, double> p{{"1", 0.5}, {"X", 0.3}, {"2", 0.2}};
    const Divergence d = divergence(p, p);
    EXPECT_DOUBLE_EQ(d.l1, 0.0);
    ASSERT_TRUE(d.kl.has_value());
    EXPECT_NEAR(*d.kl, 0.0, 1e-15);
}

TEST(DivergenceTest, L1AndKlOverSharedCodes) {
    const std::map<std::string, double> p{{"1", 0.5}, {"X", 0.3}, {"2", 0.2}};
    const std::map<std::string, double> q{{"1", 0.4}, {"X", 0.3}, {"2", 0.3}};
    const Divergence d = divergence(p, q);

    EXPECT_NEAR(d.l1, 0.2, 1e-12);
    const double expected_kl = 0.5 * std::log(0.5 / 0.4) + 0.2 * std::log(0.2 / 0.3);
    ASSERT_TRUE(d.kl.has_value());
    EXPECT_NEAR(*d.kl, expected_kl, 1e-12);
}

TEST(DivergenceTest, MissingCodeCountsAsZero) {
    const std::map<std::string, double> p{{"1", 0.6}, {"X", 0.4}};
    const std::map<std::string, double> q{{"1", 0.6}, {"X", 0.3}, {"2", 0.1}};
    const Divergence d = divergence(p, q);
    EXPECT_NEAR(d.l1, 0.2, 1e-12);
    // p = 0 where q > 0 contributes nothing
    EXPECT_TRUE(d.kl.has_value());
}

TEST(DivergenceTest, KlUndefinedWhenCanaryRulesOutOutcome) {
    const std::map<std::string, double> p{{"1", 0.6}, {"X", 0.4}};
    const std::map<std::string, double> q{{"1", 1.0}, {"X", 0.0}};
    const Divergence d = divergence(p, q);
    EXPECT_NEAR(d.l1, 0.8, 1e-12);
    EXPECT_FALSE(d.kl.has_value());
}

// ============================================================================
// Bounded queue
// ============================================================================

TEST(BoundedQueueTest, DropsOldestWhenFull) {
    BoundedQueue<int> q(3);
    EXPECT_TRUE(q.push(1));
    EXPECT_TRUE(q.push(2));
    EXPECT_TRUE(q.push(3));
    EXPECT_FALSE(q.push(4));
    EXPECT_EQ(q.dropped(), 1u);
    EXPECT_EQ(q.size(), 3u);

    EXPECT_EQ(*q.pop(std::chrono::milliseconds(1)), 2);
    EXPECT_EQ(*q.pop(std::chrono::milliseconds(1)), 3);
    EXPECT_EQ(*q.pop(std::chrono::milliseconds(1)), 4);
    EXPECT_FALSE(q.pop(std::chrono::milliseconds(1)).has_value());
}

TEST(BoundedQueueTest, CloseWakesConsumer) {
    BoundedQueue<int> q(4);
    std::thread consumer([&]() {
        EXPECT_FALSE(q.pop(std::chrono::seconds(10)).has_value());
    });
    q.close();
    consumer.join();
    EXPECT_TRUE(q.closed());
}

// ============================================================================
// Shadow logger
// ============================================================================

static ShadowComparison comparison_for(const std::string& fixture) {
    auto production = std::make_shared<MarketProbability>();
    production->fixture_id = fixture;
    production->model_version = 1;
    production->probabilities = {{"1", 0.5}, {"2", 0.5}};

    auto canary = std::make_shared<MarketProbability>(*production);
    canary->model_version = 2;
    canary->probabilities = {{"1", 0.6}, {"2", 0.4}};

    ShadowComparison c;
    c.production = production;
    c.canary = canary;
    return c;
}

TEST(ShadowLoggerTest, WritesEverySubmittedEntry) {
    RecordingSink sink;
    ServingMetrics metrics;
    ShadowLogger logger(sink, metrics, 64);
    logger.start();

    for (int i = 0; i < 20; ++i) {
        logger.submit(comparison_for("FX-" + std::to_string(i)));
    }
    logger.flush();

    EXPECT_EQ(sink.entries().size(), 20u);
    EXPECT_EQ(metrics.counters().shadow_enqueued.load(), 20u);
    EXPECT_EQ(metrics.counters().shadow_written.load(), 20u);
    EXPECT_EQ(metrics.counters().shadow_dropped.load(), 0u);
    logger.stop();
}

TEST(ShadowLoggerTest, DivergenceIsComputedByWriter) {
    RecordingSink sink;
    ServingMetrics metrics;
    ShadowLogger logger(sink, metrics, 8);

    ShadowComparison c = comparison_for("FX-1");
    c.served_bucket = Bucket::B;
    c.created_at = from_nanos(42);
    logger.submit(c);

    // Not started yet: the request side only queued the two surfaces
    EXPECT_TRUE(sink.entries().empty());
    EXPECT_EQ(c.production.use_count(), 2);

    logger.start();
    logger.flush();
    const auto entries = sink.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].fixture_id, "FX-1");
    EXPECT_EQ(entries[0].production_version, 1u);
    EXPECT_EQ(entries[0].canary_version, 2u);
    EXPECT_NEAR(entries[0].l1, 0.2, 1e-12);
    ASSERT_TRUE(entries[0].kl.has_value());
    EXPECT_NEAR(*entries[0].kl, 0.5 * std::log(0.5 / 0.6) + 0.5 * std::log(0.5 / 0.4), 1e-12);
    EXPECT_EQ(entries[0].served_bucket, Bucket::B);
    EXPECT_EQ(entries[0].created_at, from_nanos(42));

    // The queue no longer holds the surfaces once written
    EXPECT_EQ(c.production.use_count(), 1);
    logger.stop();
}

TEST(ShadowLoggerTest, RetriesTransientFailure) {
    FlakySink sink(2);
    ServingMetrics metrics;
    ShadowLogger logger(sink, metrics, 8, 3, std::chrono::milliseconds(1));
    logger.start();

    logger.submit(comparison_for("FX-1"));
    logger.flush();

    EXPECT_EQ(sink.attempts.load(), 3);
    EXPECT_EQ(metrics.counters().shadow_written.load(), 1u);
    EXPECT_EQ(metrics.counters().shadow_log_failures.load(), 2u);
    EXPECT_EQ(metrics.counters().shadow_abandoned.load(), 0u);
}

TEST(ShadowLoggerTest, AbandonsAfterMaxAttempts) {
    ThrowingSink sink;
    ServingMetrics metrics;
    ShadowLogger logger(sink, metrics, 8, 2, std::chrono::milliseconds(1));
    logger.start();

    logger.submit(comparison_for("FX-1"));
    logger.flush();

    EXPECT_EQ(metrics.counters().shadow_log_failures.load(), 2u);
    EXPECT_EQ(metrics.counters().shadow_abandoned.load(), 1u);
    EXPECT_EQ(metrics.counters().shadow_written.load(), 0u);
}

TEST(ShadowLoggerTest, OverflowIsCountedNotBlocking) {
    RecordingSink sink;
    ServingMetrics metrics;
    // Not started: nothing drains, so the ring overflows
    ShadowLogger logger(sink, metrics, 4);
    for (int i = 0; i < 10; ++i) {
        logger.submit(comparison_for("FX-" + std::to_string(i)));
    }
    EXPECT_EQ(logger.pending(), 4u);
    EXPECT_EQ(metrics.counters().shadow_dropped.load(), 6u);

    logger.start();
    logger.flush();
    const auto written = sink.entries();
    ASSERT_EQ(written.size(), 4u);
    EXPECT_EQ(written.front().fixture_id, "FX-6");
    EXPECT_EQ(written.back().fixture_id, "FX-9");
}

TEST(ShadowLoggerTest, StopDrainsQueue) {
    RecordingSink sink;
    ServingMetrics metrics;
    {
        ShadowLogger logger(sink, metrics, 16);
        logger.start();
        for (int i = 0; i < 5; ++i) {
            logger.submit(comparison_for("FX-" + std::to_string(i)));
        }
    }
    EXPECT_EQ(sink.entries().size(), 5u);
}

// ============================================================================
// Shadow evaluator
// ============================================================================

class ShadowEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        view.active.id = 1;
        view.active.version = "1.0.0";
        ModelVersion canary;
        canary.id = 2;
        canary.version = "1.1.0";
        view.canary = canary;
        view.config.canary_version = 2;
        view.config.canary_percentage = 50.0;
        logger.start();
    }

    static MarketProbability surface(ModelVersionId version, double home) {
        MarketProbability m;
        m.fixture_id = "FX-1";
        m.model_version = version;
        m.probabilities = {{"1", home}, {"X", 0.25}, {"2", 0.75 - home}};
        return m;
    }

    ShadowEvaluator::SurfaceProvider provider() {
        return [this](const ModelVersion& v) {
            ++calls;
            if (v.id == 2 && canary_broken) {
                throw PredictionError(ErrorCode::InsufficientInput, "canary has no signals");
            }
            return surface(v.id, v.id == 1 ? 0.45 : 0.40);
        };
    }

    RecordingSink sink;
    ServingMetrics metrics;
    ManualTimeSource clock{from_nanos(1'790'000'000'000'000'000LL)};
    ShadowLogger logger{sink, metrics, 64};
    ShadowEvaluator evaluator{logger, metrics, clock};
    ServingView view;
    int calls = 0;
    bool canary_broken = false;
};

TEST_F(ShadowEvaluatorTest, NoCanaryServesProductionWithoutLogging) {
    view.canary.reset();
    const auto result = evaluator.evaluate(view, Bucket::B, provider());
    EXPECT_EQ(result.served_bucket, Bucket::A);
    EXPECT_EQ(result.served->model_version, 1u);
    EXPECT_EQ(result.canary, nullptr);
    EXPECT_EQ(calls, 1);
    logger.flush();
    EXPECT_TRUE(sink.entries().empty());
}

TEST_F(ShadowEvaluatorTest, BucketAServesProductionAndLogsShadow) {
    const auto result = evaluator.evaluate(view, Bucket::A, provider());
    EXPECT_EQ(result.served->model_version, 1u);
    EXPECT_EQ(result.served_bucket, Bucket::A);
    ASSERT_NE(result.canary, nullptr);
    EXPECT_EQ(calls, 2);

    logger.flush();
    const auto entries = sink.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].production_version, 1u);
    EXPECT_EQ(entries[0].canary_version, 2u);
    EXPECT_NEAR(entries[0].l1, 0.10, 1e-12);
    EXPECT_TRUE(entries[0].kl.has_value());
    EXPECT_EQ(entries[0].served_bucket, Bucket::A);
    EXPECT_EQ(entries[0].created_at, clock.now());
}

TEST_F(ShadowEvaluatorTest, BucketBServesCanary) {
    const auto result = evaluator.evaluate(view, Bucket::B, provider());
    EXPECT_EQ(result.served->model_version, 2u);
    EXPECT_EQ(result.served_bucket, Bucket::B);
    EXPECT_EQ(metrics.counters().canary_served.load(), 1u);

    logger.flush();
    ASSERT_EQ(sink.entries().size(), 1u);
    EXPECT_EQ(sink.entries()[0].served_bucket, Bucket::B);
}

TEST_F(ShadowEvaluatorTest, BrokenCanaryFallsBackToProduction) {
    canary_broken = true;
    const auto result = evaluator.evaluate(view, Bucket::B, provider());
    EXPECT_EQ(result.served->model_version, 1u);
    EXPECT_EQ(result.served_bucket, Bucket::A);
    EXPECT_EQ(result.canary, nullptr);
    EXPECT_EQ(metrics.counters().canary_failures.load(), 1u);
    EXPECT_EQ(metrics.counters().canary_served.load(), 0u);

    logger.flush();
    EXPECT_TRUE(sink.entries().empty());
}

TEST_F(ShadowEvaluatorTest, ProductionFailurePropagates) {
    auto failing = [](const ModelVersion&) -> MarketProbability {
        throw PredictionError(ErrorCode::InsufficientInput, "no signals");
    };
    EXPECT_THROW(evaluator.evaluate(view, Bucket::A, failing), PredictionError);
}

TEST_F(ShadowEvaluatorTest, UndefinedKlIsCounted) {
    auto provider_with_zero = [](const ModelVersion& v) {
        MarketProbability m;
        m.fixture_id = "FX-1";
        m.model_version = v.id;
        if (v.id == 1) {
            m.probabilities = {{"1", 0.5}, {"2", 0.5}};
        } else {
            m.probabilities = {{"1", 1.0}, {"2", 0.0}};
        }
        return m;
    };
    evaluator.evaluate(view, Bucket::A, provider_with_zero);
    logger.flush();

    ASSERT_EQ(sink.entries().size(), 1u);
    EXPECT_FALSE(sink.entries()[0].kl.has_value());
    EXPECT_EQ(metrics.counters().shadow_kl_undefined.load(), 1u);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
