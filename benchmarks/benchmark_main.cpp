/**
 * matchcast Serving Benchmark
 *
 * Request latency of the prediction path (cold model evaluation, warm cache
 * hits, canary fan-out) plus component timings.
 *
 * Run:
 *   ./matchcast_benchmark --samples 20000 --output results
 */

#include "arbitrage_scanner.hpp"
#include "calibration_tracker.hpp"
#include "common_types.hpp"
#include "latency_stats.hpp"
#include "market_catalog.hpp"
#include "model_registry.hpp"
#include "prediction_service.hpp"
#include "scoreline_model.hpp"
#include "service_config.hpp"
#include "signal_source.hpp"
#include "traffic_splitter.hpp"

#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace matchcast;

// ============================================================================
// Discarding shadow sink (benchmarks measure serving, not disk)
// ============================================================================

class NullShadowSink : public ShadowLogSink {
public:
    bool write(const ShadowLogEntry&) override { return true; }
};

// ============================================================================
// Synthetic fixtures
// ============================================================================

FixtureSignals random_signals(std::mt19937_64& rng, Timestamp kickoff) {
    std::uniform_real_distribution<double> xg(0.6, 2.4);
    std::uniform_real_distribution<double> elo(1350.0, 1850.0);
    std::uniform_real_distribution<double> bias(-0.15, 0.15);
    std::uniform_real_distribution<double> weather(0.85, 1.05);

    FixtureSignals s;
    s.home_xg_for = xg(rng);
    s.home_xg_against = xg(rng);
    s.away_xg_for = xg(rng);
    s.away_xg_against = xg(rng);
    s.home_elo = elo(rng);
    s.away_elo = elo(rng);
    s.referee_bias = bias(rng);
    s.weather_goal_factor = weather(rng);
    s.kickoff = kickoff;
    return s;
}

template<typename Fn>
LatencyStats time_batch(size_t iterations, Fn&& fn) {
    std::vector<double> samples;
    samples.reserve(iterations);
    for (size_t i = 0; i < iterations; ++i) {
        const auto start = std::chrono::steady_clock::now();
        fn(i);
        samples.push_back(std::chrono::duration<double, std::micro>(
            std::chrono::steady_clock::now() - start).count());
    }
    return LatencyStats::calculate(samples);
}

// ============================================================================
// Component-Level Benchmarks
// ============================================================================

void run_component_benchmarks(size_t iterations) {
    std::cout << "\n=== COMPONENT BENCHMARKS ===\n\n";

    std::mt19937_64 rng(7);
    const FixtureSignals signals = random_signals(rng, matchcast::now() + std::chrono::hours(24));
    const ModelParameters params;

    time_batch(iterations, [&](size_t) {
        const ExpectedGoals xg = ScorelineModel::expected_goals(signals, params);
        volatile double cell = ScorelineModel::build_grid(xg.home, xg.away, params).at(1, 1);
        (void)cell;
    }).print("Scoreline grid (11x11)");

    const ExpectedGoals xg = ScorelineModel::expected_goals(signals, params);
    const ScoreGrid grid = ScorelineModel::build_grid(xg.home, xg.away, params);
    time_batch(iterations, [&](size_t) {
        volatile size_t n = MarketCatalog::standard().evaluate(grid).size();
        (void)n;
    }).print("Market catalog (" + std::to_string(MarketCatalog::standard().size()) + " markets)");

    SystemTimeSource clock;
    TrafficSplitter splitter(clock);
    time_batch(iterations, [&](size_t i) {
        volatile int slot = splitter.slot("device-" + std::to_string(i));
        (void)slot;
    }).print("SHA-256 bucket slot");
}

// ============================================================================
// Full request path
// ============================================================================

void run_service_benchmark(size_t num_samples, const std::string& output_prefix) {
    std::cout << "\n=== REQUEST PATH BENCHMARK ===\n\n";

    SystemTimeSource clock;
    ServiceConfig config;
    config.cache_ttl_seconds = 3600;

    ModelRegistry registry;
    ModelVersion prod;
    prod.name = config.model_name;
    prod.version = "1.0.0";
    const ModelVersionId prod_id = registry.register_version(prod);
    registry.promote(prod_id);

    ModelVersion canary = prod;
    canary.version = "1.1.0";
    canary.params.rho = -0.05;
    const ModelVersionId canary_id = registry.register_version(canary);

    InMemorySignalSource signals(clock);
    std::mt19937_64 rng(42);
    const size_t fixtures = 500;
    for (size_t i = 0; i < fixtures; ++i) {
        signals.upsert("F" + std::to_string(i), random_signals(rng, clock.now() + std::chrono::hours(48)));
    }

    ServingMetrics metrics;
    ArbitrageScanner scanner(clock, metrics, config.arbitrage());
    CalibrationTracker tracker(config.gates());
    NullShadowSink sink;
    PredictionService service(config, registry, signals, scanner, tracker, sink, metrics, clock);

    auto fixture = [&](size_t i) { return "F" + std::to_string(i % fixtures); };
    auto device = [](size_t i) { return "device-" + std::to_string(i); };

    // Cold: each fixture evaluated once (cache misses)
    LatencyStats cold = time_batch(fixtures, [&](size_t i) {
        service.get_market_probabilities(fixture(i), device(i));
    });
    cold.print("Cold request (model evaluation)");

    LatencyStats warm = time_batch(num_samples, [&](size_t i) {
        service.get_market_probabilities(fixture(i), device(i));
    });
    warm.print("Warm request (cache hit)");

    registry.set_canary(canary_id, 20.0);
    LatencyStats shadow = time_batch(num_samples, [&](size_t i) {
        service.get_market_probabilities(fixture(i), device(i + num_samples));
    });
    shadow.print("Request with canary shadow");

    service.shadow_logger().flush();
    service.shutdown();

    const MetricSnapshot snap = metrics.snapshot();
    std::cout << "requests=" << snap.requests
              << " cache_hits=" << snap.cache_hits
              << " cache_misses=" << snap.cache_misses
              << " canary_served=" << snap.canary_served
              << " shadow_written=" << snap.shadow_written
              << " shadow_dropped=" << snap.shadow_dropped << "\n";

    bool ok = cold.export_csv(output_prefix + "_cold.csv");
    ok = warm.export_csv(output_prefix + "_warm.csv") && ok;
    ok = shadow.export_csv(output_prefix + "_shadow.csv") && ok;
    if (ok) {
        std::cout << "\nResults exported to " << output_prefix << "_{cold,warm,shadow}.csv\n";
    } else {
        std::cerr << "\nFailed to export results with prefix " << output_prefix << "\n";
    }
}

// ============================================================================
// Main Entry Point
// ============================================================================

void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --samples N       Number of samples (default: 20000)\n";
    std::cout << "  --output PREFIX   Output file prefix (default: benchmark)\n";
    std::cout << "  --components      Run component benchmarks only\n";
    std::cout << "  --full            Run request path benchmark only\n";
    std::cout << "  --help            Show this help\n\n";
}

int main(int argc, char* argv[]) {
    size_t num_samples = 20000;
    std::string output_prefix = "benchmark";
    bool run_components = true;
    bool run_full = true;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--samples" && i + 1 < argc) {
            num_samples = std::stoull(argv[++i]);
        } else if (arg == "--output" && i + 1 < argc) {
            output_prefix = argv[++i];
        } else if (arg == "--components") {
            run_full = false;
        } else if (arg == "--full") {
            run_components = false;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (num_samples == 0) {
        std::cerr << "--samples must be positive\n";
        return 1;
    }

    try {
        if (run_components) {
            run_component_benchmarks(num_samples);
        }
        if (run_full) {
            run_service_benchmark(num_samples, output_prefix);
        }
    } catch (const std::exception& e) {
        std::cerr << "benchmark failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
