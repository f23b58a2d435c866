/**
 * matchcast_server
 *
 * Serves market probabilities over a WebSocket query surface, runs the
 * calibration / arbitrage / cache sweep jobs and writes the serving logs.
 *
 * Run:
 *   ./matchcast_server --config config/matchcast.json --run-id 20261018
 */

#include "arbitrage_scanner.hpp"
#include "calibration_tracker.hpp"
#include "common_types.hpp"
#include "job_scheduler.hpp"
#include "model_registry.hpp"
#include "prediction_service.hpp"
#include "query_server.hpp"
#include "service_config.hpp"
#include "serving_log.hpp"
#include "serving_metrics.hpp"
#include "signal_source.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <chrono>
#include <ctime>
#include <iostream>
#include <string>

using namespace matchcast;

// ============================================================================
// Demo data (only when the registry has no active model)
// ============================================================================

void seed_registry(ModelRegistry& registry, const std::string& name) {
    ModelVersion base;
    base.name = name;
    base.version = "1.0.0";
    base.training_date = "2026-09-01";
    base.accuracy = 0.52;
    base.log_loss = 0.98;
    base.brier = 0.59;
    base.notes = "baseline Dixon-Coles";
    const ModelVersionId base_id = registry.register_version(base);
    registry.promote(base_id);

    ModelVersion candidate = base;
    candidate.version = "1.1.0";
    candidate.training_date = "2026-10-01";
    candidate.accuracy = 0.53;
    candidate.notes = "stronger low-score correction";
    candidate.params.rho = -0.13;
    candidate.params.elo_weight = 0.70;
    const ModelVersionId candidate_id = registry.register_version(candidate);
    registry.set_canary(candidate_id, 10.0);

    std::cout << "Seeded " << name << " 1.0.0 (active) and 1.1.0 (canary 10%)" << std::endl;
}

void seed_fixtures(InMemorySignalSource& signals, const TimeSource& clock) {
    struct Demo {
        const char* id;
        double hxf, hxa, axf, axa, helo, aelo, bias, weather;
    };
    const Demo demos[] = {
        {"FX-1001", 1.85, 0.95, 1.10, 1.45, 1720.0, 1560.0, 0.05, 1.00},
        {"FX-1002", 1.30, 1.25, 1.35, 1.20, 1610.0, 1630.0, 0.00, 0.92},
        {"FX-1003", 0.95, 1.60, 2.05, 0.85, 1480.0, 1790.0, -0.04, 1.00},
    };

    const Timestamp kickoff = clock.now() + std::chrono::hours(36);
    for (const auto& d : demos) {
        FixtureSignals s;
        s.home_xg_for = d.hxf;
        s.home_xg_against = d.hxa;
        s.away_xg_for = d.axf;
        s.away_xg_against = d.axa;
        s.home_elo = d.helo;
        s.away_elo = d.aelo;
        s.referee_bias = d.bias;
        s.weather_goal_factor = d.weather;
        s.kickoff = kickoff;
        if (!signals.upsert(d.id, s)) {
            std::cerr << "seed: fixture " << d.id << " already kicked off\n";
        }
    }
}

void seed_quotes(ArbitrageScanner& scanner, const TimeSource& clock) {
    const Timestamp t = clock.now();
    auto quote = [&](const char* fixture, const char* book, const char* market,
                     const char* outcome, double odds) {
        BookmakerOddsQuote q;
        q.fixture_id = fixture;
        q.bookmaker = book;
        q.market = market;
        q.outcome = outcome;
        q.odds = odds;
        q.timestamp = t;
        scanner.upsert(q);
    };

    quote("FX-1001", "northbet", "1X2", "home", 2.10);
    quote("FX-1001", "eastline", "1X2", "draw", 3.80);
    quote("FX-1001", "southpool", "1X2", "away", 4.20);
    quote("FX-1001", "eastline", "1X2", "home", 1.95);
    quote("FX-1002", "northbet", "OU_2.5", "over", 1.92);
    quote("FX-1002", "southpool", "OU_2.5", "under", 1.98);
}

// ============================================================================
// Main Entry Point
// ============================================================================

void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config PATH     JSON configuration file\n";
    std::cout << "  --run-id ID       Suffix of the log files (default: UTC date)\n";
    std::cout << "  --no-seed         Do not seed demo models, fixtures and quotes\n";
    std::cout << "  --help            Show this help\n\n";
}

std::string default_run_id() {
    const std::time_t tt = Clock::to_time_t(Clock::now());
    std::tm tm_utc{};
    gmtime_r(&tt, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%S", &tm_utc);
    return buf;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string run_id = default_run_id();
    bool seed = true;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--run-id" && i + 1 < argc) {
            run_id = argv[++i];
        } else if (arg == "--no-seed") {
            seed = false;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    ServiceConfig config;
    if (!config_path.empty() && !config.load(config_path)) {
        std::cerr << "Using default configuration\n";
    }

    try {
        SystemTimeSource clock;
        ServingMetrics metrics;
        ServingLogBundle logs(config.log_dir, run_id);

        ModelRegistry registry(config.registry_state_path);
        if (!registry.initialize()) {
            std::cerr << "registry: state file " << config.registry_state_path
                      << " is malformed, starting empty\n";
        }

        InMemorySignalSource signals(clock);
        ArbitrageScanner scanner(clock, metrics, config.arbitrage());
        CalibrationTracker tracker(config.gates());

        if (seed) {
            if (registry.list(config.model_name).empty()) {
                seed_registry(registry, config.model_name);
            }
            seed_fixtures(signals, clock);
            seed_quotes(scanner, clock);
        }

        PredictionService service(config, registry, signals, scanner, tracker,
                                  logs.shadow(), metrics, clock, &logs.trace());

        JobScheduler jobs;
        jobs.schedule("calibration", std::chrono::seconds(config.calibration_interval_seconds),
                      [&]() { service.run_calibration(&logs.calibration()); });
        jobs.schedule("arbitrage", std::chrono::seconds(config.arbitrage_interval_seconds),
                      [&]() { service.run_arbitrage(&logs.arbitrage()); });
        jobs.schedule("cache_sweep", std::chrono::seconds(config.cache_sweep_interval_seconds),
                      [&]() { service.run_cache_sweep(); });
        jobs.schedule("metrics_snapshot", std::chrono::seconds(config.metrics_snapshot_interval_seconds),
                      [&]() { metrics.take_snapshot(); });
        jobs.start();
        jobs.trigger("arbitrage");

        QueryServer server(service, config.server_port);
        server.start();

        boost::asio::io_context signal_ioc;
        boost::asio::signal_set stop_signals(signal_ioc, SIGINT, SIGTERM);
        stop_signals.async_wait([](const boost::system::error_code&, int signo) {
            std::cout << "\nReceived signal " << signo << ", shutting down" << std::endl;
        });
        signal_ioc.run();

        server.stop();
        jobs.stop();
        service.shutdown();

        if (!registry.save()) {
            std::cerr << "registry: failed to persist state\n";
        }
        metrics.take_snapshot();
        const std::string metrics_csv = config.log_dir + "/metrics_" + run_id + ".csv";
        if (!metrics.export_to_csv(metrics_csv)) {
            std::cerr << "metrics: failed to write " << metrics_csv << "\n";
        }
        if (!logs.finalize()) {
            std::cerr << "logs: manifest incomplete\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "matchcast_server: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Shutdown complete" << std::endl;
    return 0;
}
