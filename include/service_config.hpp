#pragma once

#include "arbitrage_scanner.hpp"
#include "calibration_tracker.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

namespace matchcast {

// ============================================================================
// Service Configuration
// ============================================================================
// Every field is optional in the file. load() fills what is present and keeps
// the defaults for the rest; a malformed file leaves the whole config at its
// previous values.

struct ServiceConfig {
    // Serving
    std::string model_name = "poisson_dc";
    int worker_threads = 4;
    int cache_ttl_seconds = 60;
    std::string hash_salt = "matchcast";

    // Shadow logging
    size_t shadow_queue_capacity = 1024;
    int shadow_max_attempts = 3;
    int shadow_retry_backoff_ms = 5;

    // Calibration gates
    double accuracy_floor = 0.45;
    double ece_ceil = 0.08;
    int calibration_window_days = 7;
    uint64_t gate_min_samples = 50;
    int unsettled_horizon_hours = 72;

    // Arbitrage
    int quote_freshness_seconds = 300;
    double arbitrage_total_stake = 100.0;
    double min_profit_pct = 0.0;

    // Jobs
    int calibration_interval_seconds = 3600;
    int arbitrage_interval_seconds = 30;
    int cache_sweep_interval_seconds = 60;
    int metrics_snapshot_interval_seconds = 10;

    // Surfaces
    int server_port = 8090;
    std::string log_dir = "logs";
    std::string registry_state_path;

    bool load(const std::string& path) {
        std::ifstream in(path);
        if (!in.is_open()) {
            std::cerr << "config: cannot open " << path << "\n";
            return false;
        }
        nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            std::cerr << "config: " << path << " is not a JSON object\n";
            return false;
        }
        return load(j);
    }

    bool load(const nlohmann::json& j) {
        ServiceConfig next = *this;
        try {
            next.model_name = j.value("model_name", model_name);
            next.worker_threads = j.value("worker_threads", worker_threads);
            next.cache_ttl_seconds = j.value("cache_ttl_seconds", cache_ttl_seconds);
            next.hash_salt = j.value("hash_salt", hash_salt);
            next.shadow_queue_capacity = j.value("shadow_queue_capacity", shadow_queue_capacity);
            next.shadow_max_attempts = j.value("shadow_max_attempts", shadow_max_attempts);
            next.shadow_retry_backoff_ms = j.value("shadow_retry_backoff_ms", shadow_retry_backoff_ms);
            next.accuracy_floor = j.value("accuracy_floor", accuracy_floor);
            next.ece_ceil = j.value("ece_ceil", ece_ceil);
            next.calibration_window_days = j.value("calibration_window_days", calibration_window_days);
            next.gate_min_samples = j.value("gate_min_samples", gate_min_samples);
            next.unsettled_horizon_hours = j.value("unsettled_horizon_hours", unsettled_horizon_hours);
            next.quote_freshness_seconds = j.value("quote_freshness_seconds", quote_freshness_seconds);
            next.arbitrage_total_stake = j.value("arbitrage_total_stake", arbitrage_total_stake);
            next.min_profit_pct = j.value("min_profit_pct", min_profit_pct);
            next.calibration_interval_seconds = j.value("calibration_interval_seconds", calibration_interval_seconds);
            next.arbitrage_interval_seconds = j.value("arbitrage_interval_seconds", arbitrage_interval_seconds);
            next.cache_sweep_interval_seconds = j.value("cache_sweep_interval_seconds", cache_sweep_interval_seconds);
            next.metrics_snapshot_interval_seconds =
                j.value("metrics_snapshot_interval_seconds", metrics_snapshot_interval_seconds);
            next.server_port = j.value("server_port", server_port);
            next.log_dir = j.value("log_dir", log_dir);
            next.registry_state_path = j.value("registry_state_path", registry_state_path);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "config: " << e.what() << "\n";
            return false;
        }
        if (!next.valid()) {
            std::cerr << "config: value out of range, keeping previous configuration\n";
            return false;
        }
        *this = next;
        return true;
    }

    bool valid() const {
        return worker_threads > 0 && cache_ttl_seconds > 0 && shadow_queue_capacity > 0 &&
               shadow_max_attempts > 0 && shadow_retry_backoff_ms >= 0 &&
               accuracy_floor >= 0.0 && accuracy_floor <= 1.0 && ece_ceil >= 0.0 &&
               calibration_window_days > 0 && unsettled_horizon_hours > 0 &&
               quote_freshness_seconds > 0 &&
               arbitrage_total_stake > 0.0 && calibration_interval_seconds > 0 &&
               arbitrage_interval_seconds > 0 && cache_sweep_interval_seconds > 0 &&
               metrics_snapshot_interval_seconds > 0 &&
               server_port > 0 && server_port < 65536 && !model_name.empty();
    }

    Duration cache_ttl() const { return std::chrono::seconds(cache_ttl_seconds); }

    Duration unsettled_horizon() const { return std::chrono::hours(unsettled_horizon_hours); }

    CalibrationGates gates() const {
        CalibrationGates g;
        g.accuracy_floor = accuracy_floor;
        g.ece_ceil = ece_ceil;
        g.window_days = calibration_window_days;
        g.min_samples = gate_min_samples;
        return g;
    }

    ArbitrageSettings arbitrage() const {
        ArbitrageSettings s;
        s.freshness = std::chrono::seconds(quote_freshness_seconds);
        s.total_stake = to_cents(Decimal(arbitrage_total_stake));
        s.min_profit_pct = min_profit_pct;
        return s;
    }
};

} // namespace matchcast
