#pragma once

#include "arbitrage_scanner.hpp"
#include "calibration_tracker.hpp"
#include "common_types.hpp"
#include "json_codec.hpp"
#include "shadow_evaluator.hpp"
#include <openssl/evp.h>
#include <array>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

// ============================================================================
// SERVING LOGS
// ============================================================================
// Append-only line logs, one file per stream, each opened with a header
// block. Lines are key=value except the shadow log, which is JSON lines so
// both probability maps survive intact.
// ============================================================================

namespace matchcast {

inline std::string utc_timestamp(Timestamp t) {
    const std::time_t tt = Clock::to_time_t(t);
    std::tm tm_utc{};
    gmtime_r(&tt, &tm_utc);
    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

// ============================================================================
// Stream 1: Prediction Trace (one line per served request)
// ============================================================================
class PredictionTraceLog {
public:
    explicit PredictionTraceLog(const std::string& filename) {
        file_.open(filename, std::ios::app);
        write_header();
    }

    bool is_open() const { return file_.is_open(); }

    void log_served(const FixtureId& fixture_id, const DeviceId& device_id,
                    ModelVersionId version, Bucket bucket, bool cache_hit, double latency_us) {
        std::lock_guard<std::mutex> lock(mutex_);
        file_ << "SERVE fixture=" << fixture_id
              << " device=" << device_id
              << " version=" << version
              << " bucket=" << to_char(bucket)
              << " cache=" << (cache_hit ? "hit" : "miss")
              << " latency_us=" << std::fixed << std::setprecision(1) << latency_us
              << "\n";
    }

    void log_failure(const FixtureId& fixture_id, const std::string& code, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        file_ << "FAIL fixture=" << fixture_id
              << " code=" << code
              << " message=\"" << message << "\"\n";
    }

    void log_admin(const std::string& action, ModelVersionId version, const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        file_ << "ADMIN action=" << action
              << " version=" << version
              << " name=" << name
              << " ts=" << utc_timestamp(matchcast::now()) << "\n";
        file_.flush();
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.flush();
    }

private:
    std::ofstream file_;
    std::mutex mutex_;

    void write_header() {
        file_ << "# prediction_trace.log\n";
        file_ << "# opened=" << utc_timestamp(matchcast::now()) << "\n";
        file_ << "# latency_unit=us\n";
        file_ << "\n";
        file_.flush();
    }
};

// ============================================================================
// Stream 2: Shadow Divergence (sink of the shadow logger writer thread)
// ============================================================================
class ShadowDivergenceLog : public ShadowLogSink {
public:
    explicit ShadowDivergenceLog(const std::string& filename) {
        file_.open(filename, std::ios::app);
        write_header();
    }

    bool write(const ShadowLogEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!file_.is_open()) {
            return false;
        }
        file_ << json(entry).dump() << "\n";
        file_.flush();
        return file_.good();
    }

private:
    std::ofstream file_;
    std::mutex mutex_;

    void write_header() {
        file_ << "# shadow_divergence.log\n";
        file_ << "# format=jsonl\n";
        file_ << "# metrics=l1,kl(null when canary rules out a production outcome)\n";
        file_ << "\n";
        file_.flush();
    }
};

// ============================================================================
// Stream 3: Calibration Alerts
// ============================================================================
class CalibrationAlertLog {
public:
    explicit CalibrationAlertLog(const std::string& filename) {
        file_.open(filename, std::ios::app);
        write_header();
    }

    void log_alert(const CalibrationAlert& alert) {
        std::lock_guard<std::mutex> lock(mutex_);
        file_ << "ALERT version=" << alert.model_version
              << " metric=" << alert.metric
              << " observed=" << std::fixed << std::setprecision(4) << alert.observed
              << " threshold=" << alert.threshold
              << " window=" << alert.from_day << ".." << alert.to_day
              << " samples=" << alert.samples << "\n";
        file_.flush();
    }

    void log_run(DayIndex as_of_day, size_t versions, size_t alerts) {
        std::lock_guard<std::mutex> lock(mutex_);
        file_ << "RUN as_of_day=" << as_of_day
              << " versions=" << versions
              << " alerts=" << alerts << "\n";
        file_.flush();
    }

private:
    std::ofstream file_;
    std::mutex mutex_;

    void write_header() {
        file_ << "# calibration_alerts.log\n";
        file_ << "# gates=accuracy_floor,ece_ceil\n";
        file_ << "\n";
        file_.flush();
    }
};

// ============================================================================
// Stream 4: Arbitrage Opportunities
// ============================================================================
class ArbitrageLog {
public:
    explicit ArbitrageLog(const std::string& filename) {
        file_.open(filename, std::ios::app);
        write_header();
    }

    void log_opportunity(const ArbitrageOpportunity& opp) {
        std::lock_guard<std::mutex> lock(mutex_);
        file_ << "ARB fixture=" << opp.fixture_id
              << " market=" << opp.market
              << " implied=" << std::fixed << std::setprecision(6) << opp.implied_probability_sum
              << " profit_pct=" << std::setprecision(3) << opp.profit_pct
              << " guaranteed=" << to_fixed_string(opp.guaranteed_profit);
        for (const auto& s : opp.stakes) {
            file_ << " " << s.outcome << "=" << s.bookmaker << "@" << to_fixed_string(s.odds, ODDS_PLACES)
                  << ":" << to_fixed_string(s.stake);
        }
        file_ << "\n";
        file_.flush();
    }

private:
    std::ofstream file_;
    std::mutex mutex_;

    void write_header() {
        file_ << "# arbitrage.log\n";
        file_ << "# stake_unit=currency, cents precision\n";
        file_ << "\n";
        file_.flush();
    }
};

// ============================================================================
// MANIFEST Generator (SHA-256 of each closed log)
// ============================================================================
class ManifestGenerator {
public:
    // Returns false if the file could not be read
    bool add_file(const std::string& path, const std::string& display_name) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            return false;
        }

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (ctx == nullptr || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx);
            return false;
        }
        std::array<char, 8192> buf{};
        while (in) {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            const std::streamsize n = in.gcount();
            if (n > 0 && EVP_DigestUpdate(ctx, buf.data(), static_cast<size_t>(n)) != 1) {
                EVP_MD_CTX_free(ctx);
                return false;
            }
        }
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int len = 0;
        const bool ok = EVP_DigestFinal_ex(ctx, digest.data(), &len) == 1;
        EVP_MD_CTX_free(ctx);
        if (!ok) {
            return false;
        }

        std::stringstream hex;
        for (unsigned int i = 0; i < len; ++i) {
            hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
        }
        files_.push_back({display_name, hex.str()});
        return true;
    }

    bool write_manifest(const std::string& output_file) const {
        std::ofstream out(output_file);
        if (!out.is_open()) {
            return false;
        }
        out << "# MANIFEST.sha256\n";
        out << "# Generated: " << utc_timestamp(matchcast::now()) << "\n";
        out << "# Verification: sha256sum -c MANIFEST.sha256\n";
        out << "\n";

        for (const auto& f : files_) {
            out << f.hash << "  " << f.filename << "\n";
        }
        return out.good();
    }

    size_t size() const { return files_.size(); }

private:
    struct FileHash {
        std::string filename;
        std::string hash;
    };
    std::vector<FileHash> files_;
};

// ============================================================================
// Serving Log Bundle (owns all streams of one server run)
// ============================================================================
class ServingLogBundle {
public:
    ServingLogBundle(const std::string& log_dir, const std::string& run_id)
        : dir_(prepare(log_dir)),
          run_id_(run_id),
          trace_log_(path("prediction_trace")),
          shadow_log_(path("shadow_divergence")),
          calibration_log_(path("calibration_alerts")),
          arbitrage_log_(path("arbitrage")) {}

    PredictionTraceLog& trace() { return trace_log_; }
    ShadowDivergenceLog& shadow() { return shadow_log_; }
    CalibrationAlertLog& calibration() { return calibration_log_; }
    ArbitrageLog& arbitrage() { return arbitrage_log_; }

    // Hashes every stream into MANIFEST_<run_id>.sha256
    bool finalize() {
        trace_log_.flush();
        ManifestGenerator manifest;
        bool ok = true;
        for (const char* stream : {"prediction_trace", "shadow_divergence",
                                   "calibration_alerts", "arbitrage"}) {
            const std::string name = std::string(stream) + "_" + run_id_ + ".log";
            ok = manifest.add_file(dir_ + "/" + name, name) && ok;
        }
        return manifest.write_manifest(dir_ + "/MANIFEST_" + run_id_ + ".sha256") && ok;
    }

private:
    static std::string prepare(const std::string& log_dir) {
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            std::cerr << "serving log: cannot create " << log_dir << ": " << ec.message() << "\n";
        }
        return log_dir;
    }

    std::string path(const std::string& stream) const {
        return dir_ + "/" + stream + "_" + run_id_ + ".log";
    }

    std::string dir_;
    std::string run_id_;
    PredictionTraceLog trace_log_;
    ShadowDivergenceLog shadow_log_;
    CalibrationAlertLog calibration_log_;
    ArbitrageLog arbitrage_log_;
};

} // namespace matchcast
