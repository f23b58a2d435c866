#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace matchcast {

// ============================================================================
// Latency statistics over a batch of request timings (microseconds)
// ============================================================================

struct LatencyStats {
    double min_us;
    double max_us;
    double mean_us;
    double median_us;
    double p90_us;
    double p99_us;
    double p999_us;
    double stddev_us;
    double jitter_us;  // max - min
    size_t sample_count;

    LatencyStats()
        : min_us(0.0), max_us(0.0), mean_us(0.0), median_us(0.0), p90_us(0.0),
          p99_us(0.0), p999_us(0.0), stddev_us(0.0), jitter_us(0.0), sample_count(0) {}

    // Sorts samples in place
    static LatencyStats calculate(std::vector<double>& samples_us) {
        LatencyStats stats;
        if (samples_us.empty()) {
            return stats;
        }

        std::sort(samples_us.begin(), samples_us.end());
        stats.sample_count = samples_us.size();

        stats.min_us = samples_us.front();
        stats.max_us = samples_us.back();
        stats.jitter_us = stats.max_us - stats.min_us;

        double sum = 0.0;
        for (double sample : samples_us) {
            sum += sample;
        }
        stats.mean_us = sum / static_cast<double>(samples_us.size());

        const size_t mid = samples_us.size() / 2;
        if (samples_us.size() % 2 == 0) {
            stats.median_us = (samples_us[mid - 1] + samples_us[mid]) / 2.0;
        } else {
            stats.median_us = samples_us[mid];
        }

        stats.p90_us = percentile(samples_us, 90.0);
        stats.p99_us = percentile(samples_us, 99.0);
        stats.p999_us = percentile(samples_us, 99.9);

        double variance = 0.0;
        for (double sample : samples_us) {
            variance += (sample - stats.mean_us) * (sample - stats.mean_us);
        }
        stats.stddev_us = std::sqrt(variance / static_cast<double>(samples_us.size()));

        return stats;
    }

    // Linear interpolation between closest ranks
    static double percentile(const std::vector<double>& sorted_samples, double p) {
        if (sorted_samples.empty()) return 0.0;

        const double index = (p / 100.0) * static_cast<double>(sorted_samples.size() - 1);
        const size_t lower = static_cast<size_t>(index);
        const size_t upper = std::min(lower + 1, sorted_samples.size() - 1);

        if (lower == upper) {
            return sorted_samples[lower];
        }

        const double weight = index - static_cast<double>(lower);
        return sorted_samples[lower] * (1.0 - weight) + sorted_samples[upper] * weight;
    }

    void print(const std::string& title) const {
        std::cout << title << "\n";
        std::cout << std::fixed << std::setprecision(2);
        std::cout << "  samples : " << sample_count << "\n";
        std::cout << "  min     : " << min_us << " us\n";
        std::cout << "  median  : " << median_us << " us\n";
        std::cout << "  mean    : " << mean_us << " us\n";
        std::cout << "  p90     : " << p90_us << " us\n";
        std::cout << "  p99     : " << p99_us << " us\n";
        std::cout << "  p99.9   : " << p999_us << " us\n";
        std::cout << "  max     : " << max_us << " us\n";
        std::cout << "  stddev  : " << stddev_us << " us\n\n";
    }

    bool export_csv(const std::string& filename) const {
        std::ofstream f(filename);
        if (!f.is_open()) {
            return false;
        }
        f << "samples,min_us,median_us,mean_us,p90_us,p99_us,p999_us,max_us,stddev_us\n";
        f << sample_count << "," << min_us << "," << median_us << "," << mean_us << ","
          << p90_us << "," << p99_us << "," << p999_us << "," << max_us << "," << stddev_us << "\n";
        return f.good();
    }
};

} // namespace matchcast
