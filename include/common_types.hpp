#pragma once

#include <cstdint>
#include <chrono>
#include <atomic>
#include <string>
#include <optional>

namespace matchcast {

// ============================================================================
// Timestamp Utilities (Nanosecond precision, wall clock)
// ============================================================================
// Calibration rollups are keyed by UTC day and cache/quote expiry is compared
// against stored timestamps, so everything runs on system_clock.

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using Duration = std::chrono::nanoseconds;

inline int64_t to_nanos(const Timestamp& tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        tp.time_since_epoch()).count();
}

inline Timestamp from_nanos(int64_t ns) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(
        std::chrono::nanoseconds(ns)));
}

inline Timestamp now() {
    return Clock::now();
}

// Days since 1970-01-01 UTC
using DayIndex = int64_t;

inline DayIndex day_of(const Timestamp& tp) {
    const int64_t secs = std::chrono::duration_cast<std::chrono::seconds>(
        tp.time_since_epoch()).count();
    // floor division so pre-epoch instants land on the right day
    return secs >= 0 ? secs / 86400 : -((-secs + 86399) / 86400);
}

inline Timestamp start_of_day(DayIndex day) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(
        std::chrono::seconds(day * 86400)));
}

// ============================================================================
// Time Source (injectable so expiry and day rollover are testable)
// ============================================================================

class TimeSource {
public:
    virtual ~TimeSource() = default;
    virtual Timestamp now() const = 0;
};

class SystemTimeSource : public TimeSource {
public:
    Timestamp now() const override { return Clock::now(); }
};

class ManualTimeSource : public TimeSource {
public:
    explicit ManualTimeSource(Timestamp start = Timestamp())
        : nanos_(to_nanos(start)) {}

    Timestamp now() const override {
        return from_nanos(nanos_.load(std::memory_order_acquire));
    }

    void set(Timestamp t) {
        nanos_.store(to_nanos(t), std::memory_order_release);
    }

    void advance(Duration d) {
        nanos_.fetch_add(d.count(), std::memory_order_acq_rel);
    }

private:
    std::atomic<int64_t> nanos_;
};

// ============================================================================
// Identifiers
// ============================================================================

using FixtureId = std::string;
using ModelVersionId = uint64_t;
using DeviceId = std::string;

// ============================================================================
// Match Outcome (H/D/A)
// ============================================================================

enum class Outcome : uint8_t {
    HOME = 0,
    DRAW = 1,
    AWAY = 2
};

inline char to_char(Outcome o) {
    switch (o) {
        case Outcome::HOME: return 'H';
        case Outcome::DRAW: return 'D';
        case Outcome::AWAY: return 'A';
    }
    return '?';
}

inline std::optional<Outcome> parse_outcome(const std::string& s) {
    if (s == "H") return Outcome::HOME;
    if (s == "D") return Outcome::DRAW;
    if (s == "A") return Outcome::AWAY;
    return std::nullopt;
}

inline Outcome outcome_from_score(int home_goals, int away_goals) {
    if (home_goals > away_goals) return Outcome::HOME;
    if (home_goals < away_goals) return Outcome::AWAY;
    return Outcome::DRAW;
}

// ============================================================================
// Traffic Bucket (A = production, B = canary)
// ============================================================================

enum class Bucket : uint8_t {
    A = 0,
    B = 1
};

inline char to_char(Bucket b) {
    return b == Bucket::A ? 'A' : 'B';
}

} // namespace matchcast
