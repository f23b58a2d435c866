#pragma once

#include "common_types.hpp"
#include "scoreline_model.hpp"
#include <array>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <utility>

namespace matchcast {

// ============================================================================
// Prediction Cache (TTL-bounded memoisation)
// ============================================================================
// Keyed by (fixture, model version) so production and canary surfaces for the
// same fixture never shadow each other. An entry is valid while
// now < expires_at; expired entries are erased on access and by sweep(), but
// correctness never depends on the sweep running.

class PredictionCache {
public:
    static constexpr size_t NUM_SHARDS = 16;

    using Key = std::pair<FixtureId, ModelVersionId>;

    PredictionCache(const TimeSource& clock, Duration ttl = std::chrono::seconds(60))
        : clock_(clock), ttl_(ttl) {}

    PredictionCache(const PredictionCache&) = delete;
    PredictionCache& operator=(const PredictionCache&) = delete;

    Duration ttl() const { return ttl_; }

    // Empty result is the internal CacheMiss signal
    std::optional<MarketProbability> get(const FixtureId& fixture_id, ModelVersionId version) {
        const Key key{fixture_id, version};
        Shard& shard = shard_for(key);
        const Timestamp t = clock_.now();

        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it == shard.entries.end()) {
            return std::nullopt;
        }
        if (t >= it->second.expires_at) {
            shard.entries.erase(it);
            return std::nullopt;
        }
        return it->second;
    }

    // Stores the surface with expires_at = now + ttl and returns the stored copy
    MarketProbability put(MarketProbability value) {
        value.expires_at = clock_.now() + std::chrono::duration_cast<Clock::duration>(ttl_);
        const Key key{value.fixture_id, value.model_version};
        Shard& shard = shard_for(key);

        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.entries[key] = value;
        return value;
    }

    void invalidate(const FixtureId& fixture_id) {
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (auto it = shard.entries.begin(); it != shard.entries.end();) {
                if (it->first.first == fixture_id) {
                    it = shard.entries.erase(it);
                } else {
                    ++it;
                }
            }
        }
    }

    // Returns number of purged rows
    size_t sweep() {
        const Timestamp t = clock_.now();
        size_t purged = 0;
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (auto it = shard.entries.begin(); it != shard.entries.end();) {
                if (t >= it->second.expires_at) {
                    it = shard.entries.erase(it);
                    ++purged;
                } else {
                    ++it;
                }
            }
        }
        return purged;
    }

    size_t size() const {
        size_t n = 0;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            n += shard.entries.size();
        }
        return n;
    }

private:
    struct Shard {
        std::map<Key, MarketProbability> entries;
        mutable std::mutex mutex;
    };

    Shard& shard_for(const Key& key) {
        const size_t h = std::hash<FixtureId>{}(key.first) ^
                         (std::hash<ModelVersionId>{}(key.second) << 1);
        return shards_[h % NUM_SHARDS];
    }

    const TimeSource& clock_;
    Duration ttl_;
    std::array<Shard, NUM_SHARDS> shards_;
};

} // namespace matchcast
