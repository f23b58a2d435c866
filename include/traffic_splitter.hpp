#pragma once

#include "common_types.hpp"
#include "errors.hpp"
#include "model_registry.hpp"
#include <openssl/evp.h>
#include <array>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace matchcast {

// ============================================================================
// Traffic Splitter (sticky, deterministic canary bucketing)
// ============================================================================
//
// slot(device) = (SHA-256(salt ":" device)[0..3] as big-endian u32) % 100 + 1
// bucket       = B  iff  slot <= canary_percentage
//
// Slots live in [1, 100], so raising the percentage from p1 to p2 moves
// exactly the devices with slot in (p1, p2] into B and leaves every other
// device where it was. The first assignment is stored and returned from then
// on, even after the percentage changes, until it is explicitly cleared.

struct ABAssignment {
    DeviceId device_id;
    Bucket bucket;
    Timestamp assigned_at;
};

class TrafficSplitter {
public:
    static constexpr size_t NUM_SHARDS = 16;

    TrafficSplitter(const TimeSource& clock, std::string salt = "matchcast")
        : clock_(clock), salt_(std::move(salt)) {}

    TrafficSplitter(const TrafficSplitter&) = delete;
    TrafficSplitter& operator=(const TrafficSplitter&) = delete;

    // ========================================================================
    // Hashing
    // ========================================================================

    int slot(const DeviceId& device_id) const {
        const std::string input = salt_ + ":" + device_id;

        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int digest_len = 0;
        if (EVP_Digest(input.data(), input.size(), digest.data(), &digest_len,
                       EVP_sha256(), nullptr) != 1 || digest_len < 4) {
            throw std::runtime_error("SHA-256 digest failed");
        }

        const uint32_t prefix = (static_cast<uint32_t>(digest[0]) << 24) |
                                (static_cast<uint32_t>(digest[1]) << 16) |
                                (static_cast<uint32_t>(digest[2]) << 8) |
                                static_cast<uint32_t>(digest[3]);
        return static_cast<int>(prefix % 100u) + 1;
    }

    Bucket compute(const DeviceId& device_id, const ABConfig& config) const {
        return slot(device_id) <= config.canary_percentage ? Bucket::B : Bucket::A;
    }

    // ========================================================================
    // Sticky assignment (insert-if-absent)
    // ========================================================================

    ABAssignment assign(const DeviceId& device_id, const ABConfig& config) {
        if (device_id.empty()) {
            throw PredictionError(ErrorCode::InvalidSignal, "empty device id");
        }

        Shard& shard = shard_for(device_id);
        {
            std::lock_guard<std::mutex> lock(shard.mutex);
            auto it = shard.assignments.find(device_id);
            if (it != shard.assignments.end()) {
                return it->second;
            }
        }

        // Hash outside the lock; a racing caller computes the same bucket
        ABAssignment fresh{device_id, compute(device_id, config), clock_.now()};

        std::lock_guard<std::mutex> lock(shard.mutex);
        return shard.assignments.try_emplace(device_id, fresh).first->second;
    }

    std::optional<ABAssignment> lookup(const DeviceId& device_id) const {
        const Shard& shard = shard_for(device_id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.assignments.find(device_id);
        if (it == shard.assignments.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool clear(const DeviceId& device_id) {
        Shard& shard = shard_for(device_id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return shard.assignments.erase(device_id) > 0;
    }

    void clear_all() {
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            shard.assignments.clear();
        }
    }

    size_t size() const {
        size_t n = 0;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            n += shard.assignments.size();
        }
        return n;
    }

private:
    struct Shard {
        std::unordered_map<DeviceId, ABAssignment> assignments;
        mutable std::mutex mutex;
    };

    Shard& shard_for(const DeviceId& device_id) {
        return shards_[std::hash<DeviceId>{}(device_id) % NUM_SHARDS];
    }

    const Shard& shard_for(const DeviceId& device_id) const {
        return shards_[std::hash<DeviceId>{}(device_id) % NUM_SHARDS];
    }

    const TimeSource& clock_;
    std::string salt_;
    std::array<Shard, NUM_SHARDS> shards_;
};

} // namespace matchcast
