// model_registry.hpp
// Model Version Registry & Canary Routing Policy
//
// PURPOSE:
// - Track every deployable scoring model version and its lifecycle metadata
// - Hold exactly one active version per model name
// - Hold the global canary routing policy (ABConfig)
// - Persist state as JSON so promotions survive a restart
//
// INVARIANTS:
// 1. At most one is_active=true per model name; promote() swaps under one lock
//    and bumps a registry revision, so concurrent promotions serialise and the
//    last writer wins.
// 2. Version strings are unique per model name.
// 3. History is never deleted; rollback() re-activates the previous version.
// 4. Request-handling code only reads (serving_view); mutation is reserved to
//    the administrative calls below.

#pragma once

#include "common_types.hpp"
#include "errors.hpp"
#include "scoreline_model.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace matchcast {

// Deployable scoring model
struct ModelVersion {
    ModelVersionId id;
    std::string name;                  // e.g. "poisson_dc"
    std::string version;               // e.g. "1.4.0"
    std::string training_date;         // ISO date of the training run
    double accuracy;                   // Offline validation metrics
    double log_loss;
    double brier;
    bool is_active;
    bool is_canary;
    std::string notes;
    int64_t registered_at;             // Nanoseconds since epoch
    ModelParameters params;

    ModelVersion()
        : id(0), accuracy(0.0), log_loss(0.0), brier(0.0),
          is_active(false), is_canary(false), registered_at(0) {}
};

// Global canary routing policy
struct ABConfig {
    double canary_percentage;                       // 0 .. 100
    std::optional<ModelVersionId> canary_version;   // nullopt: all traffic to active

    ABConfig() : canary_percentage(0.0) {}
};

// Consistent read of everything a request needs, taken under one lock
struct ServingView {
    ModelVersion active;
    std::optional<ModelVersion> canary;
    ABConfig config;
    uint64_t revision;
};

// ============================================================================
// JSON mapping
// ============================================================================

inline void to_json(nlohmann::json& j, const ModelParameters& p) {
    j = nlohmann::json{
        {"rho", p.rho},
        {"home_advantage", p.home_advantage},
        {"league_avg_goals", p.league_avg_goals},
        {"elo_weight", p.elo_weight},
        {"referee_weight", p.referee_weight},
        {"max_goals", p.max_goals}
    };
}

inline void from_json(const nlohmann::json& j, ModelParameters& p) {
    const ModelParameters defaults;
    p.rho = j.value("rho", defaults.rho);
    p.home_advantage = j.value("home_advantage", defaults.home_advantage);
    p.league_avg_goals = j.value("league_avg_goals", defaults.league_avg_goals);
    p.elo_weight = j.value("elo_weight", defaults.elo_weight);
    p.referee_weight = j.value("referee_weight", defaults.referee_weight);
    p.max_goals = j.value("max_goals", defaults.max_goals);
}

inline void to_json(nlohmann::json& j, const ModelVersion& v) {
    j = nlohmann::json{
        {"id", v.id},
        {"name", v.name},
        {"version", v.version},
        {"training_date", v.training_date},
        {"accuracy", v.accuracy},
        {"log_loss", v.log_loss},
        {"brier", v.brier},
        {"is_active", v.is_active},
        {"is_canary", v.is_canary},
        {"notes", v.notes},
        {"registered_at", v.registered_at},
        {"params", v.params}
    };
}

inline void from_json(const nlohmann::json& j, ModelVersion& v) {
    v.id = j.value("id", ModelVersionId{0});
    v.name = j.at("name").get<std::string>();
    v.version = j.at("version").get<std::string>();
    v.training_date = j.value("training_date", std::string());
    v.accuracy = j.value("accuracy", 0.0);
    v.log_loss = j.value("log_loss", 0.0);
    v.brier = j.value("brier", 0.0);
    v.is_active = j.value("is_active", false);
    v.is_canary = j.value("is_canary", false);
    v.notes = j.value("notes", std::string());
    v.registered_at = j.value("registered_at", int64_t{0});
    if (j.contains("params")) {
        v.params = j.at("params").get<ModelParameters>();
    }
}

inline void to_json(nlohmann::json& j, const ABConfig& c) {
    j = nlohmann::json{{"canary_percentage", c.canary_percentage}};
    if (c.canary_version) {
        j["canary_version"] = *c.canary_version;
    } else {
        j["canary_version"] = nullptr;
    }
}

inline void from_json(const nlohmann::json& j, ABConfig& c) {
    c.canary_percentage = j.value("canary_percentage", 0.0);
    if (j.contains("canary_version") && !j.at("canary_version").is_null()) {
        c.canary_version = j.at("canary_version").get<ModelVersionId>();
    } else {
        c.canary_version.reset();
    }
}

// ============================================================================
// Model Registry
// ============================================================================

class ModelRegistry {
public:
    // Empty state_path keeps the registry in memory only
    explicit ModelRegistry(const std::string& state_path = "")
        : state_path_(state_path)
    {
    }

    //
    // Initialization
    //

    // Loads persisted state if present. A missing file is a fresh registry;
    // a malformed or inconsistent one is reported and leaves the registry
    // untouched.
    bool initialize() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_path_.empty()) {
            return true;
        }
        std::ifstream in(state_path_);
        if (!in.is_open()) {
            return true;
        }
        return load_locked(in);
    }

    bool save() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_path_.empty()) {
            return true;
        }
        std::ofstream out(state_path_, std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << to_json_locked().dump(2) << "\n";
        return out.good();
    }

    //
    // Registration
    //

    ModelVersionId register_version(const ModelVersion& metadata) {
        std::lock_guard<std::mutex> lock(mutex_);

        for (const auto& [id, existing] : versions_) {
            if (existing.name == metadata.name && existing.version == metadata.version) {
                throw PredictionError(ErrorCode::DuplicateVersion,
                                      metadata.name + " " + metadata.version);
            }
        }

        ModelVersion v = metadata;
        v.id = next_id_++;
        v.is_active = false;
        v.is_canary = false;
        if (v.registered_at == 0) {
            v.registered_at = to_nanos(matchcast::now());
        }
        versions_[v.id] = v;
        ++revision_;
        return v.id;
    }

    //
    // Reads
    //

    ModelVersion get(ModelVersionId id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return find_locked(id);
    }

    ModelVersion get_active(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_locked(name);
    }

    std::vector<ModelVersion> list(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ModelVersion> out;
        for (const auto& [id, v] : versions_) {
            if (v.name == name) {
                out.push_back(v);
            }
        }
        return out;
    }

    ABConfig ab_config() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ab_config_;
    }

    uint64_t revision() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return revision_;
    }

    ServingView serving_view(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        ServingView view;
        view.active = active_locked(name);
        view.config = ab_config_;
        view.revision = revision_;
        if (ab_config_.canary_version) {
            auto it = versions_.find(*ab_config_.canary_version);
            if (it != versions_.end() && it->second.name == name) {
                view.canary = it->second;
            }
        }
        return view;
    }

    //
    // Promotion / Rollback (administrative)
    //

    void promote(ModelVersionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        promote_locked(id);
    }

    // Compare-and-swap promotion: applies only if nobody changed the registry
    // since expected_revision was read
    bool promote_if(ModelVersionId id, uint64_t expected_revision) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (revision_ != expected_revision) {
            return false;
        }
        promote_locked(id);
        return true;
    }

    ModelVersion rollback(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto hist = history_.find(name);
        if (hist == history_.end() || hist->second.size() < 2) {
            throw PredictionError(ErrorCode::ModelNotFound,
                                  "no previous version to roll back to for " + name);
        }
        hist->second.pop_back();
        const ModelVersionId previous = hist->second.back();
        activate_locked(name, previous);
        drop_canary_if_active_locked(versions_.at(previous));
        ++revision_;
        return versions_.at(previous);
    }

    //
    // Canary policy (administrative)
    //

    void set_canary(ModelVersionId id, double percentage) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!(percentage >= 0.0 && percentage <= 100.0)) {
            throw PredictionError(ErrorCode::InvalidSignal, "canary percentage outside 0..100");
        }
        ModelVersion& v = find_mutable_locked(id);
        if (v.is_active) {
            throw PredictionError(ErrorCode::InvalidSignal, "active version cannot be the canary");
        }
        clear_canary_flag_locked();
        v.is_canary = true;
        ab_config_.canary_version = id;
        ab_config_.canary_percentage = percentage;
        ++revision_;
    }

    void set_canary_percentage(double percentage) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!(percentage >= 0.0 && percentage <= 100.0)) {
            throw PredictionError(ErrorCode::InvalidSignal, "canary percentage outside 0..100");
        }
        ab_config_.canary_percentage = percentage;
        ++revision_;
    }

    void clear_canary() {
        std::lock_guard<std::mutex> lock(mutex_);
        clear_canary_flag_locked();
        ab_config_.canary_version.reset();
        ++revision_;
    }

private:
    const ModelVersion& find_locked(ModelVersionId id) const {
        auto it = versions_.find(id);
        if (it == versions_.end()) {
            throw PredictionError(ErrorCode::ModelNotFound, "version id " + std::to_string(id));
        }
        return it->second;
    }

    ModelVersion& find_mutable_locked(ModelVersionId id) {
        auto it = versions_.find(id);
        if (it == versions_.end()) {
            throw PredictionError(ErrorCode::ModelNotFound, "version id " + std::to_string(id));
        }
        return it->second;
    }

    const ModelVersion& active_locked(const std::string& name) const {
        for (const auto& [id, v] : versions_) {
            if (v.name == name && v.is_active) {
                return v;
            }
        }
        throw PredictionError(ErrorCode::ModelNotFound, "no active version for " + name);
    }

    void activate_locked(const std::string& name, ModelVersionId id) {
        for (auto& [vid, v] : versions_) {
            if (v.name == name) {
                v.is_active = (vid == id);
            }
        }
    }

    void promote_locked(ModelVersionId id) {
        ModelVersion& target = find_mutable_locked(id);
        activate_locked(target.name, id);
        drop_canary_if_active_locked(target);

        auto& hist = history_[target.name];
        if (hist.empty() || hist.back() != id) {
            hist.push_back(id);
        }
        ++revision_;
    }

    // A version never serves as active and canary at once
    void drop_canary_if_active_locked(ModelVersion& v) {
        if (v.is_canary || (ab_config_.canary_version && *ab_config_.canary_version == v.id)) {
            v.is_canary = false;
            ab_config_.canary_version.reset();
        }
    }

    void clear_canary_flag_locked() {
        if (ab_config_.canary_version) {
            auto it = versions_.find(*ab_config_.canary_version);
            if (it != versions_.end()) {
                it->second.is_canary = false;
            }
        }
    }

    //
    // File-Based Storage
    //

    nlohmann::json to_json_locked() const {
        nlohmann::json j;
        j["next_id"] = next_id_;
        j["revision"] = revision_;
        j["versions"] = nlohmann::json::array();
        for (const auto& [id, v] : versions_) {
            j["versions"].push_back(v);
        }
        j["history"] = history_;
        j["ab_config"] = ab_config_;
        return j;
    }

    // Everything is parsed and checked before any member is touched
    bool load_locked(std::istream& in) {
        std::map<ModelVersionId, ModelVersion> versions;
        std::map<std::string, std::vector<ModelVersionId>> history;
        ABConfig ab_config;
        ModelVersionId next_id = 1;
        uint64_t revision = 0;
        try {
            const nlohmann::json j = nlohmann::json::parse(in);
            for (const auto& item : j.at("versions")) {
                ModelVersion v = item.get<ModelVersion>();
                versions[v.id] = v;
            }
            history = j.value("history", std::map<std::string, std::vector<ModelVersionId>>());
            ab_config = j.value("ab_config", ABConfig());
            next_id = j.value("next_id", ModelVersionId{1});
            revision = j.value("revision", uint64_t{0});
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "model registry: cannot load " << state_path_ << ": " << e.what() << "\n";
            return false;
        }

        const std::string problem = check_loaded(versions, history, ab_config, next_id);
        if (!problem.empty()) {
            std::cerr << "model registry: rejecting " << state_path_ << ": " << problem << "\n";
            return false;
        }

        versions_ = std::move(versions);
        history_ = std::move(history);
        ab_config_ = ab_config;
        next_id_ = next_id;
        revision_ = revision;
        return true;
    }

    static std::string check_loaded(const std::map<ModelVersionId, ModelVersion>& versions,
                                     const std::map<std::string, std::vector<ModelVersionId>>& history,
                                     const ABConfig& ab_config,
                                     ModelVersionId next_id) {
        std::map<std::string, size_t> active;
        for (const auto& [id, v] : versions) {
            if (id >= next_id) {
                return "version id " + std::to_string(id) + " is not below next_id";
            }
            if (v.is_active && ++active[v.name] > 1) {
                return "more than one active version for " + v.name;
            }
        }
        for (const auto& [name, ids] : history) {
            for (ModelVersionId id : ids) {
                auto it = versions.find(id);
                if (it == versions.end() || it->second.name != name) {
                    return "history for " + name + " names unknown version " + std::to_string(id);
                }
            }
        }
        if (ab_config.canary_version) {
            auto it = versions.find(*ab_config.canary_version);
            if (it == versions.end()) {
                return "canary names unknown version " + std::to_string(*ab_config.canary_version);
            }
            if (it->second.is_active) {
                return "canary version is also active";
            }
        }
        return "";
    }

    //
    // Member Variables
    //

    std::string state_path_;

    // Ordered so listing and persistence are stable
    std::map<ModelVersionId, ModelVersion> versions_;
    std::map<std::string, std::vector<ModelVersionId>> history_;
    ABConfig ab_config_;

    ModelVersionId next_id_ = 1;
    uint64_t revision_ = 0;

    mutable std::mutex mutex_;
};

} // namespace matchcast
