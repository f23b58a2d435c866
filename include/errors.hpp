#pragma once

#include <stdexcept>
#include <string>

namespace matchcast {

// ============================================================================
// Error Taxonomy
// ============================================================================
// Only request failures are thrown. StaleQuote, CacheMiss, ShadowLogDropped
// and CalibrationGateBreached are reported through counters, empty optionals
// and log lines.

enum class ErrorCode {
    InsufficientInput,
    InvalidSignal,
    StaleQuote,
    ModelNotFound,
    DuplicateVersion,
    CacheMiss,
    ShadowLogDropped,
    CalibrationGateBreached
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InsufficientInput:       return "InsufficientInput";
        case ErrorCode::InvalidSignal:           return "InvalidSignal";
        case ErrorCode::StaleQuote:              return "StaleQuote";
        case ErrorCode::ModelNotFound:           return "ModelNotFound";
        case ErrorCode::DuplicateVersion:        return "DuplicateVersion";
        case ErrorCode::CacheMiss:               return "CacheMiss";
        case ErrorCode::ShadowLogDropped:        return "ShadowLogDropped";
        case ErrorCode::CalibrationGateBreached: return "CalibrationGateBreached";
    }
    return "Unknown";
}

class PredictionError : public std::runtime_error {
public:
    PredictionError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(to_string(code)) + ": " + message)
        , code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace matchcast
