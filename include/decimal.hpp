#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <ios>
#include <string>

namespace matchcast {

// ============================================================================
// Decimal arithmetic for stakes and payouts
// ============================================================================
// Odds arrive as binary doubles; they are snapped to ODDS_PLACES decimal
// places before any money maths so 2.10 means exactly 2.10.

using Decimal = boost::multiprecision::cpp_dec_float_50;

constexpr int ODDS_PLACES = 4;
constexpr int MONEY_PLACES = 2;

inline Decimal decimal_scale(int places) {
    Decimal scale = 1;
    for (int i = 0; i < places; ++i) {
        scale *= 10;
    }
    return scale;
}

// Half away from zero
inline Decimal quantize(const Decimal& value, int places) {
    const Decimal scale = decimal_scale(places);
    return boost::multiprecision::round(value * scale) / scale;
}

inline Decimal to_cents(const Decimal& value) {
    return quantize(value, MONEY_PLACES);
}

inline Decimal decimal_odds(double odds) {
    return quantize(Decimal(odds), ODDS_PLACES);
}

inline std::string to_fixed_string(const Decimal& value, int places = MONEY_PLACES) {
    return quantize(value, places).str(places, std::ios_base::fixed);
}

inline double to_double(const Decimal& value) {
    return value.convert_to<double>();
}

} // namespace matchcast
