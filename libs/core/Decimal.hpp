#pragma once
// ─────────────────────────────────────────────────────────────
// Decimal – base-10 arithmetic for money values.
// Doubles are only produced at the public return boundary.
// ─────────────────────────────────────────────────────────────
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include "StringUtils.hpp"

namespace Vantage {

using Decimal = boost::multiprecision::cpp_dec_float_50;

/// Shortest round-trip text of the double, so 0.1 enters as 0.1 and not its binary expansion.
/// Caller guarantees a finite value.
inline Decimal toDecimal(double value) {
    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc{}) {
        throw std::runtime_error("toDecimal: cannot represent value as text");
    }
    return Decimal(std::string(buffer, end));
}

/// Parse a finite decimal number from text. Throws std::invalid_argument on anything else.
inline Decimal parseDecimal(std::string_view text) {
    auto trimmed = StringUtils::trim(text);
    double probe = 0.0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), probe);
    if (trimmed.empty() || ec != std::errc{} || ptr != trimmed.data() + trimmed.size() || !std::isfinite(probe)) {
        throw std::invalid_argument("Not a finite decimal number: '" + std::string(text) + "'");
    }
    return Decimal(std::string(trimmed));
}

inline double toDouble(const Decimal& value) {
    return value.convert_to<double>();
}

} // namespace Vantage
