#pragma once

// Small text helpers shared by the calculators, formatters and config loaders.

#include <string>
#include <string_view>
#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>

namespace Vantage::StringUtils {

inline char asciiToLower(unsigned char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c + ('a' - 'A'));
    }
    return static_cast<char>(c);
}

inline bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (asciiToLower(static_cast<unsigned char>(lhs[i])) != asciiToLower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

inline bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline std::string_view trim(std::string_view str) {
    while (!str.empty() && isAsciiSpace(str.front())) str.remove_prefix(1);
    while (!str.empty() && isAsciiSpace(str.back())) str.remove_suffix(1);
    return str;
}

inline bool isAllDigits(std::string_view str) {
    if (str.empty()) return false;
    for (char c : str) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

/**
 * Parse an unsigned decimal digit run without throwing.
 * @return std::nullopt when the run is empty, non-numeric or overflows int64_t
 */
inline std::optional<int64_t> parseDigits(std::string_view digits) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) return std::nullopt;
    return value;
}

} // namespace Vantage::StringUtils
