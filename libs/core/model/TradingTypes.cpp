#include "TradingTypes.hpp"
#include "../StringUtils.hpp"
#include <stdexcept>
#include <string>

namespace Vantage {

PositionSide parsePositionSide(std::string_view text) {
    auto trimmed = StringUtils::trim(text);
    if (StringUtils::equalsIgnoreCase(trimmed, "long")) return PositionSide::Long;
    if (StringUtils::equalsIgnoreCase(trimmed, "short")) return PositionSide::Short;
    throw std::invalid_argument("Unknown position side: '" + std::string(text) + "'");
}

const char* toString(PositionSide side) {
    switch (side) {
        case PositionSide::Long:  return "long";
        case PositionSide::Short: return "short";
    }
    throw std::invalid_argument("Unknown position side value: " + std::to_string(static_cast<int>(side)));
}

} // namespace Vantage
