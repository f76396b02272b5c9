#include "TriggerCalculator.hpp"
#include "Decimal.hpp"
#include "Log.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace Vantage {

namespace {

Decimal scaleFor(int decimals) {
    if (decimals < 0) {
        throw std::invalid_argument("Price precision must be non-negative, got " + std::to_string(decimals));
    }
    return boost::multiprecision::pow(Decimal(10), decimals);
}

Decimal checkedLevel(double level, const char* name) {
    if (!std::isfinite(level)) {
        throw std::invalid_argument(std::string(name) + " level must be finite");
    }
    return toDecimal(level);
}

double floorTo(const Decimal& value, int decimals) {
    const Decimal scale = scaleFor(decimals);
    return toDouble(Decimal(boost::multiprecision::floor(value * scale)) / scale);
}

double ceilTo(const Decimal& value, int decimals) {
    const Decimal scale = scaleFor(decimals);
    return toDouble(Decimal(boost::multiprecision::ceil(value * scale)) / scale);
}

} // namespace

EntryTriggers TriggerCalculator::deriveTriggers(std::optional<double> support,
                                                std::optional<double> resistance,
                                                double bufferPercentage,
                                                int pricePrecision) {
    const Decimal buffer = toDecimal(bufferPercentage) / 100;

    EntryTriggers triggers;
    if (resistance) {
        triggers.longTrigger = floorTo(checkedLevel(*resistance, "Resistance") * (Decimal(1) - buffer), pricePrecision);
    }
    if (support) {
        triggers.shortTrigger = ceilTo(checkedLevel(*support, "Support") * (Decimal(1) + buffer), pricePrecision);
    }

    LOG_D("risk", "Derived triggers buffer={}% precision={} long={} short={}",
          bufferPercentage, pricePrecision,
          triggers.longTrigger ? std::to_string(*triggers.longTrigger) : std::string("N/A"),
          triggers.shortTrigger ? std::to_string(*triggers.shortTrigger) : std::string("N/A"));
    return triggers;
}

void TriggerCalculator::applyMissingTriggers(MarketLevels& levels, double bufferPercentage, int pricePrecision) {
    auto derived = deriveTriggers(levels.support, levels.resistance, bufferPercentage, pricePrecision);
    if (!levels.longTrigger) levels.longTrigger = derived.longTrigger;
    if (!levels.shortTrigger) levels.shortTrigger = derived.shortTrigger;
}

double TriggerCalculator::roundDown(double value, int decimals) {
    return floorTo(checkedLevel(value, "Value"), decimals);
}

double TriggerCalculator::roundUp(double value, int decimals) {
    return ceilTo(checkedLevel(value, "Value"), decimals);
}

} // namespace Vantage
