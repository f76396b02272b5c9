#pragma once
// ─────────────────────────────────────────────────────────────
// TriggerCalculator – entry trigger levels derived from structure.
// Long trigger sits just under resistance, short trigger just above
// support, each snapped to the instrument's price precision.
// ─────────────────────────────────────────────────────────────
#include <optional>
#include "model/TradingTypes.hpp"

namespace Vantage {

struct EntryTriggers {
    std::optional<double> longTrigger;
    std::optional<double> shortTrigger;
};

class TriggerCalculator {
public:
    /**
     * longTrigger  = resistance * (1 - bufferPercentage / 100), rounded down
     * shortTrigger = support    * (1 + bufferPercentage / 100), rounded up
     * An absent level yields an absent trigger.
     * @throws std::invalid_argument if pricePrecision is negative or a level is not finite
     */
    static EntryTriggers deriveTriggers(std::optional<double> support,
                                        std::optional<double> resistance,
                                        double bufferPercentage,
                                        int pricePrecision);

    /// Fills longTrigger/shortTrigger on `levels` only where the caller left them empty.
    static void applyMissingTriggers(MarketLevels& levels, double bufferPercentage, int pricePrecision);

    static double roundDown(double value, int decimals);
    static double roundUp(double value, int decimals);
};

} // namespace Vantage
