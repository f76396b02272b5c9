/*
Vantage — ChartAnnotationBuilder
Role: Turns a position overlay and the current market structure levels into an AnnotationSet.
Inputs/Outputs: optional<PositionOverlay> + MarketLevels in, AnnotationSet out.
Threading: Stateless static functions; thread-safe.
Performance: At most eight annotations per call.
Integration: Called by ChartRenderer::renderCandleChart for every render; sets are never reused.
Observability: Logs suppressed liquidation lines at debug level.
Related: ChartAnnotation.hpp, ChartPalette.hpp, RiskCalculator.hpp.
Assumptions: Levels are prices in quote currency; absent levels are std::nullopt, never 0.
*/
#pragma once
#include <optional>
#include <QString>
#include "ChartAnnotation.hpp"
#include "model/TradingTypes.hpp"

namespace Vantage {

struct PositionOverlay {
    PositionSide side = PositionSide::Long;
    double avgPrice = 0.0;
    std::optional<double> liquidationPrice;

    /**
     * Uses the record's liquidation price when present, otherwise derives it with
     * RiskCalculator when leverage > 1. Leverage <= 1 leaves it empty.
     */
    static PositionOverlay fromPosition(const Position& position);
};

class ChartAnnotationBuilder {
public:
    static AnnotationSet build(const std::optional<PositionOverlay>& position, const MarketLevels& levels);

    /**
     * Finite and positive, strictly below resistance when known and strictly
     * above support when known. With neither known only the first check applies.
     */
    static bool isLiquidationVisible(double liquidationPrice, const MarketLevels& levels);

    /// "<name>: <price with 4 decimals>"
    static QString formatLabel(const QString& name, double price);
};

} // namespace Vantage
