/*
Vantage — TradingTypes
Role: Plain value types exchanged between the exchange layer, the risk calculators and the chart renderer.
Inputs/Outputs: Constructed from exchange records or snapshot files; consumed by value or const reference.
Threading: Immutable after construction in practice; safe to copy across threads.
Performance: Trivially copyable except for the string fields on Position.
Integration: Used by RiskCalculator, TriggerCalculator, ChartAnnotationBuilder and ChartRenderer.
Observability: None.
Related: TradingTypes.cpp, SnapshotJson.hpp.
Assumptions: Candle and PnL sequences are supplied in chronological order and are never re-sorted here.
*/
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Vantage {

enum class PositionSide {
    Long,
    Short
};

/// Accepts "long"/"short" in any case. Throws std::invalid_argument otherwise.
PositionSide parsePositionSide(std::string_view text);
const char* toString(PositionSide side);

struct Candle {
    int64_t timestamp_ms = 0;
    double openPrice = 0.0;
    double highPrice = 0.0;
    double lowPrice = 0.0;
    double closePrice = 0.0;
};

struct Position {
    PositionSide side = PositionSide::Long;
    double avgPrice = 0.0;
    double size = 0.0;
    double leverage = 1.0;

    // Optional exchange record fields, only read by formatters.
    int64_t id = 0;
    std::string symbol;
    double notional = 0.0;
    double realizedPnl = 0.0;
    double unrealizedPnl = 0.0;
    std::optional<double> liquidationPrice;
};

struct PnLSample {
    int64_t timestamp_ms = 0;
    double totalPnL = 0.0;
};

// One optional value per structural role; absence is a state, not a sentinel price.
struct MarketLevels {
    std::optional<double> support;
    std::optional<double> resistance;
    std::optional<double> longTrigger;
    std::optional<double> shortTrigger;
    std::optional<double> trailingStopRaw;
    std::optional<double> trailingStopBuffered;
};

} // namespace Vantage
