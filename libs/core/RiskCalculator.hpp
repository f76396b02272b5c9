/*
Vantage — RiskCalculator
Role: Exact position risk figures: unrealized PnL and isolated-margin liquidation price.
Inputs/Outputs: Position snapshots, mark prices and leverage; returns doubles computed in base-10.
Threading: Stateless static functions. generateRandomNumberOfLength uses a thread_local engine.
Performance: Each call does a handful of 50-digit decimal operations.
Integration: Consumed by bot orchestration and by PositionOverlay when a record lacks a liquidation price.
Observability: Rejected inputs are logged at WARN under the "risk" category before throwing.
Related: RiskCalculator.cpp, Decimal.hpp, TradingTypes.hpp.
Assumptions: Callers that need exact decimal results must stay in Decimal themselves; doubles leave here.
*/
#pragma once
#include <cstdint>
#include <string_view>
#include "model/TradingTypes.hpp"

namespace Vantage {

class RiskCalculator {
public:
    /**
     * Long:  (markPrice - avgPrice) * size
     * Short: (avgPrice - markPrice) * size
     * Inputs are not validated; a non-finite input yields a non-finite result.
     */
    static double calcUnrealizedPnl(const Position& position, double markPrice);

    /**
     * Long:  avgPrice * leverage / (leverage + 1)
     * Short: avgPrice * leverage / (leverage - 1)
     * @throws std::invalid_argument if leverage <= 1 (either side), avgPrice is not finite,
     *         or side is not a recognised PositionSide value
     */
    static double calcLiquidationPrice(PositionSide side, double avgPrice, double leverage);

    /// Same as above with avgPrice supplied as text (e.g. straight from an exchange payload).
    static double calcLiquidationPrice(PositionSide side, std::string_view avgPrice, double leverage);

    /**
     * Uniform integer with exactly `length` decimal digits. length 1 yields [0, 9];
     * longer lengths never have a leading zero.
     * @throws std::invalid_argument if length <= 0 or length > kMaxRandomDigits
     */
    static int64_t generateRandomNumberOfLength(int length);

    static constexpr int kMaxRandomDigits = 18;
};

} // namespace Vantage
