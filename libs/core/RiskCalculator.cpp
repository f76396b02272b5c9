#include "RiskCalculator.hpp"
#include "Decimal.hpp"
#include "Log.hpp"
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

namespace Vantage {

namespace {

Decimal liquidationPriceFor(PositionSide side, const Decimal& avgPrice, double leverage) {
    if (!(leverage > 1.0) || !std::isfinite(leverage)) {
        LOG_W("risk", "Rejected liquidation price request: leverage={} side={}", leverage, static_cast<int>(side));
        throw std::invalid_argument("Leverage must be greater than 1 to compute a liquidation price");
    }

    const Decimal lev = toDecimal(leverage);
    switch (side) {
        case PositionSide::Long:
            return avgPrice * lev / (lev + 1);
        case PositionSide::Short:
            return avgPrice * lev / (lev - 1);
    }
    LOG_W("risk", "Rejected liquidation price request: unknown side value {}", static_cast<int>(side));
    throw std::invalid_argument("Invalid position side for liquidation price");
}

std::mt19937_64& randomEngine() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

} // namespace

double RiskCalculator::calcUnrealizedPnl(const Position& position, double markPrice) {
    const bool finiteInputs = std::isfinite(markPrice) && std::isfinite(position.avgPrice) && std::isfinite(position.size);
    if (!finiteInputs) {
        // No decimal form exists; let IEEE propagation produce the non-finite result.
        return position.side == PositionSide::Long
            ? (markPrice - position.avgPrice) * position.size
            : (position.avgPrice - markPrice) * position.size;
    }

    const Decimal mark = toDecimal(markPrice);
    const Decimal avg = toDecimal(position.avgPrice);
    const Decimal size = toDecimal(position.size);

    switch (position.side) {
        case PositionSide::Long:
            return toDouble((mark - avg) * size);
        case PositionSide::Short:
            return toDouble((avg - mark) * size);
    }
    throw std::invalid_argument("Invalid position side for unrealized PnL");
}

double RiskCalculator::calcLiquidationPrice(PositionSide side, double avgPrice, double leverage) {
    if (!std::isfinite(avgPrice)) {
        LOG_W("risk", "Rejected liquidation price request: avgPrice={}", avgPrice);
        throw std::invalid_argument("Average price must be finite to compute a liquidation price");
    }
    return toDouble(liquidationPriceFor(side, toDecimal(avgPrice), leverage));
}

double RiskCalculator::calcLiquidationPrice(PositionSide side, std::string_view avgPrice, double leverage) {
    return toDouble(liquidationPriceFor(side, parseDecimal(avgPrice), leverage));
}

int64_t RiskCalculator::generateRandomNumberOfLength(int length) {
    if (length <= 0 || length > kMaxRandomDigits) {
        throw std::invalid_argument("Random number length must be between 1 and " +
                                    std::to_string(kMaxRandomDigits) + ", got " + std::to_string(length));
    }

    int64_t upper = 1;
    for (int i = 0; i < length; ++i) upper *= 10;
    const int64_t lower = length == 1 ? 0 : upper / 10;

    std::uniform_int_distribution<int64_t> dist(lower, upper - 1);
    return dist(randomEngine());
}

} // namespace Vantage
