#include <gtest/gtest.h>
#include "RiskCalculator.hpp"
#include <cmath>
#include <limits>

using namespace Vantage;

namespace {

Position makePosition(PositionSide side, double avg, double size) {
    Position p;
    p.side = side;
    p.avgPrice = avg;
    p.size = size;
    p.leverage = 10;
    return p;
}

} // namespace

TEST(RiskCalculator, LiquidationPriceLong) {
    EXPECT_NEAR(RiskCalculator::calcLiquidationPrice(PositionSide::Long, 100.0, 10.0), 90.9091, 1e-4);
    EXPECT_DOUBLE_EQ(RiskCalculator::calcLiquidationPrice(PositionSide::Long, 100.0, 10.0), 1000.0 / 11.0);
}

TEST(RiskCalculator, LiquidationPriceShort) {
    EXPECT_NEAR(RiskCalculator::calcLiquidationPrice(PositionSide::Short, 100.0, 10.0), 111.1111, 1e-4);
}

TEST(RiskCalculator, LiquidationPriceFromText) {
    EXPECT_NEAR(RiskCalculator::calcLiquidationPrice(PositionSide::Long, std::string_view(" 100.00 "), 10.0), 90.9091, 1e-4);
    EXPECT_THROW(RiskCalculator::calcLiquidationPrice(PositionSide::Long, std::string_view("abc"), 10.0),
                 std::invalid_argument);
    EXPECT_THROW(RiskCalculator::calcLiquidationPrice(PositionSide::Long, std::string_view(""), 10.0),
                 std::invalid_argument);
}

TEST(RiskCalculator, LeverageMustExceedOneForBothSides) {
    for (PositionSide side : {PositionSide::Long, PositionSide::Short}) {
        EXPECT_THROW(RiskCalculator::calcLiquidationPrice(side, 100.0, 1.0), std::invalid_argument);
        EXPECT_THROW(RiskCalculator::calcLiquidationPrice(side, 100.0, 0.5), std::invalid_argument);
        EXPECT_THROW(RiskCalculator::calcLiquidationPrice(side, 100.0, std::nan("")), std::invalid_argument);
    }
}

TEST(RiskCalculator, UnknownSideIsRejected) {
    auto bogus = static_cast<PositionSide>(7);
    EXPECT_THROW(RiskCalculator::calcLiquidationPrice(bogus, 100.0, 10.0), std::invalid_argument);
}

TEST(RiskCalculator, UnrealizedPnlBySide) {
    EXPECT_DOUBLE_EQ(RiskCalculator::calcUnrealizedPnl(makePosition(PositionSide::Long, 100.0, 2.0), 110.0), 20.0);
    EXPECT_DOUBLE_EQ(RiskCalculator::calcUnrealizedPnl(makePosition(PositionSide::Short, 100.0, 2.0), 110.0), -20.0);
}

TEST(RiskCalculator, UnrealizedPnlIsDecimalExact) {
    // 0.3 - 0.1 in binary floating point is 0.19999999999999998
    EXPECT_DOUBLE_EQ(RiskCalculator::calcUnrealizedPnl(makePosition(PositionSide::Long, 0.1, 1.0), 0.3), 0.2);
}

TEST(RiskCalculator, UnrealizedPnlSignFlipsWithSide) {
    const double cases[][3] = {{100.0, 95.5, 0.3}, {67550.0, 67690.0, 0.02}, {1.2345, 1.2, 1000.0}, {50.0, 50.0, 3.0}};
    for (const auto& c : cases) {
        double longPnl = RiskCalculator::calcUnrealizedPnl(makePosition(PositionSide::Long, c[0], c[2]), c[1]);
        double shortPnl = RiskCalculator::calcUnrealizedPnl(makePosition(PositionSide::Short, c[0], c[2]), c[1]);
        EXPECT_DOUBLE_EQ(longPnl, -shortPnl);
    }
}

TEST(RiskCalculator, UnrealizedPnlPropagatesNonFinite) {
    auto pos = makePosition(PositionSide::Long, 100.0, 1.0);
    EXPECT_TRUE(std::isnan(RiskCalculator::calcUnrealizedPnl(pos, std::nan(""))));
    EXPECT_TRUE(std::isinf(RiskCalculator::calcUnrealizedPnl(pos, std::numeric_limits<double>::infinity())));
}

TEST(RiskCalculator, RandomNumberHasRequestedDigits) {
    for (int i = 0; i < 500; ++i) {
        auto three = RiskCalculator::generateRandomNumberOfLength(3);
        EXPECT_GE(three, 100);
        EXPECT_LE(three, 999);

        auto one = RiskCalculator::generateRandomNumberOfLength(1);
        EXPECT_GE(one, 0);
        EXPECT_LE(one, 9);
    }
    auto eighteen = RiskCalculator::generateRandomNumberOfLength(18);
    EXPECT_GE(eighteen, 100'000'000'000'000'000LL);
}

TEST(RiskCalculator, RandomNumberRejectsBadLength) {
    EXPECT_THROW(RiskCalculator::generateRandomNumberOfLength(0), std::invalid_argument);
    EXPECT_THROW(RiskCalculator::generateRandomNumberOfLength(-3), std::invalid_argument);
    EXPECT_THROW(RiskCalculator::generateRandomNumberOfLength(RiskCalculator::kMaxRandomDigits + 1),
                 std::invalid_argument);
}
