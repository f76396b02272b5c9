#include <gtest/gtest.h>
#include "PositionFormatter.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

using namespace Vantage;
using namespace Vantage::PositionFormatter;

TEST(PositionFormatter, FeeAwareLine) {
    FeeAwarePnL summary{1.1, 0.1, 1.0};
    EXPECT_EQ(formatFeeAwarePnLLine(summary),
              "Realized PnL: 🟩 $1.0000 | Fees: -$0.1000 | Gross (without fees): 🟩 $1.1000");
}

TEST(PositionFormatter, FeeAwareLineMissingValues) {
    FeeAwarePnL summary{-2.0, std::nullopt, std::nan("")};
    EXPECT_EQ(formatFeeAwarePnLLine(summary, 2),
              "Realized PnL: 🟥 $N/A | Fees: -$N/A | Gross (without fees): 🟥 $-2.00");
}

TEST(PositionFormatter, PositionDetail) {
    Position position;
    position.id = 42;
    position.side = PositionSide::Short;
    position.leverage = 10;
    position.size = 0.5;
    position.notional = 50;
    position.avgPrice = 100;
    position.realizedPnl = 1.5;
    position.unrealizedPnl = -3;

    EXPECT_EQ(getPositionDetailMsg(position),
              "\nID: 42\nSide: short\nLeverage: X10\nSize: 0.5\nNotional Value: 50\n\n"
              "Liquidation Price: N/A\nAvg Price: 100\n\n"
              "Realized PnL: 1.5\nUnrealized PnL: 🟥 -3");

    position.liquidationPrice = 111.5;
    EXPECT_NE(getPositionDetailMsg(position).find("Liquidation Price: 111.5\n"), std::string::npos);
}

TEST(PositionFormatter, PositionDetailWithFees) {
    Position position;
    position.realizedPnl = 2.0;
    PositionDetailOptions options;
    options.feeSummary = FeeAwarePnL{std::nullopt, 0.25, 1.75};
    options.digits = 2;

    auto msg = getPositionDetailMsg(position, options);
    EXPECT_NE(msg.find("Realized PnL: 🟩 $1.75 | Fees: -$0.25 | Gross (without fees): 🟩 $2.00"), std::string::npos);
}

TEST(PositionFormatter, PlacedOrders) {
    EXPECT_EQ(getPlacedOrdersMsg({"a1"}, {"link"}), "\nOrder Id: a1\nOrder Link Id: link");
    EXPECT_EQ(getPlacedOrdersMsg({"a1", "b2"}, {"l1", "l2"}), "\nOrder Ids: [a1,b2]\nOrder Link Ids: [l1,l2]");
}

TEST(PositionFormatter, SameOrderLinkId) {
    EXPECT_TRUE(isSameOrderLinkId("entry", "entry"));
    EXPECT_TRUE(isSameOrderLinkId("entry-3", "entry"));
    EXPECT_TRUE(isSameOrderLinkId("entry-123", "entry"));
    EXPECT_FALSE(isSameOrderLinkId("entry-", "entry"));
    EXPECT_FALSE(isSameOrderLinkId("entry-x", "entry"));
    EXPECT_FALSE(isSameOrderLinkId("entryfoo", "entry"));
    EXPECT_FALSE(isSameOrderLinkId("ent", "entry"));
}

TEST(PositionFormatter, RandomString) {
    auto s = generateRandomString(12);
    ASSERT_EQ(s.size(), 12u);
    for (char c : s) {
        EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'z'));
    }
    EXPECT_TRUE(generateRandomString(0).empty());
    EXPECT_THROW(generateRandomString(-1), std::invalid_argument);
}

TEST(PositionFormatter, RunIdShape) {
    auto id = generateRunId();
    // adjective_animal_YYYY-MM-DD_xxxx
    auto last = id.rfind('_');
    ASSERT_NE(last, std::string::npos);
    EXPECT_EQ(id.size() - last - 1, 4u);
    auto dateStart = id.rfind('_', last - 1);
    ASSERT_NE(dateStart, std::string::npos);
    EXPECT_EQ(last - dateStart - 1, 10u);
    EXPECT_EQ(std::count(id.begin(), id.end(), '_'), 3);
}
