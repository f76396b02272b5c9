#include "PositionFormatter.hpp"
#include "StringUtils.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <array>
#include <cmath>
#include <ctime>
#include <random>
#include <stdexcept>

namespace Vantage::PositionFormatter {

namespace {

constexpr const char* kPositiveIcon = "🟩";
constexpr const char* kNegativeIcon = "🟥";

std::string formatNumberOrFallback(const std::optional<double>& value, int decimals) {
    if (!value || !std::isfinite(*value)) return "N/A";
    return fmt::format("{:.{}f}", *value, decimals);
}

const char* iconFor(const std::optional<double>& value) {
    return value && *value > 0 ? kPositiveIcon : kNegativeIcon;
}

std::mt19937& randomEngine() {
    thread_local std::mt19937 engine{std::random_device{}()};
    return engine;
}

template <std::size_t N>
const char* pickRandom(const std::array<const char*, N>& items) {
    std::uniform_int_distribution<std::size_t> dist(0, N - 1);
    return items[dist(randomEngine())];
}

constexpr std::array<const char*, 16> kAdjectives = {
    "brave", "quick", "clever", "happy", "sneaky", "nimble", "wise", "gentle", "feisty", "bold",
    "mighty", "silent", "curious", "jolly", "daring", "rich"
};

constexpr std::array<const char*, 19> kAnimals = {
    "cat", "dog", "bear", "fox", "owl", "koala", "lion", "tiger", "rabbit", "wolf",
    "eagle", "panda", "snake", "otter", "frog", "whale", "dolphin", "mouse", "moose"
};

} // namespace

std::string formatFeeAwarePnLLine(const FeeAwarePnL& summary, int decimals) {
    return fmt::format("Realized PnL: {} ${} | Fees: -${} | Gross (without fees): {} ${}",
                       iconFor(summary.netPnl),
                       formatNumberOrFallback(summary.netPnl, decimals),
                       formatNumberOrFallback(summary.feeEstimate, decimals),
                       iconFor(summary.grossPnl),
                       formatNumberOrFallback(summary.grossPnl, decimals));
}

std::string getPositionDetailMsg(const Position& position, const PositionDetailOptions& options) {
    std::string realizedLine;
    if (options.feeSummary) {
        FeeAwarePnL summary = *options.feeSummary;
        if (!summary.grossPnl) summary.grossPnl = position.realizedPnl;
        realizedLine = formatFeeAwarePnLLine(summary, options.digits);
    } else {
        realizedLine = fmt::format("Realized PnL: {}", position.realizedPnl);
    }

    const std::string liquidation = position.liquidationPrice
        ? fmt::format("{}", *position.liquidationPrice)
        : std::string("N/A");

    return fmt::format(
        "\nID: {}\nSide: {}\nLeverage: X{}\nSize: {}\nNotional Value: {}\n\n"
        "Liquidation Price: {}\nAvg Price: {}\n\n"
        "{}\nUnrealized PnL: {} {}",
        position.id, toString(position.side), position.leverage, position.size, position.notional,
        liquidation, position.avgPrice,
        realizedLine, position.unrealizedPnl > 0 ? kPositiveIcon : kNegativeIcon, position.unrealizedPnl);
}

std::string getPlacedOrdersMsg(const std::vector<std::string>& orderIds,
                               const std::vector<std::string>& orderLinkIds) {
    const std::string idLine = orderIds.size() == 1
        ? fmt::format("Order Id: {}", orderIds.front())
        : fmt::format("Order Ids: [{}]", fmt::join(orderIds, ","));
    const std::string linkLine = orderLinkIds.size() == 1
        ? fmt::format("Order Link Id: {}", orderLinkIds.front())
        : fmt::format("Order Link Ids: [{}]", fmt::join(orderLinkIds, ","));
    return fmt::format("\n{}\n{}", idLine, linkLine);
}

bool isSameOrderLinkId(std::string_view input, std::string_view base) {
    if (input.substr(0, base.size()) != base) return false;
    auto rest = input.substr(base.size());
    if (rest.empty()) return true;
    return rest.front() == '-' && StringUtils::isAllDigits(rest.substr(1));
}

std::string generateRandomString(int length) {
    if (length < 0) {
        throw std::invalid_argument("Random string length must be non-negative");
    }
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<int> dist(0, 35);
    std::string out;
    out.reserve(static_cast<std::size_t>(length));
    for (int i = 0; i < length; ++i) {
        out.push_back(kAlphabet[dist(randomEngine())]);
    }
    return out;
}

std::string generateRunId(std::chrono::system_clock::time_point now) {
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    return fmt::format("{}_{}_{:%Y-%m-%d}_{}",
                       pickRandom(kAdjectives), pickRandom(kAnimals),
                       fmt::localtime(t), generateRandomString(4));
}

} // namespace Vantage::PositionFormatter
