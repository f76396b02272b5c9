#pragma once
// ─────────────────────────────────────────────────────────────
// PositionFormatter – text blocks that accompany rendered charts
// (position detail, fee-aware PnL line, order ids) plus the
// short random identifiers used for order links and runs.
// ─────────────────────────────────────────────────────────────
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "model/TradingTypes.hpp"

namespace Vantage::PositionFormatter {

struct FeeAwarePnL {
    std::optional<double> grossPnl;
    std::optional<double> feeEstimate;
    std::optional<double> netPnl;
};

struct PositionDetailOptions {
    std::optional<FeeAwarePnL> feeSummary;
    int digits = 4;
};

/// "Realized PnL: 🟩 $1.0000 | Fees: -$0.1000 | Gross (without fees): 🟩 $1.1000"
/// Missing or non-finite values print as N/A.
std::string formatFeeAwarePnLLine(const FeeAwarePnL& summary, int decimals = 4);

std::string getPositionDetailMsg(const Position& position, const PositionDetailOptions& options = {});

std::string getPlacedOrdersMsg(const std::vector<std::string>& orderIds,
                               const std::vector<std::string>& orderLinkIds);

/// True for `base` itself or `base-<digits>` (retry suffix).
bool isSameOrderLinkId(std::string_view input, std::string_view base);

/// Lower-case base-36 string of exactly `length` characters. Throws std::invalid_argument if length < 0.
std::string generateRandomString(int length);

/// "adjective_animal_YYYY-MM-DD_xxxx", date in local time.
std::string generateRunId(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

} // namespace Vantage::PositionFormatter
