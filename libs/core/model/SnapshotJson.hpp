#pragma once
// ─────────────────────────────────────────────────────────────
// SnapshotJson – JSON mapping for exchange-shaped records.
// A MarketSnapshot is what the exchange layer hands the chart
// pipeline for one render cycle.
// ─────────────────────────────────────────────────────────────
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "TradingTypes.hpp"

namespace Vantage {

struct MarketSnapshot {
    std::string symbol;
    std::vector<Candle> candles;
    std::optional<Position> position;
    MarketLevels levels;
    std::vector<PnLSample> pnlHistory;
    std::optional<int64_t> endDate_ms;
    std::optional<int64_t> startedAt_ms;
};

void from_json(const nlohmann::json& j, Candle& candle);
void from_json(const nlohmann::json& j, Position& position);
void from_json(const nlohmann::json& j, PnLSample& sample);
void from_json(const nlohmann::json& j, MarketLevels& levels);
void from_json(const nlohmann::json& j, MarketSnapshot& snapshot);

/// Throws std::runtime_error on I/O or schema errors, std::invalid_argument on an unknown side.
MarketSnapshot loadSnapshot(const std::string& path);

} // namespace Vantage
