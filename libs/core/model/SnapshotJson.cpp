#include "SnapshotJson.hpp"
#include "../Log.hpp"
#include <fstream>
#include <stdexcept>

namespace Vantage {

namespace {

std::optional<double> optionalNumber(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<double>();
}

std::optional<int64_t> optionalInteger(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<int64_t>();
}

} // namespace

void from_json(const nlohmann::json& j, Candle& candle) {
    j.at("timestamp").get_to(candle.timestamp_ms);
    candle.highPrice = j.at("highPrice").get<double>();
    candle.lowPrice = j.at("lowPrice").get<double>();
    candle.closePrice = j.at("closePrice").get<double>();
    candle.openPrice = j.value("openPrice", candle.closePrice);
}

void from_json(const nlohmann::json& j, Position& position) {
    position.side = parsePositionSide(j.at("side").get<std::string>());
    position.avgPrice = j.at("avgPrice").get<double>();
    position.size = j.at("size").get<double>();
    position.leverage = j.at("leverage").get<double>();
    position.id = j.value("id", int64_t{0});
    position.symbol = j.value("symbol", std::string());
    position.notional = j.value("notional", 0.0);
    position.realizedPnl = j.value("realizedPnl", 0.0);
    position.unrealizedPnl = j.value("unrealizedPnl", 0.0);
    position.liquidationPrice = optionalNumber(j, "liquidationPrice");
}

void from_json(const nlohmann::json& j, PnLSample& sample) {
    j.at("timestamp").get_to(sample.timestamp_ms);
    j.at("totalPnL").get_to(sample.totalPnL);
}

void from_json(const nlohmann::json& j, MarketLevels& levels) {
    levels.support = optionalNumber(j, "support");
    levels.resistance = optionalNumber(j, "resistance");
    levels.longTrigger = optionalNumber(j, "longTrigger");
    levels.shortTrigger = optionalNumber(j, "shortTrigger");
    levels.trailingStopRaw = optionalNumber(j, "trailingStopRaw");
    levels.trailingStopBuffered = optionalNumber(j, "trailingStopBuffered");
}

void from_json(const nlohmann::json& j, MarketSnapshot& snapshot) {
    snapshot.symbol = j.at("symbol").get<std::string>();
    snapshot.candles = j.value("candles", std::vector<Candle>{});
    if (auto it = j.find("position"); it != j.end() && !it->is_null()) {
        snapshot.position = it->get<Position>();
    }
    if (auto it = j.find("levels"); it != j.end() && !it->is_null()) {
        snapshot.levels = it->get<MarketLevels>();
    }
    snapshot.pnlHistory = j.value("pnlHistory", std::vector<PnLSample>{});
    snapshot.endDate_ms = optionalInteger(j, "endDate");
    snapshot.startedAt_ms = optionalInteger(j, "startedAt");
}

MarketSnapshot loadSnapshot(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("📄 Snapshot: Failed to open snapshot file: " + path);
    }

    nlohmann::json document;
    try {
        file >> document;
    }
    catch (const std::exception& ex) {
        throw std::runtime_error("📄 Snapshot: Failed to parse JSON from snapshot file: " + std::string(ex.what()));
    }

    try {
        auto snapshot = document.get<MarketSnapshot>();
        LOG_I("snapshot", "Loaded {} with {} candles, {} PnL samples, position={}",
              snapshot.symbol, snapshot.candles.size(), snapshot.pnlHistory.size(),
              snapshot.position ? toString(snapshot.position->side) : "none");
        return snapshot;
    }
    catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("📄 Snapshot: Invalid snapshot schema: " + std::string(ex.what()));
    }
}

} // namespace Vantage
