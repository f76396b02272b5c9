#include "EngineConfig.hpp"
#include "DurationCalculator.hpp"
#include "Log.hpp"
#include "PositionFormatter.hpp"
#include "RingBuffer.hpp"
#include "RiskCalculator.hpp"
#include "TriggerCalculator.hpp"
#include "VantageLogging.hpp"
#include "model/SnapshotJson.hpp"
#include "render/ChartRenderer.hpp"
#include "render/PainterChartBackend.hpp"
#include "render/RenderCapabilityRegistry.hpp"

#include <QGuiApplication>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>

using namespace Vantage;

namespace {

std::chrono::system_clock::time_point fromEpochMs(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

int run(int argc, char* argv[]) {
    EngineConfig config = argc > 2 ? EngineConfig::loadFromFile(argv[2]) : EngineConfig{};
    Log::applyConfiguredLevel(config.logLevel);

    MarketSnapshot snapshot = loadSnapshot(argv[1]);

    RenderCapabilityRegistry registry;
    registry.initializeDefaults();
    ChartRenderer renderer(std::make_unique<PainterChartBackend>(registry));

    std::vector<Candle> candles = snapshot.candles;
    if (!candles.empty()) {
        candles = RingBuffer<Candle>::withCapacity(std::min(config.candleWindow, candles.size()), candles).snapshot();
    }

    TriggerCalculator::applyMissingTriggers(snapshot.levels, config.triggerBufferPercentage, config.pricePrecision);

    std::optional<PositionOverlay> overlay;
    if (snapshot.position) {
        overlay = PositionOverlay::fromPosition(*snapshot.position);
        if (!candles.empty()) {
            double markPrice = candles.back().closePrice;
            double pnl = RiskCalculator::calcUnrealizedPnl(*snapshot.position, markPrice);
            vLog_App("Unrealized PnL at" << markPrice << "=" << pnl);
            snapshot.position->unrealizedPnl = pnl;
        }
        std::cout << PositionFormatter::getPositionDetailMsg(*snapshot.position) << std::endl;
    }

    std::cout << "Run: " << PositionFormatter::generateRunId() << std::endl;
    if (snapshot.startedAt_ms) {
        RunDuration duration = DurationCalculator::getRunDuration(fromEpochMs(*snapshot.startedAt_ms));
        std::cout << "Running for " << duration.runDurationDisplay << " (" << duration.runDurationInDays << " days)"
                  << std::endl;
    }

    CandleChartRequest request;
    request.symbol = snapshot.symbol;
    request.candles = std::move(candles);
    request.position = overlay;
    request.levels = snapshot.levels;
    request.outputDir = config.outputDir;
    if (config.writeFiles) {
        request.persistEndDate = snapshot.endDate_ms ? fromEpochMs(*snapshot.endDate_ms)
                                                     : std::chrono::system_clock::now();
    }

    RenderResult candleChart = renderer.renderCandleChart(request);
    std::cout << "Candle chart: " << candleChart.png.size() << " bytes";
    if (candleChart.writtenPath) std::cout << " -> " << *candleChart.writtenPath;
    std::cout << std::endl;

    QByteArray pnlChart = renderer.renderPnlProgression(snapshot.pnlHistory);
    std::cout << "PnL chart: " << pnlChart.size() << " bytes";
    if (config.writeFiles) {
        const auto path = (std::filesystem::path(config.outputDir) / "pnl_progression.png").string();
        if (auto error = ChartRenderer::persist(pnlChart, path)) {
            vLog_Error("Failed to persist PnL chart:" << QString::fromStdString(*error));
            std::cout << std::endl;
            return 1;
        }
        std::cout << " -> " << path;
    }
    std::cout << std::endl;

    return candleChart.persistError ? 1 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <snapshot.json> [config.json]" << std::endl;
        return 2;
    }

    // Headless rendering unless the caller picked a platform
    if (!qEnvironmentVariableIsSet("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);

    try {
        return run(argc, argv);
    }
    catch (const std::exception& ex) {
        vLog_Error("vantage_cli failed:" << ex.what());
        return 1;
    }
}
