/*
Vantage — ChartRenderer Tests
Role: Verify scene composition and persistence without touching a raster engine
Testing Strategy: SpyChartBackend records the ChartScene handed to it
*/
#include <gtest/gtest.h>
#include "render/ChartRenderer.hpp"
#include "../fixtures/spy_chart_backend.hpp"
#include "annotations/ChartPalette.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace Vantage;

namespace {

std::vector<Candle> makeCandles(int count, int64_t startMs = 1717243200000) {
    std::vector<Candle> candles;
    for (int i = 0; i < count; ++i) {
        double close = 100.0 + i;
        candles.push_back({startMs + i * 60'000LL, close - 0.5, close + 1.0, close - 1.0, close});
    }
    return candles;
}

std::vector<PnLSample> makeHistory(const std::vector<double>& values) {
    std::vector<PnLSample> history;
    int64_t ts = 1717243200000;
    for (double v : values) {
        history.push_back({ts, v});
        ts += 3'600'000;
    }
    return history;
}

} // namespace

class ChartRendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        record = std::make_shared<SpyChartBackend::Record>();
        auto backend = std::make_unique<SpyChartBackend>(record);
        spy = backend.get();
        renderer = std::make_unique<ChartRenderer>(std::move(backend));
    }

    const ChartScene& lastScene() const {
        if (record->scenes.empty()) throw std::runtime_error("no scene recorded");
        return record->scenes.back();
    }

    std::shared_ptr<SpyChartBackend::Record> record;
    SpyChartBackend* spy = nullptr;
    std::unique_ptr<ChartRenderer> renderer;
};

TEST_F(ChartRendererTest, CandleSceneHasHighLowCloseAndBand) {
    CandleChartRequest request;
    request.symbol = "BTCUSDT";
    request.candles = makeCandles(5);

    auto result = renderer->renderCandleChart(request);
    EXPECT_EQ(result.png, QByteArray("PNGDATA"));
    EXPECT_FALSE(result.writtenPath.has_value());
    EXPECT_FALSE(result.persistError.has_value());

    const auto& scene = lastScene();
    EXPECT_EQ(scene.canvasSize, QSize(1000, 1000));
    EXPECT_EQ(scene.title, QStringLiteral("BTCUSDT"));
    ASSERT_EQ(scene.series.size(), 3u);
    EXPECT_EQ(scene.series[0].label, QStringLiteral("High"));
    EXPECT_EQ(scene.series[1].label, QStringLiteral("Low"));
    EXPECT_EQ(scene.series[2].label, QStringLiteral("Close"));
    EXPECT_DOUBLE_EQ(scene.series[0].values[4], 105.0);
    EXPECT_DOUBLE_EQ(scene.series[1].values[0], 99.0);
    ASSERT_TRUE(scene.band.has_value());
    EXPECT_EQ(scene.band->lowerSeries, 1u);
    EXPECT_EQ(scene.band->upperSeries, 0u);
    EXPECT_TRUE(scene.annotations.empty());
    ASSERT_EQ(scene.xLabels.size(), 5);
    EXPECT_EQ(scene.xLabels.front(), QStringLiteral("12:00"));
    EXPECT_EQ(scene.xLabels.back(), QStringLiteral("12:04"));
}

TEST_F(ChartRendererTest, ActivePositionAddsAvgSeriesAndAnnotations) {
    CandleChartRequest request;
    request.symbol = "BTCUSDT";
    request.candles = makeCandles(4);
    request.position = PositionOverlay{PositionSide::Short, 101.5, 95.0};
    request.levels.support = 90;
    request.levels.resistance = 110;

    renderer->renderCandleChart(request);
    const auto& scene = lastScene();

    ASSERT_EQ(scene.series.size(), 4u);
    EXPECT_EQ(scene.series[3].label, QStringLiteral("Position Avg Price"));
    EXPECT_EQ(scene.series[3].values, std::vector<double>(4, 101.5));

    // Ordered by role: support, resistance, liquidation, avg price
    ASSERT_EQ(scene.annotations.size(), 4u);
    EXPECT_EQ(scene.annotations[0].key, AnnotationRole::Support);
    EXPECT_EQ(scene.annotations[1].key, AnnotationRole::Resistance);
    EXPECT_EQ(scene.annotations[2].key, AnnotationRole::LiquidationPrice);
    EXPECT_EQ(scene.annotations[3].key, AnnotationRole::AvgPrice);
}

TEST_F(ChartRendererTest, AnnotationsAreRebuiltPerCall) {
    CandleChartRequest request;
    request.symbol = "ETHUSDT";
    request.candles = makeCandles(3);
    request.levels.support = 99;
    renderer->renderCandleChart(request);

    request.levels.support.reset();
    renderer->renderCandleChart(request);

    ASSERT_EQ(record->scenes.size(), 2u);
    EXPECT_EQ(record->scenes[0].annotations.size(), 1u);
    EXPECT_TRUE(record->scenes[1].annotations.empty());
}

TEST_F(ChartRendererTest, PersistsToDerivedFileName) {
    const auto dir = std::filesystem::temp_directory_path() / "vantage_render_test";
    std::filesystem::create_directories(dir);

    CandleChartRequest request;
    request.symbol = "SOLUSDT";
    request.candles = makeCandles(2);
    request.outputDir = dir.string();
    request.persistEndDate = std::chrono::system_clock::time_point(std::chrono::milliseconds(1717243200000));

    auto result = renderer->renderCandleChart(request);
    ASSERT_TRUE(result.writtenPath.has_value());
    EXPECT_FALSE(result.persistError.has_value());
    EXPECT_EQ(std::filesystem::path(*result.writtenPath).filename().string(), "SOLUSDT_chart_2024-06-01_1m.png");

    std::ifstream in(*result.writtenPath, std::ios::binary);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents, "PNGDATA");

    std::filesystem::remove_all(dir);
}

TEST_F(ChartRendererTest, PersistFailureIsReportedAndBufferKept) {
    CandleChartRequest request;
    request.symbol = "SOLUSDT";
    request.candles = makeCandles(2);
    request.outputDir = "/nonexistent/vantage/dir";
    request.persistEndDate = std::chrono::system_clock::now();

    RenderResult result;
    ASSERT_NO_THROW(result = renderer->renderCandleChart(request));
    EXPECT_EQ(result.png, QByteArray("PNGDATA"));
    EXPECT_FALSE(result.writtenPath.has_value());
    ASSERT_TRUE(result.persistError.has_value());
    EXPECT_FALSE(result.persistError->empty());
}

TEST_F(ChartRendererTest, FailedPersistLeavesNoPartialFile) {
    const auto dir = std::filesystem::temp_directory_path() / "vantage_render_blocked";
    std::filesystem::remove_all(dir);
    // A non-empty directory sitting at the target path makes the final move fail
    const auto target = dir / "SOLUSDT_chart_2024-06-01_1m.png";
    std::filesystem::create_directories(target);
    std::ofstream(target / "occupant").put('x');

    auto error = ChartRenderer::persist(QByteArray("PNGDATA"), target.string());
    ASSERT_TRUE(error.has_value());
    EXPECT_TRUE(std::filesystem::is_directory(target));
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        EXPECT_EQ(entry.path().filename().string(), target.filename().string());
    }

    std::filesystem::remove_all(dir);
}

TEST_F(ChartRendererTest, SuccessfulPersistLeavesOnlyTarget) {
    const auto dir = std::filesystem::temp_directory_path() / "vantage_render_single";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    const auto target = dir / "chart.png";

    ASSERT_FALSE(ChartRenderer::persist(QByteArray("PNGDATA"), target.string()).has_value());
    size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        EXPECT_EQ(entry.path().filename().string(), "chart.png");
        ++entries;
    }
    EXPECT_EQ(entries, 1u);

    std::filesystem::remove_all(dir);
}

TEST_F(ChartRendererTest, BackendFailurePropagates) {
    spy->failNext = true;
    CandleChartRequest request;
    request.symbol = "X";
    request.candles = makeCandles(2);
    EXPECT_THROW(renderer->renderCandleChart(request), std::runtime_error);
}

TEST_F(ChartRendererTest, PnlSceneColorFollowsLatestValue) {
    renderer->renderPnlProgression(makeHistory({-3.0, 1.0, 0.0}));
    EXPECT_EQ(lastScene().series.at(0).color, ChartPalette::positiveGreen());

    renderer->renderPnlProgression(makeHistory({5.0, 2.0, -0.01}));
    EXPECT_EQ(lastScene().series.at(0).color, ChartPalette::negativeDarkRed());

    renderer->renderPnlProgression({});
    EXPECT_EQ(lastScene().series.at(0).color, ChartPalette::positiveGreen());
    EXPECT_TRUE(lastScene().callout.isEmpty());
}

TEST_F(ChartRendererTest, PnlSceneLabelsAndFormatting) {
    renderer->renderPnlProgression(makeHistory({-1.0, 0.5, 2.34567}));
    const auto& scene = lastScene();

    EXPECT_EQ(scene.title, QStringLiteral("PnL Progression"));
    EXPECT_EQ(scene.series.at(0).label, QStringLiteral("Total PnL (USDT)"));
    EXPECT_TRUE(scene.series.at(0).drawPoints);
    EXPECT_EQ(scene.yTickDecimals, 2);
    EXPECT_TRUE(scene.rotateXLabels);
    EXPECT_EQ(scene.xLabels.front(), QStringLiteral("2024-06-01T12:00:00.000Z"));
    EXPECT_EQ(scene.callout, QStringLiteral("PnL: 2.3457 USDT"));
}

TEST_F(ChartRendererTest, PnlLabelsAreDownSampled) {
    std::vector<double> values(95, 1.0);
    renderer->renderPnlProgression(makeHistory(values));
    const auto& visible = lastScene().visibleXLabels;

    // step 9: 0, 9, ..., 90 plus the final index 94
    ASSERT_EQ(visible.size(), 12u);
    EXPECT_EQ(visible.front(), 0u);
    EXPECT_EQ(visible[1], 9u);
    EXPECT_EQ(visible.back(), 94u);
}

TEST(ChartRendererStatic, FileNameUsesUtcDate) {
    auto lateUtc = std::chrono::system_clock::time_point(std::chrono::milliseconds(1717285500000));  // 23:45 UTC
    EXPECT_EQ(ChartRenderer::chartFileName("BTCUSDT", lateUtc), "BTCUSDT_chart_2024-06-01_1m.png");
}

TEST(ChartRendererStatic, TooltipFormatting) {
    EXPECT_EQ(ChartRenderer::formatPnlTooltip(-0.5), QStringLiteral("PnL: -0.5000 USDT"));
    EXPECT_EQ(ChartRenderer::formatPnlTooltip(12.0), QStringLiteral("PnL: 12.0000 USDT"));
}

TEST(ChartRendererStatic, NullBackendIsRejected) {
    EXPECT_THROW(ChartRenderer(nullptr), std::invalid_argument);
}
