#include "ChartRenderer.hpp"
#include "../annotations/ChartPalette.hpp"
#include "../models/CategoryAxis.hpp"
#include "VantageLogging.hpp"
#include <QDateTime>
#include <QTimeZone>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace Vantage {

namespace {

QDateTime utcTime(int64_t timestamp_ms) {
    return QDateTime::fromMSecsSinceEpoch(timestamp_ms, QTimeZone::utc());
}

ChartSeries lineSeries(const QString& label, const QColor& color, std::vector<double> values, qreal width) {
    ChartSeries series;
    series.label = label;
    series.color = color;
    series.values = std::move(values);
    series.lineWidth = width;
    return series;
}

} // namespace

ChartRenderer::ChartRenderer(std::unique_ptr<IChartBackend> backend)
    : m_backend(std::move(backend)) {
    if (!m_backend) {
        throw std::invalid_argument("ChartRenderer: backend must not be null");
    }
}

ChartScene ChartRenderer::composeCandleScene(const std::string& symbol,
                                             const std::vector<Candle>& candles,
                                             const AnnotationSet& annotations,
                                             const std::optional<PositionOverlay>& position) {
    ChartScene scene;
    scene.title = QString::fromStdString(symbol);
    scene.yTickDecimals = 4;

    std::vector<double> highs, lows, closes;
    highs.reserve(candles.size());
    lows.reserve(candles.size());
    closes.reserve(candles.size());
    for (const auto& candle : candles) {
        highs.push_back(candle.highPrice);
        lows.push_back(candle.lowPrice);
        closes.push_back(candle.closePrice);
        scene.xLabels << utcTime(candle.timestamp_ms).toString(QStringLiteral("hh:mm"));
    }
    scene.visibleXLabels = CategoryAxis::selectLabelIndices(candles.size());

    scene.series.push_back(lineSeries(QStringLiteral("High"), ChartPalette::highLine(), std::move(highs), 1.0));
    scene.series.push_back(lineSeries(QStringLiteral("Low"), ChartPalette::lowLine(), std::move(lows), 1.0));
    scene.series.push_back(lineSeries(QStringLiteral("Close"), ChartPalette::closeLine(), std::move(closes), 2.0));
    scene.band = FilledBand{1, 0, ChartPalette::band()};

    if (position) {
        QColor avgColor = position->side == PositionSide::Long ? ChartPalette::positiveGreen()
                                                               : ChartPalette::negativeDarkRed();
        scene.series.push_back(lineSeries(QStringLiteral("Position Avg Price"), avgColor,
                                          std::vector<double>(candles.size(), position->avgPrice), 1.0));
    }

    for (const auto& [role, annotation] : annotations) {
        scene.annotations.push_back(annotation);
    }
    return scene;
}

ChartScene ChartRenderer::composePnlScene(const std::vector<PnLSample>& history) {
    ChartScene scene;
    scene.title = QStringLiteral("PnL Progression");
    scene.xAxisTitle = QStringLiteral("Time (ISO Format)");
    scene.yAxisTitle = QStringLiteral("Total PnL (USDT)");
    scene.yTickDecimals = 2;
    scene.rotateXLabels = true;

    std::vector<double> values;
    values.reserve(history.size());
    for (const auto& sample : history) {
        values.push_back(sample.totalPnL);
        scene.xLabels << utcTime(sample.timestamp_ms).toString(Qt::ISODateWithMs);
    }
    scene.visibleXLabels = CategoryAxis::selectLabelIndices(history.size());

    const double latest = history.empty() ? 0.0 : history.back().totalPnL;
    const QColor color = latest >= 0 ? ChartPalette::positiveGreen() : ChartPalette::negativeDarkRed();

    ChartSeries series = lineSeries(QStringLiteral("Total PnL (USDT)"), color, std::move(values), 2.0);
    series.drawPoints = true;
    scene.series.push_back(std::move(series));

    if (!history.empty()) {
        scene.callout = formatPnlTooltip(latest);
    }
    return scene;
}

RenderResult ChartRenderer::renderCandleChart(const CandleChartRequest& request) const {
    const AnnotationSet annotations = ChartAnnotationBuilder::build(request.position, request.levels);
    const ChartScene scene = composeCandleScene(request.symbol, request.candles, annotations, request.position);

    RenderResult result;
    result.png = m_backend->rasterize(scene);
    vLog_Render("Rendered" << QString::fromStdString(request.symbol) << "chart with" << request.candles.size()
                << "candles via" << m_backend->getBackendName());

    if (request.persistEndDate) {
        const auto path = (std::filesystem::path(request.outputDir) /
                           chartFileName(request.symbol, *request.persistEndDate)).string();
        if (auto error = persist(result.png, path)) {
            vLog_Error("Failed to persist chart:" << QString::fromStdString(*error));
            result.persistError = std::move(error);
        } else {
            result.writtenPath = path;
        }
    }
    return result;
}

QByteArray ChartRenderer::renderPnlProgression(const std::vector<PnLSample>& history) const {
    QByteArray png = m_backend->rasterize(composePnlScene(history));
    vLog_Render("Rendered PnL progression with" << history.size() << "samples");
    return png;
}

std::optional<std::string> ChartRenderer::persist(const QByteArray& png, const std::string& path) {
    // Written beside the target and renamed into place; a failed write leaves no file behind.
    const std::string staging = path + ".part";
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return fmt::format("cannot open {}: {}", staging, std::strerror(errno));
    }
    out.write(png.constData(), png.size());
    out.close();

    std::error_code ec;
    if (!out) {
        std::filesystem::remove(staging, ec);
        return fmt::format("write to {} failed", staging);
    }
    std::filesystem::rename(staging, path, ec);
    if (ec) {
        std::error_code removeEc;
        std::filesystem::remove(staging, removeEc);
        return fmt::format("cannot move {} to {}: {}", staging, path, ec.message());
    }
    return std::nullopt;
}

std::string ChartRenderer::chartFileName(const std::string& symbol, std::chrono::system_clock::time_point endDate) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(endDate);
    return fmt::format("{}_chart_{:%Y-%m-%d}_1m.png", symbol, fmt::gmtime(seconds));
}

QString ChartRenderer::formatPnlTooltip(double totalPnL) {
    return QString::fromStdString(fmt::format("PnL: {:.4f} USDT", totalPnL));
}

} // namespace Vantage
