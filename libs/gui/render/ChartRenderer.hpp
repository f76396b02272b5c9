/*
Vantage — ChartRenderer
Role: Composes candle and PnL-progression charts into ChartScenes and rasterizes them through an IChartBackend.
Inputs/Outputs: CandleChartRequest / PnL history in; RenderResult (PNG bytes plus persistence outcome) out.
Threading: Holds only the backend; every call builds its own scene. Safe to call concurrently.
Performance: Dominated by backend rasterization of a 1000x1000 canvas.
Integration: Used by apps/vantage_cli; annotations come from ChartAnnotationBuilder on every call.
Observability: vLog_Render on each render; persistence failures via vLog_Error and RenderResult::persistError.
Related: ChartScene.hpp, IChartBackend.hpp, PainterChartBackend.hpp, ChartAnnotationBuilder.hpp.
Assumptions: Candles and PnL samples arrive in chronological order; they are never re-sorted.
*/
#pragma once
#include <QByteArray>
#include <QString>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "IChartBackend.hpp"
#include "ChartScene.hpp"
#include "../annotations/ChartAnnotationBuilder.hpp"
#include "model/TradingTypes.hpp"

namespace Vantage {

struct CandleChartRequest {
    std::string symbol;
    std::vector<Candle> candles;
    std::optional<PositionOverlay> position;
    MarketLevels levels;
    std::optional<std::chrono::system_clock::time_point> persistEndDate;   // set to write a file
    std::string outputDir = ".";
};

struct RenderResult {
    QByteArray png;
    std::optional<std::string> writtenPath;
    std::optional<std::string> persistError;
};

class ChartRenderer {
public:
    explicit ChartRenderer(std::unique_ptr<IChartBackend> backend);

    /// Backend exceptions propagate; a failed file write does not throw and is reported in the result.
    RenderResult renderCandleChart(const CandleChartRequest& request) const;
    QByteArray renderPnlProgression(const std::vector<PnLSample>& history) const;

    /// Writes png to path. Returns an error message on failure.
    static std::optional<std::string> persist(const QByteArray& png, const std::string& path);

    static ChartScene composeCandleScene(const std::string& symbol,
                                         const std::vector<Candle>& candles,
                                         const AnnotationSet& annotations,
                                         const std::optional<PositionOverlay>& position);
    static ChartScene composePnlScene(const std::vector<PnLSample>& history);

    /// "{symbol}_chart_{YYYY-MM-DD}_1m.png", date in UTC.
    static std::string chartFileName(const std::string& symbol, std::chrono::system_clock::time_point endDate);
    static QString formatPnlTooltip(double totalPnL);

private:
    std::unique_ptr<IChartBackend> m_backend;
};

} // namespace Vantage
