/*
Vantage — PainterChartBackend
Role: Rasterizes a ChartScene to PNG with Qt's QPainter raster engine.
Inputs/Outputs: ChartScene in, PNG-encoded QByteArray out.
Threading: rasterize() owns its QImage and QPainter; concurrent calls share only the frozen registry.
Performance: One full-canvas paint per call; no caching between calls.
Integration: Default backend behind ChartRenderer. Requires an initialised RenderCapabilityRegistry.
Observability: vLog_Render per rasterization; errors surface as exceptions.
Related: IChartBackend.hpp, ChartScene.hpp, CoordinateSystem.h, PriceAxis.hpp.
Assumptions: A QGuiApplication exists (offscreen platform is fine).
*/
#pragma once
#include <QRectF>
#include "IChartBackend.hpp"
#include "RenderCapabilityRegistry.hpp"
#include "../CoordinateSystem.h"

class QPainter;

namespace Vantage {

struct ChartScene;

struct ChartMargins {
    double left = 90.0;
    double right = 30.0;
    double top = 70.0;
    double bottom = 70.0;
    double rotatedLabelBottom = 170.0;
};

class PainterChartBackend : public IChartBackend {
public:
    explicit PainterChartBackend(const RenderCapabilityRegistry& registry, ChartMargins margins = {});

    /**
     * @throws std::logic_error if the registry is not initialised or lacks an element the scene needs
     * @throws std::runtime_error if PNG encoding fails
     */
    QByteArray rasterize(const ChartScene& scene) const override;
    const char* getBackendName() const override { return "QPainterRaster"; }

    /// Plot rectangle and value range the scene maps onto.
    Viewport computeViewport(const ChartScene& scene) const;

private:
    void ensureSupported(const ChartScene& scene) const;

    void drawTitle(QPainter& painter, const ChartScene& scene) const;
    void drawLegend(QPainter& painter, const ChartScene& scene) const;
    void drawYAxis(QPainter& painter, const ChartScene& scene, const Viewport& viewport) const;
    void drawXAxis(QPainter& painter, const ChartScene& scene, const Viewport& viewport) const;
    void drawBand(QPainter& painter, const ChartScene& scene, const Viewport& viewport) const;
    void drawSeries(QPainter& painter, const ChartScene& scene, const Viewport& viewport) const;
    void drawAnnotations(QPainter& painter, const ChartScene& scene, const Viewport& viewport) const;
    void drawCallout(QPainter& painter, const ChartScene& scene, const Viewport& viewport) const;

    static QRectF plotRect(const Viewport& viewport);

    const RenderCapabilityRegistry& m_registry;
    ChartMargins m_margins;
};

} // namespace Vantage
