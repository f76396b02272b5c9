/*
Vantage — CoordinateSystem
Role: Coordinate transformation between world (category index, price) and canvas pixels.
Inputs/Outputs: Takes world coordinates and a Viewport describing the plot rectangle; outputs QPointF.
Threading: Pure static functions; thread-safe.
Performance: All conversion methods are simple, fast arithmetic operations.
Integration: Used by PainterChartBackend and PriceAxis.
Observability: Logs invalid viewports at debug level.
Related: CoordinateSystem.cpp, PainterChartBackend.hpp, PriceAxis.hpp.
Assumptions: Assumes a linear mapping between world and screen coordinates.
*/
#pragma once
#include <QPointF>
#include <QString>

namespace Vantage {

struct Viewport {
    double xStart = 0.0;      // first category index
    double xEnd = 1.0;        // last category index
    double priceMin = 0.0;
    double priceMax = 0.0;
    double left = 0.0;        // plot origin on the canvas
    double top = 0.0;
    double width = 800.0;
    double height = 600.0;
};

class CoordinateSystem {
public:
    static QPointF worldToScreen(double x, double price, const Viewport& viewport);
    static QPointF screenToWorld(const QPointF& screenPos, const Viewport& viewport);
    static double priceToScreenY(double price, const Viewport& viewport);

    static bool validateViewport(const Viewport& viewport);
    static QString viewportDebugString(const Viewport& viewport);

private:
    static double normalizeX(double x, const Viewport& viewport);
    static double normalizePrice(double price, const Viewport& viewport);
    static constexpr double EPSILON = 1e-10;
};

} // namespace Vantage
