#include "CoordinateSystem.h"
#include "VantageLogging.hpp"
#include <QtGlobal>
#include <cmath>

namespace Vantage {

QPointF CoordinateSystem::worldToScreen(double x, double price, const Viewport& viewport) {
    if (!validateViewport(viewport)) {
        vLog_Debug("Invalid viewport:" << viewportDebugString(viewport));
        return QPointF(viewport.left, viewport.top);
    }

    double normalizedX = normalizeX(x, viewport);
    double normalizedPrice = normalizePrice(price, viewport);

    // Clamp to avoid rendering outside the plot rectangle
    normalizedX = qBound(0.0, normalizedX, 1.0);
    normalizedPrice = qBound(0.0, normalizedPrice, 1.0);

    double sx = viewport.left + normalizedX * viewport.width;
    double sy = viewport.top + (1.0 - normalizedPrice) * viewport.height;  // Flip Y for screen coordinates

    return QPointF(sx, sy);
}

QPointF CoordinateSystem::screenToWorld(const QPointF& screenPos, const Viewport& viewport) {
    if (!validateViewport(viewport)) {
        return QPointF(0, 0);
    }

    double normalizedX = (screenPos.x() - viewport.left) / viewport.width;
    double normalizedPrice = 1.0 - ((screenPos.y() - viewport.top) / viewport.height);

    double x = viewport.xStart + normalizedX * (viewport.xEnd - viewport.xStart);
    double price = viewport.priceMin + normalizedPrice * (viewport.priceMax - viewport.priceMin);

    return QPointF(x, price);
}

double CoordinateSystem::priceToScreenY(double price, const Viewport& viewport) {
    return worldToScreen(viewport.xStart, price, viewport).y();
}

bool CoordinateSystem::validateViewport(const Viewport& viewport) {
    return viewport.xEnd > viewport.xStart &&
           viewport.priceMax > viewport.priceMin &&
           std::isfinite(viewport.priceMin) && std::isfinite(viewport.priceMax) &&
           viewport.width > EPSILON &&
           viewport.height > EPSILON;
}

QString CoordinateSystem::viewportDebugString(const Viewport& viewport) {
    return QString("Viewport{x: %1-%2, price: %3-%4, rect: %5,%6 %7x%8}")
        .arg(viewport.xStart)
        .arg(viewport.xEnd)
        .arg(viewport.priceMin)
        .arg(viewport.priceMax)
        .arg(viewport.left)
        .arg(viewport.top)
        .arg(viewport.width)
        .arg(viewport.height);
}

double CoordinateSystem::normalizeX(double x, const Viewport& viewport) {
    double range = viewport.xEnd - viewport.xStart;
    if (range <= EPSILON) return 0.0;

    return (x - viewport.xStart) / range;
}

double CoordinateSystem::normalizePrice(double price, const Viewport& viewport) {
    // Span is scale-free: sub-cent tokens can have ranges well below EPSILON
    double priceRange = viewport.priceMax - viewport.priceMin;
    if (!(priceRange > 0.0)) return 0.0;

    return (price - viewport.priceMin) / priceRange;
}

} // namespace Vantage
