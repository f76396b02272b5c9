#include "PriceAxis.hpp"
#include "VantageLogging.hpp"
#include <algorithm>
#include <cmath>

namespace Vantage {

double PriceAxis::calculateNiceStep(double range, int targetTicks) {
    if (!(range > 0) || targetTicks <= 0) return 1.0;

    double rawStep = range / targetTicks;
    double magnitude = std::pow(10.0, std::floor(std::log10(rawStep)));
    double normalizedStep = rawStep / magnitude;

    double niceStep;
    if (normalizedStep <= 1.0) {
        niceStep = 1.0;
    } else if (normalizedStep <= 2.0) {
        niceStep = 2.0;
    } else if (normalizedStep <= 2.5) {
        niceStep = 2.5;  // Common for prices
    } else if (normalizedStep <= 5.0) {
        niceStep = 5.0;
    } else {
        niceStep = 10.0;
    }

    return niceStep * magnitude;
}

std::vector<AxisTick> PriceAxis::buildTicks(const Viewport& viewport, int decimals, int targetTicks) {
    std::vector<AxisTick> ticks;
    if (!CoordinateSystem::validateViewport(viewport)) return ticks;

    double step = calculateNiceStep(viewport.priceMax - viewport.priceMin, std::clamp(targetTicks, 2, 20));
    double firstTick = std::ceil(viewport.priceMin / step) * step;

    // Index-based to avoid accumulating floating point drift
    for (int i = 0;; ++i) {
        double price = firstTick + i * step;
        if (price > viewport.priceMax + step * 1e-6) break;
        ticks.push_back({price, CoordinateSystem::priceToScreenY(price, viewport), formatLabel(price, decimals)});
    }

    vLog_Debug("PriceAxis: Generated" << ticks.size() << "ticks for range" << viewport.priceMin
               << "-" << viewport.priceMax << "step=" << step);
    return ticks;
}

std::pair<double, double> PriceAxis::paddedRange(double lo, double hi, double fraction) {
    if (lo > hi) std::swap(lo, hi);
    double span = hi - lo;
    if (span <= 0.0) {
        double half = std::max(std::abs(lo) * fraction, 1.0);
        return {lo - half, hi + half};
    }
    return {lo - span * fraction, hi + span * fraction};
}

QString PriceAxis::formatLabel(double value, int decimals) {
    // Avoid printing "-0.00"
    if (std::abs(value) < 0.5 * std::pow(10.0, -decimals)) value = 0.0;
    return QString::number(value, 'f', std::max(0, decimals));
}

} // namespace Vantage
