#pragma once
#include <QString>
#include <utility>
#include <vector>
#include "../CoordinateSystem.h"

namespace Vantage {

struct AxisTick {
    double value = 0.0;
    double position = 0.0;   // canvas Y in pixels
    QString label;
};

/**
 * Linear price axis: nice-step tick generation and fixed-decimal labels.
 */
class PriceAxis {
public:
    static double calculateNiceStep(double range, int targetTicks);

    /// Ticks inside [priceMin, priceMax] of the viewport, labelled with `decimals` fixed places.
    static std::vector<AxisTick> buildTicks(const Viewport& viewport, int decimals, int targetTicks = 8);

    /// Expands [lo, hi] by `fraction` of its span on each side. A degenerate span is widened around its midpoint.
    static std::pair<double, double> paddedRange(double lo, double hi, double fraction = 0.05);

    static QString formatLabel(double value, int decimals);
};

} // namespace Vantage
