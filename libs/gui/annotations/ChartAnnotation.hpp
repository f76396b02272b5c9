/*
Vantage — ChartAnnotation
Role: Value types for the horizontal reference lines drawn over a price chart.
Inputs/Outputs: Produced by ChartAnnotationBuilder; consumed by ChartRenderer and the chart backends.
Threading: Immutable value types; safe to copy across threads.
Performance: One small map per render call.
Integration: AnnotationSet is ordered by role so scenes are drawn deterministically.
Observability: None.
Related: ChartAnnotationBuilder.hpp, ChartPalette.hpp.
Assumptions: Exactly one annotation per role.
*/
#pragma once
#include <QColor>
#include <QString>
#include <QVector>
#include <map>

namespace Vantage {

enum class AnnotationRole {
    Support,
    Resistance,
    LongTrigger,
    ShortTrigger,
    TrailingStopRaw,
    TrailingStopBuffered,
    LiquidationPrice,
    AvgPrice
};

// Which edge of the plot the label box is pinned to.
enum class LabelAnchor {
    Start,
    End
};

struct Annotation {
    AnnotationRole key = AnnotationRole::Support;
    double priceLevel = 0.0;
    QColor color;
    QVector<qreal> dashPattern;   // pixel lengths, on/off alternating
    QString label;
    LabelAnchor labelAnchor = LabelAnchor::Start;
};

using AnnotationSet = std::map<AnnotationRole, Annotation>;

inline const char* displayName(AnnotationRole role) {
    switch (role) {
        case AnnotationRole::Support:              return "Support";
        case AnnotationRole::Resistance:           return "Resistance";
        case AnnotationRole::LongTrigger:          return "Long Trigger";
        case AnnotationRole::ShortTrigger:         return "Short Trigger";
        case AnnotationRole::TrailingStopRaw:      return "Trailing Stop";
        case AnnotationRole::TrailingStopBuffered: return "Trailing Stop (Buffered)";
        case AnnotationRole::LiquidationPrice:     return "Liquidation";
        case AnnotationRole::AvgPrice:             return "Avg Price";
    }
    return "Unknown";
}

} // namespace Vantage
