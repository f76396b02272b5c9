#include "ChartAnnotationBuilder.hpp"
#include "ChartPalette.hpp"
#include "RiskCalculator.hpp"
#include "VantageLogging.hpp"
#include <cmath>
#include <stdexcept>

namespace Vantage {

namespace {

struct RoleStyle {
    QColor color;
    QVector<qreal> dashPattern;
    LabelAnchor anchor;
};

// Paired roles anchor on opposite edges so their labels do not overlap.
RoleStyle styleFor(AnnotationRole role, PositionSide side) {
    const bool isLong = side == PositionSide::Long;
    switch (role) {
        case AnnotationRole::Support:
            return {ChartPalette::support(), {5, 5}, LabelAnchor::Start};
        case AnnotationRole::Resistance:
            return {ChartPalette::resistance(), {5, 5}, LabelAnchor::End};
        case AnnotationRole::LongTrigger:
            return {ChartPalette::longTrigger(), {3, 3}, LabelAnchor::End};
        case AnnotationRole::ShortTrigger:
            return {ChartPalette::shortTrigger(), {3, 3}, LabelAnchor::Start};
        case AnnotationRole::TrailingStopRaw:
            return {ChartPalette::trailingStopRaw(), {4, 2}, LabelAnchor::Start};
        case AnnotationRole::TrailingStopBuffered:
            return {ChartPalette::trailingStopBuffered(), {2, 2}, LabelAnchor::End};
        case AnnotationRole::AvgPrice:
            return {isLong ? ChartPalette::positiveGreen() : ChartPalette::negativeDarkRed(), {6, 6}, LabelAnchor::Start};
        case AnnotationRole::LiquidationPrice:
            // Adverse boundary: inverse of the avg price color
            return {isLong ? ChartPalette::negativeDarkRed() : ChartPalette::positiveGreen(), {8, 4}, LabelAnchor::End};
    }
    throw std::invalid_argument("ChartAnnotationBuilder: unknown annotation role");
}

void addLevel(AnnotationSet& set, AnnotationRole role, const std::optional<double>& level) {
    if (!level) return;
    RoleStyle style = styleFor(role, PositionSide::Long);
    set.emplace(role, Annotation{role, *level, style.color, style.dashPattern,
                                 ChartAnnotationBuilder::formatLabel(displayName(role), *level), style.anchor});
}

} // namespace

PositionOverlay PositionOverlay::fromPosition(const Position& position) {
    PositionOverlay overlay;
    overlay.side = position.side;
    overlay.avgPrice = position.avgPrice;
    if (position.liquidationPrice) {
        overlay.liquidationPrice = position.liquidationPrice;
    } else if (position.leverage > 1 && std::isfinite(position.avgPrice)) {
        overlay.liquidationPrice = RiskCalculator::calcLiquidationPrice(position.side, position.avgPrice, position.leverage);
    }
    return overlay;
}

AnnotationSet ChartAnnotationBuilder::build(const std::optional<PositionOverlay>& position, const MarketLevels& levels) {
    AnnotationSet set;

    addLevel(set, AnnotationRole::Support, levels.support);
    addLevel(set, AnnotationRole::Resistance, levels.resistance);
    addLevel(set, AnnotationRole::LongTrigger, levels.longTrigger);
    addLevel(set, AnnotationRole::ShortTrigger, levels.shortTrigger);
    addLevel(set, AnnotationRole::TrailingStopRaw, levels.trailingStopRaw);
    addLevel(set, AnnotationRole::TrailingStopBuffered, levels.trailingStopBuffered);

    if (!position) return set;

    RoleStyle avgStyle = styleFor(AnnotationRole::AvgPrice, position->side);
    QString sideName = QString::fromLatin1(toString(position->side)).toUpper();
    set.emplace(AnnotationRole::AvgPrice,
                Annotation{AnnotationRole::AvgPrice, position->avgPrice, avgStyle.color, avgStyle.dashPattern,
                           formatLabel(sideName, position->avgPrice), avgStyle.anchor});

    if (position->liquidationPrice) {
        double liquidation = *position->liquidationPrice;
        if (isLiquidationVisible(liquidation, levels)) {
            RoleStyle liqStyle = styleFor(AnnotationRole::LiquidationPrice, position->side);
            set.emplace(AnnotationRole::LiquidationPrice,
                        Annotation{AnnotationRole::LiquidationPrice, liquidation, liqStyle.color, liqStyle.dashPattern,
                                   formatLabel(displayName(AnnotationRole::LiquidationPrice), liquidation),
                                   liqStyle.anchor});
        } else {
            vLog_Debug("Liquidation line suppressed at" << liquidation);
        }
    }
    return set;
}

bool ChartAnnotationBuilder::isLiquidationVisible(double liquidationPrice, const MarketLevels& levels) {
    if (!std::isfinite(liquidationPrice) || liquidationPrice <= 0) return false;
    if (levels.resistance && !(liquidationPrice < *levels.resistance)) return false;
    if (levels.support && !(liquidationPrice > *levels.support)) return false;
    return true;
}

QString ChartAnnotationBuilder::formatLabel(const QString& name, double price) {
    return QStringLiteral("%1: %2").arg(name, QString::number(price, 'f', 4));
}

} // namespace Vantage
