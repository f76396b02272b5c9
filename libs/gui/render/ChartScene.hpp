#pragma once
#include <QColor>
#include <QSize>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>
#include "../annotations/ChartAnnotation.hpp"
#include "RenderCapabilityRegistry.hpp"

namespace Vantage {

struct ChartSeries {
    QString label;
    QColor color;
    std::vector<double> values;   // one per x category; non-finite values break the line
    qreal lineWidth = 2.0;
    bool drawLine = true;
    bool drawPoints = false;
};

// Area between two series, referenced by index into ChartScene::series.
struct FilledBand {
    std::size_t lowerSeries = 0;
    std::size_t upperSeries = 0;
    QColor fill;
};

/**
 * Backend-neutral description of one chart. Built fresh for every render call.
 */
struct ChartScene {
    QSize canvasSize{1000, 1000};
    QString title;
    QString xAxisTitle;
    QString yAxisTitle;
    QStringList xLabels;                    // one per category
    std::vector<std::size_t> visibleXLabels;
    bool rotateXLabels = false;
    int yTickDecimals = 2;
    std::vector<ChartSeries> series;
    std::optional<FilledBand> band;
    std::vector<Annotation> annotations;
    QString callout;                        // tooltip-style box for the latest value

    /// Elements a backend must support to draw this scene.
    std::vector<ChartElement> requiredElements() const {
        std::vector<ChartElement> required{ChartElement::LinearAxis, ChartElement::CategoryAxis};
        if (!title.isEmpty()) required.push_back(ChartElement::Title);
        if (!series.empty()) {
            required.push_back(ChartElement::LineSeries);
            required.push_back(ChartElement::Legend);
        }
        for (const auto& s : series) {
            if (s.drawPoints) {
                required.push_back(ChartElement::PointMarkers);
                break;
            }
        }
        if (band) required.push_back(ChartElement::FilledBand);
        if (!annotations.empty()) required.push_back(ChartElement::HorizontalAnnotation);
        if (!callout.isEmpty()) required.push_back(ChartElement::Callout);
        return required;
    }
};

} // namespace Vantage
