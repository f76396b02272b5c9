#include "PainterChartBackend.hpp"
#include "ChartScene.hpp"
#include "../annotations/ChartPalette.hpp"
#include "../models/PriceAxis.hpp"
#include "VantageLogging.hpp"
#include <QBuffer>
#include <QFont>
#include <QFontMetrics>
#include <QImage>
#include <QPainter>
#include <QPainterPath>
#include <QPen>
#include <QPolygonF>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace Vantage {

namespace {

constexpr qreal kAnnotationPenWidth = 2.0;
constexpr qreal kLabelRadius = 4.0;

QFont makeFont(int pointSize, bool bold = false) {
    QFont font;
    font.setPixelSize(pointSize);
    font.setBold(bold);
    return font;
}

std::size_t categoryCount(const ChartScene& scene) {
    std::size_t count = static_cast<std::size_t>(scene.xLabels.size());
    for (const auto& s : scene.series) {
        count = std::max(count, s.values.size());
    }
    return count;
}

} // namespace

PainterChartBackend::PainterChartBackend(const RenderCapabilityRegistry& registry, ChartMargins margins)
    : m_registry(registry), m_margins(margins) {
}

void PainterChartBackend::ensureSupported(const ChartScene& scene) const {
    if (!m_registry.isInitialized()) {
        throw std::logic_error("PainterChartBackend: render capabilities not registered");
    }
    for (ChartElement element : scene.requiredElements()) {
        if (!m_registry.supports(element)) {
            throw std::logic_error(std::string("PainterChartBackend: unsupported chart element ") + toString(element));
        }
    }
}

Viewport PainterChartBackend::computeViewport(const ChartScene& scene) const {
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    auto include = [&](double v) {
        if (!std::isfinite(v)) return;
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    };
    for (const auto& s : scene.series) {
        for (double v : s.values) include(v);
    }
    for (const auto& a : scene.annotations) include(a.priceLevel);
    if (!std::isfinite(lo)) {
        lo = 0.0;
        hi = 1.0;
    }
    auto [priceMin, priceMax] = PriceAxis::paddedRange(lo, hi);

    const std::size_t count = categoryCount(scene);
    const double bottom = scene.rotateXLabels ? m_margins.rotatedLabelBottom : m_margins.bottom;

    Viewport viewport;
    viewport.xStart = 0.0;
    viewport.xEnd = count > 1 ? static_cast<double>(count - 1) : 1.0;
    viewport.priceMin = priceMin;
    viewport.priceMax = priceMax;
    viewport.left = m_margins.left;
    viewport.top = m_margins.top;
    viewport.width = std::max(1.0, scene.canvasSize.width() - m_margins.left - m_margins.right);
    viewport.height = std::max(1.0, scene.canvasSize.height() - m_margins.top - bottom);
    return viewport;
}

QRectF PainterChartBackend::plotRect(const Viewport& viewport) {
    return QRectF(viewport.left, viewport.top, viewport.width, viewport.height);
}

QByteArray PainterChartBackend::rasterize(const ChartScene& scene) const {
    ensureSupported(scene);

    const Viewport viewport = computeViewport(scene);
    QImage image(scene.canvasSize, QImage::Format_ARGB32_Premultiplied);
    if (image.isNull()) {
        throw std::runtime_error("PainterChartBackend: failed to allocate canvas");
    }
    image.fill(Qt::white);

    {
        QPainter painter(&image);
        painter.setRenderHint(QPainter::Antialiasing, true);
        painter.setRenderHint(QPainter::TextAntialiasing, true);

        drawTitle(painter, scene);
        drawLegend(painter, scene);
        drawYAxis(painter, scene, viewport);
        drawXAxis(painter, scene, viewport);
        drawBand(painter, scene, viewport);
        drawSeries(painter, scene, viewport);
        drawAnnotations(painter, scene, viewport);
        drawCallout(painter, scene, viewport);
    }

    QByteArray png;
    QBuffer buffer(&png);
    if (!buffer.open(QIODevice::WriteOnly) || !image.save(&buffer, "PNG")) {
        throw std::runtime_error("PainterChartBackend: PNG encoding failed");
    }

    vLog_Render("Rasterized" << scene.series.size() << "series," << scene.annotations.size()
                << "annotations into" << png.size() << "bytes");
    return png;
}

void PainterChartBackend::drawTitle(QPainter& painter, const ChartScene& scene) const {
    if (scene.title.isEmpty()) return;
    painter.setPen(ChartPalette::text());
    painter.setFont(makeFont(20, true));
    painter.drawText(QRectF(0, 8, scene.canvasSize.width(), 30), Qt::AlignHCenter | Qt::AlignVCenter, scene.title);
}

void PainterChartBackend::drawLegend(QPainter& painter, const ChartScene& scene) const {
    if (scene.series.empty()) return;

    painter.setFont(makeFont(12));
    QFontMetrics metrics(painter.font());
    constexpr qreal swatch = 24.0;
    constexpr qreal gap = 16.0;

    qreal total = 0.0;
    for (const auto& s : scene.series) {
        total += swatch + 6 + metrics.horizontalAdvance(s.label) + gap;
    }
    qreal x = std::max<qreal>(m_margins.left, (scene.canvasSize.width() - total) / 2.0);
    const qreal y = 46.0;

    for (const auto& s : scene.series) {
        painter.setPen(QPen(s.color, 3));
        painter.drawLine(QPointF(x, y), QPointF(x + swatch, y));
        x += swatch + 6;
        painter.setPen(ChartPalette::text());
        painter.drawText(QPointF(x, y + metrics.ascent() / 2.0 - 1), s.label);
        x += metrics.horizontalAdvance(s.label) + gap;
    }
}

void PainterChartBackend::drawYAxis(QPainter& painter, const ChartScene& scene, const Viewport& viewport) const {
    const QRectF plot = plotRect(viewport);
    const int targetTicks = std::max(4, static_cast<int>(viewport.height / 80.0));

    painter.setFont(makeFont(12));
    QFontMetrics metrics(painter.font());
    for (const auto& tick : PriceAxis::buildTicks(viewport, scene.yTickDecimals, targetTicks)) {
        painter.setPen(QPen(ChartPalette::grid(), 1));
        painter.drawLine(QPointF(plot.left(), tick.position), QPointF(plot.right(), tick.position));
        painter.setPen(ChartPalette::text());
        painter.drawText(QRectF(0, tick.position - metrics.height() / 2.0, plot.left() - 8, metrics.height()),
                         Qt::AlignRight | Qt::AlignVCenter, tick.label);
    }

    painter.setPen(QPen(ChartPalette::text(), 1));
    painter.drawLine(plot.bottomLeft(), plot.topLeft());

    if (!scene.yAxisTitle.isEmpty()) {
        painter.save();
        painter.translate(16, plot.center().y());
        painter.rotate(-90);
        painter.setFont(makeFont(13, true));
        painter.drawText(QRectF(-plot.height() / 2.0, -10, plot.height(), 20), Qt::AlignCenter, scene.yAxisTitle);
        painter.restore();
    }
}

void PainterChartBackend::drawXAxis(QPainter& painter, const ChartScene& scene, const Viewport& viewport) const {
    const QRectF plot = plotRect(viewport);
    painter.setPen(QPen(ChartPalette::text(), 1));
    painter.drawLine(plot.bottomLeft(), plot.bottomRight());

    painter.setFont(makeFont(11));
    QFontMetrics metrics(painter.font());
    for (std::size_t index : scene.visibleXLabels) {
        if (index >= static_cast<std::size_t>(scene.xLabels.size())) continue;
        const QString& label = scene.xLabels.at(static_cast<qsizetype>(index));
        const double x = CoordinateSystem::worldToScreen(static_cast<double>(index), viewport.priceMin, viewport).x();

        painter.drawLine(QPointF(x, plot.bottom()), QPointF(x, plot.bottom() + 5));
        if (scene.rotateXLabels) {
            painter.save();
            painter.translate(x, plot.bottom() + 8);
            painter.rotate(45);
            painter.drawText(QPointF(0, metrics.ascent() / 2.0), label);
            painter.restore();
        } else {
            const qreal w = metrics.horizontalAdvance(label);
            painter.drawText(QPointF(x - w / 2.0, plot.bottom() + 8 + metrics.ascent()), label);
        }
    }

    if (!scene.xAxisTitle.isEmpty()) {
        painter.setFont(makeFont(13, true));
        painter.drawText(QRectF(plot.left(), scene.canvasSize.height() - 28, plot.width(), 20),
                         Qt::AlignCenter, scene.xAxisTitle);
    }
}

void PainterChartBackend::drawBand(QPainter& painter, const ChartScene& scene, const Viewport& viewport) const {
    if (!scene.band) return;
    const FilledBand& band = *scene.band;
    if (band.lowerSeries >= scene.series.size() || band.upperSeries >= scene.series.size()) {
        throw std::logic_error("PainterChartBackend: filled band references a missing series");
    }
    const auto& lower = scene.series[band.lowerSeries].values;
    const auto& upper = scene.series[band.upperSeries].values;
    const std::size_t count = std::min(lower.size(), upper.size());

    QPolygonF polygon;
    for (std::size_t i = 0; i < count; ++i) {
        if (std::isfinite(upper[i])) {
            polygon << CoordinateSystem::worldToScreen(static_cast<double>(i), upper[i], viewport);
        }
    }
    for (std::size_t i = count; i-- > 0;) {
        if (std::isfinite(lower[i])) {
            polygon << CoordinateSystem::worldToScreen(static_cast<double>(i), lower[i], viewport);
        }
    }
    if (polygon.size() < 3) return;

    painter.setPen(Qt::NoPen);
    painter.setBrush(band.fill);
    painter.drawPolygon(polygon);
    painter.setBrush(Qt::NoBrush);
}

void PainterChartBackend::drawSeries(QPainter& painter, const ChartScene& scene, const Viewport& viewport) const {
    painter.setClipRect(plotRect(viewport).adjusted(-4, -4, 4, 4));
    for (const auto& s : scene.series) {
        QPainterPath path;
        bool penDown = false;
        for (std::size_t i = 0; i < s.values.size(); ++i) {
            if (!std::isfinite(s.values[i])) {
                penDown = false;
                continue;
            }
            QPointF point = CoordinateSystem::worldToScreen(static_cast<double>(i), s.values[i], viewport);
            if (penDown) {
                path.lineTo(point);
            } else {
                path.moveTo(point);
                penDown = true;
            }
        }

        if (s.drawLine) {
            painter.setPen(QPen(s.color, s.lineWidth, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
            painter.drawPath(path);
        }
        if (s.drawPoints) {
            painter.setPen(Qt::NoPen);
            painter.setBrush(s.color);
            for (std::size_t i = 0; i < s.values.size(); ++i) {
                if (!std::isfinite(s.values[i])) continue;
                painter.drawEllipse(CoordinateSystem::worldToScreen(static_cast<double>(i), s.values[i], viewport), 3.0, 3.0);
            }
            painter.setBrush(Qt::NoBrush);
        }
    }
    painter.setClipping(false);
}

void PainterChartBackend::drawAnnotations(QPainter& painter, const ChartScene& scene, const Viewport& viewport) const {
    const QRectF plot = plotRect(viewport);
    painter.setFont(makeFont(11, true));
    QFontMetrics metrics(painter.font());

    for (const auto& annotation : scene.annotations) {
        const double y = CoordinateSystem::priceToScreenY(annotation.priceLevel, viewport);

        QPen pen(annotation.color, kAnnotationPenWidth);
        if (!annotation.dashPattern.isEmpty()) {
            // QPen dash lengths are in units of the pen width
            QVector<qreal> pattern;
            for (qreal px : annotation.dashPattern) pattern << px / kAnnotationPenWidth;
            pen.setDashPattern(pattern);
        }
        painter.setPen(pen);
        painter.drawLine(QPointF(plot.left(), y), QPointF(plot.right(), y));

        if (annotation.label.isEmpty()) continue;
        const qreal w = metrics.horizontalAdvance(annotation.label) + 12;
        const qreal h = metrics.height() + 6;
        const qreal x = annotation.labelAnchor == LabelAnchor::Start ? plot.left() + 4 : plot.right() - w - 4;
        const qreal top = std::max<qreal>(0.0, std::min<qreal>(y - h - 2, scene.canvasSize.height() - h));
        const QRectF box(x, top, w, h);

        painter.setPen(Qt::NoPen);
        painter.setBrush(annotation.color);
        painter.drawRoundedRect(box, kLabelRadius, kLabelRadius);
        painter.setBrush(Qt::NoBrush);
        painter.setPen(Qt::white);
        painter.drawText(box, Qt::AlignCenter, annotation.label);
    }
}

void PainterChartBackend::drawCallout(QPainter& painter, const ChartScene& scene, const Viewport& viewport) const {
    if (scene.callout.isEmpty()) return;
    const QRectF plot = plotRect(viewport);

    painter.setFont(makeFont(12, true));
    QFontMetrics metrics(painter.font());
    const qreal w = metrics.horizontalAdvance(scene.callout) + 16;
    const qreal h = metrics.height() + 10;
    const QRectF box(plot.right() - w - 8, plot.top() + 8, w, h);

    painter.setPen(Qt::NoPen);
    painter.setBrush(QColor(0, 0, 0, 190));
    painter.drawRoundedRect(box, kLabelRadius, kLabelRadius);
    painter.setBrush(Qt::NoBrush);
    painter.setPen(Qt::white);
    painter.drawText(box, Qt::AlignCenter, scene.callout);
}

} // namespace Vantage
