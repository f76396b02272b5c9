#include "RenderCapabilityRegistry.hpp"
#include "VantageLogging.hpp"
#include <QGuiApplication>
#include <stdexcept>

namespace Vantage {

const char* toString(ChartElement element) {
    switch (element) {
        case ChartElement::LineSeries:           return "LineSeries";
        case ChartElement::FilledBand:           return "FilledBand";
        case ChartElement::HorizontalAnnotation: return "HorizontalAnnotation";
        case ChartElement::Legend:               return "Legend";
        case ChartElement::Title:                return "Title";
        case ChartElement::CategoryAxis:         return "CategoryAxis";
        case ChartElement::LinearAxis:           return "LinearAxis";
        case ChartElement::PointMarkers:         return "PointMarkers";
        case ChartElement::Callout:              return "Callout";
        case ChartElement::Count_:               break;
    }
    return "Unknown";
}

void RenderCapabilityRegistry::initializeDefaults() {
    // Fonts and the raster paint engine need a GUI application
    if (!QGuiApplication::instance()) {
        throw std::logic_error("RenderCapabilityRegistry: QGuiApplication must exist before initialization");
    }

    std::call_once(m_once, [this] {
        for (std::size_t i = 0; i < kElementCount; ++i) {
            m_elements.set(i);
        }
        m_initialized.store(true, std::memory_order_release);
        vLog_App("RenderCapabilityRegistry: Registered" << m_elements.count() << "chart elements");
    });
}

bool RenderCapabilityRegistry::supports(ChartElement element) const noexcept {
    if (!isInitialized()) return false;
    auto index = static_cast<std::size_t>(element);
    return index < kElementCount && m_elements.test(index);
}

std::vector<ChartElement> RenderCapabilityRegistry::registeredElements() const {
    std::vector<ChartElement> elements;
    if (!isInitialized()) return elements;
    for (std::size_t i = 0; i < kElementCount; ++i) {
        if (m_elements.test(i)) elements.push_back(static_cast<ChartElement>(i));
    }
    return elements;
}

} // namespace Vantage
