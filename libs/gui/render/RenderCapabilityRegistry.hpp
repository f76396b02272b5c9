/*
Vantage — RenderCapabilityRegistry
Role: Records which chart elements the drawing engine can render; populated once, then read-only.
Inputs/Outputs: initializeDefaults() registers the built-in elements; supports() answers per element.
Threading: initializeDefaults() is idempotent and safe to race (std::call_once); reads after it are lock-free.
Performance: Bitset lookup.
Integration: Created by the application after QGuiApplication and injected into PainterChartBackend.
Observability: Logs the registered element count once.
Related: PainterChartBackend.hpp, ChartScene.hpp.
Assumptions: Must be initialised before the first render call; a backend refuses to draw otherwise.
*/
#pragma once
#include <atomic>
#include <bitset>
#include <mutex>
#include <vector>

namespace Vantage {

enum class ChartElement {
    LineSeries,
    FilledBand,
    HorizontalAnnotation,
    Legend,
    Title,
    CategoryAxis,
    LinearAxis,
    PointMarkers,
    Callout,
    Count_
};

const char* toString(ChartElement element);

class RenderCapabilityRegistry {
public:
    RenderCapabilityRegistry() = default;
    RenderCapabilityRegistry(const RenderCapabilityRegistry&) = delete;
    RenderCapabilityRegistry& operator=(const RenderCapabilityRegistry&) = delete;

    /**
     * Registers the raster engine's elements. Call after QGuiApplication exists.
     * @throws std::logic_error if no QGuiApplication instance is present
     */
    void initializeDefaults();

    bool isInitialized() const noexcept { return m_initialized.load(std::memory_order_acquire); }
    bool supports(ChartElement element) const noexcept;
    std::vector<ChartElement> registeredElements() const;

private:
    static constexpr std::size_t kElementCount = static_cast<std::size_t>(ChartElement::Count_);

    std::once_flag m_once;
    std::atomic<bool> m_initialized{false};
    std::bitset<kElementCount> m_elements;
};

} // namespace Vantage
