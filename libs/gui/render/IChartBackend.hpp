#pragma once
#include <QByteArray>

namespace Vantage {

struct ChartScene;

class IChartBackend {
public:
    virtual ~IChartBackend() = default;

    // Returns PNG bytes. Throws on unsupported scenes or encoding failure.
    virtual QByteArray rasterize(const ChartScene& scene) const = 0;
    virtual const char* getBackendName() const = 0;
};

} // namespace Vantage
