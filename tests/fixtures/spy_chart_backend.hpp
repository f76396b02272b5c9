#pragma once
#include "render/IChartBackend.hpp"
#include "render/ChartScene.hpp"
#include <memory>
#include <stdexcept>
#include <vector>

/// Spy backend that records every scene it is asked to draw
class SpyChartBackend : public Vantage::IChartBackend {
public:
    struct Record {
        std::vector<Vantage::ChartScene> scenes;
    };

    explicit SpyChartBackend(std::shared_ptr<Record> record, QByteArray output = QByteArray("PNGDATA"))
        : record_(std::move(record)), output_(std::move(output)) {}

    QByteArray rasterize(const Vantage::ChartScene& scene) const override {
        record_->scenes.push_back(scene);
        if (failNext) {
            throw std::runtime_error("SpyChartBackend: forced failure");
        }
        return output_;
    }

    const char* getBackendName() const override { return "Spy"; }

    bool failNext = false;

private:
    std::shared_ptr<Record> record_;
    QByteArray output_;
};
