#include "EngineConfig.hpp"
#include "Log.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

namespace Vantage {

namespace {

const nlohmann::json& sectionOrEmpty(const nlohmann::json& document, const char* key) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    auto it = document.find(key);
    if (it == document.end()) return kEmpty;
    if (!it->is_object()) {
        throw std::runtime_error(std::string("⚙️ EngineConfig: section '") + key + "' must be an object");
    }
    return *it;
}

} // namespace

EngineConfig EngineConfig::loadFromFile(const std::string& path) {
    std::ifstream configFile(path);
    if (!configFile.is_open()) {
        throw std::runtime_error("⚙️ EngineConfig: Failed to open config file: " + path);
    }

    nlohmann::json document;
    try {
        configFile >> document;
    }
    catch (const std::exception& ex) {
        throw std::runtime_error("⚙️ EngineConfig: Failed to parse JSON from config file: " + std::string(ex.what()));
    }

    EngineConfig config = fromJson(document);
    LOG_I("config", "Loaded {} (output_dir={}, write_files={}, candle_window={}, buffer={}%, precision={})",
          path, config.outputDir, config.writeFiles, config.candleWindow,
          config.triggerBufferPercentage, config.pricePrecision);
    return config;
}

EngineConfig EngineConfig::fromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("⚙️ EngineConfig: top-level JSON value must be an object");
    }

    EngineConfig config;
    try {
        const auto& chart = sectionOrEmpty(document, "chart");
        config.outputDir = chart.value("output_dir", config.outputDir);
        config.writeFiles = chart.value("write_files", config.writeFiles);
        config.candleWindow = chart.value("candle_window", config.candleWindow);

        const auto& triggers = sectionOrEmpty(document, "triggers");
        config.triggerBufferPercentage = triggers.value("buffer_percentage", config.triggerBufferPercentage);
        config.pricePrecision = triggers.value("price_precision", config.pricePrecision);

        const auto& log = sectionOrEmpty(document, "log");
        config.logLevel = log.value("level", config.logLevel);
    }
    catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("⚙️ EngineConfig: Invalid value type: " + std::string(ex.what()));
    }

    if (config.candleWindow == 0) {
        throw std::runtime_error("⚙️ EngineConfig: 'chart.candle_window' must be greater than 0");
    }
    if (config.pricePrecision < 0) {
        throw std::runtime_error("⚙️ EngineConfig: 'triggers.price_precision' must be non-negative");
    }
    if (!Log::levelFromString(config.logLevel)) {
        throw std::runtime_error("⚙️ EngineConfig: 'log.level' must be one of trace|debug|info|warn|error|off, got '" +
                                 config.logLevel + "'");
    }
    if (config.outputDir.empty()) {
        throw std::runtime_error("⚙️ EngineConfig: 'chart.output_dir' must not be empty");
    }
    return config;
}

} // namespace Vantage
