/*
Vantage — EngineConfig
Role: Loads chart output, candle window, trigger and logging settings from a JSON file.
Inputs/Outputs: Reads a JSON document (default 'vantage.json'); outputs a plain settings struct.
Threading: Load once at startup on the calling thread; the struct is then copied by value.
Performance: File I/O is a one-time cost.
Integration: Read by apps/vantage_cli before building renderers.
Observability: Throws std::runtime_error with the offending key or file; logs the loaded values.
Related: EngineConfig.cpp, configs/vantage.example.json.
Assumptions: Missing keys fall back to defaults; present keys must have the documented type.
*/
#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace Vantage {

struct EngineConfig {
    std::string outputDir = ".";          // chart.output_dir
    bool writeFiles = false;              // chart.write_files
    std::size_t candleWindow = 120;       // chart.candle_window
    double triggerBufferPercentage = 0.0; // triggers.buffer_percentage
    int pricePrecision = 4;               // triggers.price_precision
    std::string logLevel = "info";        // log.level

    /// Throws std::runtime_error if the file is missing, unparsable or holds invalid values.
    static EngineConfig loadFromFile(const std::string& path = "vantage.json");
    static EngineConfig fromJson(const nlohmann::json& document);
};

} // namespace Vantage
