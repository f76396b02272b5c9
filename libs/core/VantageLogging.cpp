#include "VantageLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "vantage.app")         // Application: init, lifecycle, config
Q_LOGGING_CATEGORY(logRender, "vantage.render")   // Render: scene composition, rasterization, persistence
Q_LOGGING_CATEGORY(logDebug, "vantage.debug", QtWarningMsg)  // Debug: disabled unless QT_LOGGING_RULES enables it
