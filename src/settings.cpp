#include "settings.h"
#include "logger.h"
#include <cstdlib>

namespace idcrop {

Settings settingsFromConfig(const Config& config) {
    Settings settings;
    DetectorSettings& det = settings.detector;
    ExtractionOptions& opt = settings.extraction;

    if (auto value = config.getString("detection", "backend")) {
        if (auto backend = parseDetectorBackend(*value)) {
            det.backend = *backend;
        }
    }
    if (auto value = config.getString("detection", "model")) {
        det.model_path = *value;
    }
    if (auto value = config.getString("detection", "cascade")) {
        det.cascade_path = *value;
    }
    if (auto value = config.getInt("detection", "threads")) {
        if (*value >= 1 && *value <= 64) det.num_threads = *value;
    }
    if (auto value = config.getDouble("detection", "min_confidence")) {
        if (*value >= 0.1 && *value <= 0.99) opt.min_confidence = static_cast<float>(*value);
    }

    if (auto value = config.getInt("crop", "margin_percent")) {
        if (*value >= 0 && *value <= 40) opt.margin_percent = *value;
    }

    if (auto value = config.getString("selection", "mode")) {
        if (auto mode = parseSelectionMode(*value)) {
            opt.mode = *mode;
        }
    }
    if (auto value = config.getInt("selection", "max_faces")) {
        if (*value >= 1 && *value <= 10) opt.max_faces = *value;
    }

    if (auto value = config.getInt("output", "jpeg_quality")) {
        if (*value >= 1 && *value <= 100) opt.jpeg_quality = *value;
    }
    if (auto value = config.getBool("output", "overlay")) {
        opt.draw_overlay = *value;
    }

    return settings;
}

void applyLoggingConfig(const Config& config) {
    Logger& logger = Logger::getInstance();

    if (auto value = config.getInt("logging", "max_lines")) {
        if (*value >= 10 && *value <= 100000) {
            logger.setMaxLogLines(static_cast<size_t>(*value));
        }
    }
    if (auto value = config.getString("logging", "file")) {
        if (!value->empty()) {
            logger.setLogFile(*value);
        }
    }
    // IDCROP_LOG_LEVEL wins over the config file
    if (std::getenv("IDCROP_LOG_LEVEL") != nullptr) {
        return;
    }
    if (auto value = config.getString("logging", "level")) {
        if (auto level = Logger::parseLevel(*value)) {
            logger.setLogLevel(*level);
        }
    }
}

} // namespace idcrop
