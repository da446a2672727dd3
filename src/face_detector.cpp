#include "face_detector.h"
#include "cascade_detector.h"
#include "errors.h"
#include "logger.h"
#include "model_detector.h"
#include <algorithm>
#include <cctype>

namespace idcrop {

std::unique_ptr<FaceDetector> createFaceDetector(const DetectorSettings& settings) {
    Logger& logger = Logger::getInstance();

    switch (settings.backend) {
        case DetectorBackend::MODEL:
            return std::make_unique<ModelFaceDetector>(settings);

        case DetectorBackend::CASCADE:
            return std::make_unique<CascadeFaceDetector>(settings);

        case DetectorBackend::AUTO:
            break;
    }

    std::string model_error;
    try {
        auto detector = std::make_unique<ModelFaceDetector>(settings);
        logger.info("Using detection backend: " + detector->name());
        return detector;
    } catch (const BackendUnavailable& e) {
        model_error = e.what();
        logger.warning("Model backend unavailable, falling back to cascade: " + model_error);
    }

    try {
        auto detector = std::make_unique<CascadeFaceDetector>(settings);
        logger.info("Using detection backend: " + detector->name());
        return detector;
    } catch (const BackendUnavailable& e) {
        throw BackendUnavailable("No detection backend available (model: " + model_error +
                                 "; cascade: " + e.what() + ")");
    }
}

std::optional<DetectorBackend> parseDetectorBackend(const std::string& text) {
    std::string value = text;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (value == "auto") return DetectorBackend::AUTO;
    if (value == "model" || value == "ncnn") return DetectorBackend::MODEL;
    if (value == "cascade" || value == "haar") return DetectorBackend::CASCADE;
    return std::nullopt;
}

std::string detectorBackendToString(DetectorBackend backend) {
    switch (backend) {
        case DetectorBackend::MODEL: return "model";
        case DetectorBackend::CASCADE: return "cascade";
        default: return "auto";
    }
}

} // namespace idcrop
