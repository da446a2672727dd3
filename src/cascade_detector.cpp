#include "cascade_detector.h"
#include "config_paths.h"
#include "errors.h"
#include "image_ops.h"
#include "logger.h"
#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>
#include <vector>

namespace idcrop {

namespace {

// Cascades have no confidence; every hit scores 1.0
const float kCascadeScore = 1.0f;

} // namespace

std::string defaultCascadePath() {
    return std::string(HAARCASCADE_DIR) + "/haarcascade_frontalface_default.xml";
}

DetectionSet detectionsFromRects(const std::vector<cv::Rect>& rects, int image_width, int image_height) {
    DetectionSet detections;
    detections.reserve(rects.size());
    for (const cv::Rect& r : rects) {
        Detection det;
        det.box = clipBox(r.x, r.y, r.x + r.width, r.y + r.height, image_width, image_height);
        det.score = kCascadeScore;
        detections.push_back(det);
    }
    return detections;
}

CascadeFaceDetector::CascadeFaceDetector(const DetectorSettings& settings)
    : cascade_path_(settings.cascade_path.empty() ? defaultCascadePath() : settings.cascade_path) {
    // Probe once so a bad path fails at startup rather than per image
    cv::CascadeClassifier probe;
    bool loaded = false;
    try {
        loaded = probe.load(cascade_path_);
    } catch (const cv::Exception& e) {
        throw BackendUnavailable("Failed to load cascade " + cascade_path_ + ": " + e.what());
    }
    if (!loaded || probe.empty()) {
        throw BackendUnavailable("Failed to load cascade: " + cascade_path_);
    }

    Logger::getInstance().info("Cascade detector loaded: " + cascade_path_);
}

std::string CascadeFaceDetector::name() const {
    size_t last_slash = cascade_path_.find_last_of('/');
    return "cascade:" + (last_slash != std::string::npos ? cascade_path_.substr(last_slash + 1)
                                                         : cascade_path_);
}

DetectionSet CascadeFaceDetector::detect(const ImageView& image, float min_confidence) const {
    if (image.empty()) {
        return {};
    }

    Image gray;
    if (image.channels() == 1) {
        gray = image.clone();
    } else if (image.channels() == 3) {
        gray = toGrayscale(image);
    } else {
        throw std::invalid_argument("Cascade detector expects a BGR or grayscale image");
    }

    // Per-call classifier: CascadeClassifier keeps mutable scan state
    cv::CascadeClassifier cascade;
    std::vector<cv::Rect> rects;
    try {
        if (!cascade.load(cascade_path_)) {
            throw BackendUnavailable("Failed to load cascade: " + cascade_path_);
        }
        cv::Mat mat(gray.height(), gray.width(), CV_8UC1, gray.data(), gray.stride());
        cascade.detectMultiScale(mat, rects, kScaleFactor, kMinNeighbors, 0,
                                 cv::Size(kMinFaceSize, kMinFaceSize));
    } catch (const cv::Exception& e) {
        throw BackendUnavailable(std::string("Cascade detection failed: ") + e.what());
    }

    if (kCascadeScore < min_confidence) {
        return {};
    }

    DetectionSet detections = detectionsFromRects(rects, image.width(), image.height());

    Logger::getInstance().debug("Cascade detector found " + std::to_string(detections.size()) + " face(s)");
    return detections;
}

} // namespace idcrop
