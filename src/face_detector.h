#ifndef IDCROP_FACE_DETECTOR_H
#define IDCROP_FACE_DETECTOR_H

#include "detection.h"
#include "image.h"
#include <memory>
#include <optional>
#include <string>

namespace idcrop {

enum class DetectorBackend {
    AUTO,      // Model if its files load, otherwise cascade (decided once)
    MODEL,     // Pretrained dense detector run through ncnn
    CASCADE    // OpenCV Haar cascade
};

struct DetectorSettings {
    DetectorBackend backend = DetectorBackend::AUTO;
    std::string model_path;     // .param/.bin base path without extension
    std::string cascade_path;   // Haar cascade XML
    int num_threads = 4;
};

// Detection backend contract.
//
// detect() is a pure function of the image and threshold: it returns every
// face scoring at least min_confidence, in backend order, with boxes in
// absolute pixels already clipped to the image. Zero faces is an empty set,
// not an error. Backend failures throw BackendUnavailable.
//
// Implementations hold only immutable state after construction and
// acquire per-call resources inside detect(), so one instance may be
// shared across threads.
class FaceDetector {
public:
    virtual ~FaceDetector() = default;

    virtual DetectionSet detect(const ImageView& image, float min_confidence) const = 0;

    virtual DetectorBackend backend() const = 0;

    // Human readable backend/model description for logs and `idcrop info`
    virtual std::string name() const = 0;
};

// Resolve the backend once. Throws BackendUnavailable when the requested
// backend (or, for AUTO, any backend) cannot be constructed.
std::unique_ptr<FaceDetector> createFaceDetector(const DetectorSettings& settings);

std::optional<DetectorBackend> parseDetectorBackend(const std::string& text);
std::string detectorBackendToString(DetectorBackend backend);

} // namespace idcrop

#endif // IDCROP_FACE_DETECTOR_H
