#ifndef IDCROP_CASCADE_DETECTOR_H
#define IDCROP_CASCADE_DETECTOR_H

#include "face_detector.h"
#include <opencv2/core/types.hpp>
#include <string>
#include <vector>

namespace idcrop {

// Path of the stock frontal face cascade shipped with OpenCV
std::string defaultCascadePath();

// Cascade hits as detections: each rect clipped to the image, score 1.0
DetectionSet detectionsFromRects(const std::vector<cv::Rect>& rects, int image_width, int image_height);

// Fallback backend: OpenCV Haar cascade on the grayscale image.
// Boxes carry a fixed score of 1.0.
class CascadeFaceDetector : public FaceDetector {
public:
    // Throws BackendUnavailable if the XML is missing or not a cascade
    explicit CascadeFaceDetector(const DetectorSettings& settings);

    DetectionSet detect(const ImageView& image, float min_confidence) const override;

    DetectorBackend backend() const override { return DetectorBackend::CASCADE; }
    std::string name() const override;

private:
    std::string cascade_path_;

    static constexpr double kScaleFactor = 1.1;
    static constexpr int kMinNeighbors = 5;
    static constexpr int kMinFaceSize = 60;
};

} // namespace idcrop

#endif // IDCROP_CASCADE_DETECTOR_H
