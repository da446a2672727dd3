#ifndef IDCROP_PORTRAIT_EXTRACTOR_H
#define IDCROP_PORTRAIT_EXTRACTOR_H

#include "detection.h"
#include "face_detector.h"
#include "image.h"
#include "image_codec.h"
#include "selection.h"
#include <memory>
#include <string>
#include <vector>

namespace idcrop {

struct ExtractionOptions {
    float min_confidence = 0.6f;    // [0.1, 0.99]
    int margin_percent = 10;        // [0, 40]
    SelectionMode mode = SelectionMode::LARGEST_ONLY;
    int max_faces = 5;              // [1, 10], used in ALL_FACES mode
    int jpeg_quality = 95;          // [1, 100]
    bool draw_overlay = true;
};

// Throws std::invalid_argument naming the first out-of-range field
void validateOptions(const ExtractionOptions& options);

enum class ExtractionStatus {
    OK,
    NO_FACES_FOUND,     // Detector returned nothing at this threshold
    EMPTY_CROP_SET      // Faces kept, but every crop had zero area
};

std::string extractionStatusToString(ExtractionStatus status);

struct ExtractionResult {
    ExtractionStatus status = ExtractionStatus::NO_FACES_FOUND;
    size_t detected = 0;            // Faces before selection
    DetectionSet detections;        // Selected, largest first
    std::vector<Image> crops;       // crops[0] is the main portrait
    std::vector<Bytes> crop_jpegs;  // Same order as crops
    Bytes main_portrait_jpeg;       // Empty unless status == OK
    Bytes archive;                  // ZIP of portrait_i.jpg, zero entries if no crops
    Image overlay;                  // Input with selected boxes drawn (copy of input if none)
    double duration_ms = 0.0;
};

// Detect -> select -> crop -> encode for one image.
// The detector is chosen once and shared; extract() keeps no state between
// calls, so one extractor can serve concurrent requests.
class PortraitExtractor {
public:
    explicit PortraitExtractor(std::shared_ptr<const FaceDetector> detector);

    ExtractionResult extract(const ImageView& image, const ExtractionOptions& options) const;

    // Decodes first; throws DecodeError for unreadable input
    ExtractionResult extract(const Bytes& encoded, const ExtractionOptions& options) const;

    const FaceDetector& detector() const { return *detector_; }

private:
    std::shared_ptr<const FaceDetector> detector_;
};

// Fixed output names
inline const char* kMainPortraitName = "portrait_main.jpg";
inline const char* kArchiveName = "portraits.zip";
inline const char* kOverlayName = "detections.jpg";

} // namespace idcrop

#endif // IDCROP_PORTRAIT_EXTRACTOR_H
