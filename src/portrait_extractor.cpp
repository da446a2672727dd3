#include "portrait_extractor.h"
#include "archive.h"
#include "cropper.h"
#include "logger.h"
#include "overlay.h"
#include <chrono>
#include <stdexcept>

namespace idcrop {

void validateOptions(const ExtractionOptions& options) {
    if (!(options.min_confidence >= 0.1f && options.min_confidence <= 0.99f)) {
        throw std::invalid_argument("min_confidence must be in [0.1, 0.99], got " +
                                    std::to_string(options.min_confidence));
    }
    if (options.margin_percent < 0 || options.margin_percent > 40) {
        throw std::invalid_argument("margin_percent must be in [0, 40], got " +
                                    std::to_string(options.margin_percent));
    }
    if (options.max_faces < 1 || options.max_faces > 10) {
        throw std::invalid_argument("max_faces must be in [1, 10], got " +
                                    std::to_string(options.max_faces));
    }
    if (options.jpeg_quality < 1 || options.jpeg_quality > 100) {
        throw std::invalid_argument("jpeg_quality must be in [1, 100], got " +
                                    std::to_string(options.jpeg_quality));
    }
}

std::string extractionStatusToString(ExtractionStatus status) {
    switch (status) {
        case ExtractionStatus::OK: return "ok";
        case ExtractionStatus::NO_FACES_FOUND: return "no_faces_found";
        case ExtractionStatus::EMPTY_CROP_SET: return "empty_crop_set";
    }
    return "unknown";
}

PortraitExtractor::PortraitExtractor(std::shared_ptr<const FaceDetector> detector)
    : detector_(std::move(detector)) {
    if (!detector_) {
        throw std::invalid_argument("PortraitExtractor requires a detector");
    }
}

ExtractionResult PortraitExtractor::extract(const Bytes& encoded, const ExtractionOptions& options) const {
    validateOptions(options);
    Image image = decodeImage(encoded);
    return extract(image.view(), options);
}

ExtractionResult PortraitExtractor::extract(const ImageView& image, const ExtractionOptions& options) const {
    validateOptions(options);
    if (image.empty()) {
        throw std::invalid_argument("Cannot extract portraits from an empty image");
    }

    auto start = std::chrono::steady_clock::now();
    ExtractionResult result;

    DetectionSet detections = detector_->detect(image, options.min_confidence);
    result.detected = detections.size();

    if (detections.empty()) {
        result.status = ExtractionStatus::NO_FACES_FOUND;
        result.archive = buildPortraitArchive({});
        if (options.draw_overlay) {
            result.overlay = image.clone();
        }
    } else {
        result.detections = selectDetections(std::move(detections), options.mode, options.max_faces);

        std::vector<Box> boxes;
        boxes.reserve(result.detections.size());
        for (const Detection& det : result.detections) {
            boxes.push_back(det.box);
        }

        if (options.draw_overlay) {
            result.overlay = drawDetections(image, boxes, 0);
        }

        result.crops = cropRegions(image, boxes, options.margin_percent);
        result.crop_jpegs.reserve(result.crops.size());
        for (const Image& crop : result.crops) {
            result.crop_jpegs.push_back(encodeJpeg(crop.view(), options.jpeg_quality));
        }

        result.archive = buildPortraitArchive(result.crop_jpegs);

        if (result.crops.empty()) {
            result.status = ExtractionStatus::EMPTY_CROP_SET;
        } else {
            result.status = ExtractionStatus::OK;
            result.main_portrait_jpeg = result.crop_jpegs.front();
        }
    }

    auto end = std::chrono::steady_clock::now();
    result.duration_ms = std::chrono::duration<double, std::milli>(end - start).count();

    Logger::getInstance().extractionSummary(result.detected, result.detections.size(),
                                            result.crops.size(),
                                            extractionStatusToString(result.status),
                                            result.duration_ms);
    return result;
}

} // namespace idcrop
