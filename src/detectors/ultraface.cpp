// UltraFace/RFB-320 Face Detector
// Model: Ultra-Light-Fast-Generic-Face-Detector-1MB (RFB-320)
// Input: RGB image, resized here to 320x240, "in0" layer
// Output: Prior-box encoded detections
//         - out0: Classification scores (2, 4420) - [background, face]
//         - out1: Bounding box offsets (4, 4420) - [cx, cy, w, h]
// Reference: https://github.com/Linzaer/Ultra-Light-Fast-Generic-Face-Detector-1MB

#include "detectors.h"
#include "../errors.h"
#include <string>

namespace idcrop {

namespace {

const int kModelWidth = 320;
const int kModelHeight = 240;

struct Prior {
    float cx, cy, w, h;
};

// Priors in normalized [0, 1] coordinates, matching the training config
std::vector<Prior> generatePriors() {
    const std::vector<std::vector<float>> min_boxes = {
        {10.0f, 16.0f, 24.0f},
        {32.0f, 48.0f},
        {64.0f, 96.0f},
        {128.0f, 192.0f, 256.0f}
    };
    const float strides[] = {8.0f, 16.0f, 32.0f, 64.0f};

    std::vector<Prior> priors;
    for (int scale_idx = 0; scale_idx < 4; scale_idx++) {
        const float stride = strides[scale_idx];
        const int feat_w = static_cast<int>(std::ceil(kModelWidth / stride));
        const int feat_h = static_cast<int>(std::ceil(kModelHeight / stride));

        for (int j = 0; j < feat_h; j++) {
            for (int i = 0; i < feat_w; i++) {
                float x_center = (i + 0.5f) / (kModelWidth / stride);
                float y_center = (j + 0.5f) / (kModelHeight / stride);

                for (float min_box : min_boxes[scale_idx]) {
                    Prior p;
                    p.cx = std::min(std::max(x_center, 0.0f), 1.0f);
                    p.cy = std::min(std::max(y_center, 0.0f), 1.0f);
                    p.w = std::min(std::max(min_box / kModelWidth, 0.0f), 1.0f);
                    p.h = std::min(std::max(min_box / kModelHeight, 0.0f), 1.0f);
                    priors.push_back(p);
                }
            }
        }
    }
    return priors;
}

} // namespace

std::vector<FaceObject> decodeUltraFace(const ncnn::Net& net, const ncnn::Mat& in,
                                        float confidence_threshold) {
    ncnn::Mat in_resized;
    if (in.w == kModelWidth && in.h == kModelHeight) {
        in_resized = in.clone();
    } else {
        ncnn::resize_bilinear(in, in_resized, kModelWidth, kModelHeight);
    }

    const float mean_vals[3] = {127.f, 127.f, 127.f};
    const float norm_vals[3] = {1.f / 128.f, 1.f / 128.f, 1.f / 128.f};
    in_resized.substract_mean_normalize(mean_vals, norm_vals);

    ncnn::Extractor ex = net.create_extractor();
    ex.set_light_mode(true);
    if (ex.input("in0", in_resized) != 0) {
        throw BackendUnavailable("UltraFace: model has no 'in0' input");
    }

    ncnn::Mat scores, boxes;
    if (ex.extract("out0", scores) != 0 || ex.extract("out1", boxes) != 0) {
        throw BackendUnavailable("UltraFace: inference failed");
    }

    static const std::vector<Prior> priors = generatePriors();
    const size_t num_anchors = priors.size();
    if (scores.total() < num_anchors * 2 || boxes.total() < num_anchors * 4) {
        throw BackendUnavailable("UltraFace: unexpected output shape");
    }

    const float center_variance = 0.1f;
    const float size_variance = 0.2f;
    const float nms_threshold = 0.3f;
    const float* scores_ptr = static_cast<const float*>(scores.data);
    const float* boxes_ptr = static_cast<const float*>(boxes.data);

    std::vector<FaceObject> proposals;
    for (size_t i = 0; i < num_anchors; i++) {
        // Interleaved [bg, face] per anchor
        float face_score = scores_ptr[i * 2 + 1];
        if (face_score < confidence_threshold) continue;

        const Prior& prior = priors[i];
        float cx = boxes_ptr[i * 4 + 0] * center_variance * prior.w + prior.cx;
        float cy = boxes_ptr[i * 4 + 1] * center_variance * prior.h + prior.cy;
        float w = std::exp(boxes_ptr[i * 4 + 2] * size_variance) * prior.w;
        float h = std::exp(boxes_ptr[i * 4 + 3] * size_variance) * prior.h;

        // Normalized -> pixels of the caller's input
        FaceObject faceobj;
        faceobj.x = (cx - w / 2.0f) * in.w;
        faceobj.y = (cy - h / 2.0f) * in.h;
        faceobj.width = w * in.w;
        faceobj.height = h * in.h;
        faceobj.prob = std::min(1.0f, std::max(0.0f, face_score));
        proposals.push_back(faceobj);
    }

    return apply_nms(std::move(proposals), nms_threshold);
}

} // namespace idcrop
