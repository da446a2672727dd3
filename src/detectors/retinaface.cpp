// RetinaFace Face Detector
// Model: RetinaFace (mnet.25-opt)
// Input: RGB image, variable size, "data" layer
// Output: Bounding boxes at 3 scales (stride 32, 16, 8)
//         - face_rpn_cls_prob_reshape_stride*: Classification scores
//         - face_rpn_bbox_pred_stride*: Bounding box offsets
// Reference: https://github.com/deepinsight/insightface/tree/master/detection/retinaface

#include "detectors.h"
#include "../errors.h"
#include <string>

namespace idcrop {

namespace {

struct StrideAnchors {
    int feat_stride;
    float scale_large;
    float scale_small;
};

} // namespace

std::vector<FaceObject> decodeRetinaFace(const ncnn::Net& net, const ncnn::Mat& in,
                                         float confidence_threshold) {
    ncnn::Extractor ex = net.create_extractor();
    ex.set_light_mode(true);
    if (ex.input("data", in) != 0) {
        throw BackendUnavailable("RetinaFace: model has no 'data' input");
    }

    const float nms_threshold = 0.4f;
    const int base_size = 16;
    const StrideAnchors strides[] = {
        {32, 32.f, 16.f},
        {16, 8.f, 4.f},
        {8, 2.f, 1.f},
    };

    std::vector<FaceObject> proposals;
    for (const StrideAnchors& level : strides) {
        const std::string suffix = "stride" + std::to_string(level.feat_stride);

        ncnn::Mat score_blob, bbox_blob;
        if (ex.extract(("face_rpn_cls_prob_reshape_" + suffix).c_str(), score_blob) != 0 ||
            ex.extract(("face_rpn_bbox_pred_" + suffix).c_str(), bbox_blob) != 0) {
            throw BackendUnavailable("RetinaFace: inference failed at " + suffix);
        }

        ncnn::Mat ratios(1);
        ratios[0] = 1.f;
        ncnn::Mat scales(2);
        scales[0] = level.scale_large;
        scales[1] = level.scale_small;
        ncnn::Mat anchors = generate_anchors(base_size, ratios, scales);

        generate_proposals(anchors, level.feat_stride, score_blob, bbox_blob,
                           confidence_threshold, proposals);
    }

    return apply_nms(std::move(proposals), nms_threshold);
}

} // namespace idcrop
