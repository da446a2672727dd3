// YuNet Face Detector
// Model: YuNet (libfacedetection), exported with dynamic input size
// Input: RGB image, width/height multiples of 32, "in0" layer
// Output: 3 scales (stride 8, 16, 32), row-major per grid cell
//         - out0-out2: Classification scores
//         - out3-out5: Objectness scores
//         - out6-out8: Bounding boxes (dx, dy, log w, log h)
//         - out9-out11: Keypoints (unused here)
// Reference: https://github.com/ShiqiYu/libfacedetection

#include "detectors.h"
#include "../errors.h"
#include <string>

namespace idcrop {

std::vector<FaceObject> decodeYuNet(const ncnn::Net& net, const ncnn::Mat& in,
                                    float confidence_threshold) {
    ncnn::Extractor ex = net.create_extractor();
    ex.set_light_mode(true);
    if (ex.input("in0", in) != 0) {
        throw BackendUnavailable("YuNet: model has no 'in0' input");
    }

    const float nms_threshold = 0.3f;
    const int strides[] = {8, 16, 32};
    std::vector<FaceObject> proposals;

    for (int scale_idx = 0; scale_idx < 3; scale_idx++) {
        ncnn::Mat cls, obj, bbox;
        if (ex.extract(("out" + std::to_string(scale_idx)).c_str(), cls) != 0 ||
            ex.extract(("out" + std::to_string(scale_idx + 3)).c_str(), obj) != 0 ||
            ex.extract(("out" + std::to_string(scale_idx + 6)).c_str(), bbox) != 0) {
            throw BackendUnavailable("YuNet: inference failed at scale " + std::to_string(scale_idx));
        }

        const int stride = strides[scale_idx];
        const int feat_w = in.w / stride;
        const int feat_h = in.h / stride;
        const int cells = feat_w * feat_h;

        // Flattened outputs: one score per cell, 4 bbox values per cell
        if (static_cast<int>(cls.total()) < cells || static_cast<int>(obj.total()) < cells ||
            static_cast<int>(bbox.total()) < cells * 4) {
            throw BackendUnavailable("YuNet: unexpected output shape at stride " + std::to_string(stride));
        }

        const float* cls_ptr = static_cast<const float*>(cls.data);
        const float* obj_ptr = static_cast<const float*>(obj.data);
        const float* bbox_ptr = static_cast<const float*>(bbox.data);

        for (int r = 0; r < feat_h; r++) {
            for (int c = 0; c < feat_w; c++) {
                const int idx = r * feat_w + c;

                float cls_score = std::min(1.0f, std::max(0.0f, cls_ptr[idx]));
                float obj_score = std::min(1.0f, std::max(0.0f, obj_ptr[idx]));
                float score = std::sqrt(cls_score * obj_score);
                if (score < confidence_threshold) continue;

                float cx = (c + bbox_ptr[idx * 4 + 0]) * stride;
                float cy = (r + bbox_ptr[idx * 4 + 1]) * stride;
                float w = std::exp(bbox_ptr[idx * 4 + 2]) * stride;
                float h = std::exp(bbox_ptr[idx * 4 + 3]) * stride;

                FaceObject faceobj;
                faceobj.x = cx - w / 2.0f;
                faceobj.y = cy - h / 2.0f;
                faceobj.width = w;
                faceobj.height = h;
                faceobj.prob = score;
                proposals.push_back(faceobj);
            }
        }
    }

    return apply_nms(std::move(proposals), nms_threshold);
}

} // namespace idcrop
