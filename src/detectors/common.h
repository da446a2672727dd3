#ifndef IDCROP_DETECTORS_COMMON_H
#define IDCROP_DETECTORS_COMMON_H

#include "../geometry.h"
#include <ncnn/net.h>
#include <vector>
#include <algorithm>
#include <cmath>

namespace idcrop {

// Raw decoder output, in pixels of the network input tensor
struct FaceObject {
    float x, y, width, height;
    float prob;
};

// Convert to fractions of the image content that was fed to the network.
// content_w/content_h exclude any right/bottom padding.
inline RelativeBox toRelativeBox(const FaceObject& obj, int content_w, int content_h) {
    return RelativeBox{
        obj.x / content_w,
        obj.y / content_h,
        obj.width / content_w,
        obj.height / content_h
    };
}

inline float intersection_area(const FaceObject& a, const FaceObject& b) {
    float x1 = std::max(a.x, b.x);
    float y1 = std::max(a.y, b.y);
    float x2 = std::min(a.x + a.width, b.x + b.width);
    float y2 = std::min(a.y + a.height, b.y + b.height);

    if (x2 <= x1 || y2 <= y1) return 0.0f;
    return (x2 - x1) * (y2 - y1);
}

// Descending probability, ties keep decode order
inline void sort_by_prob_descending(std::vector<FaceObject>& faceobjects) {
    std::stable_sort(faceobjects.begin(), faceobjects.end(),
        [](const FaceObject& a, const FaceObject& b) { return a.prob > b.prob; });
}

// Non-Maximum Suppression over bboxes already sorted by probability
inline void nms_sorted_bboxes(const std::vector<FaceObject>& faceobjects, std::vector<int>& picked, float nms_threshold) {
    picked.clear();
    const int n = static_cast<int>(faceobjects.size());

    std::vector<float> areas(n);
    for (int i = 0; i < n; i++) {
        areas[i] = faceobjects[i].width * faceobjects[i].height;
    }

    for (int i = 0; i < n; i++) {
        const FaceObject& a = faceobjects[i];

        bool keep = true;
        for (int j : picked) {
            float inter_area = intersection_area(a, faceobjects[j]);
            float union_area = areas[i] + areas[j] - inter_area;
            if (union_area > 0.0f && inter_area / union_area > nms_threshold) {
                keep = false;
                break;
            }
        }

        if (keep) picked.push_back(i);
    }
}

// Sort, suppress overlaps and return the survivors
inline std::vector<FaceObject> apply_nms(std::vector<FaceObject> proposals, float nms_threshold) {
    sort_by_prob_descending(proposals);

    std::vector<int> picked;
    nms_sorted_bboxes(proposals, picked, nms_threshold);

    std::vector<FaceObject> faces;
    faces.reserve(picked.size());
    for (int idx : picked) {
        faces.push_back(proposals[idx]);
    }
    return faces;
}

// Anchor boxes for RetinaFace-style detection
inline ncnn::Mat generate_anchors(int base_size, const ncnn::Mat& ratios, const ncnn::Mat& scales) {
    int num_ratio = ratios.w;
    int num_scale = scales.w;

    ncnn::Mat anchors;
    anchors.create(4, num_ratio * num_scale);

    const float cx = base_size * 0.5f;
    const float cy = base_size * 0.5f;

    for (int i = 0; i < num_ratio; i++) {
        float ar = ratios[i];
        int r_w = static_cast<int>(std::round(base_size / std::sqrt(ar)));
        int r_h = static_cast<int>(std::round(r_w * ar));

        for (int j = 0; j < num_scale; j++) {
            float scale = scales[j];
            float rs_w = r_w * scale;
            float rs_h = r_h * scale;

            float* anchor = anchors.row(i * num_scale + j);
            anchor[0] = cx - rs_w * 0.5f;
            anchor[1] = cy - rs_h * 0.5f;
            anchor[2] = cx + rs_w * 0.5f;
            anchor[3] = cy + rs_h * 0.5f;
        }
    }

    return anchors;
}

// Proposals from anchors and one stride's score/bbox blobs (RetinaFace-style)
inline void generate_proposals(const ncnn::Mat& anchors, int feat_stride, const ncnn::Mat& score_blob,
                               const ncnn::Mat& bbox_blob, float prob_threshold,
                               std::vector<FaceObject>& faceobjects) {
    const int w = score_blob.w;
    const int h = score_blob.h;
    const int num_anchors = anchors.h;

    for (int q = 0; q < num_anchors; q++) {
        const float* anchor = anchors.row(q);
        const ncnn::Mat score = score_blob.channel(q + num_anchors);
        const ncnn::Mat bbox = bbox_blob.channel_range(q * 4, 4);

        float anchor_y = anchor[1];
        const float anchor_w = anchor[2] - anchor[0];
        const float anchor_h = anchor[3] - anchor[1];

        for (int i = 0; i < h; i++) {
            float anchor_x = anchor[0];

            for (int j = 0; j < w; j++) {
                const int index = i * w + j;
                const float prob = score[index];

                if (prob >= prob_threshold) {
                    float dx = bbox.channel(0)[index];
                    float dy = bbox.channel(1)[index];
                    float dw = bbox.channel(2)[index];
                    float dh = bbox.channel(3)[index];

                    float cx = anchor_x + anchor_w * 0.5f;
                    float cy = anchor_y + anchor_h * 0.5f;

                    float pb_cx = cx + anchor_w * dx;
                    float pb_cy = cy + anchor_h * dy;
                    float pb_w = anchor_w * std::exp(dw);
                    float pb_h = anchor_h * std::exp(dh);

                    FaceObject obj;
                    obj.x = pb_cx - pb_w * 0.5f;
                    obj.y = pb_cy - pb_h * 0.5f;
                    obj.width = pb_w;
                    obj.height = pb_h;
                    obj.prob = std::min(1.0f, std::max(0.0f, prob));
                    faceobjects.push_back(obj);
                }

                anchor_x += feat_stride;
            }

            anchor_y += feat_stride;
        }
    }
}

} // namespace idcrop

#endif // IDCROP_DETECTORS_COMMON_H
