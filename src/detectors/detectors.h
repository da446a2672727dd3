#ifndef IDCROP_DETECTORS_H
#define IDCROP_DETECTORS_H

#include "common.h"
#include <ncnn/net.h>
#include <vector>

namespace idcrop {

// Every decoder creates its own ncnn::Extractor from the shared, read-only
// net and returns NMS-filtered faces in pixels of `in`, scoring at least
// confidence_threshold.

// RetinaFace (mnet.25-opt)
// Input: RGB, any size (multiples of 32 recommended), "data" layer, raw 0-255
// Outputs: face_rpn_cls_prob_reshape_stride{8,16,32}, face_rpn_bbox_pred_stride{8,16,32}
std::vector<FaceObject> decodeRetinaFace(const ncnn::Net& net, const ncnn::Mat& in,
                                         float confidence_threshold);

// YuNet (libfacedetection)
// Input: RGB, width/height multiples of 32, "in0" layer, raw 0-255
// Outputs: out0-2 cls, out3-5 obj, out6-8 bbox, out9-11 keypoints (strides 8/16/32)
std::vector<FaceObject> decodeYuNet(const ncnn::Net& net, const ncnn::Mat& in,
                                    float confidence_threshold);

// UltraFace RFB-320
// Input: RGB 320x240, "in0" layer, normalized (x - 127) / 128
// Outputs: out0 scores (2 x 4420), out1 boxes (4 x 4420)
std::vector<FaceObject> decodeUltraFace(const ncnn::Net& net, const ncnn::Mat& in,
                                        float confidence_threshold);

} // namespace idcrop

#endif // IDCROP_DETECTORS_H
