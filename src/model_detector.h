#ifndef IDCROP_MODEL_DETECTOR_H
#define IDCROP_MODEL_DETECTOR_H

#include "face_detector.h"
#include <ncnn/net.h>
#include <string>

namespace idcrop {

// Detection model families (auto-detected from .param file structure)
enum class DetectionModelType {
    RETINAFACE,   // RetinaFace (mnet.25-opt): input="data", outputs=face_rpn_*
    YUNET,        // YuNet: input="in0", 12 outputs (out0-out11)
    ULTRAFACE,    // UltraFace RFB-320: input="in0", outputs out0/out1
    UNKNOWN
};

std::string detectionModelTypeToString(DetectionModelType type);

// Inspect an ncnn .param file and classify the network
DetectionModelType detectModelType(const std::string& param_path);

// Resolved .param/.bin pair for a model base path
struct ModelFiles {
    std::string param_path;
    std::string bin_path;
};

// Tries <base>.param/.bin then <base>.ncnn.param/.ncnn.bin.
// An empty base searches MODELS_DIR for detection, mnet.25-opt, RFB-320.
// Returns false if no complete pair exists.
bool resolveModelFiles(const std::string& base_path, ModelFiles& out);

// Primary backend: pretrained dense face detector run through ncnn
class ModelFaceDetector : public FaceDetector {
public:
    // Throws BackendUnavailable if the model can't be found, loaded or classified
    explicit ModelFaceDetector(const DetectorSettings& settings);

    DetectionSet detect(const ImageView& image, float min_confidence) const override;

    DetectorBackend backend() const override { return DetectorBackend::MODEL; }
    std::string name() const override;

    DetectionModelType modelType() const { return model_type_; }

private:
    ncnn::Net net_;
    ModelFiles files_;
    DetectionModelType model_type_ = DetectionModelType::UNKNOWN;
    std::string model_name_;

    // Longest side of the network input for variable-size models
    static constexpr int kTargetSize = 640;
};

} // namespace idcrop

#endif // IDCROP_MODEL_DETECTOR_H
