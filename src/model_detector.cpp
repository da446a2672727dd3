#include "model_detector.h"
#include "config_paths.h"
#include "detectors/detectors.h"
#include "errors.h"
#include "image_ops.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <fstream>

namespace idcrop {

namespace {

bool fileExists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool resolvePair(const std::string& base, ModelFiles& out) {
    if (fileExists(base + ".param") && fileExists(base + ".bin")) {
        out.param_path = base + ".param";
        out.bin_path = base + ".bin";
        return true;
    }
    if (fileExists(base + ".ncnn.param") && fileExists(base + ".ncnn.bin")) {
        out.param_path = base + ".ncnn.param";
        out.bin_path = base + ".ncnn.bin";
        return true;
    }
    return false;
}

std::string baseName(const std::string& path) {
    size_t last_slash = path.find_last_of("/\\");
    std::string name = (last_slash != std::string::npos) ? path.substr(last_slash + 1) : path;
    for (const char* ext : {".ncnn.param", ".param"}) {
        const std::string suffix(ext);
        if (name.size() > suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return name.substr(0, name.size() - suffix.size());
        }
    }
    return name;
}

// Network input plus the unpadded content size inside it
struct NetworkInput {
    ncnn::Mat mat;
    int content_w = 0;
    int content_h = 0;
};

NetworkInput prepareInput(const ImageView& image, DetectionModelType type, int target_size) {
    NetworkInput input;

    if (type == DetectionModelType::ULTRAFACE) {
        // Fixed-size network: stretch the whole image, no padding
        Image resized = resizeImage(image, 320, 240);
        input.mat = ncnn::Mat::from_pixels(resized.data(), ncnn::Mat::PIXEL_BGR2RGB,
                                           resized.width(), resized.height(), resized.stride());
        input.content_w = resized.width();
        input.content_h = resized.height();
        return input;
    }

    // Variable-size networks: scale the longest side to target_size and pad
    // right/bottom up to a multiple of 32 (largest stride)
    const float scale = static_cast<float>(target_size) / std::max(image.width(), image.height());
    const int scaled_w = std::max(1, static_cast<int>(std::lround(image.width() * scale)));
    const int scaled_h = std::max(1, static_cast<int>(std::lround(image.height() * scale)));

    Image resized = resizeImage(image, scaled_w, scaled_h);
    ncnn::Mat in = ncnn::Mat::from_pixels(resized.data(), ncnn::Mat::PIXEL_BGR2RGB,
                                          scaled_w, scaled_h, resized.stride());

    const int wpad = (scaled_w + 31) / 32 * 32 - scaled_w;
    const int hpad = (scaled_h + 31) / 32 * 32 - scaled_h;
    if (wpad > 0 || hpad > 0) {
        ncnn::copy_make_border(in, input.mat, 0, hpad, 0, wpad, ncnn::BORDER_CONSTANT, 0.f);
    } else {
        input.mat = in;
    }

    input.content_w = scaled_w;
    input.content_h = scaled_h;
    return input;
}

} // namespace

std::string detectionModelTypeToString(DetectionModelType type) {
    switch (type) {
        case DetectionModelType::RETINAFACE: return "RetinaFace";
        case DetectionModelType::YUNET: return "YuNet";
        case DetectionModelType::ULTRAFACE: return "UltraFace";
        default: return "Unknown";
    }
}

DetectionModelType detectModelType(const std::string& param_path) {
    std::ifstream file(param_path);
    if (!file.is_open()) {
        Logger::getInstance().debug("Failed to open detection param file: " + param_path);
        return DetectionModelType::UNKNOWN;
    }

    std::string line;
    bool has_data_input = false;          // RetinaFace uses "data" as input
    bool has_in0_input = false;           // YuNet and UltraFace use "in0"
    bool has_face_rpn_outputs = false;    // RetinaFace has face_rpn_* blobs
    int out_count = 0;                    // Highest outN blob index + 1

    while (std::getline(file, line)) {
        if (line.compare(0, 5, "Input") == 0) {
            if (line.find(" data ") != std::string::npos || line.find(" data") == line.size() - 5) {
                has_data_input = true;
            }
            if (line.find(" in0 ") != std::string::npos || line.find(" in0") == line.size() - 4) {
                has_in0_input = true;
            }
        }

        if (line.find("face_rpn") != std::string::npos) {
            has_face_rpn_outputs = true;
        }

        // Count blobs named out0..out19 (skip the layer type/name columns)
        for (int i = 0; i < 20; i++) {
            const std::string out_name = " out" + std::to_string(i);
            size_t pos = line.find(out_name);
            while (pos != std::string::npos) {
                size_t end = pos + out_name.size();
                bool whole_token = end == line.size() || line[end] == ' ';
                if (whole_token && pos > 20) {
                    out_count = std::max(out_count, i + 1);
                    break;
                }
                pos = line.find(out_name, pos + 1);
            }
        }
    }

    if (has_data_input && has_face_rpn_outputs) {
        Logger::getInstance().debug("Detected RetinaFace model (input='data', outputs=face_rpn_*)");
        return DetectionModelType::RETINAFACE;
    }
    if (has_in0_input && out_count >= 12) {
        Logger::getInstance().debug("Detected YuNet model (input='in0', " + std::to_string(out_count) + " outputs)");
        return DetectionModelType::YUNET;
    }
    if (has_in0_input && out_count >= 2) {
        Logger::getInstance().debug("Detected UltraFace model (input='in0', " + std::to_string(out_count) + " outputs)");
        return DetectionModelType::ULTRAFACE;
    }

    Logger::getInstance().debug("Unknown detection model type (data=" + std::to_string(has_data_input) +
        ", in0=" + std::to_string(has_in0_input) + ", face_rpn=" + std::to_string(has_face_rpn_outputs) +
        ", out_count=" + std::to_string(out_count) + ")");
    return DetectionModelType::UNKNOWN;
}

bool resolveModelFiles(const std::string& base_path, ModelFiles& out) {
    if (!base_path.empty()) {
        // Accept a path given with its .param extension as well
        std::string base = base_path;
        for (const char* ext : {".ncnn.param", ".param"}) {
            const std::string suffix(ext);
            if (base.size() > suffix.size() &&
                base.compare(base.size() - suffix.size(), suffix.size(), suffix) == 0) {
                base = base.substr(0, base.size() - suffix.size());
                break;
            }
        }
        return resolvePair(base, out);
    }

    // Priority: detection.{param,bin}, then the bundled RetinaFace, then RFB-320
    for (const char* name : {"detection", "mnet.25-opt", "RFB-320"}) {
        std::string candidate = std::string(MODELS_DIR) + "/" + name;
        if (resolvePair(candidate, out)) {
            Logger::getInstance().debug("Found detection model: " + candidate);
            return true;
        }
    }
    return false;
}

ModelFaceDetector::ModelFaceDetector(const DetectorSettings& settings) {
    if (!resolveModelFiles(settings.model_path, files_)) {
        throw BackendUnavailable("Detection model not found" +
            (settings.model_path.empty() ? " in " + std::string(MODELS_DIR)
                                         : ": " + settings.model_path));
    }

    model_type_ = detectModelType(files_.param_path);
    if (model_type_ == DetectionModelType::UNKNOWN) {
        throw BackendUnavailable("Unsupported detection model: " + files_.param_path);
    }

    net_.opt.use_vulkan_compute = false;
    net_.opt.num_threads = std::max(1, settings.num_threads);
    net_.opt.use_fp16_packed = false;
    net_.opt.use_fp16_storage = false;

    int ret = net_.load_param(files_.param_path.c_str());
    if (ret != 0) {
        throw BackendUnavailable("Failed to load " + files_.param_path + " (ret=" + std::to_string(ret) + ")");
    }
    ret = net_.load_model(files_.bin_path.c_str());
    if (ret != 0) {
        throw BackendUnavailable("Failed to load " + files_.bin_path + " (ret=" + std::to_string(ret) + ")");
    }

    model_name_ = baseName(files_.param_path);
    Logger::getInstance().info("Detection model loaded: " + model_name_ +
        " (type: " + detectionModelTypeToString(model_type_) + ")");
}

std::string ModelFaceDetector::name() const {
    return "model:" + model_name_ + " (" + detectionModelTypeToString(model_type_) + ")";
}

DetectionSet ModelFaceDetector::detect(const ImageView& image, float min_confidence) const {
    if (image.empty()) {
        return {};
    }
    if (image.channels() != 3) {
        throw std::invalid_argument("Model detector expects a 3-channel BGR image");
    }

    NetworkInput input = prepareInput(image, model_type_, kTargetSize);

    std::vector<FaceObject> faces;
    switch (model_type_) {
        case DetectionModelType::RETINAFACE:
            faces = decodeRetinaFace(net_, input.mat, min_confidence);
            break;
        case DetectionModelType::YUNET:
            faces = decodeYuNet(net_, input.mat, min_confidence);
            break;
        case DetectionModelType::ULTRAFACE:
            faces = decodeUltraFace(net_, input.mat, min_confidence);
            break;
        default:
            throw BackendUnavailable("Unknown detection model type");
    }

    DetectionSet detections;
    detections.reserve(faces.size());
    for (const FaceObject& face : faces) {
        Detection det;
        det.box = toAbsoluteBox(toRelativeBox(face, input.content_w, input.content_h),
                                image.width(), image.height());
        det.score = face.prob;
        detections.push_back(det);
    }

    Logger::getInstance().debug("Model detector found " + std::to_string(detections.size()) +
        " face(s) at confidence >= " + std::to_string(min_confidence));
    return detections;
}

} // namespace idcrop
