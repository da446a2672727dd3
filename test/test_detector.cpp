#include <boost/test/unit_test.hpp>

#include "cascade_detector.h"
#include "errors.h"
#include "face_detector.h"
#include "model_detector.h"
#include "test_helpers.h"

#include <cmath>
#include <opencv2/core/types.hpp>

using namespace idcrop;

BOOST_AUTO_TEST_SUITE(detector)

static const char* kRetinaFaceParam =
    "7767517\n"
    "4 4\n"
    "Input            data             0 1 data 0=640 1=480 2=3\n"
    "Convolution      conv1            1 1 data conv1 0=8 1=3\n"
    "Softmax          face_rpn_cls_prob_stride32 1 1 conv1 face_rpn_cls_prob_reshape_stride32\n"
    "Convolution      face_rpn_bbox_pred_stride32 1 1 conv1 face_rpn_bbox_pred_stride32 0=8\n";

static std::string yunetParam() {
    std::string text = "7767517\n13 13\nInput            in0              0 1 in0\n";
    for (int i = 0; i < 12; i++) {
        text += "Convolution      head_conv_" + std::to_string(i) + "      1 1 in0 out" +
                std::to_string(i) + " 0=1\n";
    }
    return text;
}

static const char* kUltraFaceParam =
    "7767517\n"
    "3 3\n"
    "Input            in0              0 1 in0\n"
    "Softmax          scores_softmax   1 1 in0 out0 0=1\n"
    "Concat           boxes_concat     1 1 in0 out1\n";

static const char* kUnknownParam =
    "7767517\n"
    "2 2\n"
    "Input            images           0 1 images\n"
    "Convolution      head             1 1 images output0 0=16\n";

BOOST_AUTO_TEST_CASE(model_type_from_param_structure) {
    test::TempDir dir;
    BOOST_CHECK(detectModelType(dir.writeText("retina.param", kRetinaFaceParam)) == DetectionModelType::RETINAFACE);
    BOOST_CHECK(detectModelType(dir.writeText("yunet.param", yunetParam())) == DetectionModelType::YUNET);
    BOOST_CHECK(detectModelType(dir.writeText("rfb.param", kUltraFaceParam)) == DetectionModelType::ULTRAFACE);
    BOOST_CHECK(detectModelType(dir.writeText("other.param", kUnknownParam)) == DetectionModelType::UNKNOWN);
    BOOST_CHECK(detectModelType(dir.path() + "/missing.param") == DetectionModelType::UNKNOWN);
}

BOOST_AUTO_TEST_CASE(model_type_names) {
    BOOST_CHECK_EQUAL(detectionModelTypeToString(DetectionModelType::RETINAFACE), "RetinaFace");
    BOOST_CHECK_EQUAL(detectionModelTypeToString(DetectionModelType::YUNET), "YuNet");
    BOOST_CHECK_EQUAL(detectionModelTypeToString(DetectionModelType::ULTRAFACE), "UltraFace");
    BOOST_CHECK_EQUAL(detectionModelTypeToString(DetectionModelType::UNKNOWN), "Unknown");
}

BOOST_AUTO_TEST_CASE(model_files_resolution) {
    test::TempDir dir;
    dir.writeText("plain.param", kUltraFaceParam);
    dir.writeText("plain.bin", "weights");
    dir.writeText("exported.ncnn.param", kUltraFaceParam);
    dir.writeText("exported.ncnn.bin", "weights");
    dir.writeText("orphan.param", kUltraFaceParam);

    ModelFiles files;
    BOOST_REQUIRE(resolveModelFiles(dir.path() + "/plain", files));
    BOOST_CHECK_EQUAL(files.param_path, dir.path() + "/plain.param");
    BOOST_CHECK_EQUAL(files.bin_path, dir.path() + "/plain.bin");

    BOOST_REQUIRE(resolveModelFiles(dir.path() + "/exported", files));
    BOOST_CHECK_EQUAL(files.param_path, dir.path() + "/exported.ncnn.param");
    BOOST_CHECK_EQUAL(files.bin_path, dir.path() + "/exported.ncnn.bin");

    // Extension given explicitly
    BOOST_REQUIRE(resolveModelFiles(dir.path() + "/plain.param", files));
    BOOST_CHECK_EQUAL(files.bin_path, dir.path() + "/plain.bin");

    BOOST_CHECK(!resolveModelFiles(dir.path() + "/orphan", files));
    BOOST_CHECK(!resolveModelFiles(dir.path() + "/nothing", files));
}

// UltraFace layout: scores (2 x 4420) and prior offsets (4 x 4420) served
// straight from MemoryData, so the decoder sees exactly these values.
static const char* kUltraFaceMemoryParam =
    "7767517\n"
    "3 3\n"
    "Input            in0              0 1 in0 0=320 1=240 2=3\n"
    "MemoryData       out0             0 1 out0 0=2 1=4420\n"
    "MemoryData       out1             0 1 out1 0=4 1=4420\n";

BOOST_AUTO_TEST_CASE(ultraface_model_boxes_in_image_pixels) {
    const int num_priors = 4420;
    std::vector<float> weights(num_priors * 2 + num_priors * 4, 0.0f);
    // Prior 4246: stride 32, cell (3, 2), 64 px box -> (80, 48, 64, 64) on 320x240
    weights[4246 * 2 + 1] = 0.9f;
    // Prior 4360: stride 64, cell (0, 0), 128 px box -> (-32, -32, 128, 128)
    weights[4360 * 2 + 1] = 0.8f;
    // Below threshold
    weights[100 * 2 + 1] = 0.3f;

    test::TempDir dir;
    dir.writeText("rfb.param", kUltraFaceMemoryParam);
    dir.writeFloats("rfb.bin", weights);

    DetectorSettings settings;
    settings.backend = DetectorBackend::MODEL;
    settings.model_path = dir.path() + "/rfb";
    settings.num_threads = 1;
    ModelFaceDetector detector(settings);
    BOOST_REQUIRE(detector.modelType() == DetectionModelType::ULTRAFACE);

    // Fixed-size network: the 1000x800 image is stretched to 320x240
    Image img = test::makeImage(1000, 800);
    DetectionSet detections = detector.detect(img.view(), 0.6f);
    BOOST_REQUIRE_EQUAL(detections.size(), 2u);
    BOOST_CHECK_EQUAL(detections[0].box, Box(250, 160, 450, 373));
    BOOST_CHECK_CLOSE(detections[0].score, 0.9f, 1e-3);
    BOOST_CHECK_EQUAL(detections[1].box, Box(0, 0, 300, 320));
    BOOST_CHECK_CLOSE(detections[1].score, 0.8f, 1e-3);

    BOOST_CHECK_EQUAL(detector.detect(img.view(), 0.85f).size(), 1u);
    BOOST_CHECK(detector.detect(img.view(), 0.95f).empty());
}

// YuNet layout for a 640x512 network input (1000x770 scaled to 640x493,
// padded to 512): per stride 8/16/32 one cls, one obj and 4 bbox values per cell
static std::string yunetMemoryParam() {
    const int cells[] = {80 * 64, 40 * 32, 20 * 16};
    std::string text = "7767517\n13 13\nInput            in0              0 1 in0\n";
    for (int i = 0; i < 12; i++) {
        std::string shape;
        if (i < 6) {
            shape = "0=" + std::to_string(cells[i % 3]);
        } else if (i < 9) {
            shape = "0=4 1=" + std::to_string(cells[i % 3]);
        } else {
            shape = "0=1";
        }
        const std::string blob = "out" + std::to_string(i);
        text += "MemoryData       " + blob + std::string(17 - blob.size(), ' ') + "0 1 " + blob + " " + shape + "\n";
    }
    return text;
}

BOOST_AUTO_TEST_CASE(yunet_model_ignores_padding) {
    const int cells[] = {80 * 64, 40 * 32, 20 * 16};
    std::vector<std::vector<float>> blobs(12);
    for (int i = 0; i < 12; i++) {
        size_t size = i < 6 ? cells[i % 3] : (i < 9 ? cells[i % 3] * 4 : 1);
        blobs[i].assign(size, 0.0f);
    }

    // Stride 32, row 5, column 10: centre (320, 160), 4 * 32 = 128 px square
    const int idx = 5 * 20 + 10;
    blobs[2][idx] = 1.0f;              // cls
    blobs[5][idx] = 0.81f;             // obj -> score sqrt(0.81) = 0.9
    blobs[8][idx * 4 + 2] = std::log(4.0f);
    blobs[8][idx * 4 + 3] = std::log(4.0f);

    std::vector<float> weights;
    for (const auto& blob : blobs) {
        weights.insert(weights.end(), blob.begin(), blob.end());
    }

    test::TempDir dir;
    dir.writeText("yunet.param", yunetMemoryParam());
    dir.writeFloats("yunet.bin", weights);

    DetectorSettings settings;
    settings.backend = DetectorBackend::MODEL;
    settings.model_path = dir.path() + "/yunet";
    settings.num_threads = 1;
    ModelFaceDetector detector(settings);
    BOOST_REQUIRE(detector.modelType() == DetectionModelType::YUNET);

    // Network box (256, 96, 128, 128) over 640x493 content, scale 0.64
    Image img = test::makeImage(1000, 770);
    DetectionSet detections = detector.detect(img.view(), 0.6f);
    BOOST_REQUIRE_EQUAL(detections.size(), 1u);
    BOOST_CHECK_EQUAL(detections[0].box, Box(400, 150, 600, 350));
    BOOST_CHECK_CLOSE(detections[0].score, 0.9f, 1e-3);
}

BOOST_AUTO_TEST_CASE(model_backend_unavailable) {
    test::TempDir dir;
    DetectorSettings settings;
    settings.backend = DetectorBackend::MODEL;
    settings.model_path = dir.path() + "/missing";
    BOOST_CHECK_THROW(createFaceDetector(settings), BackendUnavailable);

    // Files exist but the structure is not a known detector
    dir.writeText("odd.param", kUnknownParam);
    dir.writeText("odd.bin", "weights");
    settings.model_path = dir.path() + "/odd";
    BOOST_CHECK_THROW(createFaceDetector(settings), BackendUnavailable);
}

BOOST_AUTO_TEST_CASE(cascade_backend_unavailable) {
    test::TempDir dir;
    DetectorSettings settings;
    settings.backend = DetectorBackend::CASCADE;
    settings.cascade_path = dir.path() + "/missing.xml";
    BOOST_CHECK_THROW(createFaceDetector(settings), BackendUnavailable);

    settings.cascade_path = dir.writeText("bogus.xml", "<?xml version=\"1.0\"?>\n<opencv_storage>\n</opencv_storage>\n");
    BOOST_CHECK_THROW(createFaceDetector(settings), BackendUnavailable);
}

BOOST_AUTO_TEST_CASE(auto_without_any_backend) {
    test::TempDir dir;
    DetectorSettings settings;
    settings.backend = DetectorBackend::AUTO;
    settings.model_path = dir.path() + "/missing";
    settings.cascade_path = dir.path() + "/missing.xml";
    BOOST_CHECK_THROW(createFaceDetector(settings), BackendUnavailable);
}

BOOST_AUTO_TEST_CASE(cascade_on_blank_image) {
    DetectorSettings settings;
    settings.backend = DetectorBackend::CASCADE;
    auto detector = createFaceDetector(settings);
    BOOST_CHECK(detector->backend() == DetectorBackend::CASCADE);
    BOOST_CHECK_EQUAL(detector->name(), "cascade:haarcascade_frontalface_default.xml");

    Image blank = test::makeImage(320, 240, 255, 255, 255);
    BOOST_CHECK(detector->detect(blank.view(), 0.6f).empty());
    // Repeated calls share nothing
    BOOST_CHECK(detector->detect(blank.view(), 0.6f).empty());

    Image none;
    BOOST_CHECK(detector->detect(none.view(), 0.6f).empty());
}

BOOST_AUTO_TEST_CASE(cascade_rects_become_clipped_detections) {
    const std::vector<cv::Rect> rects = {
        cv::Rect(10, 20, 60, 60),
        cv::Rect(300, 200, 100, 80),   // runs past the right and bottom edges
        cv::Rect(-10, -10, 50, 50),
    };
    DetectionSet detections = detectionsFromRects(rects, 320, 240);
    BOOST_REQUIRE_EQUAL(detections.size(), 3u);
    BOOST_CHECK_EQUAL(detections[0].box, Box(10, 20, 70, 80));
    BOOST_CHECK_EQUAL(detections[1].box, Box(300, 200, 319, 239));
    BOOST_CHECK_EQUAL(detections[2].box, Box(0, 0, 40, 40));
    for (const Detection& det : detections) {
        BOOST_CHECK_EQUAL(det.score, 1.0f);
    }

    BOOST_CHECK(detectionsFromRects({}, 320, 240).empty());
}

BOOST_AUTO_TEST_CASE(auto_falls_back_to_cascade) {
    test::TempDir dir;
    DetectorSettings settings;
    settings.backend = DetectorBackend::AUTO;
    settings.model_path = dir.path() + "/missing";
    auto detector = createFaceDetector(settings);
    BOOST_CHECK(detector->backend() == DetectorBackend::CASCADE);
}

BOOST_AUTO_TEST_CASE(backend_names) {
    BOOST_CHECK(parseDetectorBackend("auto") == DetectorBackend::AUTO);
    BOOST_CHECK(parseDetectorBackend("Model") == DetectorBackend::MODEL);
    BOOST_CHECK(parseDetectorBackend("ncnn") == DetectorBackend::MODEL);
    BOOST_CHECK(parseDetectorBackend("CASCADE") == DetectorBackend::CASCADE);
    BOOST_CHECK(parseDetectorBackend("haar") == DetectorBackend::CASCADE);
    BOOST_CHECK(!parseDetectorBackend("mediapipe"));
    BOOST_CHECK_EQUAL(detectorBackendToString(DetectorBackend::MODEL), "model");
    BOOST_CHECK_EQUAL(detectorBackendToString(DetectorBackend::CASCADE), "cascade");
    BOOST_CHECK_EQUAL(detectorBackendToString(DetectorBackend::AUTO), "auto");
}

BOOST_AUTO_TEST_SUITE_END()
