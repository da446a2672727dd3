#include <boost/test/unit_test.hpp>

#include "errors.h"
#include "image_codec.h"
#include "test_helpers.h"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

using namespace idcrop;
using idcrop::test::makeImage;
using idcrop::test::makePositionImage;
using idcrop::test::pixelAt;

BOOST_AUTO_TEST_SUITE(codec)

static Bytes encodeWithOpenCV(const std::string& ext, const cv::Mat& mat) {
    std::vector<uint8_t> buf;
    BOOST_REQUIRE(cv::imencode(ext, mat, buf));
    return Bytes(buf.begin(), buf.end());
}

BOOST_AUTO_TEST_CASE(jpeg_round_trip_keeps_dimensions) {
    for (auto dims : {std::make_pair(64, 48), std::make_pair(33, 17), std::make_pair(1, 1), std::make_pair(240, 240)}) {
        Image img = makePositionImage(dims.first, dims.second);
        Bytes jpeg = encodeJpeg(img.view(), 95);
        BOOST_REQUIRE_GT(jpeg.size(), 3u);
        BOOST_CHECK(detectImageFormat(jpeg.data(), jpeg.size()) == ImageFormat::JPEG);

        Image decoded = decodeImage(jpeg);
        BOOST_CHECK_EQUAL(decoded.width(), dims.first);
        BOOST_CHECK_EQUAL(decoded.height(), dims.second);
        BOOST_CHECK_EQUAL(decoded.channels(), 3);
    }
}

BOOST_AUTO_TEST_CASE(jpeg_keeps_color_order) {
    // Solid colors survive JPEG closely enough to tell channels apart
    Image red = makeImage(32, 32, 0, 0, 255);
    Image decoded = decodeImage(encodeJpeg(red.view(), 95));
    const uint8_t* p = pixelAt(decoded, 16, 16);
    BOOST_CHECK_LT(p[0], 40);
    BOOST_CHECK_LT(p[1], 40);
    BOOST_CHECK_GT(p[2], 215);
}

BOOST_AUTO_TEST_CASE(jpeg_from_strided_view) {
    Image img = makePositionImage(100, 80);
    ImageView roi = img.view().roi(10, 20, 30, 25);
    Image decoded = decodeImage(encodeJpeg(roi, 90));
    BOOST_CHECK_EQUAL(decoded.width(), 30);
    BOOST_CHECK_EQUAL(decoded.height(), 25);
}

BOOST_AUTO_TEST_CASE(grayscale_jpeg_decodes_to_bgr) {
    Image gray(20, 10, 1);
    std::memset(gray.data(), 200, gray.size());
    Image decoded = decodeImage(encodeJpeg(gray.view()));
    BOOST_CHECK_EQUAL(decoded.channels(), 3);
    BOOST_CHECK_EQUAL(decoded.width(), 20);
    const uint8_t* p = pixelAt(decoded, 5, 5);
    BOOST_CHECK_EQUAL(p[0], p[1]);
    BOOST_CHECK_EQUAL(p[1], p[2]);
}

BOOST_AUTO_TEST_CASE(png_decodes_through_stb) {
    cv::Mat mat(12, 20, CV_8UC3, cv::Scalar(10, 20, 230));
    mat.at<cv::Vec3b>(3, 4) = cv::Vec3b(1, 2, 3);
    Bytes png = encodeWithOpenCV(".png", mat);
    BOOST_CHECK(detectImageFormat(png.data(), png.size()) == ImageFormat::PNG);

    // Lossless: exact BGR values
    Image decoded = decodeImage(png);
    BOOST_REQUIRE_EQUAL(decoded.width(), 20);
    BOOST_REQUIRE_EQUAL(decoded.height(), 12);
    const uint8_t* p = pixelAt(decoded, 0, 0);
    BOOST_CHECK_EQUAL(p[0], 10);
    BOOST_CHECK_EQUAL(p[1], 20);
    BOOST_CHECK_EQUAL(p[2], 230);
    const uint8_t* q = pixelAt(decoded, 4, 3);
    BOOST_CHECK_EQUAL(q[0], 1);
    BOOST_CHECK_EQUAL(q[1], 2);
    BOOST_CHECK_EQUAL(q[2], 3);
}

BOOST_AUTO_TEST_CASE(bmp_decodes_through_stb) {
    cv::Mat mat(7, 9, CV_8UC3, cv::Scalar(50, 60, 70));
    Bytes bmp = encodeWithOpenCV(".bmp", mat);
    BOOST_CHECK(detectImageFormat(bmp.data(), bmp.size()) == ImageFormat::OTHER);
    Image decoded = decodeImage(bmp);
    BOOST_CHECK_EQUAL(decoded.width(), 9);
    BOOST_CHECK_EQUAL(decoded.height(), 7);
    BOOST_CHECK_EQUAL(pixelAt(decoded, 8, 6)[2], 70);
}

BOOST_AUTO_TEST_CASE(format_sniffing) {
    const uint8_t webp[12] = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'E', 'B', 'P'};
    BOOST_CHECK(detectImageFormat(webp, sizeof(webp)) == ImageFormat::WEBP);
    const uint8_t riff_wav[12] = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E'};
    BOOST_CHECK(detectImageFormat(riff_wav, sizeof(riff_wav)) == ImageFormat::OTHER);
    const uint8_t short_jpeg[2] = {0xFF, 0xD8};
    BOOST_CHECK(detectImageFormat(short_jpeg, sizeof(short_jpeg)) == ImageFormat::OTHER);
}

BOOST_AUTO_TEST_CASE(undecodable_input_throws) {
    BOOST_CHECK_THROW(decodeImage(Bytes{}), DecodeError);
    BOOST_CHECK_THROW(decodeImage(nullptr, 0), DecodeError);

    Bytes text = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
    BOOST_CHECK_THROW(decodeImage(text), DecodeError);

    Bytes truncated = {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F'};
    BOOST_CHECK_THROW(decodeImage(truncated), DecodeError);

    Bytes fake_webp = {'R', 'I', 'F', 'F', 4, 0, 0, 0, 'W', 'E', 'B', 'P', 0, 0};
    BOOST_CHECK_THROW(decodeImage(fake_webp), DecodeError);
}

BOOST_AUTO_TEST_CASE(encode_errors) {
    Image none;
    BOOST_CHECK_THROW(encodeJpeg(none.view()), EncodeError);

    Image rgba(4, 4, 4);
    BOOST_CHECK_THROW(encodeJpeg(rgba.view()), EncodeError);
}

BOOST_AUTO_TEST_CASE(file_helpers) {
    test::TempDir dir;
    const std::string path = dir.file("input.jpg");

    Image img = makePositionImage(50, 40);
    BOOST_REQUIRE(writeFile(path, encodeJpeg(img.view())));

    Image loaded = loadImageFile(path);
    BOOST_CHECK_EQUAL(loaded.width(), 50);
    BOOST_CHECK_EQUAL(loaded.height(), 40);

    BOOST_CHECK_THROW(readFile(dir.path() + "/missing.jpg"), DecodeError);
    BOOST_CHECK_THROW(loadImageFile(dir.path() + "/missing.jpg"), DecodeError);
    BOOST_CHECK(!writeFile(dir.path() + "/no/such/dir/out.jpg", Bytes{1, 2, 3}));
}

BOOST_AUTO_TEST_SUITE_END()
