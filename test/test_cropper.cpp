#include <boost/test/unit_test.hpp>

#include "cropper.h"
#include "test_helpers.h"

#include <limits>

using namespace idcrop;
using idcrop::test::makePositionImage;
using idcrop::test::pixelAt;

BOOST_AUTO_TEST_SUITE(cropper)

BOOST_AUTO_TEST_CASE(margin_expands_box) {
    Image img = makePositionImage(1000, 800);
    std::vector<Image> crops = cropRegions(img.view(), {Box(100, 100, 300, 300)}, 10);
    BOOST_REQUIRE_EQUAL(crops.size(), 1u);
    BOOST_CHECK_EQUAL(crops[0].width(), 240);
    BOOST_CHECK_EQUAL(crops[0].height(), 240);
    BOOST_CHECK_EQUAL(crops[0].channels(), 3);

    // Top-left crop pixel is source pixel (80, 80)
    const uint8_t* p = pixelAt(crops[0], 0, 0);
    BOOST_CHECK_EQUAL(p[0], 80);
    BOOST_CHECK_EQUAL(p[1], 80);
    const uint8_t* q = pixelAt(crops[0], 239, 10);
    BOOST_CHECK_EQUAL(q[0], static_cast<uint8_t>(80 + 239));
    BOOST_CHECK_EQUAL(q[1], 90);
}

BOOST_AUTO_TEST_CASE(crop_box_matches_crop) {
    BOOST_CHECK_EQUAL(cropBoxFor(Box(100, 100, 300, 300), 1000, 800, 10), Box(80, 80, 320, 320));
    // Expansion past the border is clipped to W-1/H-1
    BOOST_CHECK_EQUAL(cropBoxFor(Box(0, 0, 100, 100), 200, 150, 40), Box(0, 0, 140, 140));
    BOOST_CHECK_EQUAL(cropBoxFor(Box(150, 100, 199, 149), 200, 150, 40), Box(131, 81, 199, 149));
}

BOOST_AUTO_TEST_CASE(negative_margin_is_zero) {
    Image img = makePositionImage(200, 200);
    std::vector<Image> crops = cropRegions(img.view(), {Box(50, 50, 100, 120)}, -20);
    BOOST_REQUIRE_EQUAL(crops.size(), 1u);
    BOOST_CHECK_EQUAL(crops[0].width(), 50);
    BOOST_CHECK_EQUAL(crops[0].height(), 70);
}

BOOST_AUTO_TEST_CASE(margin_is_monotonic) {
    Image img = makePositionImage(640, 480);
    const std::vector<Box> boxes = {Box(200, 150, 300, 260), Box(0, 0, 80, 60), Box(600, 440, 639, 479)};
    for (const Box& box : boxes) {
        long long previous = 0;
        for (int margin = 0; margin <= 40; margin++) {
            std::vector<Image> crops = cropRegions(img.view(), {box}, margin);
            BOOST_REQUIRE_EQUAL(crops.size(), 1u);
            const long long area = static_cast<long long>(crops[0].width()) * crops[0].height();
            BOOST_CHECK_GE(area, previous);
            BOOST_CHECK_LE(area, 640LL * 480LL);
            previous = area;
        }
    }
}

BOOST_AUTO_TEST_CASE(zero_area_regions_are_dropped) {
    // On a 1-pixel wide image every region collapses to zero width
    Image narrow = makePositionImage(1, 50);
    BOOST_CHECK(cropRegions(narrow.view(), {Box(0, 0, 1, 10), Box(0, 5, 1, 40)}, 10).empty());

    // Two columns are enough for a 1-pixel wide crop (the last column is excluded)
    Image two = makePositionImage(2, 50);
    std::vector<Image> thin = cropRegions(two.view(), {Box(0, 0, 1, 10), Box(0, 5, 2, 40)}, 10);
    BOOST_REQUIRE_EQUAL(thin.size(), 2u);
    BOOST_CHECK_EQUAL(thin[0].width(), 1);
    BOOST_CHECK_EQUAL(thin[0].height(), 11);
    BOOST_CHECK_EQUAL(thin[1].width(), 1);
    BOOST_CHECK_EQUAL(thin[1].height(), 41);
}

BOOST_AUTO_TEST_CASE(valid_boxes_keep_order) {
    Image img = makePositionImage(100, 100);
    std::vector<Box> boxes = {Box(10, 10, 20, 20), Box(30, 30, 60, 50)};
    std::vector<Image> crops = cropRegions(img.view(), boxes, 0);
    BOOST_REQUIRE_EQUAL(crops.size(), 2u);
    BOOST_CHECK_EQUAL(crops[0].width(), 10);
    BOOST_CHECK_EQUAL(crops[1].width(), 30);
    BOOST_CHECK_EQUAL(crops[1].height(), 20);
}

BOOST_AUTO_TEST_CASE(box_spanning_int_range) {
    const int lo = std::numeric_limits<int>::min();
    const int hi = std::numeric_limits<int>::max();
    BOOST_CHECK_EQUAL(cropBoxFor(Box(lo, 0, hi, 10), 1000, 800, 10), Box(0, 0, 999, 11));

    Image img = makePositionImage(1000, 800);
    std::vector<Image> crops = cropRegions(img.view(), {Box(lo, 0, hi, 10)}, 10);
    BOOST_REQUIRE_EQUAL(crops.size(), 1u);
    BOOST_CHECK_EQUAL(crops[0].width(), 999);
    BOOST_CHECK_EQUAL(crops[0].height(), 11);
}

BOOST_AUTO_TEST_CASE(empty_inputs) {
    Image img = makePositionImage(100, 100);
    BOOST_CHECK(cropRegions(img.view(), {}, 10).empty());

    Image none;
    BOOST_CHECK(cropRegions(none.view(), {Box(0, 0, 10, 10)}, 10).empty());
}

BOOST_AUTO_TEST_CASE(crops_do_not_alias_source) {
    Image img = makePositionImage(100, 100);
    std::vector<Image> crops = cropRegions(img.view(), {Box(10, 10, 50, 50)}, 0);
    BOOST_REQUIRE_EQUAL(crops.size(), 1u);
    BOOST_CHECK(crops[0].data() != img.data() + 10 * img.stride() + 30);

    // Scribble over the source; the crop keeps the original pixels
    std::memset(img.data(), 0xEE, static_cast<size_t>(img.stride()) * img.height());
    const uint8_t* p = pixelAt(crops[0], 5, 7);
    BOOST_CHECK_EQUAL(p[0], 15);
    BOOST_CHECK_EQUAL(p[1], 17);
    BOOST_CHECK_EQUAL(crops[0].stride(), 40 * 3);
}

BOOST_AUTO_TEST_SUITE_END()
