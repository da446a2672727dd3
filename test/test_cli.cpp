#include <boost/test/unit_test.hpp>

#include "cli/cli_common.h"
#include "errors.h"

#include <opencv2/core.hpp>
#include <stdexcept>

using namespace idcrop;

BOOST_AUTO_TEST_SUITE(cli_commands)

BOOST_AUTO_TEST_CASE(guarded_body_passes_exit_code) {
    BOOST_CHECK_EQUAL(cli::runGuarded([]() { return 0; }), 0);
    BOOST_CHECK_EQUAL(cli::runGuarded([]() { return 3; }), 3);
}

BOOST_AUTO_TEST_CASE(guarded_body_maps_exceptions_to_failure) {
    BOOST_CHECK_EQUAL(cli::runGuarded([]() -> int { throw DecodeError("truncated"); }), 1);
    BOOST_CHECK_EQUAL(cli::runGuarded([]() -> int { throw BackendUnavailable("no model"); }), 1);
    BOOST_CHECK_EQUAL(cli::runGuarded([]() -> int { throw EncodeError("quality"); }), 1);
    BOOST_CHECK_EQUAL(cli::runGuarded([]() -> int { throw std::invalid_argument("margin"); }), 1);

    // Failures outside the documented set still end the command cleanly
    BOOST_CHECK_EQUAL(cli::runGuarded([]() -> int { throw std::runtime_error("deflate failed"); }), 1);
    BOOST_CHECK_EQUAL(cli::runGuarded([]() -> int {
        cv::Mat empty;
        cv::Mat roi = empty(cv::Rect(0, 0, 10, 10));
        return roi.empty() ? 0 : 4;
    }), 1);
}

BOOST_AUTO_TEST_CASE(parse_overrides) {
    cli::CliOptions options;
    BOOST_REQUIRE(cli::parseOptions({"id.jpg", "--margin", "25", "--all", "--max-faces", "3", "-o", "out"},
                                    options, true));
    BOOST_CHECK_EQUAL(options.image_path, "id.jpg");
    BOOST_CHECK_EQUAL(options.output_dir, "out");
    BOOST_CHECK_EQUAL(options.margin.value_or(-1), 25);
    BOOST_CHECK_EQUAL(options.max_faces.value_or(-1), 3);
    BOOST_CHECK(options.all_faces);

    cli::CliOptions non_numeric;
    BOOST_CHECK(!cli::parseOptions({"id.jpg", "--margin", "ten"}, non_numeric, true));
    cli::CliOptions unknown;
    BOOST_CHECK(!cli::parseOptions({"id.jpg", "--unknown"}, unknown, true));
    cli::CliOptions no_image;
    BOOST_CHECK(!cli::parseOptions({}, no_image, true));
    BOOST_CHECK(cli::parseOptions({}, no_image, false));
}

BOOST_AUTO_TEST_SUITE_END()
