#include "sbem_stack/inspection/image_inspector.hpp"

#include <filesystem>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using sbem_stack::config::InspectionConfig;
using sbem_stack::inspection::BasicImageInspector;

namespace fs = std::filesystem;

namespace {

// Rows alternate between low and high: mean (low + high) / 2,
// stddev (high - low) / 2
cv::Mat striped(int low, int high, int width = 64, int height = 48) {
    cv::Mat img(height, width, CV_8UC1);
    for (int r = 0; r < height; ++r) {
        img.row(r).setTo(cv::Scalar(r % 2 == 0 ? low : high));
    }
    return img;
}

fs::path write_frame(const cv::Mat& img, const std::string& name) {
    const fs::path dir = fs::temp_directory_path() / "sbem_stack_test_inspector";
    fs::create_directories(dir);
    const fs::path path = dir / (name + ".png");
    REQUIRE(cv::imwrite(path.string(), img));
    return path;
}

} // namespace

TEST_CASE("frame_stats_of_striped_frame") {
    const auto s = sbem_stack::inspection::frame_stats(striped(88, 168));
    REQUIRE(s.mean == Catch::Approx(128.0));
    REQUIRE(s.stddev == Catch::Approx(40.0));
}

TEST_CASE("tile_inside_limits_passes") {
    BasicImageInspector inspector(InspectionConfig{});
    const auto r = inspector.process_tile(write_frame(striped(88, 168), "ok"), 0, 0, 0);
    REQUIRE_FALSE(r.load_error);
    REQUIRE(r.range_ok);
    REQUIRE_FALSE(r.grab_incomplete);
    REQUIRE_FALSE(r.frozen_frame);
    REQUIRE_FALSE(r.slice_by_slice_ok.has_value());
}

TEST_CASE("dark_tile_is_out_of_range_and_incomplete") {
    BasicImageInspector inspector(InspectionConfig{});
    cv::Mat img = striped(10, 20);
    img.row(img.rows - 1).setTo(cv::Scalar(0));
    const auto r = inspector.process_tile(write_frame(img, "dark"), 0, 0, 0);
    REQUIRE_FALSE(r.range_ok);
    REQUIRE(r.grab_incomplete);
}

TEST_CASE("identical_consecutive_tiles_are_frozen") {
    BasicImageInspector inspector(InspectionConfig{});
    const fs::path a = write_frame(striped(88, 168), "frozen_a");
    const fs::path b = write_frame(striped(88, 168), "frozen_b");
    REQUIRE_FALSE(inspector.process_tile(a, 0, 0, 0).frozen_frame);
    REQUIRE(inspector.process_tile(b, 0, 1, 0).frozen_frame);
    inspector.reset_tile_stats();
    REQUIRE_FALSE(inspector.process_tile(b, 0, 1, 0).frozen_frame);
}

TEST_CASE("slice_by_slice_comparison_uses_same_tile") {
    BasicImageInspector inspector(InspectionConfig{});
    inspector.process_tile(write_frame(striped(88, 168), "sbs0"), 0, 3, 0);

    const auto same = inspector.process_tile(write_frame(striped(168, 88), "sbs1"), 0, 3, 1);
    REQUIRE(same.slice_by_slice_ok.has_value());
    REQUIRE(*same.slice_by_slice_ok);

    const auto other_tile = inspector.process_tile(write_frame(striped(98, 178), "sbs_other"), 0, 4, 1);
    REQUIRE_FALSE(other_tile.slice_by_slice_ok.has_value());

    const auto brighter = inspector.process_tile(write_frame(striped(98, 178), "sbs2"), 0, 3, 2);
    REQUIRE(brighter.slice_by_slice_ok.has_value());
    REQUIRE_FALSE(*brighter.slice_by_slice_ok);
}

TEST_CASE("missing_frame_is_a_load_error") {
    BasicImageInspector inspector(InspectionConfig{});
    REQUIRE(inspector.process_tile("/nonexistent/sbem_stack/tile.png", 0, 0, 0).load_error);
    REQUIRE(inspector.process_overview("/nonexistent/sbem_stack/ov.png", 0, 0).load_error);
}

TEST_CASE("debris_detected_in_one_quadrant") {
    BasicImageInspector inspector(InspectionConfig{});
    const fs::path clean = write_frame(striped(88, 168), "ov_clean");
    inspector.process_overview(clean, 0, 0);
    REQUIRE_FALSE(inspector.detect_debris(0, 0).detected);

    inspector.process_overview(clean, 0, 1);
    REQUIRE_FALSE(inspector.detect_debris(0, 0).detected);

    cv::Mat dirty = striped(88, 168);
    cv::Mat top_left = dirty(cv::Rect(0, 0, 32, 24));
    top_left += cv::Scalar(12);
    inspector.process_overview(write_frame(dirty, "ov_dirty"), 0, 2);
    const auto quadrant = inspector.detect_debris(0, 0);
    REQUIRE(quadrant.detected);
    REQUIRE(quadrant.message.find("debris detected") != std::string::npos);
    // Averaged over the whole frame the difference stays below threshold
    REQUIRE_FALSE(inspector.detect_debris(0, 1).detected);

    inspector.discard_last_overview(0);
    REQUIRE_FALSE(inspector.detect_debris(0, 0).detected);
}
