#pragma once

#include "sbem_stack/config/configuration.hpp"
#include "sbem_stack/hardware/interfaces.hpp"

#include <map>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace sbem_stack::inspection {

namespace fs = std::filesystem;

struct FrameStats {
    double mean = 0.0;
    double stddev = 0.0;
};

// Loads a frame as single-channel 8-bit. Returns an empty Mat on failure.
cv::Mat load_frame(const fs::path& path);

FrameStats frame_stats(const cv::Mat& img);

// True if the last scan line is entirely zero (frame not fully written)
bool is_incomplete(const cv::Mat& img);

// Largest mean / stddev difference between corresponding regions of two
// frames. quadrants: compare the four quadrants, else the whole frame.
FrameStats max_region_difference(const cv::Mat& a, const cv::Mat& b, bool quadrants);

// Image checks with OpenCV: mean/stddev range test, comparison with the
// same tile in the previous slice, frozen frame and incomplete grab
// detection, and debris detection by comparing consecutive overviews.
class BasicImageInspector : public hardware::ImageInspector {
public:
    explicit BasicImageInspector(const config::InspectionConfig& cfg);

    hardware::TileInspection process_tile(const fs::path& path, int grid, int tile,
                                          int slice) override;
    hardware::OverviewInspection process_overview(const fs::path& path, int ov,
                                                  int slice) override;
    void discard_last_overview(int ov) override;
    hardware::DebrisResult detect_debris(int ov, int method) override;
    void reset_tile_stats() override;

    bool in_range(const FrameStats& s) const;

private:
    struct TileRecord {
        int slice = -1;
        FrameStats stats;
    };

    config::InspectionConfig cfg_;
    std::map<std::string, TileRecord> tile_stats_;
    cv::Mat last_tile_;
    // Last accepted overview and the candidate, per overview
    std::map<int, std::vector<cv::Mat>> ov_history_;
};

} // namespace sbem_stack::inspection
