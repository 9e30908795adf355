#include "sbem_stack/inspection/image_inspector.hpp"
#include "sbem_stack/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace sbem_stack::inspection {

cv::Mat load_frame(const fs::path& path) {
    cv::Mat img = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (img.empty()) {
        return img;
    }
    if (img.channels() == 3) {
        cv::cvtColor(img, img, cv::COLOR_BGR2GRAY);
    } else if (img.channels() == 4) {
        cv::cvtColor(img, img, cv::COLOR_BGRA2GRAY);
    }
    if (img.depth() == CV_16U) {
        img.convertTo(img, CV_8U, 1.0 / 256.0);
    } else if (img.depth() != CV_8U) {
        img.convertTo(img, CV_8U);
    }
    return img;
}

FrameStats frame_stats(const cv::Mat& img) {
    cv::Scalar mean, stddev;
    cv::meanStdDev(img, mean, stddev);
    return FrameStats{mean[0], stddev[0]};
}

bool is_incomplete(const cv::Mat& img) {
    if (img.empty()) return true;
    return cv::countNonZero(img.row(img.rows - 1)) == 0;
}

FrameStats max_region_difference(const cv::Mat& a, const cv::Mat& b, bool quadrants) {
    const int w = std::min(a.cols, b.cols);
    const int h = std::min(a.rows, b.rows);
    std::vector<cv::Rect> regions;
    if (quadrants && w >= 2 && h >= 2) {
        const int hw = w / 2;
        const int hh = h / 2;
        regions = {cv::Rect(0, 0, hw, hh), cv::Rect(hw, 0, w - hw, hh),
                   cv::Rect(0, hh, hw, h - hh), cv::Rect(hw, hh, w - hw, h - hh)};
    } else {
        regions = {cv::Rect(0, 0, w, h)};
    }

    FrameStats diff;
    for (const auto& r : regions) {
        const FrameStats sa = frame_stats(a(r));
        const FrameStats sb = frame_stats(b(r));
        diff.mean = std::max(diff.mean, std::abs(sa.mean - sb.mean));
        diff.stddev = std::max(diff.stddev, std::abs(sa.stddev - sb.stddev));
    }
    return diff;
}

BasicImageInspector::BasicImageInspector(const config::InspectionConfig& cfg) : cfg_(cfg) {}

bool BasicImageInspector::in_range(const FrameStats& s) const {
    return s.mean >= cfg_.mean_lower_limit && s.mean <= cfg_.mean_upper_limit &&
           s.stddev >= cfg_.stddev_lower_limit && s.stddev <= cfg_.stddev_upper_limit;
}

hardware::TileInspection BasicImageInspector::process_tile(const fs::path& path, int grid,
                                                           int tile, int slice) {
    hardware::TileInspection r;
    cv::Mat img = load_frame(path);
    if (img.empty()) {
        r.load_error = true;
        return r;
    }

    const FrameStats s = frame_stats(img);
    r.mean = s.mean;
    r.stddev = s.stddev;
    r.range_ok = in_range(s);
    r.grab_incomplete = is_incomplete(img);

    if (!last_tile_.empty() && last_tile_.size() == img.size() &&
        cv::norm(img, last_tile_, cv::NORM_L1) == 0.0) {
        r.frozen_frame = true;
    }
    last_tile_ = img;

    const std::string key = tile_key(grid, tile);
    auto it = tile_stats_.find(key);
    if (it != tile_stats_.end() && it->second.slice < slice) {
        const auto& prev = it->second.stats;
        r.slice_by_slice_ok = std::abs(s.mean - prev.mean) <= cfg_.slice_mean_threshold &&
                              std::abs(s.stddev - prev.stddev) <= cfg_.slice_stddev_threshold;
    }
    tile_stats_[key] = TileRecord{slice, s};
    return r;
}

hardware::OverviewInspection BasicImageInspector::process_overview(const fs::path& path, int ov,
                                                                   int /*slice*/) {
    hardware::OverviewInspection r;
    cv::Mat img = load_frame(path);
    if (img.empty()) {
        r.load_error = true;
        return r;
    }
    const FrameStats s = frame_stats(img);
    r.mean = s.mean;
    r.stddev = s.stddev;
    r.range_ok = in_range(s);
    r.grab_incomplete = is_incomplete(img);

    auto& history = ov_history_[ov];
    history.push_back(img);
    if (history.size() > 2) {
        history.erase(history.begin());
    }
    return r;
}

void BasicImageInspector::discard_last_overview(int ov) {
    auto it = ov_history_.find(ov);
    if (it != ov_history_.end() && !it->second.empty()) {
        it->second.pop_back();
    }
}

hardware::DebrisResult BasicImageInspector::detect_debris(int ov, int method) {
    hardware::DebrisResult r;
    auto it = ov_history_.find(ov);
    if (it == ov_history_.end() || it->second.size() < 2) {
        r.message = "CTRL: No previous OV " + std::to_string(ov) + " for debris detection.";
        return r;
    }
    const auto& history = it->second;
    const FrameStats d = max_region_difference(history[0], history[1], method == 0);
    r.detected = d.mean > cfg_.debris_mean_threshold || d.stddev > cfg_.debris_stddev_threshold;
    r.message = "CTRL: Debris detection (" + std::string(method == 0 ? "quadrants" : "frame") +
                "): mean diff " + core::format_fixed(d.mean, 2) +
                ", SD diff " + core::format_fixed(d.stddev, 2) +
                (r.detected ? ", debris detected" : ", no debris");
    return r;
}

void BasicImageInspector::reset_tile_stats() {
    tile_stats_.clear();
    last_tile_.release();
}

} // namespace sbem_stack::inspection
