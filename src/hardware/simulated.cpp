#include "sbem_stack/hardware/simulated.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <thread>

namespace sbem_stack::hardware {

namespace {

// Frame size per store resolution selector
constexpr int kFrameSizes[][2] = {
    {512, 384},   {1024, 768},  {2048, 1536}, {3072, 2304},
    {4096, 3072}, {6144, 4608}, {8192, 6144},
};
constexpr int kNumFrameSizes = sizeof(kFrameSizes) / sizeof(kFrameSizes[0]);

} // namespace

SimulatedStage::SimulatedStage(const config::StageConfig& cfg, double initial_z, bool realtime)
    : cfg_(cfg), realtime_(realtime), z_(initial_z) {}

void SimulatedStage::wait_move() const {
    if (!realtime_) return;
    std::this_thread::sleep_for(std::chrono::duration<double>(cfg_.stage_move_wait_interval));
}

bool SimulatedStage::move_xy(double x, double y) {
    x_ = x;
    y_ = y;
    wait_move();
    return true;
}

bool SimulatedStage::move_z(double z) {
    if (z < 0.0) {
        error_state_ = core::ErrorCode::StageZ;
        return false;
    }
    if (std::abs(z - z_) > cfg_.max_z_move) {
        error_state_ = core::ErrorCode::StageZMoveTooLarge;
        return false;
    }
    z_ = z;
    wait_move();
    return true;
}

std::optional<double> SimulatedStage::stage_z() {
    return z_;
}

bool SimulatedStage::full_cut() {
    ++cuts_;
    return true;
}

bool SimulatedStage::sweep(double z) {
    if (std::abs(z - z_) > cfg_.max_z_move) {
        error_state_ = core::ErrorCode::Sweeping;
        return false;
    }
    ++sweeps_;
    wait_move();
    return true;
}

double SimulatedStage::full_cut_duration() const {
    return realtime_ ? cfg_.full_cut_duration : 0.0;
}

SimulatedImaging::SimulatedImaging(const config::ImagingConfig& cfg, int preview_scale)
    : preview_scale_(preview_scale > 0 ? preview_scale : 1),
      wd_(cfg.working_distance),
      stig_x_(cfg.stig_x),
      stig_y_(cfg.stig_y),
      magnification_(cfg.magnification),
      beam_current_(cfg.beam_current) {}

bool SimulatedImaging::frame_size(int selector, int& width, int& height) {
    if (selector < 0 || selector >= kNumFrameSizes) return false;
    width = kFrameSizes[selector][0];
    height = kFrameSizes[selector][1];
    return true;
}

bool SimulatedImaging::apply_frame_settings(int size_selector, double pixel_size,
                                            double dwell_time) {
    if (!frame_size(size_selector, width_, height_) || pixel_size <= 0.0 || dwell_time <= 0.0) {
        error_state_ = core::ErrorCode::FrameSize;
        return false;
    }
    return true;
}

bool SimulatedImaging::acquire_frame(const fs::path& path) {
    if (width_ == 0 || height_ == 0) {
        error_state_ = core::ErrorCode::FrameSize;
        return false;
    }
    cv::Mat img(std::max(1, height_ / preview_scale_), std::max(1, width_ / preview_scale_),
                CV_8UC1);
    cv::randn(img, cv::Scalar(128.0), cv::Scalar(40.0));
    try {
        if (!cv::imwrite(path.string(), img)) {
            error_state_ = core::ErrorCode::GrabImage;
            return false;
        }
    } catch (const cv::Exception&) {
        error_state_ = core::ErrorCode::GrabImage;
        return false;
    }
    ++frames_acquired_;
    return true;
}

bool SimulatedImaging::set_working_distance(double wd) {
    if (wd <= 0.0) {
        error_state_ = core::ErrorCode::WorkingDistance;
        return false;
    }
    wd_ = wd;
    return true;
}

bool SimulatedImaging::set_stigmation(double x, double y) {
    stig_x_ = x;
    stig_y_ = y;
    return true;
}

bool SimulatedImaging::set_magnification(double magnification) {
    if (magnification <= 0.0) {
        error_state_ = core::ErrorCode::Magnification;
        return false;
    }
    magnification_ = magnification;
    return true;
}

SimulatedAutofocus::SimulatedAutofocus(const config::AutofocusConfig& cfg, ImagingDriver& imaging)
    : cfg_(cfg), imaging_(imaging) {}

AutofocusMethod SimulatedAutofocus::method() const {
    return cfg_.method == 1 ? AutofocusMethod::Heuristic : AutofocusMethod::Hardware;
}

AutofocusSchedule SimulatedAutofocus::is_active_current_slice(int slice_counter) const {
    const int interval = cfg_.interval > 0 ? cfg_.interval : 1;
    AutofocusSchedule s;
    s.focus = cfg_.focus && slice_counter % interval == 0;
    s.stig = cfg_.stig && (slice_counter + cfg_.autostig_delay) % interval == 0;
    return s;
}

bool SimulatedAutofocus::is_reference_tile(int grid, int tile) const {
    for (const auto& r : cfg_.reference_tiles) {
        if (r[0] == grid && r[1] == tile) return true;
    }
    return false;
}

std::vector<TileRef> SimulatedAutofocus::reference_tiles() const {
    std::vector<TileRef> refs;
    refs.reserve(cfg_.reference_tiles.size());
    for (const auto& r : cfg_.reference_tiles) {
        refs.push_back(TileRef{r[0], r[1]});
    }
    return refs;
}

std::string SimulatedAutofocus::run_hardware_autofocus(bool do_focus, bool do_stig) {
    std::string what;
    if (do_focus && do_stig) what = "focus+stig";
    else if (do_focus) what = "focus";
    else if (do_stig) what = "stig";
    else return "SEM: Nothing to do.";
    return "SEM: Simulated autofocus (" + what + ") completed.";
}

bool SimulatedAutofocus::check_wd_stig_diff(double target_wd, double target_stig_x,
                                            double target_stig_y) {
    const auto stig = imaging_.stigmation();
    return std::abs(imaging_.working_distance() - target_wd) <= cfg_.max_wd_stig_diff[0] &&
           std::abs(stig[0] - target_stig_x) <= cfg_.max_wd_stig_diff[1] &&
           std::abs(stig[1] - target_stig_y) <= cfg_.max_wd_stig_diff[2];
}

void SimulatedAutofocus::process_heuristic_image(const fs::path& /*path*/,
                                                 const std::string& tile_key,
                                                 int /*slice_counter*/) {
    ++processed_[tile_key];
}

std::optional<HeuristicCorrection> SimulatedAutofocus::heuristic_corrections(
    const std::string& tile_key) {
    // A noise frame carries no focus information; two frames give a zero estimate
    auto it = processed_.find(tile_key);
    if (it == processed_.end() || it->second < 2) {
        return std::nullopt;
    }
    return HeuristicCorrection{};
}

} // namespace sbem_stack::hardware
