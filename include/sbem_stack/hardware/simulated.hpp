#pragma once

#include "interfaces.hpp"
#include "sbem_stack/config/configuration.hpp"

#include <map>

namespace sbem_stack::hardware {

// Devices without hardware for dry runs of a stack. Moves and cuts
// complete immediately unless realtime is set.

class SimulatedStage : public StageDriver {
public:
    SimulatedStage(const config::StageConfig& cfg, double initial_z, bool realtime = false);

    bool move_xy(double x, double y) override;
    bool move_z(double z) override;
    std::optional<double> stage_z() override;
    bool full_cut() override;
    bool sweep(double z) override;
    double full_cut_duration() const override;

    core::ErrorCode error_state() const override { return error_state_; }
    void reset_error_state() override { error_state_ = core::ErrorCode::None; }

    double x() const { return x_; }
    double y() const { return y_; }
    int cuts() const { return cuts_; }
    int sweeps() const { return sweeps_; }

private:
    void wait_move() const;

    config::StageConfig cfg_;
    bool realtime_;
    double x_ = 0.0;
    double y_ = 0.0;
    double z_;
    int cuts_ = 0;
    int sweeps_ = 0;
    core::ErrorCode error_state_ = core::ErrorCode::None;
};

class SimulatedImaging : public ImagingDriver {
public:
    // Frames are written at 1/preview_scale of the selected frame size
    explicit SimulatedImaging(const config::ImagingConfig& cfg, int preview_scale = 1);

    bool apply_frame_settings(int size_selector, double pixel_size, double dwell_time) override;
    bool acquire_frame(const fs::path& path) override;

    bool set_working_distance(double wd) override;
    double working_distance() override { return wd_; }
    bool set_stigmation(double x, double y) override;
    std::array<double, 2> stigmation() override { return {stig_x_, stig_y_}; }
    double magnification() override { return magnification_; }
    bool set_magnification(double magnification) override;
    double beam_current() override { return beam_current_; }

    core::ErrorCode error_state() const override { return error_state_; }
    void reset_error_state() override { error_state_ = core::ErrorCode::None; }

    int frames_acquired() const { return frames_acquired_; }

    static bool frame_size(int selector, int& width, int& height);

private:
    int width_ = 0;
    int height_ = 0;
    int preview_scale_;
    double wd_;
    double stig_x_;
    double stig_y_;
    double magnification_;
    double beam_current_;
    int frames_acquired_ = 0;
    core::ErrorCode error_state_ = core::ErrorCode::None;
};

// Schedules hardware autofocus runs by slice interval; the routine itself
// leaves WD and stigmation unchanged.
class SimulatedAutofocus : public Autofocus {
public:
    SimulatedAutofocus(const config::AutofocusConfig& cfg, ImagingDriver& imaging);

    bool is_active() const override { return cfg_.enabled; }
    AutofocusMethod method() const override;
    AutofocusSchedule is_active_current_slice(int slice_counter) const override;
    bool is_reference_tile(int grid, int tile) const override;
    std::vector<TileRef> reference_tiles() const override;

    std::string run_hardware_autofocus(bool do_focus, bool do_stig) override;
    bool check_wd_stig_diff(double target_wd, double target_stig_x,
                            double target_stig_y) override;

    std::array<double, 3> heuristic_deltas() const override { return cfg_.heuristic_deltas; }
    std::array<double, 3> max_wd_stig_diff() const override { return cfg_.max_wd_stig_diff; }
    void process_heuristic_image(const fs::path& path, const std::string& tile_key,
                                 int slice_counter) override;
    std::optional<HeuristicCorrection> heuristic_corrections(const std::string& tile_key) override;

private:
    config::AutofocusConfig cfg_;
    ImagingDriver& imaging_;
    std::map<std::string, int> processed_;
};

} // namespace sbem_stack::hardware
