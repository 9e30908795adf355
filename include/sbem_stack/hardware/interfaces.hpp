#pragma once

#include "sbem_stack/core/error_codes.hpp"
#include "sbem_stack/core/types.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sbem_stack::hardware {

namespace fs = std::filesystem;

// Microtome / stage. Blocking calls; a false return leaves the reason in
// error_state() until reset_error_state().
class StageDriver {
public:
    virtual ~StageDriver() = default;

    virtual bool move_xy(double x, double y) = 0;
    virtual bool move_z(double z) = 0;
    // nullopt if the position could not be read
    virtual std::optional<double> stage_z() = 0;
    // Starts cutting a slice at the current Z. The cut takes
    // full_cut_duration(); errors are reported by error_state() afterwards.
    virtual bool full_cut() = 0;
    // Clears debris by a cutting cycle at z without removing material
    virtual bool sweep(double z) = 0;
    virtual double full_cut_duration() const = 0;

    virtual core::ErrorCode error_state() const = 0;
    virtual void reset_error_state() = 0;
};

// Electron-optical imaging device
class ImagingDriver {
public:
    virtual ~ImagingDriver() = default;

    virtual bool apply_frame_settings(int size_selector, double pixel_size, double dwell_time) = 0;
    // Scans one frame and writes it to path
    virtual bool acquire_frame(const fs::path& path) = 0;

    virtual bool set_working_distance(double wd) = 0;
    virtual double working_distance() = 0;
    virtual bool set_stigmation(double x, double y) = 0;
    virtual std::array<double, 2> stigmation() = 0;
    virtual double magnification() = 0;
    virtual bool set_magnification(double magnification) = 0;
    virtual double beam_current() = 0;

    virtual core::ErrorCode error_state() const = 0;
    virtual void reset_error_state() = 0;
};

struct TileInspection {
    double mean = 0.0;
    double stddev = 0.0;
    bool range_ok = true;
    // Comparison with the same tile in the previous slice, if there was one
    std::optional<bool> slice_by_slice_ok;
    // False if the frame should be discarded (not an error)
    bool selected = true;
    bool load_error = false;
    bool grab_incomplete = false;
    bool frozen_frame = false;
};

struct OverviewInspection {
    double mean = 0.0;
    double stddev = 0.0;
    bool range_ok = true;
    bool load_error = false;
    bool grab_incomplete = false;
};

struct DebrisResult {
    bool detected = false;
    std::string message;
};

// Image quality checks on acquired frames
class ImageInspector {
public:
    virtual ~ImageInspector() = default;

    virtual TileInspection process_tile(const fs::path& path, int grid, int tile, int slice) = 0;
    virtual OverviewInspection process_overview(const fs::path& path, int ov, int slice) = 0;
    // Drops the most recent overview from the history used by detect_debris
    virtual void discard_last_overview(int ov) = 0;
    // Compares the latest overview with the previous one
    virtual DebrisResult detect_debris(int ov, int method) = 0;
    virtual void reset_tile_stats() = 0;
};

struct AutofocusSchedule {
    bool focus = false;
    bool stig = false;

    bool any() const { return focus || stig; }
};

struct HeuristicCorrection {
    double wd = 0.0;
    double stig_x = 0.0;
    double stig_y = 0.0;
};

class Autofocus {
public:
    virtual ~Autofocus() = default;

    virtual bool is_active() const = 0;
    virtual AutofocusMethod method() const = 0;
    virtual AutofocusSchedule is_active_current_slice(int slice_counter) const = 0;
    virtual bool is_reference_tile(int grid, int tile) const = 0;
    virtual std::vector<TileRef> reference_tiles() const = 0;

    // Returns a status message; failures contain "ERROR"
    virtual std::string run_hardware_autofocus(bool do_focus, bool do_stig) = 0;
    // True if the current WD/stigmation is within max_wd_stig_diff() of the target
    virtual bool check_wd_stig_diff(double target_wd, double target_stig_x,
                                    double target_stig_y) = 0;

    virtual std::array<double, 3> heuristic_deltas() const = 0;
    virtual std::array<double, 3> max_wd_stig_diff() const = 0;
    virtual void process_heuristic_image(const fs::path& path, const std::string& tile_key,
                                         int slice_counter) = 0;
    // nullopt until enough frames have been processed for tile_key
    virtual std::optional<HeuristicCorrection> heuristic_corrections(const std::string& tile_key) = 0;
};

} // namespace sbem_stack::hardware
