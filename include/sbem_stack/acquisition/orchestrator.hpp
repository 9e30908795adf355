#pragma once

#include "acq_logs.hpp"
#include "observer.hpp"
#include "state.hpp"
#include "user_prompt.hpp"
#include "sbem_stack/config/configuration.hpp"
#include "sbem_stack/core/events.hpp"
#include "sbem_stack/geometry/coordinate_system.hpp"
#include "sbem_stack/geometry/grid_manager.hpp"
#include "sbem_stack/geometry/overview_manager.hpp"
#include "sbem_stack/hardware/interfaces.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace sbem_stack::acquisition {

struct OrchestratorStatus {
    RunState run_state = RunState::Idle;
    std::string run_id;
    AcquisitionState state;
};

// Runs a serial block-face stack: per slice, overviews with debris
// mitigation, all scheduled grids tile by tile, then a cut. Hardware and
// image errors inside a run are reported as numeric codes and end the run in
// ErrorPaused; the persisted state allows the run to be resumed at the
// interrupted tile.
class AcquisitionOrchestrator {
public:
    // state_path empty: state is not persisted
    AcquisitionOrchestrator(config::Config cfg,
                            hardware::StageDriver& stage,
                            hardware::ImagingDriver& imaging,
                            hardware::ImageInspector& inspector,
                            hardware::Autofocus& autofocus,
                            AcquisitionState initial = AcquisitionState{},
                            fs::path state_path = fs::path());
    ~AcquisitionOrchestrator();

    AcquisitionOrchestrator(const AcquisitionOrchestrator&) = delete;
    AcquisitionOrchestrator& operator=(const AcquisitionOrchestrator&) = delete;

    // nullptr restores the default observer. Not while running.
    void set_observer(AcquisitionObserver* observer);

    // Starts the slice loop on a worker thread. Throws ValidationError if
    // the stack is already complete and StateError if a run is active.
    void start();
    // Runs the slice loop on the calling thread, returns the final state
    RunState run();
    void wait();
    bool is_running() const { return running_.load(); }

    // Thread-safe. PauseAfterImage also aborts a pending user prompt.
    void request_pause(PauseState state);

    // Back to slice 0. Throws StateError while running.
    void reset();

    OrchestratorStatus status() const;
    AcquisitionState state() const;
    geometry::GridManager grids() const;
    const config::Config& config() const { return cfg_; }
    UserPromptChannel& prompts() { return prompts_; }

private:
    struct TileResult {
        fs::path relative_path;
        fs::path path;
        bool accepted = false;
        bool skipped = false;
        bool selected = true;
    };

    void validate_start() const;
    RunState execute();
    void restore_grid_snapshots();
    void setup_run();
    void slice_loop();
    void finish_run();

    // Overviews and debris
    void acquire_overviews();
    bool acquire_overview(int ov, fs::path& ov_path);
    void save_debris_image(const fs::path& ov_path, int sweep_counter);
    void remove_debris();

    // Grids and tiles
    void acquire_grids();
    void acquire_grid(int grid);
    TileResult acquire_tile(int grid, int tile);
    void register_accepted_tile(int grid, int tile, const fs::path& relative_path);
    bool apply_grid_frame_settings(int grid);

    // Focus and magnification lock
    void perform_hardware_autofocus(int grid, int tile, bool do_move);
    void perform_heuristic_autofocus(int grid, int tile, const fs::path& path);
    void lock_wd_stig();
    void lock_mag();
    bool set_target_wd_stig();
    // Failures set 311/312 (or the device code) and pause
    bool set_working_distance(double wd);
    bool set_stigmation(double x, double y);
    void check_locked_wd_stig();
    void check_locked_mag();

    bool perform_cut();
    bool move_stage(const Vector2d& position, const std::string& what);
    void mirror_files(const std::vector<fs::path>& files);

    // Shared-state updates (locked)
    void set_error(core::ErrorCode code);
    void clear_error();
    void pause_acquisition(PauseState state);
    void poll_pause_request();
    void save_interruption_point(int grid, int tile);
    void set_run_state(RunState state);
    void persist();

    bool paused_after_image() const { return state_.pause_state == PauseState::PauseAfterImage; }
    bool has_error() const { return state_.error_state != core::ErrorCode::None; }
    bool hardware_af_active() const;
    bool heuristic_af_active() const;

    UserReply ask_user(PromptKind kind);
    void process_error_state();
    void log(const std::string& message);
    void error_log(const std::string& message);
    void report_progress(int grid, int tile);
    void wait_seconds(double seconds) const;
    std::ostream& events_out();

    config::Config cfg_;
    hardware::StageDriver& stage_;
    hardware::ImagingDriver& imaging_;
    hardware::ImageInspector& inspector_;
    hardware::Autofocus& autofocus_;

    geometry::CoordinateSystem cs_;
    geometry::GridManager grids_;
    geometry::OverviewManager overviews_;
    AcquisitionState state_;
    fs::path state_path_;
    fs::path base_dir_;
    std::string stack_name_;

    AcquisitionObserver default_observer_;
    AcquisitionObserver* observer_;
    UserPromptChannel prompts_;

    mutable std::mutex mutex_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<int> pause_request_{0};
    RunState run_state_ = RunState::Idle;
    std::string run_id_;

    std::unique_ptr<RunLogs> logs_;
    MirrorDrive mirror_;
    core::EventEmitter events_;
    std::ostream null_out_{nullptr};

    // Per-run
    std::vector<bool> first_ov_;
    hardware::AutofocusSchedule af_schedule_;
    bool use_adaptive_focus_ = false;
    bool wd_locked_ = false;
    bool mag_locked_ = false;
    double target_mag_ = 0.0;
    double wd_delta_ = 0.0;
    double stig_x_delta_ = 0.0;
    double stig_y_delta_ = 0.0;
    bool completed_ = false;
    int tiles_done_ = 0;
    int tiles_total_ = 0;
};

} // namespace sbem_stack::acquisition
