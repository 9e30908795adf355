#include "sbem_stack/acquisition/orchestrator.hpp"
#include "sbem_stack/core/errors.hpp"
#include "sbem_stack/core/utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

namespace sbem_stack::acquisition {

namespace {

// WD (m) and stigmation deviations below this are not corrected
constexpr double kLockTolerance = 0.000001;

std::string position_string(const Vector2d& p) {
    return "X:" + core::format_fixed(p.x(), 3) + ", Y:" + core::format_fixed(p.y(), 3);
}

} // namespace

AcquisitionOrchestrator::AcquisitionOrchestrator(config::Config cfg,
                                                 hardware::StageDriver& stage,
                                                 hardware::ImagingDriver& imaging,
                                                 hardware::ImageInspector& inspector,
                                                 hardware::Autofocus& autofocus,
                                                 AcquisitionState initial,
                                                 fs::path state_path)
    : cfg_(std::move(cfg)),
      stage_(stage),
      imaging_(imaging),
      inspector_(inspector),
      autofocus_(autofocus),
      cs_(geometry::CoordinateSystem::from_config(cfg_)),
      grids_(cfg_.grids),
      overviews_(cfg_.overviews),
      state_(std::move(initial)),
      state_path_(std::move(state_path)),
      base_dir_(cfg_.acquisition.base_dir),
      stack_name_(cfg_.resolved_stack_name()),
      observer_(&default_observer_) {}

AcquisitionOrchestrator::~AcquisitionOrchestrator() {
    if (worker_.joinable()) {
        request_pause(PauseState::PauseAfterImage);
        worker_.join();
    }
}

void AcquisitionOrchestrator::set_observer(AcquisitionObserver* observer) {
    if (running_) {
        throw StateError("cannot change the observer of a running acquisition");
    }
    observer_ = observer ? observer : &default_observer_;
}

// ---------------------------------------------------------------------------
// Run control
// ---------------------------------------------------------------------------

void AcquisitionOrchestrator::validate_start() const {
    const int n = cfg_.acquisition.number_slices;
    const int s = state_.slice_counter;
    if (n > 0 && s > n) {
        throw ValidationError("slice counter " + std::to_string(s) +
                              " exceeds number of slices " + std::to_string(n));
    }
    if (n > 0 && s == n) {
        throw ValidationError("target number of slices (" + std::to_string(n) +
                              ") already reached");
    }
}

void AcquisitionOrchestrator::start() {
    if (running_) {
        throw StateError("acquisition already running");
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    validate_start();
    running_ = true;
    worker_ = std::thread([this]() { execute(); });
}

RunState AcquisitionOrchestrator::run() {
    if (running_) {
        throw StateError("acquisition already running");
    }
    validate_start();
    running_ = true;
    return execute();
}

void AcquisitionOrchestrator::wait() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AcquisitionOrchestrator::request_pause(PauseState state) {
    if (state == PauseState::None) return;
    const int requested = pause_state_to_int(state);
    int current = pause_request_.load();
    // PauseAfterImage takes precedence over PauseAfterSlice
    while (current != 1 && current != requested &&
           !pause_request_.compare_exchange_weak(current, requested)) {
    }
    if (state == PauseState::PauseAfterImage) {
        prompts_.abort();
    }
}

void AcquisitionOrchestrator::reset() {
    if (running_) {
        throw StateError("cannot reset a running acquisition");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.reset();
        run_state_ = RunState::Idle;
    }
    persist();
}

OrchestratorStatus AcquisitionOrchestrator::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return OrchestratorStatus{run_state_, run_id_, state_};
}

AcquisitionState AcquisitionOrchestrator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

geometry::GridManager AcquisitionOrchestrator::grids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return grids_;
}

RunState AcquisitionOrchestrator::execute() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        run_id_ = core::get_run_id();
        state_.number_slices = cfg_.acquisition.number_slices;
        state_.slice_thickness = cfg_.acquisition.slice_thickness;
        state_.paused = false;
        state_.pause_state = PauseState::None;
        state_.error_state = core::ErrorCode::None;
    }
    pause_request_ = 0;
    completed_ = false;
    wd_delta_ = stig_x_delta_ = stig_y_delta_ = 0.0;
    wd_locked_ = mag_locked_ = false;

    try {
        restore_grid_snapshots();
        setup_run();
        slice_loop();
    } catch (const std::exception& e) {
        log("CTRL: Unexpected exception: " + std::string(e.what()));
        set_error(core::ErrorCode::TestCase);
        pause_acquisition(PauseState::PauseAfterImage);
    }

    finish_run();
    RunState final_state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        final_state = run_state_;
    }
    logs_.reset();
    running_ = false;
    return final_state;
}

void AcquisitionOrchestrator::restore_grid_snapshots() {
    if (!state_.interrupted || state_.grids.empty()) return;
    if (static_cast<int>(state_.grids.size()) != grids_.number_grids()) {
        std::cerr << "[STATE] grid snapshot does not match configuration, ignored" << std::endl;
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (int g = 0; g < grids_.number_grids(); ++g) {
        const auto& snap = state_.grids[static_cast<size_t>(g)];
        try {
            grids_.set_active_tiles(g, snap.active_tiles);
            grids_.set_adaptive_focus_tiles(g, snap.adaptive_focus_tiles);
            grids_.set_adaptive_focus_gradient(g, snap.adaptive_focus_gradient);
            grids_.set_origin_wd(g, snap.origin_wd);
        } catch (const GridError& e) {
            std::cerr << "[STATE] grid " << g << " snapshot ignored: " << e.what() << std::endl;
        }
    }
}

void AcquisitionOrchestrator::setup_run() {
    const bool restarted = state_.slice_counter > 0 || state_.interrupted;

    const auto dirs = stack_subdirectories(grids_, overviews_.number_overviews());
    if (!create_subdirectories(base_dir_, dirs)) {
        set_error(core::ErrorCode::PrimaryDrive);
        pause_acquisition(PauseState::PauseAfterImage);
        return;
    }
    if (cfg_.acquisition.use_mirror_drive) {
        mirror_ = MirrorDrive(base_dir_, cfg_.acquisition.mirror_drive, stack_name_);
        if (!mirror_.create_subdirectories(dirs)) {
            set_error(core::ErrorCode::MirrorDrive);
            pause_acquisition(PauseState::PauseAfterSlice);
        }
    } else {
        mirror_ = MirrorDrive();
    }

    try {
        logs_ = std::make_unique<RunLogs>(base_dir_, core::get_file_timestamp(),
                                          cfg_.acquisition.echo_events);
        config::Config snapshot = cfg_;
        snapshot.grids = grids_.to_config();
        snapshot.save(logs_->config_path());
        grids_.save_grid_map(logs_->gridmap_path());
    } catch (const SbemStackError& e) {
        std::cerr << "[STACK] " << e.what() << std::endl;
        set_error(core::ErrorCode::PrimaryDrive);
        pause_acquisition(PauseState::PauseAfterImage);
        return;
    }
    mirror_files(logs_->all_files());

    log("*** SBEM stack acquisition: " + base_dir_.string() + " ***");
    log(restarted ? "CTRL: Stack restarted." : "CTRL: Stack started.");
    if (mirror_.enabled()) {
        log("CTRL: Mirror drive directory: " + mirror_.directory().string());
    }

    first_ov_.assign(static_cast<size_t>(overviews_.number_overviews()), true);
    inspector_.reset_tile_stats();

    json grid_names = json::array();
    json pixel_sizes = json::array();
    json dwell_times = json::array();
    for (int g = 0; g < grids_.number_grids(); ++g) {
        grid_names.push_back(core::zero_pad(g, core::kGridDigits));
        pixel_sizes.push_back(grids_.params(g).pixel_size);
        dwell_times.push_back(grids_.params(g).dwell_time);
    }
    const auto stig = imaging_.stigmation();
    logs_->metadata("SESSION", {
        {"timestamp", core::get_iso_timestamp()},
        {"eht", cfg_.imaging.eht},
        {"beam_current", imaging_.beam_current()},
        {"stig_parameters", {stig[0], stig[1]}},
        {"working_distance", imaging_.working_distance()},
        {"slice_thickness", cfg_.acquisition.slice_thickness},
        {"grids", grid_names},
        {"pixel_sizes", pixel_sizes},
        {"dwell_times", dwell_times},
    });

    events_.run_start(run_id_, {
        {"base_dir", base_dir_.string()},
        {"stack_name", stack_name_},
        {"slice_counter", state_.slice_counter},
        {"number_slices", cfg_.acquisition.number_slices},
        {"restarted", restarted},
    }, events_out());

    lock_wd_stig();

    std::optional<double> z = stage_.stage_z();
    if (!z || *z < 0.0) {
        wait_seconds(cfg_.stage.retry_delay);
        z = stage_.stage_z();
    }
    if (!z || *z < 0.0) {
        set_error(core::ErrorCode::ScriptReturnValues);
        pause_acquisition(PauseState::PauseAfterImage);
        log("CTRL: Error reading initial Z position.");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.stage_z_position = *z;
    }
}

void AcquisitionOrchestrator::slice_loop() {
    while (!(state_.paused || completed_)) {
        log("CTRL: ****************************************");
        log("CTRL: slice " + std::to_string(state_.slice_counter) +
            ", Z:" + core::format_fixed(state_.stage_z_position, 3));
        events_.slice_start(run_id_, state_.slice_counter, state_.stage_z_position, events_out());

        af_schedule_ = hardware_af_active()
            ? autofocus_.is_active_current_slice(state_.slice_counter)
            : hardware::AutofocusSchedule{};

        if (heuristic_af_active()) {
            const double sign = (state_.slice_counter % 2) ? 1.0 : -1.0;
            const auto deltas = autofocus_.heuristic_deltas();
            wd_delta_ = sign * deltas[0];
            stig_x_delta_ = sign * deltas[1];
            stig_y_delta_ = sign * deltas[2];
            log("CTRL: Heuristic autofocus active.");
            log("CTRL: DIFF_WD: " + core::format_fixed(wd_delta_ * 1000, 4) +
                ", DIFF_STIG_X: " + core::format_fixed(stig_x_delta_, 2) +
                ", DIFF_STIG_Y: " + core::format_fixed(stig_y_delta_, 2));
        }

        tiles_done_ = 0;
        tiles_total_ = 0;
        for (int g = 0; g < grids_.number_grids(); ++g) {
            if (grids_.is_slice_active(g, state_.slice_counter)) {
                tiles_total_ += grids_.number_active_tiles(g);
            }
        }

        if (cfg_.acquisition.take_overviews) {
            acquire_overviews();
        }

        acquire_grids();

        logs_->metadata("SLICE COMPLETE", {
            {"timestamp", core::get_iso_timestamp()},
            {"completed_slice", state_.slice_counter},
        });

        poll_pause_request();

        // Single slice: image only
        if (cfg_.acquisition.number_slices == 0) {
            pause_acquisition(PauseState::PauseAfterImage);
            if (!state_.interrupted) {
                std::lock_guard<std::mutex> lock(mutex_);
                state_.grids_acquired.clear();
                state_.tiles_acquired.clear();
            }
        }

        if (!paused_after_image() && !has_error()) {
            if (perform_cut()) {
                std::lock_guard<std::mutex> lock(mutex_);
                state_.reset_interruption();
            }
        }

        persist();
        report_progress(-1, -1);

        if (cfg_.acquisition.number_slices > 0 &&
            state_.slice_counter == cfg_.acquisition.number_slices) {
            completed_ = true;
        }

        mirror_files({logs_->main_log_path(), logs_->imagelist_path()});
    }
}

void AcquisitionOrchestrator::finish_run() {
    if (heuristic_af_active() && logs_) {
        wd_delta_ = stig_x_delta_ = stig_y_delta_ = 0.0;
        if (!set_target_wd_stig()) {
            log("CTRL: Could not restore target WD/stigmation.");
        }
    }

    if (has_error()) {
        process_error_state();
    }

    RunState final_state;
    if (completed_) {
        final_state = RunState::Completed;
        std::lock_guard<std::mutex> lock(mutex_);
        state_.paused = false;
        state_.pause_state = PauseState::None;
    } else if (has_error()) {
        final_state = RunState::ErrorPaused;
    } else {
        final_state = RunState::Paused;
    }

    if (completed_) {
        log("CTRL: Stack completed.");
    } else {
        log("CTRL: Stack paused.");
    }

    persist();
    set_run_state(final_state);
    events_.run_end(run_id_, final_state, state_.slice_counter, events_out());

    if (logs_) {
        log("*** END OF LOG ***");
        mirror_files(logs_->live_files());
    }
    if (completed_) {
        observer_->on_completed();
    }
}

// ---------------------------------------------------------------------------
// Overviews
// ---------------------------------------------------------------------------

void AcquisitionOrchestrator::acquire_overviews() {
    set_run_state(RunState::AcquiringOverviews);
    events_.phase_start(run_id_, RunState::AcquiringOverviews,
                        {{"slice", state_.slice_counter}}, events_out());

    const bool use_debris_detection = cfg_.acquisition.use_debris_detection;
    const int max_sweeps = cfg_.debris.max_number_sweeps;

    for (int ov = 0; ov < overviews_.number_overviews(); ++ov) {
        poll_pause_request();
        if (has_error() || paused_after_image()) break;

        if (!overviews_.is_slice_active(ov, state_.slice_counter)) {
            log("CTRL: Skip OV " + std::to_string(ov) + " (intervallic acquisition)");
            continue;
        }

        bool accepted = false;
        bool sweep_limit = false;
        int sweep_counter = 0;
        int fail_counter = 0;
        fs::path ov_path;

        while (!accepted && !sweep_limit && !paused_after_image() &&
               fail_counter < core::kMaxTransientAttempts) {
            accepted = acquire_overview(ov, ov_path);

            if (state_.error_state == core::ErrorCode::GrabIncomplete ||
                state_.error_state == core::ErrorCode::LoadImage) {
                ++fail_counter;
                inspector_.discard_last_overview(ov);
                if (fail_counter < core::kMaxTransientAttempts) {
                    log("CTRL: OV problem detected. Trying again.");
                    clear_error();
                } else {
                    pause_acquisition(PauseState::PauseAfterImage);
                }
            } else if (has_error()) {
                break;
            } else if (!accepted && !paused_after_image() &&
                       (use_debris_detection || first_ov_[static_cast<size_t>(ov)])) {
                save_debris_image(ov_path, sweep_counter);
                inspector_.discard_last_overview(ov);
                if (sweep_counter < max_sweeps) {
                    remove_debris();
                    ++sweep_counter;
                } else {
                    sweep_limit = true;
                }
            }
        }

        if (!accepted && !has_error() && !paused_after_image()) {
            if (!cfg_.debris.continue_after_max_sweeps) {
                set_error(core::ErrorCode::MaxSweeps);
                pause_acquisition(PauseState::PauseAfterImage);
                log("CTRL: Max. number of sweeps reached.");
            } else {
                accepted = true;
                const std::string msg = "Max. number of sweeps reached for OV " +
                    std::to_string(ov) + ", continuing with debris";
                log("CTRL: WARNING: " + msg + ".");
                logs_->debris(std::to_string(state_.slice_counter) + ": WARNING (" + msg + ")");
                events_.debris_accepted_with_warning(run_id_, ov, state_.slice_counter,
                                                     sweep_counter, events_out());
            }
        }

        first_ov_[static_cast<size_t>(ov)] = false;

        if (accepted) {
            events_.overview_acquired(run_id_, ov, state_.slice_counter, sweep_counter,
                                      events_out());
        }
        if (!ov_path.empty() && fs::exists(ov_path)) {
            mirror_files({ov_path});
        }
        if (sweep_counter > 0) {
            logs_->debris(std::to_string(state_.slice_counter) + ": Debris, " +
                          std::to_string(sweep_counter) + " sweep(s)");
        }
    }

    events_.phase_end(run_id_, RunState::AcquiringOverviews, has_error() ? "error" : "ok",
                      {{"slice", state_.slice_counter}}, events_out());
}

bool AcquisitionOrchestrator::acquire_overview(int ov, fs::path& ov_path) {
    const auto& p = overviews_.params(ov);
    const Vector2d pos = overviews_.stage_position(ov, cs_);

    log("STAGE: Moving stage to OV " + std::to_string(ov) + " position.");
    if (!move_stage(pos, "OV" + std::to_string(ov))) {
        return false;
    }

    if (!set_target_wd_stig()) {
        return false;
    }
    log("IMAGING: Acquiring OV at " + position_string(pos));
    if (!imaging_.apply_frame_settings(p.size_selector, p.pixel_size, p.dwell_time)) {
        const auto code = imaging_.error_state();
        imaging_.reset_error_state();
        set_error(code != core::ErrorCode::None ? code : core::ErrorCode::FrameSize);
        pause_acquisition(PauseState::PauseAfterImage);
        return false;
    }
    if (p.wd > 0.0) {
        if (!set_working_distance(p.wd + wd_delta_)) {
            return false;
        }
        log("IMAGING: Using user-specified WD: " + core::format_fixed((p.wd + wd_delta_) * 1000, 6));
    }

    ov_path = base_dir_ / core::overview_save_path(stack_name_, ov, state_.slice_counter);
    const bool grabbed = imaging_.acquire_frame(ov_path);
    imaging_.reset_error_state();

    if (!grabbed || !fs::exists(ov_path)) {
        log("CTRL: OV acquisition failure.");
        set_error(core::ErrorCode::OverviewOutOfRange);
        pause_acquisition(PauseState::PauseAfterImage);
        return false;
    }

    const auto insp = inspector_.process_overview(ov_path, ov, state_.slice_counter);
    if (insp.load_error) {
        set_error(core::ErrorCode::LoadImage);
        return false;
    }
    log("CTRL: OV: M:" + core::format_fixed(insp.mean, 2) +
        ", SD:" + core::format_fixed(insp.stddev, 2));
    if (insp.grab_incomplete) {
        set_error(core::ErrorCode::GrabIncomplete);
        return false;
    }
    if (cfg_.acquisition.monitor_images && !insp.range_ok) {
        set_error(core::ErrorCode::OverviewOutOfRange);
        pause_acquisition(PauseState::PauseAfterImage);
        log("CTRL: OV outside of mean/stddev limits.");
        return false;
    }

    bool accepted = true;
    if (first_ov_[static_cast<size_t>(ov)]) {
        const UserReply reply = ask_user(PromptKind::DebrisFirstOverview);
        accepted = (reply == UserReply::Yes);
        if (reply == UserReply::Abort) {
            pause_acquisition(PauseState::PauseAfterImage);
        }
    } else if (cfg_.acquisition.use_debris_detection) {
        const auto debris = inspector_.detect_debris(ov, cfg_.debris.detection_method);
        if (!debris.message.empty()) {
            log(debris.message);
        }
        if (debris.detected) {
            accepted = false;
            events_.debris_detected(run_id_, ov, state_.slice_counter, 0, debris.message,
                                    events_out());
            if (cfg_.acquisition.ask_user) {
                const UserReply reply = ask_user(PromptKind::DebrisConfirmation);
                accepted = (reply == UserReply::No);
                if (reply == UserReply::Abort) {
                    pause_acquisition(PauseState::PauseAfterImage);
                }
            }
        }
    }
    return accepted;
}

void AcquisitionOrchestrator::save_debris_image(const fs::path& ov_path, int sweep_counter) {
    if (ov_path.empty() || !fs::exists(ov_path)) return;
    const fs::path dst = base_dir_ / "overviews" / "debris" /
        (ov_path.stem().string() + "_" + std::to_string(sweep_counter) + ".tif");
    std::error_code ec;
    fs::copy_file(ov_path, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        log("CTRL: Could not save debris image: " + ec.message());
        return;
    }
    mirror_files({dst});
}

void AcquisitionOrchestrator::remove_debris() {
    log("CTRL: Sweeping to remove debris.");
    if (stage_.sweep(state_.stage_z_position)) return;

    stage_.reset_error_state();
    log("CTRL: Problem during sweep. Trying again.");
    error_log(std::to_string(state_.slice_counter) + ": WARNING (Problem during sweep)");
    wait_seconds(cfg_.stage.retry_delay);
    if (!stage_.sweep(state_.stage_z_position)) {
        stage_.reset_error_state();
        set_error(core::ErrorCode::Sweeping);
        pause_acquisition(PauseState::PauseAfterImage);
        log("CTRL: Error during second sweep attempt.");
    }
}

// ---------------------------------------------------------------------------
// Grids
// ---------------------------------------------------------------------------

void AcquisitionOrchestrator::acquire_grids() {
    if (state_.interrupted && state_.interrupted_at.grid >= grids_.number_grids()) {
        // The grid of the interruption point no longer exists
        std::lock_guard<std::mutex> lock(mutex_);
        state_.interrupted = false;
        state_.interrupted_at = TileRef{};
        state_.tiles_acquired.clear();
    }

    for (int g = 0; g < grids_.number_grids(); ++g) {
        poll_pause_request();
        if (has_error() || paused_after_image()) break;

        if (!grids_.is_slice_active(g, state_.slice_counter)) {
            log("CTRL: Skip grid " + std::to_string(g) + " (intervallic acquisition)");
            continue;
        }
        const int n = grids_.number_active_tiles(g);
        log("CTRL: Grid " + std::to_string(g) + ", number of active tiles: " + std::to_string(n));
        if (n == 0) continue;

        if (state_.is_grid_acquired(g)) {
            log("CTRL: Grid " + std::to_string(g) + " already acquired. Skipping.");
            tiles_done_ += n;
        } else {
            acquire_grid(g);
        }
    }

    if (!paused_after_image() && state_.interrupted &&
        state_.is_grid_acquired(state_.interrupted_at.grid)) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.interrupted = false;
        state_.interrupted_at = TileRef{};
    }
}

bool AcquisitionOrchestrator::apply_grid_frame_settings(int grid) {
    const auto& p = grids_.params(grid);
    if (imaging_.apply_frame_settings(p.tile_size_selector, p.pixel_size, p.dwell_time)) {
        return true;
    }
    const auto code = imaging_.error_state();
    imaging_.reset_error_state();
    set_error(code != core::ErrorCode::None ? code : core::ErrorCode::FrameSize);
    pause_acquisition(PauseState::PauseAfterImage);
    return false;
}

void AcquisitionOrchestrator::acquire_grid(int grid) {
    set_run_state(RunState::AcquiringGrids);
    events_.phase_start(run_id_, RunState::AcquiringGrids,
                        {{"slice", state_.slice_counter}, {"grid", grid}}, events_out());

    use_adaptive_focus_ = grids_.is_adaptive_focus_active(grid);
    const std::vector<int> active_tiles = grids_.active_tiles(grid);

    if (hardware_af_active() && af_schedule_.any()) {
        // Reference tiles outside the active set are focused first
        for (const auto& ref : autofocus_.reference_tiles()) {
            if (ref.grid != grid) continue;
            if (std::find(active_tiles.begin(), active_tiles.end(), ref.tile) != active_tiles.end())
                continue;
            perform_hardware_autofocus(grid, ref.tile, true);
            if (has_error() || paused_after_image()) {
                pause_acquisition(PauseState::PauseAfterImage);
                save_interruption_point(grid, ref.tile);
                break;
            }
        }
    }

    if (!paused_after_image()) {
        log("CTRL: Starting acquisition of active tiles in grid " + std::to_string(grid));
        const bool ready = apply_grid_frame_settings(grid) &&
                           (use_adaptive_focus_ || set_target_wd_stig());
        if (!ready) {
            if (!state_.interrupted) {
                save_interruption_point(grid, active_tiles.front());
            }
        } else {
            lock_mag();

            if (state_.interrupted) {
                // Tiles deactivated since the interruption
                std::lock_guard<std::mutex> lock(mutex_);
                auto& acquired = state_.tiles_acquired;
                acquired.erase(std::remove_if(acquired.begin(), acquired.end(),
                    [&](const std::string& key) {
                        for (int t : active_tiles) {
                            if (key == tile_key(grid, t)) return false;
                        }
                        return true;
                    }), acquired.end());
            }

            const auto stig = imaging_.stigmation();
            log("IMAGING: Current WD/STIG_XY: " +
                core::format_fixed(imaging_.working_distance() * 1000, 6) + ", " +
                core::format_fixed(stig[0], 6) + ", " + core::format_fixed(stig[1], 6));

            for (int tile : active_tiles) {
                int fail_counter = 0;
                TileResult result;
                while (!result.accepted && fail_counter < core::kMaxTransientAttempts) {
                    result = acquire_tile(grid, tile);
                    if (core::is_transient(state_.error_state)) {
                        ++fail_counter;
                        if (fail_counter < core::kMaxTransientAttempts) {
                            log("CTRL: Problem with tile detected. Trying again.");
                            std::error_code ec;
                            fs::remove(result.path, ec);
                            clear_error();
                        } else {
                            pause_acquisition(PauseState::PauseAfterImage);
                        }
                    } else if (has_error()) {
                        pause_acquisition(PauseState::PauseAfterImage);
                        break;
                    }
                }

                const std::string key = tile_key(grid, tile);
                if (result.accepted && result.selected && !result.skipped) {
                    register_accepted_tile(grid, tile, result.relative_path);
                    if (heuristic_af_active() && autofocus_.is_reference_tile(grid, tile)) {
                        perform_heuristic_autofocus(grid, tile, result.path);
                    }
                } else if (!result.selected && !result.skipped && !has_error()) {
                    log("CTRL: Tile " + key + " was discarded by image inspector.");
                    std::error_code ec;
                    fs::remove(result.path, ec);
                    if (ec) {
                        log("CTRL: Tile image file could not be deleted.");
                    }
                    std::lock_guard<std::mutex> lock(mutex_);
                    state_.tiles_acquired.push_back(key);
                }

                if (!has_error() || result.skipped) {
                    ++tiles_done_;
                }
                persist();
                report_progress(grid, tile);

                poll_pause_request();
                if (paused_after_image()) {
                    save_interruption_point(grid, tile);
                    break;
                }
            }
        }
    }

    bool complete = true;
    for (int t : active_tiles) {
        if (!state_.is_tile_acquired(grid, t)) {
            complete = false;
            break;
        }
    }
    if (complete) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.grids_acquired.push_back(grid);
        state_.tiles_acquired.clear();
    }
    persist();

    events_.phase_end(run_id_, RunState::AcquiringGrids, complete ? "ok" : "incomplete",
                      {{"slice", state_.slice_counter}, {"grid", grid}}, events_out());
}

AcquisitionOrchestrator::TileResult AcquisitionOrchestrator::acquire_tile(int grid, int tile) {
    TileResult r;
    r.relative_path = core::tile_save_path(stack_name_, grid, tile, state_.slice_counter);
    r.path = base_dir_ / r.relative_path;
    const std::string key = tile_key(grid, tile);

    if (state_.is_tile_acquired(grid, tile)) {
        r.skipped = true;
        r.accepted = true;
        log("CTRL: Tile " + key + " already acquired. Skipping.");
        return r;
    }

    const bool retake = state_.interrupted && state_.interrupted_at == TileRef{grid, tile};
    if (fs::exists(r.path) && !retake) {
        // Never overwrite an image that is not known to be incomplete
        set_error(core::ErrorCode::OverwriteFile);
        log("CTRL: Problem detected.");
        log("CTRL: Tile " + key + ": Image file already exists!");
        return r;
    }

    const Vector2d pos = grids_.tile_stage_position(grid, tile, cs_);
    log("STAGE: Moving stage to position of tile " + key);
    if (!move_stage(pos, "tile " + key)) {
        return r;
    }

    if (hardware_af_active() && af_schedule_.any() && autofocus_.is_reference_tile(grid, tile)) {
        perform_hardware_autofocus(grid, tile, false);
    }

    if (mag_locked_ && !core::is_autofocus_error(state_.error_state)) {
        check_locked_mag();
    }
    if (wd_locked_ && !use_adaptive_focus_ && !core::is_autofocus_error(state_.error_state)) {
        check_locked_wd_stig();
    }
    if (use_adaptive_focus_ && !set_working_distance(grids_.tile_wd(grid, tile))) {
        return r;
    }

    // Acquired even after an autofocus error; the image is kept for reference
    log("IMAGING: Acquiring tile at " + position_string(pos));
    const bool grabbed = imaging_.acquire_frame(r.path);
    imaging_.reset_error_state();
    if (fs::exists(r.path)) {
        mirror_files({r.path});
    }

    if (!grabbed || !fs::exists(r.path)) {
        log("CTRL: Tile image acquisition failure.");
        set_error(core::ErrorCode::GrabImage);
        return r;
    }

    const auto insp = inspector_.process_tile(r.path, grid, tile, state_.slice_counter);
    r.selected = insp.selected;
    if (insp.load_error) {
        set_error(core::ErrorCode::LoadImage);
        return r;
    }

    log("CTRL: Tile " + key + ": M:" + core::format_fixed(insp.mean, 2) +
        ", SD:" + core::format_fixed(insp.stddev, 2));
    r.accepted = true;
    if (cfg_.acquisition.monitor_images) {
        if (!insp.range_ok) {
            r.accepted = false;
            set_error(core::ErrorCode::TileOutOfRange);
            log("CTRL: Tile outside of permitted mean/SD range!");
        }
        if (insp.slice_by_slice_ok && !*insp.slice_by_slice_ok) {
            r.accepted = false;
            set_error(core::ErrorCode::SliceBySlice);
            log("CTRL: Tile above mean/SD slice-by-slice thresholds.");
        }
    }
    if (insp.frozen_frame) {
        r.accepted = false;
        set_error(core::ErrorCode::FrozenFrame);
        log("CTRL: Tile " + key + ": frozen frame error!");
    } else if (insp.grab_incomplete) {
        r.accepted = false;
        set_error(core::ErrorCode::GrabIncomplete);
    }
    if (core::is_autofocus_error(state_.error_state)) {
        r.accepted = false;
    }
    return r;
}

void AcquisitionOrchestrator::register_accepted_tile(int grid, int tile,
                                                     const fs::path& relative_path) {
    const auto& p = grids_.params(grid);
    const Vector2d pos = grids_.tile_pixel_position(grid, tile, cs_);
    const int global_px = static_cast<int>(pos.x() - p.tile_width / 2.0);
    const int global_py = static_cast<int>(pos.y() - p.tile_height / 2.0);

    logs_->imagelist(relative_path.generic_string() + ";" + std::to_string(global_px) + ";" +
                     std::to_string(global_py) + ";" + std::to_string(state_.slice_counter));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.tiles_acquired.push_back(tile_key(grid, tile));
    }
    logs_->metadata("TILE", {
        {"timestamp", core::get_iso_timestamp()},
        {"tileid", core::tile_id(grid, tile, state_.slice_counter)},
        {"filename", relative_path.generic_string()},
        {"tile_width", p.tile_width},
        {"tile_height", p.tile_height},
        {"working_distance", imaging_.working_distance()},
        {"glob_x", global_px},
        {"glob_y", global_py},
        {"slice_counter", state_.slice_counter},
    });
    events_.tile_acquired(run_id_, grid, tile, state_.slice_counter,
                          relative_path.generic_string(), events_out());
}

// ---------------------------------------------------------------------------
// Focus
// ---------------------------------------------------------------------------

bool AcquisitionOrchestrator::hardware_af_active() const {
    return autofocus_.is_active() && autofocus_.method() == AutofocusMethod::Hardware;
}

bool AcquisitionOrchestrator::heuristic_af_active() const {
    return autofocus_.is_active() && autofocus_.method() == AutofocusMethod::Heuristic;
}

void AcquisitionOrchestrator::perform_hardware_autofocus(int grid, int tile, bool do_move) {
    const std::string key = tile_key(grid, tile);
    if (do_move) {
        const Vector2d pos = grids_.tile_stage_position(grid, tile, cs_);
        log("STAGE: Moving stage to position of tile " + key + " for autofocus");
        if (!move_stage(pos, "tile " + key)) return;
    }
    if (!af_schedule_.any()) return;

    std::string af_type = "(focus+stig)";
    if (!af_schedule_.stig) af_type = "(focus only)";
    else if (!af_schedule_.focus) af_type = "(stig only)";
    log("CTRL: Running hardware autofocus " + af_type + " for tile " + key);

    const std::string msg = autofocus_.run_hardware_autofocus(af_schedule_.focus, af_schedule_.stig);
    log(msg);
    if (msg.find("ERROR") != std::string::npos) {
        set_error(core::ErrorCode::HardwareAutofocus);
    } else if (autofocus_.check_wd_stig_diff(state_.target_wd, state_.target_stig_x,
                                             state_.target_stig_y)) {
        if (grids_.is_adaptive_focus_active(grid)) {
            const double diff = imaging_.working_distance() - grids_.tile_wd(grid, tile);
            std::lock_guard<std::mutex> lock(mutex_);
            for (int g = 0; g < grids_.number_grids(); ++g) {
                if (grids_.is_adaptive_focus_active(g)) {
                    grids_.adjust_focus_map(g, diff);
                }
            }
        }
        lock_wd_stig();
    } else {
        set_error(core::ErrorCode::WdStigDifference);
    }
    if (!apply_grid_frame_settings(grid)) {
        log("CTRL: Could not restore frame settings of grid " + std::to_string(grid));
    }
}

void AcquisitionOrchestrator::perform_heuristic_autofocus(int grid, int tile, const fs::path& path) {
    const std::string key = tile_key(grid, tile);
    log("CTRL: Processing tile " + key + " for heuristic autofocus");
    autofocus_.process_heuristic_image(path, key, state_.slice_counter);

    const auto corr = autofocus_.heuristic_corrections(key);
    if (!corr) {
        log("CTRL: No estimates computed.");
        return;
    }
    log("CTRL: New corrections: " + core::format_fixed(corr->wd * 1000, 6) + ", " +
        core::format_fixed(corr->stig_x, 6) + ", " + core::format_fixed(corr->stig_y, 6));

    const auto max_diff = autofocus_.max_wd_stig_diff();
    if (std::abs(corr->wd) > max_diff[0] || std::abs(corr->stig_x) > max_diff[1] ||
        std::abs(corr->stig_y) > max_diff[2]) {
        set_error(core::ErrorCode::WdStigDifference);
        pause_acquisition(PauseState::PauseAfterImage);
    } else if (std::abs(corr->wd) < 3 * std::abs(wd_delta_) &&
               std::abs(corr->stig_x) < 3 * std::abs(stig_x_delta_) &&
               std::abs(corr->stig_y) < 3 * std::abs(stig_y_delta_)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_.target_wd += corr->wd;
            state_.target_stig_x += corr->stig_x;
            state_.target_stig_y += corr->stig_y;
        }
        log("IMAGING: New WD/STIG_XY: " + core::format_fixed(state_.target_wd * 1000, 6) + ", " +
            core::format_fixed(state_.target_stig_x, 6) + ", " +
            core::format_fixed(state_.target_stig_y, 6));
    } else {
        log("CTRL: Warning: estimates out of range, not applied.");
    }
}

void AcquisitionOrchestrator::lock_wd_stig() {
    const double wd = imaging_.working_distance();
    const auto stig = imaging_.stigmation();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.target_wd = wd;
        state_.target_stig_x = stig[0];
        state_.target_stig_y = stig[1];
    }
    wd_locked_ = true;
    log("IMAGING: Current WD/STIG_XY: " + core::format_fixed(wd * 1000, 6) + ", " +
        core::format_fixed(stig[0], 6) + ", " + core::format_fixed(stig[1], 6));
}

void AcquisitionOrchestrator::lock_mag() {
    target_mag_ = imaging_.magnification();
    mag_locked_ = true;
}

bool AcquisitionOrchestrator::set_target_wd_stig() {
    return set_working_distance(state_.target_wd + wd_delta_) &&
           set_stigmation(state_.target_stig_x + stig_x_delta_,
                          state_.target_stig_y + stig_y_delta_);
}

bool AcquisitionOrchestrator::set_working_distance(double wd) {
    if (imaging_.set_working_distance(wd)) return true;
    const auto code = imaging_.error_state();
    imaging_.reset_error_state();
    set_error(code != core::ErrorCode::None ? code : core::ErrorCode::WorkingDistance);
    pause_acquisition(PauseState::PauseAfterImage);
    return false;
}

bool AcquisitionOrchestrator::set_stigmation(double x, double y) {
    if (imaging_.set_stigmation(x, y)) return true;
    const auto code = imaging_.error_state();
    imaging_.reset_error_state();
    set_error(code != core::ErrorCode::None ? code : core::ErrorCode::Stigmation);
    pause_acquisition(PauseState::PauseAfterImage);
    return false;
}

void AcquisitionOrchestrator::check_locked_wd_stig() {
    const double wd_target = state_.target_wd + wd_delta_;
    const double sx_target = state_.target_stig_x + stig_x_delta_;
    const double sy_target = state_.target_stig_y + stig_y_delta_;
    const auto stig = imaging_.stigmation();

    std::string alert;
    if (std::abs(imaging_.working_distance() - wd_target) > kLockTolerance) {
        log("CTRL: Warning: Change in working distance detected.");
        log("CTRL: Resetting working distance.");
        if (!set_working_distance(wd_target)) return;
        alert = "Change in working distance detected and corrected";
    }
    if (std::abs(stig[0] - sx_target) > kLockTolerance ||
        std::abs(stig[1] - sy_target) > kLockTolerance) {
        log("CTRL: Warning: Change in stigmation settings detected.");
        log("CTRL: Resetting stigmation parameters.");
        if (!set_stigmation(sx_target, sy_target)) return;
        alert += alert.empty() ? "Change in stigmation detected and corrected"
                               : "; change in stigmation detected and corrected";
    }
    if (!alert.empty()) {
        events_.focus_alert(run_id_, alert, events_out());
        observer_->on_focus_alert(alert);
    }
}

void AcquisitionOrchestrator::check_locked_mag() {
    if (imaging_.magnification() == target_mag_) return;
    log("CTRL: Warning: Change in magnification detected.");
    log("CTRL: Resetting magnification.");
    if (!imaging_.set_magnification(target_mag_)) {
        const auto code = imaging_.error_state();
        imaging_.reset_error_state();
        set_error(code != core::ErrorCode::None ? code : core::ErrorCode::Magnification);
        pause_acquisition(PauseState::PauseAfterImage);
        return;
    }
    const std::string msg = "Change in magnification detected and corrected";
    events_.warning(run_id_, msg, events_out());
    observer_->on_mag_alert(msg);
}

// ---------------------------------------------------------------------------
// Stage
// ---------------------------------------------------------------------------

bool AcquisitionOrchestrator::move_stage(const Vector2d& position, const std::string& what) {
    if (stage_.move_xy(position.x(), position.y())) return true;

    stage_.reset_error_state();
    log("CTRL: Problem detected (XY stage move). Trying again.");
    error_log(std::to_string(state_.slice_counter) + ": WARNING (Move to " + what +
              " position failed)");
    wait_seconds(cfg_.stage.retry_delay);
    if (stage_.move_xy(position.x(), position.y())) return true;

    const auto code = stage_.error_state();
    stage_.reset_error_state();
    set_error(code != core::ErrorCode::None ? code : core::ErrorCode::StageXY);
    pause_acquisition(PauseState::PauseAfterImage);
    log("CTRL: Stage failed to move to " + what + " position.");
    return false;
}

bool AcquisitionOrchestrator::perform_cut() {
    set_run_state(RunState::Cutting);
    events_.phase_start(run_id_, RunState::Cutting, {{"slice", state_.slice_counter}},
                        events_out());

    const double thickness_um = cfg_.acquisition.slice_thickness / 1000.0;
    const double new_z = state_.stage_z_position + thickness_um;
    log("STAGE: Move to new Z: " + core::format_fixed(new_z, 3));

    core::ErrorCode code = core::ErrorCode::None;
    if (!stage_.move_z(new_z)) {
        code = stage_.error_state();
        if (code == core::ErrorCode::None) code = core::ErrorCode::StageZ;
    } else {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_.stage_z_position = new_z;
        }
        log("STAGE: Cutting in progress (" + std::to_string(cfg_.acquisition.slice_thickness) +
            " nm cutting thickness).");
        const bool cut_ok = stage_.full_cut();
        wait_seconds(stage_.full_cut_duration());
        code = stage_.error_state();
        if (!cut_ok && code == core::ErrorCode::None) code = core::ErrorCode::Cutting;
    }
    stage_.reset_error_state();

    if (code != core::ErrorCode::None) {
        set_error(code);
        log("CTRL: Problem detected.");
        pause_acquisition(PauseState::PauseAfterImage);
        events_.phase_end(run_id_, RunState::Cutting, "error", {{"code", core::to_int(code)}},
                          events_out());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.slice_counter += 1;
        state_.total_z_diff += thickness_um;
    }
    log("STAGE: Cut completed.");
    events_.cut_completed(run_id_, state_.slice_counter, state_.total_z_diff, events_out());
    events_.phase_end(run_id_, RunState::Cutting, "ok", {{"slice", state_.slice_counter}},
                      events_out());
    return true;
}

void AcquisitionOrchestrator::mirror_files(const std::vector<fs::path>& files) {
    if (!mirror_.enabled() || files.empty()) return;
    if (mirror_.mirror_files(files)) return;

    error_log(std::to_string(state_.slice_counter) + ": WARNING (Could not mirror file(s))");
    wait_seconds(cfg_.stage.retry_delay);
    if (!mirror_.mirror_files(files)) {
        log("CTRL: Copying file(s) to mirror drive failed.");
        pause_acquisition(PauseState::PauseAfterSlice);
        set_error(core::ErrorCode::MirrorDrive);
    }
}

// ---------------------------------------------------------------------------
// Shared state
// ---------------------------------------------------------------------------

void AcquisitionOrchestrator::set_error(core::ErrorCode code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.error_state == core::ErrorCode::None) {
        state_.error_state = code;
    }
}

void AcquisitionOrchestrator::clear_error() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.error_state = core::ErrorCode::None;
}

void AcquisitionOrchestrator::pause_acquisition(PauseState pause_state) {
    if (pause_state == PauseState::None) return;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.pause_state != PauseState::PauseAfterImage &&
            state_.pause_state != pause_state) {
            state_.pause_state = pause_state;
            changed = true;
        }
        state_.paused = true;
    }
    if (changed) {
        events_.pause(run_id_, pause_state, events_out());
    }
}

void AcquisitionOrchestrator::poll_pause_request() {
    const int requested = pause_request_.exchange(0);
    if (requested == 0) return;
    log("CTRL: Pause requested (" + pause_state_to_string(int_to_pause_state(requested)) + ").");
    pause_acquisition(int_to_pause_state(requested));
}

void AcquisitionOrchestrator::save_interruption_point(int grid, int tile) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.save_interruption_point(grid, tile);
}

void AcquisitionOrchestrator::set_run_state(RunState state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (run_state_ == state) return;
        run_state_ = state;
    }
    observer_->on_state_changed(state);
}

void AcquisitionOrchestrator::persist() {
    AcquisitionState snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.last_update = core::get_iso_timestamp();
        state_.grids.clear();
        for (int g = 0; g < grids_.number_grids(); ++g) {
            GridSnapshot s;
            s.active_tiles = grids_.active_tiles(g);
            s.adaptive_focus_tiles = grids_.adaptive_focus_tiles(g);
            s.adaptive_focus_gradient = grids_.adaptive_focus_gradient(g);
            s.origin_wd = grids_.origin_wd(g);
            state_.grids.push_back(std::move(s));
        }
        snapshot = state_;
    }
    if (state_path_.empty()) return;
    try {
        snapshot.save(state_path_);
    } catch (const IOError& e) {
        log("CTRL: Could not save acquisition state: " + std::string(e.what()));
        if (running_) {
            set_error(core::ErrorCode::PrimaryDrive);
            pause_acquisition(PauseState::PauseAfterImage);
        }
    }
}

// ---------------------------------------------------------------------------
// Reporting
// ---------------------------------------------------------------------------

UserReply AcquisitionOrchestrator::ask_user(PromptKind kind) {
    events_.user_prompt(run_id_, prompt_kind_to_string(kind), events_out());
    prompts_.open(kind);
    observer_->on_user_prompt_required(kind, prompts_);
    if (pause_request_.load() == pause_state_to_int(PauseState::PauseAfterImage)) {
        prompts_.abort();
    }
    const UserReply reply = prompts_.wait();
    log("CTRL: User reply (" + prompt_kind_to_string(kind) + "): " + user_reply_to_string(reply));
    return reply;
}

void AcquisitionOrchestrator::process_error_state() {
    const auto code = state_.error_state;
    const std::string description = core::error_description(code);
    log("CTRL: " + description);
    error_log(std::to_string(state_.slice_counter) + ": ERROR (" + description + ")");
    events_.error(run_id_, code, state_.slice_counter, events_out());
    observer_->on_error(code, description);
}

void AcquisitionOrchestrator::log(const std::string& message) {
    if (logs_) {
        logs_->main(message);
    }
    observer_->on_log(message);
}

void AcquisitionOrchestrator::error_log(const std::string& message) {
    if (logs_) {
        logs_->error(message);
    }
    observer_->on_log(message);
}

void AcquisitionOrchestrator::report_progress(int grid, int tile) {
    Progress p;
    p.slice_counter = state_.slice_counter;
    p.number_slices = cfg_.acquisition.number_slices;
    p.grid = grid;
    p.tile = tile;
    p.tiles_done = tiles_done_;
    p.tiles_total = tiles_total_;
    observer_->on_progress(p);
}

void AcquisitionOrchestrator::wait_seconds(double seconds) const {
    if (seconds <= 0.0) return;
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

std::ostream& AcquisitionOrchestrator::events_out() {
    return logs_ ? logs_->events() : null_out_;
}

} // namespace sbem_stack::acquisition
