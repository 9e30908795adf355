#include "sbem_stack/acquisition/orchestrator.hpp"
#include "sbem_stack/core/errors.hpp"
#include "sbem_stack/core/utils.hpp"
#include "stub_devices.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace sbem_stack;
using namespace sbem_stack::testing;
using acquisition::AcquisitionOrchestrator;
using acquisition::AcquisitionState;
using core::ErrorCode;

namespace {

struct Rig {
    StubStage stage;
    StubImaging imaging;
    StubInspector inspector;
    StubAutofocus autofocus;
    RecordingObserver observer;
};

std::string stack_name(const std::string& name) {
    return "sbem_stack_test_" + name;
}

int count_files(const fs::path& dir) {
    int n = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file()) ++n;
    }
    return n;
}

int count_lines_of_log(const fs::path& base_dir, const std::string& prefix) {
    int n = 0;
    for (const auto& entry : fs::directory_iterator(base_dir / "meta" / "logs")) {
        if (entry.path().filename().string().rfind(prefix, 0) != 0) continue;
        std::ifstream in(entry.path());
        for (std::string line; std::getline(in, line);) ++n;
    }
    return n;
}

bool logged(const RecordingObserver& obs, const std::string& fragment) {
    return std::any_of(obs.logs.begin(), obs.logs.end(), [&](const std::string& m) {
        return m.find(fragment) != std::string::npos;
    });
}

void add_overview(config::Config& cfg, int max_sweeps, bool continue_after_max) {
    cfg.acquisition.take_overviews = true;
    cfg.acquisition.use_debris_detection = true;
    cfg.debris.max_number_sweeps = max_sweeps;
    cfg.debris.continue_after_max_sweeps = continue_after_max;
    cfg.overviews.push_back(config::OverviewConfig{});
}

} // namespace

TEST_CASE("stack_completes_and_persists_state") {
    const fs::path dir = make_temp_stack_dir("complete");
    const config::Config cfg = make_test_config(dir, 2);
    Rig rig;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus,
                                 AcquisitionState{}, cfg.state_path());
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::Completed);
    REQUIRE(rig.stage.cuts == 2);
    REQUIRE(rig.stage.z == Catch::Approx(5.1));
    REQUIRE(rig.imaging.frames.size() == 12);
    REQUIRE(rig.observer.completed == 1);
    REQUIRE(rig.observer.errors.empty());

    // Snake order within the slice
    REQUIRE(rig.imaging.frames[3].filename().string().find("_t0005_s00000") != std::string::npos);
    REQUIRE(fs::exists(dir / core::tile_save_path(stack_name("complete"), 0, 3, 1)));

    const AcquisitionState st = orch.state();
    REQUIRE(st.slice_counter == 2);
    REQUIRE(st.total_z_diff == Catch::Approx(0.1));
    REQUIRE_FALSE(st.paused);
    REQUIRE(st.tiles_acquired.empty());

    const AcquisitionState on_disk = AcquisitionState::load(cfg.state_path());
    REQUIRE(on_disk.slice_counter == 2);
    REQUIRE(on_disk.grids.size() == 1);
    REQUIRE(on_disk.grids[0].active_tiles.size() == 6);

    REQUIRE(count_lines_of_log(dir, "imagelist") == 12);
    REQUIRE(rig.observer.progress.back().tiles_done == 6);
    REQUIRE(rig.observer.progress.back().tiles_total == 6);

    // Target reached: a further start is refused
    REQUIRE_THROWS_AS(orch.run(), ValidationError);
}

TEST_CASE("start_runs_on_worker_thread") {
    const fs::path dir = make_temp_stack_dir("worker");
    const config::Config cfg = make_test_config(dir, 1);
    Rig rig;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    orch.start();
    orch.wait();
    REQUIRE_FALSE(orch.is_running());
    REQUIRE(orch.status().run_state == RunState::Completed);
    REQUIRE(orch.status().state.slice_counter == 1);
    // No state path: nothing persisted
    REQUIRE_FALSE(fs::exists(cfg.state_path()));
}

TEST_CASE("start_refused_when_counter_beyond_target") {
    const fs::path dir = make_temp_stack_dir("beyond");
    const config::Config cfg = make_test_config(dir, 3);
    Rig rig;
    AcquisitionState initial;
    initial.slice_counter = 5;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus, initial);
    REQUIRE_THROWS_AS(orch.run(), ValidationError);
    REQUIRE(rig.imaging.frames.empty());
}

TEST_CASE("reset_returns_to_slice_zero") {
    const fs::path dir = make_temp_stack_dir("reset");
    const config::Config cfg = make_test_config(dir, 1);
    Rig rig;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus,
                                 AcquisitionState{}, cfg.state_path());
    REQUIRE(orch.run() == RunState::Completed);

    orch.reset();
    REQUIRE(orch.state().slice_counter == 0);
    REQUIRE(AcquisitionState::load(cfg.state_path()).slice_counter == 0);
    REQUIRE(orch.status().run_state == RunState::Idle);
}

TEST_CASE("single_slice_mode_images_without_cutting") {
    const fs::path dir = make_temp_stack_dir("single");
    const config::Config cfg = make_test_config(dir, 0);
    Rig rig;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::Paused);
    REQUIRE(rig.stage.cuts == 0);
    REQUIRE(rig.imaging.frames.size() == 6);
    const AcquisitionState st = orch.state();
    REQUIRE(st.slice_counter == 0);
    REQUIRE(st.error_state == ErrorCode::None);
    REQUIRE_FALSE(st.interrupted);
    REQUIRE(st.grids_acquired.empty());
}

TEST_CASE("failed_cut_keeps_slice_and_resumes_without_reimaging") {
    const fs::path dir = make_temp_stack_dir("cut_failure");
    const config::Config cfg = make_test_config(dir, 3);
    Rig rig;
    rig.stage.fail_cut = true;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus,
                                 AcquisitionState{}, cfg.state_path());
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::ErrorPaused);
    AcquisitionState st = orch.state();
    REQUIRE(st.error_state == ErrorCode::Cutting);
    REQUIRE(st.slice_counter == 0);
    REQUIRE(st.is_grid_acquired(0));
    REQUIRE(rig.observer.errors == std::vector<ErrorCode>{ErrorCode::Cutting});
    REQUIRE(rig.imaging.frames.size() == 6);
    REQUIRE(count_lines_of_log(dir, "error_log") == 1);

    rig.stage.fail_cut = false;
    REQUIRE(orch.run() == RunState::Completed);
    st = orch.state();
    REQUIRE(st.slice_counter == 3);
    REQUIRE(st.error_state == ErrorCode::None);
    // Slice 0 is not imaged again
    REQUIRE(rig.imaging.frames.size() == 18);
    REQUIRE(rig.stage.cuts == 3);
}

TEST_CASE("pause_after_image_resumes_at_interrupted_tile") {
    const fs::path dir = make_temp_stack_dir("resume_mid_grid");
    const config::Config cfg = make_test_config(dir, 1);
    Rig rig;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus,
                                 AcquisitionState{}, cfg.state_path());
    orch.set_observer(&rig.observer);
    rig.observer.on_progress_hook = [&orch](const acquisition::Progress& p) {
        if (p.grid == 0 && p.tile == 2) orch.request_pause(PauseState::PauseAfterImage);
    };

    REQUIRE(orch.run() == RunState::Paused);
    AcquisitionState st = orch.state();
    REQUIRE(st.interrupted);
    REQUIRE(st.interrupted_at == TileRef{0, 2});
    REQUIRE(st.tiles_acquired == std::vector<std::string>{"0.0", "0.1", "0.2"});
    REQUIRE(st.error_state == ErrorCode::None);
    REQUIRE(rig.stage.cuts == 0);
    REQUIRE(rig.imaging.frames.size() == 3);

    // A fresh orchestrator continues from the persisted state
    rig.observer.on_progress_hook = nullptr;
    AcquisitionOrchestrator resumed(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus,
                                    AcquisitionState::load(cfg.state_path()), cfg.state_path());
    resumed.set_observer(&rig.observer);
    REQUIRE(resumed.run() == RunState::Completed);
    REQUIRE(rig.imaging.frames.size() == 6);
    REQUIRE(rig.stage.cuts == 1);
    REQUIRE(logged(rig.observer, "CTRL: Stack restarted."));
    REQUIRE(logged(rig.observer, "Tile 0.1 already acquired"));

    st = resumed.state();
    REQUIRE(st.slice_counter == 1);
    REQUIRE_FALSE(st.interrupted);
    REQUIRE(st.tiles_acquired.empty());
}

TEST_CASE("pause_after_slice_finishes_slice_and_cut") {
    const fs::path dir = make_temp_stack_dir("pause_after_slice");
    const config::Config cfg = make_test_config(dir, 3);
    Rig rig;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);
    rig.observer.on_progress_hook = [&orch](const acquisition::Progress& p) {
        if (p.grid == 0 && p.tile == 1) orch.request_pause(PauseState::PauseAfterSlice);
    };

    REQUIRE(orch.run() == RunState::Paused);
    const AcquisitionState st = orch.state();
    REQUIRE(st.pause_state == PauseState::PauseAfterSlice);
    REQUIRE(st.slice_counter == 1);
    REQUIRE_FALSE(st.interrupted);
    REQUIRE(rig.imaging.frames.size() == 6);
    REQUIRE(rig.stage.cuts == 1);
}

TEST_CASE("transient_grab_errors_are_retried") {
    const fs::path dir = make_temp_stack_dir("grab_retry");
    const config::Config cfg = make_test_config(dir, 1);
    Rig rig;
    rig.imaging.fail_grabs = 2;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::Completed);
    REQUIRE(rig.imaging.frames.size() == 6);
    REQUIRE(rig.observer.errors.empty());
    REQUIRE(logged(rig.observer, "Trying again"));
}

TEST_CASE("third_transient_failure_pauses_with_error") {
    const fs::path dir = make_temp_stack_dir("grab_failure");
    const config::Config cfg = make_test_config(dir, 1);
    Rig rig;
    rig.imaging.fail_grabs = 3;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::ErrorPaused);
    const AcquisitionState st = orch.state();
    REQUIRE(st.error_state == ErrorCode::GrabImage);
    REQUIRE(st.interrupted_at == TileRef{0, 0});
    REQUIRE(rig.imaging.frames.empty());
    REQUIRE(rig.stage.cuts == 0);
}

TEST_CASE("incomplete_tile_is_retaken") {
    const fs::path dir = make_temp_stack_dir("incomplete");
    const config::Config cfg = make_test_config(dir, 1);
    Rig rig;
    hardware::TileInspection incomplete;
    incomplete.mean = 120.0;
    incomplete.stddev = 40.0;
    incomplete.grab_incomplete = true;
    rig.inspector.tile_results.push_back(incomplete);
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::Completed);
    REQUIRE(rig.imaging.frames.size() == 7);
    REQUIRE(rig.inspector.processed_tiles.size() == 7);
    REQUIRE(rig.inspector.processed_tiles[0] == "0:0.0");
    REQUIRE(rig.inspector.processed_tiles[1] == "0:0.0");
}

TEST_CASE("tile_out_of_range_pauses_without_retry") {
    const fs::path dir = make_temp_stack_dir("out_of_range");
    const config::Config cfg = make_test_config(dir, 1);
    Rig rig;
    hardware::TileInspection dark;
    dark.mean = 5.0;
    dark.range_ok = false;
    rig.inspector.tile_results.push_back(dark);
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::ErrorPaused);
    REQUIRE(orch.state().error_state == ErrorCode::TileOutOfRange);
    REQUIRE(rig.imaging.frames.size() == 1);
    REQUIRE(rig.observer.errors == std::vector<ErrorCode>{ErrorCode::TileOutOfRange});
}

TEST_CASE("existing_tile_file_is_not_overwritten") {
    const fs::path dir = make_temp_stack_dir("overwrite");
    const config::Config cfg = make_test_config(dir, 1);
    const fs::path existing = dir / core::tile_save_path(stack_name("overwrite"), 0, 0, 0);
    fs::create_directories(existing.parent_path());
    {
        std::ofstream out(existing);
        out << "previous";
    }
    Rig rig;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::ErrorPaused);
    REQUIRE(orch.state().error_state == ErrorCode::OverwriteFile);
    REQUIRE(rig.imaging.frames.empty());
    REQUIRE(core::read_text(existing) == "previous");
}

TEST_CASE("stage_move_is_retried_once") {
    const fs::path dir = make_temp_stack_dir("stage_retry");
    const config::Config cfg = make_test_config(dir, 1);
    Rig rig;
    rig.stage.fail_xy_moves = 1;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);
    REQUIRE(orch.run() == RunState::Completed);
    REQUIRE(rig.stage.xy_moves == 6);

    const fs::path dir2 = make_temp_stack_dir("stage_failure");
    const config::Config cfg2 = make_test_config(dir2, 1);
    Rig rig2;
    rig2.stage.fail_xy_moves = 2;
    AcquisitionOrchestrator orch2(cfg2, rig2.stage, rig2.imaging, rig2.inspector, rig2.autofocus);
    REQUIRE(orch2.run() == RunState::ErrorPaused);
    REQUIRE(orch2.state().error_state == ErrorCode::StageXY);
    REQUIRE(rig2.imaging.frames.empty());
}

TEST_CASE("unreadable_initial_z_pauses_run") {
    const fs::path dir = make_temp_stack_dir("z_read");
    const config::Config cfg = make_test_config(dir, 1);
    Rig rig;
    rig.stage.fail_z_reads = 2;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    REQUIRE(orch.run() == RunState::ErrorPaused);
    REQUIRE(orch.state().error_state == ErrorCode::ScriptReturnValues);
    REQUIRE(rig.imaging.frames.empty());
}

TEST_CASE("max_sweeps_pauses_with_error") {
    const fs::path dir = make_temp_stack_dir("max_sweeps");
    config::Config cfg = make_test_config(dir, 2);
    add_overview(cfg, 2, false);
    Rig rig;
    for (int i = 0; i < 3; ++i) {
        rig.inspector.debris_results.push_back(hardware::DebrisResult{true, "CTRL: debris"});
    }
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::ErrorPaused);
    const AcquisitionState st = orch.state();
    REQUIRE(st.error_state == ErrorCode::MaxSweeps);
    REQUIRE(st.slice_counter == 1);
    REQUIRE(rig.stage.sweeps == 2);
    REQUIRE(rig.inspector.debris_checks == 3);
    REQUIRE(rig.observer.prompts ==
            std::vector<acquisition::PromptKind>{acquisition::PromptKind::DebrisFirstOverview});
    // One overview in slice 0, three attempts in slice 1, no tiles in slice 1
    REQUIRE(rig.imaging.frames.size() == 1 + 6 + 3);
    REQUIRE(count_files(dir / "overviews" / "debris") == 3);
}

TEST_CASE("max_sweeps_continues_when_configured") {
    const fs::path dir = make_temp_stack_dir("max_sweeps_continue");
    config::Config cfg = make_test_config(dir, 2);
    add_overview(cfg, 2, true);
    Rig rig;
    for (int i = 0; i < 3; ++i) {
        rig.inspector.debris_results.push_back(hardware::DebrisResult{true, "CTRL: debris"});
    }
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::Completed);
    REQUIRE(orch.state().slice_counter == 2);
    REQUIRE(rig.stage.sweeps == 2);
    REQUIRE(logged(rig.observer, "continuing with debris"));
    REQUIRE(count_lines_of_log(dir, "debris_log") == 2);
}

TEST_CASE("aborted_first_overview_prompt_pauses") {
    const fs::path dir = make_temp_stack_dir("prompt_abort");
    config::Config cfg = make_test_config(dir, 2);
    add_overview(cfg, 2, false);
    Rig rig;
    rig.observer.reply = acquisition::UserReply::Abort;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::Paused);
    REQUIRE(orch.state().error_state == ErrorCode::None);
    REQUIRE(rig.imaging.frames.size() == 1);
    REQUIRE(rig.stage.sweeps == 0);
    REQUIRE(rig.stage.cuts == 0);
}

TEST_CASE("intervallic_grid_is_skipped_on_off_slices") {
    const fs::path dir = make_temp_stack_dir("interval");
    config::Config cfg = make_test_config(dir, 2);
    config::GridConfig second = cfg.grids[0];
    second.origin = {200.0, 0.0};
    second.acq_interval = 2;
    cfg.grids.push_back(second);
    Rig rig;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::Completed);
    REQUIRE(rig.imaging.frames.size() == 12 + 6);
    REQUIRE(logged(rig.observer, "Skip grid 1"));
}

TEST_CASE("adaptive_focus_sets_wd_per_tile") {
    const fs::path dir = make_temp_stack_dir("adaptive");
    config::Config cfg = make_test_config(dir, 1);
    cfg.grids[0].adaptive_focus = true;
    cfg.grids[0].adaptive_focus_tiles = {0, 1, 3};
    cfg.grids[0].adaptive_focus_gradient = {0.0001, 0.0002};
    cfg.grids[0].origin_wd = 0.005;
    Rig rig;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::Completed);
    // Acquisition order 0, 1, 2, 5, 4, 3
    const auto& wd = rig.imaging.wd_at_frame;
    REQUIRE(wd.size() == 6);
    REQUIRE(wd[0] == Catch::Approx(0.005));
    REQUIRE(wd[2] == Catch::Approx(0.0052));
    REQUIRE(wd[3] == Catch::Approx(0.0054));
    REQUIRE(wd[5] == Catch::Approx(0.0052));
    REQUIRE(rig.observer.focus_alerts.empty());
}

TEST_CASE("wd_drift_is_corrected_and_reported") {
    const fs::path dir = make_temp_stack_dir("wd_drift");
    const config::Config cfg = make_test_config(dir, 1);
    Rig rig;
    rig.imaging.after_frame = [](StubImaging& im) {
        if (im.frames.size() == 2) im.wd = 0.006;
    };
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::Completed);
    REQUIRE(rig.observer.focus_alerts.size() == 1);
    REQUIRE(rig.imaging.wd_at_frame[2] == Catch::Approx(0.005));
    REQUIRE(rig.imaging.wd == Catch::Approx(0.005));
}

TEST_CASE("magnification_drift_is_corrected") {
    const fs::path dir = make_temp_stack_dir("mag_drift");
    const config::Config cfg = make_test_config(dir, 1);
    Rig rig;
    rig.imaging.after_frame = [](StubImaging& im) {
        if (im.frames.size() == 1) im.mag = 2000.0;
    };
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::Completed);
    REQUIRE(rig.observer.mag_alerts.size() == 1);
    REQUIRE(rig.imaging.mag == Catch::Approx(1000.0));
}

TEST_CASE("hardware_autofocus_failure_pauses_at_reference_tile") {
    const fs::path dir = make_temp_stack_dir("af_failure");
    const config::Config cfg = make_test_config(dir, 2);
    Rig rig;
    rig.autofocus.active = true;
    rig.autofocus.af_method = AutofocusMethod::Hardware;
    rig.autofocus.refs = {TileRef{0, 4}};
    rig.autofocus.af_message = "SEM: ERROR during autofocus";
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::ErrorPaused);
    const AcquisitionState st = orch.state();
    REQUIRE(st.error_state == ErrorCode::HardwareAutofocus);
    REQUIRE(st.interrupted_at == TileRef{0, 4});
    REQUIRE_FALSE(st.is_tile_acquired(0, 4));
    REQUIRE(rig.autofocus.af_runs == 1);
    // The reference tile is imaged for inspection, then the run stops
    REQUIRE(rig.imaging.frames.size() == 5);
}

TEST_CASE("hardware_autofocus_relocks_target") {
    const fs::path dir = make_temp_stack_dir("af_success");
    const config::Config cfg = make_test_config(dir, 1);
    Rig rig;
    rig.autofocus.active = true;
    rig.autofocus.refs = {TileRef{0, 1}};
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);
    rig.imaging.after_frame = [](StubImaging& im) {
        // Autofocus on tile 1 moved the focus before this frame
        if (im.frames.size() == 1) im.wd = 0.0051;
    };

    REQUIRE(orch.run() == RunState::Completed);
    REQUIRE(rig.autofocus.af_runs == 1);
    REQUIRE(orch.state().target_wd == Catch::Approx(0.0051));
    REQUIRE(rig.observer.focus_alerts.empty());
}

TEST_CASE("heuristic_correction_beyond_limit_pauses") {
    const fs::path dir = make_temp_stack_dir("heuristic_limit");
    const config::Config cfg = make_test_config(dir, 2);
    Rig rig;
    rig.autofocus.active = true;
    rig.autofocus.af_method = AutofocusMethod::Heuristic;
    rig.autofocus.refs = {TileRef{0, 1}};
    rig.autofocus.corrections["0.1"] = hardware::HeuristicCorrection{0.00001, 0.0, 0.0};
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::ErrorPaused);
    REQUIRE(orch.state().error_state == ErrorCode::WdStigDifference);
    REQUIRE(rig.autofocus.heuristic_images == std::vector<std::string>{"0.1"});
    // Slice 0 is imaged below the target, the target is restored afterwards
    REQUIRE(rig.imaging.wd_at_frame[0] == Catch::Approx(0.004999));
    REQUIRE(rig.imaging.wd == Catch::Approx(0.005));
}

TEST_CASE("heuristic_correction_within_limit_moves_target") {
    const fs::path dir = make_temp_stack_dir("heuristic_apply");
    const config::Config cfg = make_test_config(dir, 1);
    Rig rig;
    rig.autofocus.active = true;
    rig.autofocus.af_method = AutofocusMethod::Heuristic;
    rig.autofocus.refs = {TileRef{0, 1}};
    rig.autofocus.corrections["0.1"] = hardware::HeuristicCorrection{0.000002, 0.0, 0.0};
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::Completed);
    REQUIRE(orch.state().target_wd == Catch::Approx(0.005002));
    REQUIRE(rig.imaging.wd == Catch::Approx(0.005002));
}

TEST_CASE("mirror_drive_receives_tiles_and_logs") {
    const fs::path dir = make_temp_stack_dir("mirror_src");
    const fs::path mirror_root = make_temp_stack_dir("mirror_root");
    config::Config cfg = make_test_config(dir, 1);
    cfg.acquisition.use_mirror_drive = true;
    cfg.acquisition.mirror_drive = mirror_root.string();
    Rig rig;
    AcquisitionOrchestrator orch(cfg, rig.stage, rig.imaging, rig.inspector, rig.autofocus);
    orch.set_observer(&rig.observer);

    REQUIRE(orch.run() == RunState::Completed);
    const fs::path mirror = mirror_root / stack_name("mirror_src");
    REQUIRE(fs::exists(mirror / core::tile_save_path(stack_name("mirror_src"), 0, 4, 0)));
    REQUIRE(count_files(mirror / "meta" / "logs") >= 2);
}
