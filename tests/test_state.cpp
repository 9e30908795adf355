#include "sbem_stack/acquisition/state.hpp"
#include "sbem_stack/core/errors.hpp"

#include <filesystem>
#include <fstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using sbem_stack::StateError;
using sbem_stack::acquisition::AcquisitionState;
using sbem_stack::acquisition::GridSnapshot;
using sbem_stack::core::ErrorCode;

namespace fs = std::filesystem;

TEST_CASE("state_json_keeps_interruption_point") {
    AcquisitionState st;
    st.slice_counter = 17;
    st.number_slices = 200;
    st.total_z_diff = 0.85;
    st.paused = true;
    st.pause_state = sbem_stack::PauseState::PauseAfterImage;
    st.error_state = ErrorCode::GrabIncomplete;
    st.save_interruption_point(1, 7);
    st.tiles_acquired = {"0.0", "0.1", "1.3"};
    st.grids_acquired = {0};
    GridSnapshot g;
    g.active_tiles = {0, 1, 3, 2};
    g.adaptive_focus_tiles = {0, 1, 2};
    g.origin_wd = 0.0051;
    st.grids.push_back(g);
    st.target_wd = 0.0052;

    const AcquisitionState back = AcquisitionState::from_json(st.to_json());
    REQUIRE(back.slice_counter == 17);
    REQUIRE(back.total_z_diff == Catch::Approx(0.85));
    REQUIRE(back.pause_state == sbem_stack::PauseState::PauseAfterImage);
    REQUIRE(back.error_state == ErrorCode::GrabIncomplete);
    REQUIRE(back.interrupted);
    REQUIRE(back.interrupted_at == sbem_stack::TileRef{1, 7});
    REQUIRE(back.is_tile_acquired(1, 3));
    REQUIRE_FALSE(back.is_tile_acquired(1, 7));
    REQUIRE(back.is_grid_acquired(0));
    REQUIRE(back.grids.size() == 1);
    REQUIRE(back.grids[0].active_tiles == g.active_tiles);
    REQUIRE(back.grids[0].origin_wd == Catch::Approx(0.0051));
    REQUIRE(back.target_wd == Catch::Approx(0.0052));
}

TEST_CASE("state_without_interruption_writes_null") {
    AcquisitionState st;
    const auto j = st.to_json();
    REQUIRE(j["interrupted_at"].is_null());
    REQUIRE(j["pause_state"] == "none");
}

TEST_CASE("unknown_error_code_is_rejected") {
    nlohmann::json j = AcquisitionState{}.to_json();
    j["error_state"] = 999;
    REQUIRE_THROWS_AS(AcquisitionState::from_json(j), StateError);
}

TEST_CASE("negative_slice_counter_is_rejected") {
    nlohmann::json j = AcquisitionState{}.to_json();
    j["slice_counter"] = -3;
    REQUIRE_THROWS_AS(AcquisitionState::from_json(j), StateError);
}

TEST_CASE("malformed_interruption_point_is_rejected") {
    nlohmann::json j = AcquisitionState{}.to_json();
    j["interrupted_at"] = {1};
    REQUIRE_THROWS_AS(AcquisitionState::from_json(j), StateError);
}

TEST_CASE("missing_state_file_gives_defaults") {
    const AcquisitionState st = AcquisitionState::load("/nonexistent/sbem_stack/acq_state.json");
    REQUIRE(st.slice_counter == 0);
    REQUIRE_FALSE(st.interrupted);
    REQUIRE(st.error_state == ErrorCode::None);
}

TEST_CASE("malformed_state_file_throws") {
    const fs::path path = fs::temp_directory_path() / "sbem_stack_test_bad_state.json";
    {
        std::ofstream out(path);
        out << "{ \"slice_counter\": ";
    }
    REQUIRE_THROWS_AS(AcquisitionState::load(path), StateError);
    fs::remove(path);
}

TEST_CASE("save_then_load_from_disk") {
    const fs::path dir = fs::temp_directory_path() / "sbem_stack_test_state_dir";
    fs::remove_all(dir);
    const fs::path path = dir / "meta" / "acq_state.json";

    AcquisitionState st;
    st.slice_counter = 4;
    st.tiles_acquired = {"0.2"};
    st.save(path);
    REQUIRE(fs::exists(path));
    REQUIRE_FALSE(fs::exists(fs::path(path.string() + ".tmp")));

    const AcquisitionState back = AcquisitionState::load(path);
    REQUIRE(back.slice_counter == 4);
    REQUIRE(back.is_tile_acquired(0, 2));
    fs::remove_all(dir);
}

TEST_CASE("reset_returns_to_first_slice") {
    AcquisitionState st;
    st.slice_counter = 40;
    st.total_z_diff = 2.0;
    st.paused = true;
    st.error_state = ErrorCode::Cutting;
    st.save_interruption_point(0, 3);
    st.tiles_acquired = {"0.0"};
    st.target_wd = 0.005;

    st.reset();
    REQUIRE(st.slice_counter == 0);
    REQUIRE(st.total_z_diff == 0.0);
    REQUIRE_FALSE(st.paused);
    REQUIRE(st.error_state == ErrorCode::None);
    REQUIRE_FALSE(st.interrupted);
    REQUIRE(st.tiles_acquired.empty());
    // Locked imaging parameters survive a reset
    REQUIRE(st.target_wd == Catch::Approx(0.005));
}
