#pragma once

#include "sbem_stack/core/error_codes.hpp"
#include "sbem_stack/core/types.hpp"

#include <array>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sbem_stack::acquisition {

namespace fs = std::filesystem;
using json = nlohmann::json;

// Grid parameters that must survive a restart unchanged
struct GridSnapshot {
    std::vector<int> active_tiles;
    std::array<int, 3> adaptive_focus_tiles{-1, -1, -1};
    std::array<double, 2> adaptive_focus_gradient{0.0, 0.0};
    double origin_wd = 0.0;
};

// Resumable progress of a stack acquisition
struct AcquisitionState {
    int slice_counter = 0;
    int number_slices = 0;
    int slice_thickness = 50;       // nm
    double total_z_diff = 0.0;      // um
    double stage_z_position = 0.0;  // um, last known

    bool paused = false;
    PauseState pause_state = PauseState::None;
    core::ErrorCode error_state = core::ErrorCode::None;

    bool interrupted = false;
    TileRef interrupted_at;

    // Completed units of the slice in progress
    std::vector<std::string> tiles_acquired;   // "g.t"
    std::vector<int> grids_acquired;

    std::vector<GridSnapshot> grids;

    // Locked imaging parameters
    double target_wd = 0.0;
    double target_stig_x = 0.0;
    double target_stig_y = 0.0;

    std::string last_update;

    // Back to slice 0, nothing acquired
    void reset();
    // Forget the interruption point and all per-slice progress
    void reset_interruption();
    void save_interruption_point(int grid, int tile);

    bool is_tile_acquired(int grid, int tile) const;
    bool is_grid_acquired(int grid) const;

    json to_json() const;
    static AcquisitionState from_json(const json& j);

    // Atomic write (tmp file + rename); throws IOError
    void save(const fs::path& path) const;
    // Defaults if path does not exist; throws StateError on malformed content
    static AcquisitionState load(const fs::path& path);
};

} // namespace sbem_stack::acquisition
