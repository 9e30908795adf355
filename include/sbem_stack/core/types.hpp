#pragma once

#include <Eigen/Dense>
#include <filesystem>
#include <string>

namespace sbem_stack {

namespace fs = std::filesystem;

// Coordinate types. SEM ("d") and stage ("s") coordinates are in micrometres,
// pixel ("p") coordinates in pixels of the respective grid.
using Vector2d = Eigen::Vector2d;
using Vector2i = Eigen::Vector2i;
using Matrix2d = Eigen::Matrix2d;

// Pause severity requested by the user or by error handling
enum class PauseState {
    None = 0,
    PauseAfterImage = 1,
    PauseAfterSlice = 2
};

inline int pause_state_to_int(PauseState state) {
    return static_cast<int>(state);
}

inline PauseState int_to_pause_state(int value) {
    switch (value) {
        case 1: return PauseState::PauseAfterImage;
        case 2: return PauseState::PauseAfterSlice;
        default: return PauseState::None;
    }
}

inline std::string pause_state_to_string(PauseState state) {
    switch (state) {
        case PauseState::PauseAfterImage: return "pause_after_image";
        case PauseState::PauseAfterSlice: return "pause_after_slice";
        default: return "none";
    }
}

// Orchestrator run state
enum class RunState {
    Idle,
    AcquiringOverviews,
    AcquiringGrids,
    Cutting,
    Paused,
    ErrorPaused,
    Completed
};

inline std::string run_state_to_string(RunState state) {
    switch (state) {
        case RunState::Idle: return "idle";
        case RunState::AcquiringOverviews: return "acquiring_overviews";
        case RunState::AcquiringGrids: return "acquiring_grids";
        case RunState::Cutting: return "cutting";
        case RunState::Paused: return "paused";
        case RunState::ErrorPaused: return "error_paused";
        case RunState::Completed: return "completed";
        default: return "unknown";
    }
}

// Autofocus method
enum class AutofocusMethod {
    Hardware = 0,   // autofocus routine of the imaging device
    Heuristic = 1   // sharpness feedback from reference tiles
};

// A tile addressed by grid and tile index
struct TileRef {
    int grid = -1;
    int tile = -1;
};

inline bool operator==(const TileRef& a, const TileRef& b) {
    return a.grid == b.grid && a.tile == b.tile;
}

inline bool operator!=(const TileRef& a, const TileRef& b) {
    return !(a == b);
}

inline std::string tile_key(int grid, int tile) {
    return std::to_string(grid) + "." + std::to_string(tile);
}

} // namespace sbem_stack
