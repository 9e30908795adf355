#pragma once

#include "sbem_stack/core/types.hpp"
#include "sbem_stack/config/configuration.hpp"
#include "coordinate_system.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <vector>

namespace sbem_stack::geometry {

namespace fs = std::filesystem;

// A unit participates in slice s iff s >= offset and (s - offset) % interval == 0
bool is_slice_scheduled(int interval, int offset, int slice_counter);

// Scan time of one frame (s), dwell time in us
double frame_cycle_time(int width, int height, double dwell_time);

struct GridSize {
    int rows = 0;
    int cols = 0;
};

// Axis-aligned rectangle in stage coordinates (um)
struct BoundingBox {
    double left = 0.0;
    double top = 0.0;
    double right = 0.0;
    double bottom = 0.0;
};

// Owns N independently configured tile grids: tile positions in pixel and
// SEM space, the active tile set in acquisition (snake) order, and the
// per-tile working distance of the adaptive focus map.
//
// Tile t of a grid with C columns lies in row t / C, column t % C.
class GridManager {
public:
    GridManager() = default;
    explicit GridManager(const std::vector<config::GridConfig>& grids);

    std::vector<config::GridConfig> to_config() const;

    int number_grids() const { return static_cast<int>(grids_.size()); }

    // Appends a grid with default parameters, returns its index
    int add_grid();
    // Removes the last grid
    void delete_grid();
    static Vector2d default_grid_origin(int grid);

    const config::GridConfig& params(int grid) const;

    // Geometry
    GridSize grid_size(int grid) const;
    void set_grid_size(int grid, int rows, int cols);
    int number_tiles(int grid) const;
    void set_tile_size(int grid, int width, int height, int selector);
    void set_overlap(int grid, int overlap);
    void set_row_shift(int grid, int row_shift);
    void set_pixel_size(int grid, double pixel_size);
    void set_dwell_time(int grid, double dwell_time, int selector);
    void set_rotation(int grid, double rotation);
    void set_display_colour(int grid, int colour);

    Vector2i grid_size_px(int grid) const;
    double tile_width_um(int grid) const;
    double tile_height_um(int grid) const;
    double tile_cycle_time(int grid) const;

    // Grid map. Positions are tile centres relative to the grid origin
    // (the centre of tile 0). The origin itself is taken from cs.
    void calculate_grid_map(int grid);
    Vector2i tile_position_p(int grid, int tile) const;
    Vector2d tile_position_d(int grid, int tile) const;
    Vector2d tile_coordinates_d(int grid, int tile, const CoordinateSystem& cs) const;
    Vector2d tile_stage_position(int grid, int tile, const CoordinateSystem& cs) const;
    Vector2d tile_pixel_position(int grid, int tile, const CoordinateSystem& cs) const;
    BoundingBox tile_bounding_box(int grid, int tile, const CoordinateSystem& cs) const;

    // Active tiles
    const std::vector<int>& active_tiles(int grid) const;
    int number_active_tiles(int grid) const;
    int total_active_tiles() const;
    bool is_tile_active(int grid, int tile) const;
    void set_active_tiles(int grid, const std::vector<int>& tiles);
    void select_tile(int grid, int tile);
    void deselect_tile(int grid, int tile);
    // Returns true if the tile is active afterwards
    bool toggle_tile(int grid, int tile);
    void select_all_tiles(int grid);
    void reset_active_tiles(int grid);
    void sort_acquisition_order(int grid);

    // Scheduling
    void set_acq_interval(int grid, int interval, int offset);
    bool is_slice_active(int grid, int slice_counter) const;
    bool is_intervallic_acq_active() const;

    // Adaptive focus
    bool is_adaptive_focus_active() const;
    bool is_adaptive_focus_active(int grid) const;
    void set_adaptive_focus_enabled(int grid, bool enabled);
    void set_adaptive_focus_tiles(int grid, const std::array<int, 3>& tiles);
    const std::array<int, 3>& adaptive_focus_tiles(int grid) const;
    const std::array<double, 2>& adaptive_focus_gradient(int grid) const;
    void set_adaptive_focus_gradient(int grid, const std::array<double, 2>& gradient);
    double origin_wd(int grid) const;
    void set_origin_wd(int grid, double wd);
    double tile_wd(int grid, int tile) const;
    void set_tile_wd(int grid, int tile, double wd);

    // Derives gradient and origin WD from the WD stored at the three
    // reference tiles and recomputes all tile WDs. Returns false without
    // modifying anything if the references are not (origin, right
    // neighbour in the same row, lower neighbour in the same column).
    bool calculate_focus_map(int grid);
    // Shifts the WD of the reference tiles by diff, then recomputes
    bool adjust_focus_map(int grid, double diff);

    // One line per tile: "<grid>.<tile>;<px>;<py>;<active 0|1>;<wd>"
    void save_grid_map(const fs::path& path) const;

private:
    struct Grid {
        config::GridConfig params;
        std::vector<Vector2i> map_p;
        std::vector<Vector2d> map_d;
        std::vector<double> wd;
    };

    Grid& grid_at(int grid);
    const Grid& grid_at(int grid) const;
    void check_tile(const Grid& g, int tile) const;
    bool focus_tiles_valid(const Grid& g) const;
    static void update_wd(Grid& g);

    std::vector<Grid> grids_;
};

} // namespace sbem_stack::geometry
