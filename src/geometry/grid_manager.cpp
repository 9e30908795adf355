#include "sbem_stack/geometry/grid_manager.hpp"
#include "sbem_stack/core/errors.hpp"

#include <algorithm>
#include <fstream>
#include <set>

namespace sbem_stack::geometry {

namespace {

constexpr int kNumberDisplayColours = 8;

} // namespace

bool is_slice_scheduled(int interval, int offset, int slice_counter) {
    if (interval < 1) return false;
    if (slice_counter < offset) return false;
    return (slice_counter - offset) % interval == 0;
}

double frame_cycle_time(int width, int height, double dwell_time) {
    return static_cast<double>(width) * static_cast<double>(height) * dwell_time * 1e-6;
}

GridManager::GridManager(const std::vector<config::GridConfig>& grids) {
    grids_.reserve(grids.size());
    for (const auto& params : grids) {
        Grid g;
        g.params = params;
        g.params.active_tiles.clear();
        grids_.push_back(std::move(g));
        const int idx = number_grids() - 1;
        calculate_grid_map(idx);
        set_active_tiles(idx, params.active_tiles);
    }
}

std::vector<config::GridConfig> GridManager::to_config() const {
    std::vector<config::GridConfig> out;
    out.reserve(grids_.size());
    for (const auto& g : grids_) out.push_back(g.params);
    return out;
}

Vector2d GridManager::default_grid_origin(int grid) {
    return Vector2d(std::min(grid * 40.0, 400.0), 0.0);
}

int GridManager::add_grid() {
    std::set<int> used;
    for (const auto& g : grids_) used.insert(g.params.display_colour);
    int colour = 1;
    for (int c = 0; c < kNumberDisplayColours; ++c) {
        if (used.count(c) == 0) {
            colour = c;
            break;
        }
    }

    Grid g;
    const Vector2d origin = default_grid_origin(number_grids());
    g.params.origin = {origin.x(), origin.y()};
    g.params.display_colour = colour;
    grids_.push_back(std::move(g));
    const int idx = number_grids() - 1;
    calculate_grid_map(idx);
    return idx;
}

void GridManager::delete_grid() {
    if (grids_.empty()) {
        throw GridError("no grid to delete");
    }
    grids_.pop_back();
}

GridManager::Grid& GridManager::grid_at(int grid) {
    if (grid < 0 || grid >= number_grids()) {
        throw GridError("grid index " + std::to_string(grid) + " out of range");
    }
    return grids_[static_cast<size_t>(grid)];
}

const GridManager::Grid& GridManager::grid_at(int grid) const {
    if (grid < 0 || grid >= number_grids()) {
        throw GridError("grid index " + std::to_string(grid) + " out of range");
    }
    return grids_[static_cast<size_t>(grid)];
}

void GridManager::check_tile(const Grid& g, int tile) const {
    if (tile < 0 || tile >= g.params.rows * g.params.cols) {
        throw GridError("tile index " + std::to_string(tile) + " out of range");
    }
}

const config::GridConfig& GridManager::params(int grid) const {
    return grid_at(grid).params;
}

GridSize GridManager::grid_size(int grid) const {
    const auto& p = grid_at(grid).params;
    return GridSize{p.rows, p.cols};
}

int GridManager::number_tiles(int grid) const {
    const auto& p = grid_at(grid).params;
    return p.rows * p.cols;
}

void GridManager::set_grid_size(int grid, int rows, int cols) {
    if (rows < 1 || cols < 1) {
        throw ValidationError("grid size must be at least 1x1");
    }
    Grid& g = grid_at(grid);
    const int old_cols = g.params.cols;
    if (rows == g.params.rows && cols == old_cols) return;

    // Keep tiles that still lie inside the grid, at their spatial position
    std::vector<int> remapped;
    for (int t : g.params.active_tiles) {
        const int r = t / old_cols;
        const int c = t % old_cols;
        if (r < rows && c < cols) {
            remapped.push_back(r * cols + c);
        }
    }

    std::array<int, 3> focus_tiles = g.params.adaptive_focus_tiles;
    for (auto& t : focus_tiles) {
        if (t < 0) continue;
        const int r = t / old_cols;
        const int c = t % old_cols;
        t = (r < rows && c < cols) ? r * cols + c : -1;
    }

    g.params.rows = rows;
    g.params.cols = cols;
    g.params.active_tiles = std::move(remapped);
    g.params.adaptive_focus_tiles = focus_tiles;
    calculate_grid_map(grid);
    sort_acquisition_order(grid);
}

void GridManager::set_tile_size(int grid, int width, int height, int selector) {
    if (width < 1 || height < 1) {
        throw ValidationError("tile size must be positive");
    }
    Grid& g = grid_at(grid);
    g.params.tile_width = width;
    g.params.tile_height = height;
    g.params.tile_size_selector = selector;
    calculate_grid_map(grid);
}

void GridManager::set_overlap(int grid, int overlap) {
    Grid& g = grid_at(grid);
    if (overlap >= g.params.tile_width || overlap >= g.params.tile_height) {
        throw ValidationError("overlap must be smaller than the tile size");
    }
    g.params.overlap = overlap;
    calculate_grid_map(grid);
}

void GridManager::set_row_shift(int grid, int row_shift) {
    grid_at(grid).params.row_shift = row_shift;
    calculate_grid_map(grid);
}

void GridManager::set_pixel_size(int grid, double pixel_size) {
    if (pixel_size <= 0.0) {
        throw ValidationError("pixel size must be positive");
    }
    grid_at(grid).params.pixel_size = pixel_size;
    calculate_grid_map(grid);
}

void GridManager::set_dwell_time(int grid, double dwell_time, int selector) {
    if (dwell_time <= 0.0) {
        throw ValidationError("dwell time must be positive");
    }
    Grid& g = grid_at(grid);
    g.params.dwell_time = dwell_time;
    g.params.dwell_time_selector = selector;
}

void GridManager::set_rotation(int grid, double rotation) {
    grid_at(grid).params.rotation = rotation;
}

void GridManager::set_display_colour(int grid, int colour) {
    grid_at(grid).params.display_colour = colour;
}

Vector2i GridManager::grid_size_px(int grid) const {
    const auto& p = grid_at(grid).params;
    const int width = p.cols * p.tile_width - (p.cols - 1) * p.overlap + p.row_shift;
    const int height = p.rows * p.tile_height - (p.rows - 1) * p.overlap;
    return Vector2i(width, height);
}

double GridManager::tile_width_um(int grid) const {
    const auto& p = grid_at(grid).params;
    return p.tile_width * p.pixel_size / 1000.0;
}

double GridManager::tile_height_um(int grid) const {
    const auto& p = grid_at(grid).params;
    return p.tile_height * p.pixel_size / 1000.0;
}

double GridManager::tile_cycle_time(int grid) const {
    const auto& p = grid_at(grid).params;
    return frame_cycle_time(p.tile_width, p.tile_height, p.dwell_time);
}

void GridManager::calculate_grid_map(int grid) {
    Grid& g = grid_at(grid);
    const auto& p = g.params;
    const size_t n = static_cast<size_t>(p.rows * p.cols);
    g.map_p.assign(n, Vector2i::Zero());
    g.map_d.assign(n, Vector2d::Zero());

    for (int row = 0; row < p.rows; ++row) {
        for (int col = 0; col < p.cols; ++col) {
            const size_t t = static_cast<size_t>(col + row * p.cols);
            const int x = col * (p.tile_width - p.overlap) + p.row_shift * (row % 2);
            const int y = row * (p.tile_height - p.overlap);
            // Rotation is a stored setting only; the map is axis-aligned
            g.map_p[t] = Vector2i(x, y);
            g.map_d[t] = g.map_p[t].cast<double>() * p.pixel_size / 1000.0;
        }
    }
    update_wd(g);
}

void GridManager::update_wd(Grid& g) {
    const auto& p = g.params;
    g.wd.assign(static_cast<size_t>(p.rows * p.cols), 0.0);
    for (int row = 0; row < p.rows; ++row) {
        for (int col = 0; col < p.cols; ++col) {
            g.wd[static_cast<size_t>(col + row * p.cols)] =
                p.origin_wd + col * p.adaptive_focus_gradient[0] + row * p.adaptive_focus_gradient[1];
        }
    }
}

Vector2i GridManager::tile_position_p(int grid, int tile) const {
    const Grid& g = grid_at(grid);
    check_tile(g, tile);
    return g.map_p[static_cast<size_t>(tile)];
}

Vector2d GridManager::tile_position_d(int grid, int tile) const {
    const Grid& g = grid_at(grid);
    check_tile(g, tile);
    return g.map_d[static_cast<size_t>(tile)];
}

Vector2d GridManager::tile_coordinates_d(int grid, int tile, const CoordinateSystem& cs) const {
    return cs.grid_origin_d(grid) + tile_position_d(grid, tile);
}

Vector2d GridManager::tile_stage_position(int grid, int tile, const CoordinateSystem& cs) const {
    return cs.convert_to_s(tile_coordinates_d(grid, tile, cs));
}

Vector2d GridManager::tile_pixel_position(int grid, int tile, const CoordinateSystem& cs) const {
    const double pixel_size = grid_at(grid).params.pixel_size;
    return CoordinateSystem::convert_to_p(cs.grid_origin_d(grid), pixel_size)
        + tile_position_p(grid, tile).cast<double>();
}

BoundingBox GridManager::tile_bounding_box(int grid, int tile, const CoordinateSystem& cs) const {
    const Vector2d centre = tile_coordinates_d(grid, tile, cs);
    const double hw = tile_width_um(grid) / 2.0;
    const double hh = tile_height_um(grid) / 2.0;

    const Vector2d corners[4] = {
        cs.convert_to_s(centre + Vector2d(-hw, -hh)),
        cs.convert_to_s(centre + Vector2d(hw, -hh)),
        cs.convert_to_s(centre + Vector2d(-hw, hh)),
        cs.convert_to_s(centre + Vector2d(hw, hh)),
    };

    BoundingBox box{corners[0].x(), corners[0].y(), corners[0].x(), corners[0].y()};
    for (const auto& c : corners) {
        box.left = std::min(box.left, c.x());
        box.top = std::min(box.top, c.y());
        box.right = std::max(box.right, c.x());
        box.bottom = std::max(box.bottom, c.y());
    }
    return box;
}

const std::vector<int>& GridManager::active_tiles(int grid) const {
    return grid_at(grid).params.active_tiles;
}

int GridManager::number_active_tiles(int grid) const {
    return static_cast<int>(grid_at(grid).params.active_tiles.size());
}

int GridManager::total_active_tiles() const {
    int total = 0;
    for (const auto& g : grids_) total += static_cast<int>(g.params.active_tiles.size());
    return total;
}

bool GridManager::is_tile_active(int grid, int tile) const {
    const auto& active = grid_at(grid).params.active_tiles;
    return std::find(active.begin(), active.end(), tile) != active.end();
}

void GridManager::set_active_tiles(int grid, const std::vector<int>& tiles) {
    Grid& g = grid_at(grid);
    std::vector<int> active;
    for (int t : tiles) {
        check_tile(g, t);
        if (std::find(active.begin(), active.end(), t) == active.end()) {
            active.push_back(t);
        }
    }
    g.params.active_tiles = std::move(active);
    sort_acquisition_order(grid);
}

void GridManager::select_tile(int grid, int tile) {
    Grid& g = grid_at(grid);
    check_tile(g, tile);
    if (!is_tile_active(grid, tile)) {
        g.params.active_tiles.push_back(tile);
        sort_acquisition_order(grid);
    }
}

void GridManager::deselect_tile(int grid, int tile) {
    Grid& g = grid_at(grid);
    check_tile(g, tile);
    auto& active = g.params.active_tiles;
    auto it = std::find(active.begin(), active.end(), tile);
    if (it != active.end()) {
        active.erase(it);
        sort_acquisition_order(grid);
    }
}

bool GridManager::toggle_tile(int grid, int tile) {
    if (is_tile_active(grid, tile)) {
        deselect_tile(grid, tile);
        return false;
    }
    select_tile(grid, tile);
    return true;
}

void GridManager::select_all_tiles(int grid) {
    Grid& g = grid_at(grid);
    const int n = g.params.rows * g.params.cols;
    g.params.active_tiles.resize(static_cast<size_t>(n));
    for (int t = 0; t < n; ++t) g.params.active_tiles[static_cast<size_t>(t)] = t;
    sort_acquisition_order(grid);
}

void GridManager::reset_active_tiles(int grid) {
    grid_at(grid).params.active_tiles.clear();
}

void GridManager::sort_acquisition_order(int grid) {
    Grid& g = grid_at(grid);
    const auto& p = g.params;
    std::vector<bool> flags(static_cast<size_t>(p.rows * p.cols), false);
    for (int t : p.active_tiles) flags[static_cast<size_t>(t)] = true;

    std::vector<int> order;
    order.reserve(p.active_tiles.size());
    for (int row = 0; row < p.rows; ++row) {
        for (int i = 0; i < p.cols; ++i) {
            const int col = (row % 2 == 0) ? i : p.cols - 1 - i;
            const int t = row * p.cols + col;
            if (flags[static_cast<size_t>(t)]) order.push_back(t);
        }
    }
    g.params.active_tiles = std::move(order);
}

void GridManager::set_acq_interval(int grid, int interval, int offset) {
    if (interval < 1 || offset < 0) {
        throw ValidationError("acquisition interval must be >= 1 and offset >= 0");
    }
    Grid& g = grid_at(grid);
    g.params.acq_interval = interval;
    g.params.acq_interval_offset = offset;
}

bool GridManager::is_slice_active(int grid, int slice_counter) const {
    const auto& p = grid_at(grid).params;
    return is_slice_scheduled(p.acq_interval, p.acq_interval_offset, slice_counter);
}

bool GridManager::is_intervallic_acq_active() const {
    return std::any_of(grids_.begin(), grids_.end(),
                       [](const Grid& g) { return g.params.acq_interval > 1; });
}

bool GridManager::is_adaptive_focus_active() const {
    return std::any_of(grids_.begin(), grids_.end(),
                       [](const Grid& g) { return g.params.adaptive_focus; });
}

bool GridManager::is_adaptive_focus_active(int grid) const {
    return grid_at(grid).params.adaptive_focus;
}

void GridManager::set_adaptive_focus_enabled(int grid, bool enabled) {
    grid_at(grid).params.adaptive_focus = enabled;
}

void GridManager::set_adaptive_focus_tiles(int grid, const std::array<int, 3>& tiles) {
    Grid& g = grid_at(grid);
    for (int t : tiles) {
        if (t >= 0) check_tile(g, t);
    }
    g.params.adaptive_focus_tiles = tiles;
}

const std::array<int, 3>& GridManager::adaptive_focus_tiles(int grid) const {
    return grid_at(grid).params.adaptive_focus_tiles;
}

const std::array<double, 2>& GridManager::adaptive_focus_gradient(int grid) const {
    return grid_at(grid).params.adaptive_focus_gradient;
}

void GridManager::set_adaptive_focus_gradient(int grid, const std::array<double, 2>& gradient) {
    Grid& g = grid_at(grid);
    g.params.adaptive_focus_gradient = gradient;
    update_wd(g);
}

double GridManager::origin_wd(int grid) const {
    return grid_at(grid).params.origin_wd;
}

void GridManager::set_origin_wd(int grid, double wd) {
    Grid& g = grid_at(grid);
    g.params.origin_wd = wd;
    update_wd(g);
}

double GridManager::tile_wd(int grid, int tile) const {
    const Grid& g = grid_at(grid);
    check_tile(g, tile);
    return g.wd[static_cast<size_t>(tile)];
}

void GridManager::set_tile_wd(int grid, int tile, double wd) {
    Grid& g = grid_at(grid);
    check_tile(g, tile);
    g.wd[static_cast<size_t>(tile)] = wd;
}

bool GridManager::focus_tiles_valid(const Grid& g) const {
    const int cols = g.params.cols;
    const int n = g.params.rows * cols;
    const auto& ft = g.params.adaptive_focus_tiles;
    const int t0 = ft[0], t1 = ft[1], t2 = ft[2];
    if (t0 < 0 || t1 < 0 || t2 < 0) return false;
    if (t0 >= n || t1 >= n || t2 >= n) return false;
    if (!(t1 > t0 && t1 / cols == t0 / cols)) return false;
    if (!(t2 > t0 && t2 % cols == t0 % cols)) return false;
    return true;
}

bool GridManager::calculate_focus_map(int grid) {
    Grid& g = grid_at(grid);
    if (!focus_tiles_valid(g)) return false;

    const int cols = g.params.cols;
    const auto& ft = g.params.adaptive_focus_tiles;
    const int t0 = ft[0], t1 = ft[1], t2 = ft[2];
    const double wd0 = g.wd[static_cast<size_t>(t0)];
    const double wd1 = g.wd[static_cast<size_t>(t1)];
    const double wd2 = g.wd[static_cast<size_t>(t2)];

    const double gx = (wd1 - wd0) / static_cast<double>(t1 - t0);
    const double gy = (wd2 - wd0) / static_cast<double>((t2 - t0) / cols);

    g.params.adaptive_focus_gradient = {gx, gy};
    g.params.origin_wd = wd0 - (t0 % cols) * gx - (t0 / cols) * gy;
    update_wd(g);
    return true;
}

bool GridManager::adjust_focus_map(int grid, double diff) {
    Grid& g = grid_at(grid);
    if (!focus_tiles_valid(g)) return false;
    for (int t : g.params.adaptive_focus_tiles) {
        g.wd[static_cast<size_t>(t)] += diff;
    }
    return calculate_focus_map(grid);
}

void GridManager::save_grid_map(const fs::path& path) const {
    std::ofstream out(path);
    if (!out) {
        throw IOError("cannot write grid map: " + path.string());
    }
    out.precision(10);
    for (int gi = 0; gi < number_grids(); ++gi) {
        const Grid& g = grids_[static_cast<size_t>(gi)];
        std::vector<bool> flags(g.map_p.size(), false);
        for (int t : g.params.active_tiles) flags[static_cast<size_t>(t)] = true;
        for (size_t t = 0; t < g.map_p.size(); ++t) {
            out << gi << "." << t << ";"
                << g.map_p[t].x() << ";" << g.map_p[t].y() << ";"
                << (flags[t] ? 1 : 0) << ";" << g.wd[t] << "\n";
        }
    }
    if (!out) {
        throw IOError("failed writing grid map: " + path.string());
    }
}

} // namespace sbem_stack::geometry
