#include "sbem_stack/geometry/grid_manager.hpp"
#include "sbem_stack/core/errors.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using sbem_stack::GridError;
using sbem_stack::Vector2d;
using sbem_stack::config::GridConfig;
using sbem_stack::geometry::CoordinateSystem;
using sbem_stack::geometry::GridManager;

namespace {

GridConfig make_grid(int rows, int cols, std::vector<int> active) {
    GridConfig g;
    g.rows = rows;
    g.cols = cols;
    g.tile_width = 1024;
    g.tile_height = 768;
    g.overlap = 100;
    g.pixel_size = 10.0;
    g.active_tiles = std::move(active);
    return g;
}

std::vector<int> all_tiles(int n) {
    std::vector<int> v;
    for (int i = 0; i < n; ++i) v.push_back(i);
    return v;
}

} // namespace

TEST_CASE("snake_order_skips_deactivated_tile") {
    GridManager gm({make_grid(2, 3, all_tiles(6))});
    REQUIRE(gm.active_tiles(0) == std::vector<int>{0, 1, 2, 5, 4, 3});

    gm.deselect_tile(0, 3);
    REQUIRE(gm.active_tiles(0) == std::vector<int>{0, 1, 2, 5, 4});
    REQUIRE(gm.number_active_tiles(0) == 5);
}

TEST_CASE("snake_order_alternates_for_random_subsets") {
    std::mt19937 gen(42);
    std::bernoulli_distribution pick(0.5);
    for (int trial = 0; trial < 50; ++trial) {
        const int rows = 1 + trial % 5;
        const int cols = 1 + (trial * 3) % 7;
        std::vector<int> active;
        for (int t = 0; t < rows * cols; ++t) {
            if (pick(gen)) active.push_back(t);
        }
        GridManager gm({make_grid(rows, cols, active)});
        const auto& order = gm.active_tiles(0);
        REQUIRE(order.size() == active.size());
        for (size_t i = 1; i < order.size(); ++i) {
            const int r0 = order[i - 1] / cols;
            const int r1 = order[i] / cols;
            REQUIRE(r1 >= r0);
            if (r1 == r0) {
                const int c0 = order[i - 1] % cols;
                const int c1 = order[i] % cols;
                if (r0 % 2 == 0) REQUIRE(c1 > c0);
                else REQUIRE(c1 < c0);
            }
        }
    }
}

TEST_CASE("toggle_select_and_reset_update_active_set") {
    GridManager gm({make_grid(2, 2, {})});
    REQUIRE(gm.number_active_tiles(0) == 0);
    REQUIRE(gm.toggle_tile(0, 2));
    REQUIRE(gm.is_tile_active(0, 2));
    REQUIRE_FALSE(gm.toggle_tile(0, 2));
    REQUIRE_FALSE(gm.is_tile_active(0, 2));

    gm.select_all_tiles(0);
    REQUIRE(gm.active_tiles(0) == std::vector<int>{0, 1, 3, 2});
    gm.select_tile(0, 1);
    REQUIRE(gm.number_active_tiles(0) == 4);
    gm.reset_active_tiles(0);
    REQUIRE(gm.total_active_tiles() == 0);
}

TEST_CASE("invalid_tile_indices_throw_grid_error") {
    GridManager gm({make_grid(2, 3, {})});
    REQUIRE_THROWS_AS(gm.select_tile(0, 6), GridError);
    REQUIRE_THROWS_AS(gm.set_active_tiles(0, {0, 7}), GridError);
    REQUIRE_THROWS_AS(gm.active_tiles(1), GridError);
    REQUIRE_THROWS_AS(gm.tile_position_p(0, -1), GridError);
}

TEST_CASE("grid_map_applies_overlap_and_alternating_row_shift") {
    GridConfig g = make_grid(2, 3, {});
    g.row_shift = 50;
    GridManager gm({g});

    REQUIRE(gm.tile_position_p(0, 0) == sbem_stack::Vector2i(0, 0));
    REQUIRE(gm.tile_position_p(0, 1) == sbem_stack::Vector2i(924, 0));
    REQUIRE(gm.tile_position_p(0, 3) == sbem_stack::Vector2i(50, 668));
    REQUIRE(gm.tile_position_p(0, 4) == sbem_stack::Vector2i(974, 668));

    const Vector2d d = gm.tile_position_d(0, 4);
    REQUIRE(d.x() == Catch::Approx(9.74));
    REQUIRE(d.y() == Catch::Approx(6.68));

    REQUIRE(gm.grid_size_px(0) == sbem_stack::Vector2i(3 * 1024 - 2 * 100 + 50, 2 * 768 - 100));
}

TEST_CASE("grid_rotation_leaves_map_axis_aligned") {
    GridConfig g = make_grid(2, 2, all_tiles(4));
    g.tile_width = 1000;
    g.tile_height = 800;
    g.row_shift = 50;
    g.rotation = 10.0;
    GridManager gm({g});

    REQUIRE(gm.tile_position_p(0, 1) == sbem_stack::Vector2i(900, 0));
    REQUIRE(gm.tile_position_p(0, 2) == sbem_stack::Vector2i(50, 700));
    REQUIRE(gm.tile_position_p(0, 3) == sbem_stack::Vector2i(950, 700));
    REQUIRE(gm.tile_position_d(0, 3).x() == Catch::Approx(9.5));
    REQUIRE(gm.tile_position_d(0, 3).y() == Catch::Approx(7.0));

    gm.set_rotation(0, 25.0);
    REQUIRE(gm.params(0).rotation == 25.0);
    REQUIRE(gm.tile_position_p(0, 3) == sbem_stack::Vector2i(950, 700));
}

TEST_CASE("resize_keeps_spatial_position_of_active_tiles") {
    GridManager gm({make_grid(3, 3, {0, 4, 8})});
    gm.set_grid_size(0, 2, 2);
    REQUIRE(gm.grid_size(0).rows == 2);
    REQUIRE(gm.number_tiles(0) == 4);
    REQUIRE(gm.active_tiles(0) == std::vector<int>{0, 3});

    gm.select_all_tiles(0);
    gm.set_grid_size(0, 3, 3);
    REQUIRE(gm.active_tiles(0) == std::vector<int>{0, 1, 4, 3});
}

TEST_CASE("random_resizes_keep_map_size_and_bounds") {
    std::mt19937 gen(7);
    std::uniform_int_distribution<int> dim(1, 6);
    GridManager gm({make_grid(4, 4, all_tiles(16))});
    for (int i = 0; i < 40; ++i) {
        const auto before = gm.grid_size(0);
        const auto old_active = gm.active_tiles(0);
        const int rows = dim(gen);
        const int cols = dim(gen);
        gm.set_grid_size(0, rows, cols);

        std::vector<int> expected;
        for (int t : old_active) {
            const int r = t / before.cols;
            const int c = t % before.cols;
            if (r < rows && c < cols) expected.push_back(r * cols + c);
        }
        REQUIRE(gm.number_active_tiles(0) == static_cast<int>(expected.size()));
        for (int t : expected) REQUIRE(gm.is_tile_active(0, t));
        for (int t = 0; t < rows * cols; ++t) {
            REQUIRE_NOTHROW(gm.tile_position_p(0, t));
        }
        REQUIRE_THROWS_AS(gm.tile_position_p(0, rows * cols), GridError);
    }
}

TEST_CASE("focus_map_reproduces_reference_working_distances") {
    GridManager gm({make_grid(3, 3, all_tiles(9))});
    gm.set_adaptive_focus_tiles(0, {0, 1, 3});
    gm.set_tile_wd(0, 0, 0.0050);
    gm.set_tile_wd(0, 1, 0.0051);
    gm.set_tile_wd(0, 3, 0.0052);

    REQUIRE(gm.calculate_focus_map(0));
    REQUIRE(gm.origin_wd(0) == Catch::Approx(0.0050));
    REQUIRE(gm.adaptive_focus_gradient(0)[0] == Catch::Approx(0.0001));
    REQUIRE(gm.adaptive_focus_gradient(0)[1] == Catch::Approx(0.0002));
    REQUIRE(gm.tile_wd(0, 0) == Catch::Approx(0.0050));
    REQUIRE(gm.tile_wd(0, 1) == Catch::Approx(0.0051));
    REQUIRE(gm.tile_wd(0, 3) == Catch::Approx(0.0052));
    REQUIRE(gm.tile_wd(0, 8) == Catch::Approx(0.0056));
}

TEST_CASE("focus_map_with_invalid_references_changes_nothing") {
    GridManager gm({make_grid(3, 3, all_tiles(9))});
    gm.set_origin_wd(0, 0.004);
    gm.set_tile_wd(0, 4, 0.0049);
    // Tile 4 is not in the row of tile 0
    gm.set_adaptive_focus_tiles(0, {0, 4, 3});

    REQUIRE_FALSE(gm.calculate_focus_map(0));
    REQUIRE(gm.origin_wd(0) == Catch::Approx(0.004));
    REQUIRE(gm.tile_wd(0, 4) == Catch::Approx(0.0049));
    REQUIRE(gm.adaptive_focus_gradient(0)[0] == 0.0);

    // Tile 4 is not in the column of tile 0
    gm.set_tile_wd(0, 1, 0.0051);
    gm.set_adaptive_focus_tiles(0, {0, 1, 4});
    REQUIRE_FALSE(gm.calculate_focus_map(0));
    REQUIRE(gm.origin_wd(0) == Catch::Approx(0.004));
    REQUIRE(gm.tile_wd(0, 1) == Catch::Approx(0.0051));
    REQUIRE(gm.tile_wd(0, 4) == Catch::Approx(0.0049));
    REQUIRE(gm.adaptive_focus_gradient(0)[0] == 0.0);
    REQUIRE(gm.adaptive_focus_gradient(0)[1] == 0.0);

    gm.set_adaptive_focus_tiles(0, {-1, 1, 3});
    REQUIRE_FALSE(gm.calculate_focus_map(0));
    REQUIRE_FALSE(gm.adjust_focus_map(0, 0.001));
}

TEST_CASE("adjust_focus_map_shifts_the_whole_plane") {
    GridManager gm({make_grid(2, 2, all_tiles(4))});
    gm.set_adaptive_focus_tiles(0, {0, 1, 2});
    gm.set_adaptive_focus_gradient(0, {0.0001, 0.0002});
    gm.set_origin_wd(0, 0.005);

    REQUIRE(gm.adjust_focus_map(0, 0.0003));
    REQUIRE(gm.origin_wd(0) == Catch::Approx(0.0053));
    REQUIRE(gm.adaptive_focus_gradient(0)[0] == Catch::Approx(0.0001));
    REQUIRE(gm.tile_wd(0, 3) == Catch::Approx(0.0056));
}

TEST_CASE("tile_bounding_box_is_centred_on_tile") {
    GridManager gm({make_grid(2, 3, {})});
    CoordinateSystem cs;
    cs.set_grid_origin_d(0, Vector2d(100.0, 50.0));

    const auto box = gm.tile_bounding_box(0, 0, cs);
    REQUIRE(box.left == Catch::Approx(100.0 - 5.12));
    REQUIRE(box.right == Catch::Approx(100.0 + 5.12));
    REQUIRE(box.top == Catch::Approx(50.0 - 3.84));
    REQUIRE(box.bottom == Catch::Approx(50.0 + 3.84));

    const Vector2d s = gm.tile_stage_position(0, 1, cs);
    REQUIRE(s.x() == Catch::Approx(109.24));
    REQUIRE(s.y() == Catch::Approx(50.0));

    const Vector2d p = gm.tile_pixel_position(0, 1, cs);
    REQUIRE(p.x() == Catch::Approx(10000.0 + 924.0));
    REQUIRE(p.y() == Catch::Approx(5000.0));
}

TEST_CASE("slice_schedule_honours_interval_and_offset") {
    using sbem_stack::geometry::is_slice_scheduled;
    REQUIRE(is_slice_scheduled(1, 0, 0));
    REQUIRE_FALSE(is_slice_scheduled(3, 1, 0));
    REQUIRE(is_slice_scheduled(3, 1, 1));
    REQUIRE(is_slice_scheduled(3, 1, 4));
    REQUIRE_FALSE(is_slice_scheduled(3, 1, 5));

    GridManager gm({make_grid(1, 1, {0}), make_grid(1, 1, {0})});
    REQUIRE_FALSE(gm.is_intervallic_acq_active());
    gm.set_acq_interval(1, 2, 1);
    REQUIRE(gm.is_intervallic_acq_active());
    REQUIRE_FALSE(gm.is_slice_active(1, 0));
    REQUIRE(gm.is_slice_active(1, 3));
}

TEST_CASE("add_and_delete_grid") {
    GridManager gm;
    REQUIRE(gm.add_grid() == 0);
    REQUIRE(gm.add_grid() == 1);
    REQUIRE(gm.params(1).origin[0] == Catch::Approx(40.0));
    REQUIRE(gm.params(0).display_colour == 0);
    REQUIRE(gm.params(1).display_colour == 1);
    REQUIRE(gm.grid_size(1).rows == 5);
    REQUIRE(gm.number_tiles(1) == 25);

    gm.delete_grid();
    gm.delete_grid();
    REQUIRE(gm.number_grids() == 0);
    REQUIRE_THROWS_AS(gm.delete_grid(), GridError);
}

TEST_CASE("save_grid_map_writes_one_line_per_tile") {
    GridManager gm({make_grid(2, 3, {0, 4})});
    const auto path = std::filesystem::temp_directory_path() / "sbem_stack_test_gridmap.txt";
    gm.save_grid_map(path);

    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    REQUIRE(lines.size() == 6);
    REQUIRE(lines[0] == "0.0;0;0;1;0");
    REQUIRE(lines[1] == "0.1;924;0;0;0");
    REQUIRE(lines[4] == "0.4;924;668;1;0");
    std::filesystem::remove(path);
}
