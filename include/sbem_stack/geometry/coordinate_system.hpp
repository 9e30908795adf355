#pragma once

#include "sbem_stack/core/types.hpp"
#include "sbem_stack/config/configuration.hpp"

#include <vector>

namespace sbem_stack::geometry {

// Converts between SEM coordinates (d, micrometres, beam frame of reference)
// and stage coordinates (s, micrometres, motor frame of reference), and holds
// the SEM-space origins of grids and the centres of overviews.
//
// The stage calibration maps s -> d:
//   d = M * s,  M = [ sx*cos(rx)  -sy*sin(ry) ]
//                   [ sx*sin(rx)   sy*cos(ry) ]
class CoordinateSystem {
public:
    CoordinateSystem();
    CoordinateSystem(double scale_x, double scale_y, double rotation_x, double rotation_y);

    static CoordinateSystem from_config(const config::Config& cfg);

    void set_stage_calibration(double scale_x, double scale_y,
                               double rotation_x, double rotation_y);
    const Matrix2d& calibration_matrix() const { return calib_; }

    Vector2d convert_to_s(const Vector2d& d) const;
    Vector2d convert_to_d(const Vector2d& s) const;

    // SEM micrometres to pixels at the given pixel size (nm)
    static Vector2d convert_to_p(const Vector2d& d, double pixel_size);

    // Unset origins and centres default to (0, 0)
    void set_grid_origin_d(int grid, const Vector2d& origin);
    Vector2d grid_origin_d(int grid) const;
    Vector2d grid_origin_s(int grid) const;
    int number_grid_origins() const { return static_cast<int>(grid_origins_d_.size()); }

    void set_overview_centre_d(int ov, const Vector2d& centre);
    Vector2d overview_centre_d(int ov) const;
    Vector2d overview_centre_s(int ov) const;

private:
    Matrix2d calib_;
    Matrix2d calib_inv_;
    std::vector<Vector2d> grid_origins_d_;
    std::vector<Vector2d> ov_centres_d_;
};

} // namespace sbem_stack::geometry
