#include "sbem_stack/geometry/coordinate_system.hpp"
#include "sbem_stack/core/errors.hpp"

#include <cmath>

namespace sbem_stack::geometry {

CoordinateSystem::CoordinateSystem() {
    calib_.setIdentity();
    calib_inv_.setIdentity();
}

CoordinateSystem::CoordinateSystem(double scale_x, double scale_y,
                                   double rotation_x, double rotation_y) {
    set_stage_calibration(scale_x, scale_y, rotation_x, rotation_y);
}

CoordinateSystem CoordinateSystem::from_config(const config::Config& cfg) {
    CoordinateSystem cs(cfg.stage.calibration_scale_x, cfg.stage.calibration_scale_y,
                        cfg.stage.calibration_rotation_x, cfg.stage.calibration_rotation_y);
    for (size_t g = 0; g < cfg.grids.size(); ++g) {
        const auto& o = cfg.grids[g].origin;
        cs.set_grid_origin_d(static_cast<int>(g), Vector2d(o[0], o[1]));
    }
    for (size_t ov = 0; ov < cfg.overviews.size(); ++ov) {
        const auto& c = cfg.overviews[ov].centre;
        cs.set_overview_centre_d(static_cast<int>(ov), Vector2d(c[0], c[1]));
    }
    return cs;
}

void CoordinateSystem::set_stage_calibration(double scale_x, double scale_y,
                                             double rotation_x, double rotation_y) {
    Matrix2d m;
    m << scale_x * std::cos(rotation_x), -scale_y * std::sin(rotation_y),
         scale_x * std::sin(rotation_x),  scale_y * std::cos(rotation_y);
    if (std::abs(m.determinant()) < 1e-12) {
        throw ValidationError("stage calibration matrix is singular");
    }
    calib_ = m;
    calib_inv_ = m.inverse();
}

Vector2d CoordinateSystem::convert_to_s(const Vector2d& d) const {
    return calib_inv_ * d;
}

Vector2d CoordinateSystem::convert_to_d(const Vector2d& s) const {
    return calib_ * s;
}

Vector2d CoordinateSystem::convert_to_p(const Vector2d& d, double pixel_size) {
    return d * 1000.0 / pixel_size;
}

void CoordinateSystem::set_grid_origin_d(int grid, const Vector2d& origin) {
    if (grid < 0) {
        throw GridError("negative grid index " + std::to_string(grid));
    }
    if (static_cast<size_t>(grid) >= grid_origins_d_.size()) {
        grid_origins_d_.resize(static_cast<size_t>(grid) + 1, Vector2d::Zero());
    }
    grid_origins_d_[static_cast<size_t>(grid)] = origin;
}

Vector2d CoordinateSystem::grid_origin_d(int grid) const {
    if (grid < 0 || static_cast<size_t>(grid) >= grid_origins_d_.size()) {
        return Vector2d::Zero();
    }
    return grid_origins_d_[static_cast<size_t>(grid)];
}

Vector2d CoordinateSystem::grid_origin_s(int grid) const {
    return convert_to_s(grid_origin_d(grid));
}

void CoordinateSystem::set_overview_centre_d(int ov, const Vector2d& centre) {
    if (ov < 0) {
        throw GridError("negative overview index " + std::to_string(ov));
    }
    if (static_cast<size_t>(ov) >= ov_centres_d_.size()) {
        ov_centres_d_.resize(static_cast<size_t>(ov) + 1, Vector2d::Zero());
    }
    ov_centres_d_[static_cast<size_t>(ov)] = centre;
}

Vector2d CoordinateSystem::overview_centre_d(int ov) const {
    if (ov < 0 || static_cast<size_t>(ov) >= ov_centres_d_.size()) {
        return Vector2d::Zero();
    }
    return ov_centres_d_[static_cast<size_t>(ov)];
}

Vector2d CoordinateSystem::overview_centre_s(int ov) const {
    return convert_to_s(overview_centre_d(ov));
}

} // namespace sbem_stack::geometry
