#include "sbem_stack/geometry/overview_manager.hpp"
#include "sbem_stack/geometry/grid_manager.hpp"
#include "sbem_stack/core/errors.hpp"

namespace sbem_stack::geometry {

const config::OverviewConfig& OverviewManager::params(int ov) const {
    if (ov < 0 || ov >= number_overviews()) {
        throw GridError("overview index " + std::to_string(ov) + " out of range");
    }
    return overviews_[static_cast<size_t>(ov)];
}

bool OverviewManager::is_slice_active(int ov, int slice_counter) const {
    const auto& p = params(ov);
    return is_slice_scheduled(p.acq_interval, p.acq_interval_offset, slice_counter);
}

double OverviewManager::cycle_time(int ov) const {
    const auto& p = params(ov);
    return frame_cycle_time(p.width, p.height, p.dwell_time);
}

double OverviewManager::width_um(int ov) const {
    const auto& p = params(ov);
    return p.width * p.pixel_size / 1000.0;
}

double OverviewManager::height_um(int ov) const {
    const auto& p = params(ov);
    return p.height * p.pixel_size / 1000.0;
}

Vector2d OverviewManager::stage_position(int ov, const CoordinateSystem& cs) const {
    const auto& c = params(ov).centre;
    return cs.convert_to_s(Vector2d(c[0], c[1]));
}

} // namespace sbem_stack::geometry
