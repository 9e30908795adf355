#pragma once

#include "sbem_stack/core/types.hpp"
#include "sbem_stack/config/configuration.hpp"
#include "coordinate_system.hpp"

#include <vector>

namespace sbem_stack::geometry {

// Overview images: low-magnification frames taken once per scheduled slice
// and used for debris detection.
class OverviewManager {
public:
    OverviewManager() = default;
    explicit OverviewManager(const std::vector<config::OverviewConfig>& overviews)
        : overviews_(overviews) {}

    const std::vector<config::OverviewConfig>& to_config() const { return overviews_; }

    int number_overviews() const { return static_cast<int>(overviews_.size()); }
    const config::OverviewConfig& params(int ov) const;

    bool is_slice_active(int ov, int slice_counter) const;
    double cycle_time(int ov) const;
    double width_um(int ov) const;
    double height_um(int ov) const;

    Vector2d stage_position(int ov, const CoordinateSystem& cs) const;

private:
    std::vector<config::OverviewConfig> overviews_;
};

} // namespace sbem_stack::geometry
