#include "sbem_stack/acquisition/estimates.hpp"
#include "sbem_stack/core/utils.hpp"

#include <algorithm>

namespace sbem_stack::acquisition {

namespace {

constexpr double kElementaryCharge = 1.602e-19;

} // namespace

json Estimates::to_json() const {
    json j = {
        {"min_dose", min_dose},
        {"max_dose", max_dose},
        {"total_area_um2", total_area},
        {"total_z_um", total_z},
        {"total_duration_s", total_duration},
        {"total_data_gb", total_data_gb},
    };
    j["completion_date"] = completion_date ? json(*completion_date) : json(nullptr);
    return j;
}

double electron_dose(double beam_current, double dwell_time, double pixel_size) {
    return beam_current * 1e-12 / kElementaryCharge * dwell_time * 1e-6
           / (pixel_size * pixel_size);
}

Estimates calculate_estimates(const config::Config& cfg,
                              const geometry::GridManager& grids,
                              const geometry::OverviewManager& overviews,
                              double beam_current, int slice_counter,
                              std::chrono::system_clock::time_point now) {
    const int number_slices = cfg.acquisition.number_slices;
    const int n = number_slices == 0 ? 1 : number_slices;

    Estimates est;
    bool have_dose = false;
    auto add_dose = [&](double dose) {
        if (!have_dose) {
            est.min_dose = est.max_dose = dose;
            have_dose = true;
        } else {
            est.min_dose = std::min(est.min_dose, dose);
            est.max_dose = std::max(est.max_dose, dose);
        }
    };

    const double total_cut_time = number_slices * cfg.stage.full_cut_duration;
    double total_ov_time = 0.0;
    double total_grid_time = 0.0;
    double total_pixels = 0.0;

    if (cfg.acquisition.take_overviews) {
        for (int ov = 0; ov < overviews.number_overviews(); ++ov) {
            const auto& p = overviews.params(ov);
            add_dose(electron_dose(beam_current, p.dwell_time, p.pixel_size));
            const int frames = n / p.acq_interval;
            total_ov_time += (overviews.cycle_time(ov) + cfg.stage.motor_time_overview) * frames;
            total_pixels += static_cast<double>(p.width) * p.height * frames;
        }
    }

    for (int g = 0; g < grids.number_grids(); ++g) {
        const auto& p = grids.params(g);
        add_dose(electron_dose(beam_current, p.dwell_time, p.pixel_size));
        const int active = grids.number_active_tiles(g);
        const int slices = n / p.acq_interval;
        total_grid_time += (grids.tile_cycle_time(g) + cfg.stage.motor_time_tile)
                           * active * slices;
        est.total_area += active * grids.tile_width_um(g) * grids.tile_height_um(g);
        total_pixels += static_cast<double>(p.tile_width) * p.tile_height * active * slices;
    }

    est.total_z = number_slices * cfg.acquisition.slice_thickness / 1000.0;
    est.total_duration = total_cut_time + total_ov_time + total_grid_time;
    est.total_data_gb = total_pixels / 1e9;

    if (slice_counter > 10 && number_slices > 10) {
        const double fraction = static_cast<double>(slice_counter) / number_slices;
        const auto remaining = std::chrono::seconds(
            static_cast<long long>(est.total_duration * (1.0 - fraction)));
        est.completion_date = core::format_local_time(
            now + std::chrono::duration_cast<std::chrono::system_clock::duration>(remaining));
    }
    return est;
}

} // namespace sbem_stack::acquisition
