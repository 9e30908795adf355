#pragma once

#include "sbem_stack/config/configuration.hpp"
#include "sbem_stack/geometry/grid_manager.hpp"
#include "sbem_stack/geometry/overview_manager.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sbem_stack::acquisition {

using json = nlohmann::json;

struct Estimates {
    double min_dose = 0.0;        // electrons per nm^2
    double max_dose = 0.0;
    double total_area = 0.0;      // um^2 per slice
    double total_z = 0.0;         // um
    double total_duration = 0.0;  // s
    double total_data_gb = 0.0;
    // Only available once more than 10 slices of a longer stack are done
    std::optional<std::string> completion_date;

    json to_json() const;
};

// Electron dose per nm^2 for beam current (pA), dwell time (us), pixel size (nm)
double electron_dose(double beam_current, double dwell_time, double pixel_size);

Estimates calculate_estimates(const config::Config& cfg,
                              const geometry::GridManager& grids,
                              const geometry::OverviewManager& overviews,
                              double beam_current, int slice_counter,
                              std::chrono::system_clock::time_point now =
                                  std::chrono::system_clock::now());

} // namespace sbem_stack::acquisition
