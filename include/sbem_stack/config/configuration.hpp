#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace sbem_stack::config {

namespace fs = std::filesystem;

struct AcquisitionConfig {
  std::string base_dir;
  std::string stack_name;        // empty = last component of base_dir
  int number_slices = 0;         // 0 = image a single slice without cutting
  int slice_thickness = 50;      // nm
  bool take_overviews = true;
  bool use_debris_detection = true;
  bool ask_user = false;         // confirm detected debris with the operator
  bool monitor_images = true;
  bool use_mirror_drive = false;
  std::string mirror_drive;
  std::string state_file = "meta/acq_state.json"; // relative to base_dir
  bool echo_events = false;      // tee JSON events to stdout
};

struct DebrisConfig {
  int max_number_sweeps = 3;
  bool continue_after_max_sweeps = false;
  int detection_method = 0;      // 0 = quadrant, 1 = whole frame
};

struct StageConfig {
  float full_cut_duration = 20.0f;      // s
  float sweep_distance = 70.0f;         // nm
  float stage_move_wait_interval = 0.5f; // s
  float retry_delay = 2.0f;             // s, before a second move/sweep attempt
  float max_z_move = 0.2f;              // um
  float motor_time_tile = 0.5f;         // s, used for estimates
  float motor_time_overview = 5.0f;     // s, used for estimates
  float calibration_scale_x = 1.0f;
  float calibration_scale_y = 1.0f;
  float calibration_rotation_x = 0.0f;  // rad
  float calibration_rotation_y = 0.0f;  // rad
};

struct ImagingConfig {
  float beam_current = 300.0f;   // pA
  float eht = 1.5f;              // kV
  float magnification = 1000.0f;
  double working_distance = 0.0055; // m
  double stig_x = 0.0;
  double stig_y = 0.0;
};

struct AutofocusConfig {
  bool enabled = false;
  int method = 0;                // 0 = hardware, 1 = heuristic
  std::vector<std::array<int, 2>> reference_tiles;  // [grid, tile]
  int interval = 10;             // slices between hardware autofocus runs
  int autostig_delay = 0;
  bool focus = true;
  bool stig = false;
  std::array<double, 3> heuristic_deltas{0.000001, 0.1, 0.1};   // WD (m), stig x, stig y
  std::array<double, 3> max_wd_stig_diff{0.000005, 1.0, 1.0};  // WD (m), stig x, stig y
};

struct InspectionConfig {
  float mean_lower_limit = 30.0f;
  float mean_upper_limit = 220.0f;
  float stddev_lower_limit = 15.0f;
  float stddev_upper_limit = 120.0f;
  float slice_mean_threshold = 5.0f;
  float slice_stddev_threshold = 5.0f;
  float debris_mean_threshold = 4.0f;
  float debris_stddev_threshold = 4.0f;
};

struct GridConfig {
  std::array<double, 2> origin{0.0, 0.0};  // SEM coordinates of tile 0 centre (um)
  int rows = 5;
  int cols = 5;
  int tile_width = 4096;
  int tile_height = 3072;
  int tile_size_selector = 4;
  double pixel_size = 10.0;      // nm
  double dwell_time = 0.8;       // us
  int dwell_time_selector = 4;
  int overlap = 200;             // px
  int row_shift = 0;             // px
  double rotation = 0.0;         // deg
  int display_colour = 0;
  std::vector<int> active_tiles;
  bool adaptive_focus = false;
  std::array<int, 3> adaptive_focus_tiles{-1, -1, -1};
  std::array<double, 2> adaptive_focus_gradient{0.0, 0.0};
  double origin_wd = 0.0;        // m
  int acq_interval = 1;
  int acq_interval_offset = 0;
};

struct OverviewConfig {
  std::array<double, 2> centre{0.0, 0.0};  // SEM coordinates (um)
  int size_selector = 3;
  int width = 3072;
  int height = 2304;
  double pixel_size = 155.0;     // nm
  double dwell_time = 0.8;       // us
  double wd = 0.0;               // m, 0 = use the locked target
  int acq_interval = 1;
  int acq_interval_offset = 0;
};

struct Config {
  AcquisitionConfig acquisition;
  DebrisConfig debris;
  StageConfig stage;
  ImagingConfig imaging;
  AutofocusConfig autofocus;
  InspectionConfig inspection;
  std::vector<GridConfig> grids;
  std::vector<OverviewConfig> overviews;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // base_dir/state_file unless state_file is absolute
  fs::path state_path() const;
  std::string resolved_stack_name() const;
};

std::string get_schema_json();

} // namespace sbem_stack::config
