#include "sbem_stack/config/configuration.hpp"
#include "sbem_stack/core/errors.hpp"
#include "sbem_stack/core/utils.hpp"

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

namespace sbem_stack::config {

static void read_double_pair(const YAML::Node& n, std::array<double, 2>& out) {
    if (n && n.IsSequence() && n.size() == 2) {
        out[0] = n[0].as<double>();
        out[1] = n[1].as<double>();
    }
}

static void read_double_triple(const YAML::Node& n, std::array<double, 3>& out) {
    if (n && n.IsSequence() && n.size() == 3) {
        out[0] = n[0].as<double>();
        out[1] = n[1].as<double>();
        out[2] = n[2].as<double>();
    }
}

static void read_int_triple(const YAML::Node& n, std::array<int, 3>& out) {
    if (n && n.IsSequence() && n.size() == 3) {
        out[0] = n[0].as<int>();
        out[1] = n[1].as<int>();
        out[2] = n[2].as<int>();
    }
}

template <typename T, size_t N>
static YAML::Node flow_seq(const std::array<T, N>& values) {
    YAML::Node n;
    for (const auto& v : values) n.push_back(v);
    n.SetStyle(YAML::EmitterStyle::Flow);
    return n;
}

static GridConfig grid_from_yaml(const YAML::Node& g) {
    GridConfig grid;
    read_double_pair(g["origin"], grid.origin);
    if (g["rows"]) grid.rows = g["rows"].as<int>();
    if (g["cols"]) grid.cols = g["cols"].as<int>();
    if (g["tile_width"]) grid.tile_width = g["tile_width"].as<int>();
    if (g["tile_height"]) grid.tile_height = g["tile_height"].as<int>();
    if (g["tile_size_selector"]) grid.tile_size_selector = g["tile_size_selector"].as<int>();
    if (g["pixel_size"]) grid.pixel_size = g["pixel_size"].as<double>();
    if (g["dwell_time"]) grid.dwell_time = g["dwell_time"].as<double>();
    if (g["dwell_time_selector"]) grid.dwell_time_selector = g["dwell_time_selector"].as<int>();
    if (g["overlap"]) grid.overlap = g["overlap"].as<int>();
    if (g["row_shift"]) grid.row_shift = g["row_shift"].as<int>();
    if (g["rotation"]) grid.rotation = g["rotation"].as<double>();
    if (g["display_colour"]) grid.display_colour = g["display_colour"].as<int>();
    if (g["active_tiles"]) grid.active_tiles = g["active_tiles"].as<std::vector<int>>();
    if (g["adaptive_focus"]) grid.adaptive_focus = g["adaptive_focus"].as<bool>();
    read_int_triple(g["adaptive_focus_tiles"], grid.adaptive_focus_tiles);
    read_double_pair(g["adaptive_focus_gradient"], grid.adaptive_focus_gradient);
    if (g["origin_wd"]) grid.origin_wd = g["origin_wd"].as<double>();
    if (g["acq_interval"]) grid.acq_interval = g["acq_interval"].as<int>();
    if (g["acq_interval_offset"]) grid.acq_interval_offset = g["acq_interval_offset"].as<int>();
    return grid;
}

static OverviewConfig overview_from_yaml(const YAML::Node& o) {
    OverviewConfig ov;
    read_double_pair(o["centre"], ov.centre);
    if (o["size_selector"]) ov.size_selector = o["size_selector"].as<int>();
    if (o["width"]) ov.width = o["width"].as<int>();
    if (o["height"]) ov.height = o["height"].as<int>();
    if (o["pixel_size"]) ov.pixel_size = o["pixel_size"].as<double>();
    if (o["dwell_time"]) ov.dwell_time = o["dwell_time"].as<double>();
    if (o["wd"]) ov.wd = o["wd"].as<double>();
    if (o["acq_interval"]) ov.acq_interval = o["acq_interval"].as<int>();
    if (o["acq_interval_offset"]) ov.acq_interval_offset = o["acq_interval_offset"].as<int>();
    return ov;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["acquisition"]) {
            auto a = node["acquisition"];
            if (a["base_dir"]) cfg.acquisition.base_dir = a["base_dir"].as<std::string>();
            if (a["stack_name"]) cfg.acquisition.stack_name = a["stack_name"].as<std::string>();
            if (a["number_slices"]) cfg.acquisition.number_slices = a["number_slices"].as<int>();
            if (a["slice_thickness"]) cfg.acquisition.slice_thickness = a["slice_thickness"].as<int>();
            if (a["take_overviews"]) cfg.acquisition.take_overviews = a["take_overviews"].as<bool>();
            if (a["use_debris_detection"]) cfg.acquisition.use_debris_detection = a["use_debris_detection"].as<bool>();
            if (a["ask_user"]) cfg.acquisition.ask_user = a["ask_user"].as<bool>();
            if (a["monitor_images"]) cfg.acquisition.monitor_images = a["monitor_images"].as<bool>();
            if (a["use_mirror_drive"]) cfg.acquisition.use_mirror_drive = a["use_mirror_drive"].as<bool>();
            if (a["mirror_drive"]) cfg.acquisition.mirror_drive = a["mirror_drive"].as<std::string>();
            if (a["state_file"]) cfg.acquisition.state_file = a["state_file"].as<std::string>();
            if (a["echo_events"]) cfg.acquisition.echo_events = a["echo_events"].as<bool>();
        }

        if (node["debris"]) {
            auto d = node["debris"];
            if (d["max_number_sweeps"]) cfg.debris.max_number_sweeps = d["max_number_sweeps"].as<int>();
            if (d["continue_after_max_sweeps"]) {
                cfg.debris.continue_after_max_sweeps = d["continue_after_max_sweeps"].as<bool>();
            }
            if (d["detection_method"]) cfg.debris.detection_method = d["detection_method"].as<int>();
        }

        if (node["stage"]) {
            auto s = node["stage"];
            if (s["full_cut_duration"]) cfg.stage.full_cut_duration = s["full_cut_duration"].as<float>();
            if (s["sweep_distance"]) cfg.stage.sweep_distance = s["sweep_distance"].as<float>();
            if (s["stage_move_wait_interval"]) cfg.stage.stage_move_wait_interval = s["stage_move_wait_interval"].as<float>();
            if (s["retry_delay"]) cfg.stage.retry_delay = s["retry_delay"].as<float>();
            if (s["max_z_move"]) cfg.stage.max_z_move = s["max_z_move"].as<float>();
            if (s["motor_time_tile"]) cfg.stage.motor_time_tile = s["motor_time_tile"].as<float>();
            if (s["motor_time_overview"]) cfg.stage.motor_time_overview = s["motor_time_overview"].as<float>();
            if (s["calibration"]) {
                auto c = s["calibration"];
                if (c["scale_x"]) cfg.stage.calibration_scale_x = c["scale_x"].as<float>();
                if (c["scale_y"]) cfg.stage.calibration_scale_y = c["scale_y"].as<float>();
                if (c["rotation_x"]) cfg.stage.calibration_rotation_x = c["rotation_x"].as<float>();
                if (c["rotation_y"]) cfg.stage.calibration_rotation_y = c["rotation_y"].as<float>();
            }
        }

        if (node["imaging"]) {
            auto i = node["imaging"];
            if (i["beam_current"]) cfg.imaging.beam_current = i["beam_current"].as<float>();
            if (i["eht"]) cfg.imaging.eht = i["eht"].as<float>();
            if (i["magnification"]) cfg.imaging.magnification = i["magnification"].as<float>();
            if (i["working_distance"]) cfg.imaging.working_distance = i["working_distance"].as<double>();
            if (i["stig_x"]) cfg.imaging.stig_x = i["stig_x"].as<double>();
            if (i["stig_y"]) cfg.imaging.stig_y = i["stig_y"].as<double>();
        }

        if (node["autofocus"]) {
            auto af = node["autofocus"];
            if (af["enabled"]) cfg.autofocus.enabled = af["enabled"].as<bool>();
            if (af["method"]) cfg.autofocus.method = af["method"].as<int>();
            if (af["reference_tiles"] && af["reference_tiles"].IsSequence()) {
                cfg.autofocus.reference_tiles.clear();
                for (const auto& rt : af["reference_tiles"]) {
                    if (!rt.IsSequence() || rt.size() != 2) {
                        throw ConfigError("autofocus.reference_tiles entries must be [grid, tile]");
                    }
                    cfg.autofocus.reference_tiles.push_back({rt[0].as<int>(), rt[1].as<int>()});
                }
            }
            if (af["interval"]) cfg.autofocus.interval = af["interval"].as<int>();
            if (af["autostig_delay"]) cfg.autofocus.autostig_delay = af["autostig_delay"].as<int>();
            if (af["focus"]) cfg.autofocus.focus = af["focus"].as<bool>();
            if (af["stig"]) cfg.autofocus.stig = af["stig"].as<bool>();
            read_double_triple(af["heuristic_deltas"], cfg.autofocus.heuristic_deltas);
            read_double_triple(af["max_wd_stig_diff"], cfg.autofocus.max_wd_stig_diff);
        }

        if (node["inspection"]) {
            auto in = node["inspection"];
            if (in["mean_lower_limit"]) cfg.inspection.mean_lower_limit = in["mean_lower_limit"].as<float>();
            if (in["mean_upper_limit"]) cfg.inspection.mean_upper_limit = in["mean_upper_limit"].as<float>();
            if (in["stddev_lower_limit"]) cfg.inspection.stddev_lower_limit = in["stddev_lower_limit"].as<float>();
            if (in["stddev_upper_limit"]) cfg.inspection.stddev_upper_limit = in["stddev_upper_limit"].as<float>();
            if (in["slice_mean_threshold"]) cfg.inspection.slice_mean_threshold = in["slice_mean_threshold"].as<float>();
            if (in["slice_stddev_threshold"]) cfg.inspection.slice_stddev_threshold = in["slice_stddev_threshold"].as<float>();
            if (in["debris_mean_threshold"]) cfg.inspection.debris_mean_threshold = in["debris_mean_threshold"].as<float>();
            if (in["debris_stddev_threshold"]) cfg.inspection.debris_stddev_threshold = in["debris_stddev_threshold"].as<float>();
        }

        if (node["grids"] && node["grids"].IsSequence()) {
            for (const auto& g : node["grids"]) {
                cfg.grids.push_back(grid_from_yaml(g));
            }
        }

        if (node["overviews"] && node["overviews"].IsSequence()) {
            for (const auto& o : node["overviews"]) {
                cfg.overviews.push_back(overview_from_yaml(o));
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["acquisition"]["base_dir"] = acquisition.base_dir;
    node["acquisition"]["stack_name"] = acquisition.stack_name;
    node["acquisition"]["number_slices"] = acquisition.number_slices;
    node["acquisition"]["slice_thickness"] = acquisition.slice_thickness;
    node["acquisition"]["take_overviews"] = acquisition.take_overviews;
    node["acquisition"]["use_debris_detection"] = acquisition.use_debris_detection;
    node["acquisition"]["ask_user"] = acquisition.ask_user;
    node["acquisition"]["monitor_images"] = acquisition.monitor_images;
    node["acquisition"]["use_mirror_drive"] = acquisition.use_mirror_drive;
    node["acquisition"]["mirror_drive"] = acquisition.mirror_drive;
    node["acquisition"]["state_file"] = acquisition.state_file;
    node["acquisition"]["echo_events"] = acquisition.echo_events;

    node["debris"]["max_number_sweeps"] = debris.max_number_sweeps;
    node["debris"]["continue_after_max_sweeps"] = debris.continue_after_max_sweeps;
    node["debris"]["detection_method"] = debris.detection_method;

    node["stage"]["full_cut_duration"] = stage.full_cut_duration;
    node["stage"]["sweep_distance"] = stage.sweep_distance;
    node["stage"]["stage_move_wait_interval"] = stage.stage_move_wait_interval;
    node["stage"]["retry_delay"] = stage.retry_delay;
    node["stage"]["max_z_move"] = stage.max_z_move;
    node["stage"]["motor_time_tile"] = stage.motor_time_tile;
    node["stage"]["motor_time_overview"] = stage.motor_time_overview;
    node["stage"]["calibration"]["scale_x"] = stage.calibration_scale_x;
    node["stage"]["calibration"]["scale_y"] = stage.calibration_scale_y;
    node["stage"]["calibration"]["rotation_x"] = stage.calibration_rotation_x;
    node["stage"]["calibration"]["rotation_y"] = stage.calibration_rotation_y;

    node["imaging"]["beam_current"] = imaging.beam_current;
    node["imaging"]["eht"] = imaging.eht;
    node["imaging"]["magnification"] = imaging.magnification;
    node["imaging"]["working_distance"] = imaging.working_distance;
    node["imaging"]["stig_x"] = imaging.stig_x;
    node["imaging"]["stig_y"] = imaging.stig_y;

    node["autofocus"]["enabled"] = autofocus.enabled;
    node["autofocus"]["method"] = autofocus.method;
    YAML::Node ref_tiles(YAML::NodeType::Sequence);
    for (const auto& rt : autofocus.reference_tiles) {
        ref_tiles.push_back(flow_seq(rt));
    }
    node["autofocus"]["reference_tiles"] = ref_tiles;
    node["autofocus"]["interval"] = autofocus.interval;
    node["autofocus"]["autostig_delay"] = autofocus.autostig_delay;
    node["autofocus"]["focus"] = autofocus.focus;
    node["autofocus"]["stig"] = autofocus.stig;
    node["autofocus"]["heuristic_deltas"] = flow_seq(autofocus.heuristic_deltas);
    node["autofocus"]["max_wd_stig_diff"] = flow_seq(autofocus.max_wd_stig_diff);

    node["inspection"]["mean_lower_limit"] = inspection.mean_lower_limit;
    node["inspection"]["mean_upper_limit"] = inspection.mean_upper_limit;
    node["inspection"]["stddev_lower_limit"] = inspection.stddev_lower_limit;
    node["inspection"]["stddev_upper_limit"] = inspection.stddev_upper_limit;
    node["inspection"]["slice_mean_threshold"] = inspection.slice_mean_threshold;
    node["inspection"]["slice_stddev_threshold"] = inspection.slice_stddev_threshold;
    node["inspection"]["debris_mean_threshold"] = inspection.debris_mean_threshold;
    node["inspection"]["debris_stddev_threshold"] = inspection.debris_stddev_threshold;

    YAML::Node grid_list(YAML::NodeType::Sequence);
    for (const auto& grid : grids) {
        YAML::Node g;
        g["origin"] = flow_seq(grid.origin);
        g["rows"] = grid.rows;
        g["cols"] = grid.cols;
        g["tile_width"] = grid.tile_width;
        g["tile_height"] = grid.tile_height;
        g["tile_size_selector"] = grid.tile_size_selector;
        g["pixel_size"] = grid.pixel_size;
        g["dwell_time"] = grid.dwell_time;
        g["dwell_time_selector"] = grid.dwell_time_selector;
        g["overlap"] = grid.overlap;
        g["row_shift"] = grid.row_shift;
        g["rotation"] = grid.rotation;
        g["display_colour"] = grid.display_colour;
        YAML::Node active(YAML::NodeType::Sequence);
        for (int t : grid.active_tiles) active.push_back(t);
        active.SetStyle(YAML::EmitterStyle::Flow);
        g["active_tiles"] = active;
        g["adaptive_focus"] = grid.adaptive_focus;
        g["adaptive_focus_tiles"] = flow_seq(grid.adaptive_focus_tiles);
        g["adaptive_focus_gradient"] = flow_seq(grid.adaptive_focus_gradient);
        g["origin_wd"] = grid.origin_wd;
        g["acq_interval"] = grid.acq_interval;
        g["acq_interval_offset"] = grid.acq_interval_offset;
        grid_list.push_back(g);
    }
    node["grids"] = grid_list;

    YAML::Node ov_list(YAML::NodeType::Sequence);
    for (const auto& ov : overviews) {
        YAML::Node o;
        o["centre"] = flow_seq(ov.centre);
        o["size_selector"] = ov.size_selector;
        o["width"] = ov.width;
        o["height"] = ov.height;
        o["pixel_size"] = ov.pixel_size;
        o["dwell_time"] = ov.dwell_time;
        o["wd"] = ov.wd;
        o["acq_interval"] = ov.acq_interval;
        o["acq_interval_offset"] = ov.acq_interval_offset;
        ov_list.push_back(o);
    }
    node["overviews"] = ov_list;

    return node;
}

void Config::validate() const {
    if (acquisition.base_dir.empty()) {
        throw ValidationError("acquisition.base_dir must not be empty");
    }
    if (resolved_stack_name().empty()) {
        throw ValidationError("acquisition.stack_name cannot be derived from base_dir");
    }
    if (acquisition.number_slices < 0) {
        throw ValidationError("acquisition.number_slices must be >= 0");
    }
    if (acquisition.slice_thickness < 1 || acquisition.slice_thickness > 1000) {
        throw ValidationError("acquisition.slice_thickness must be in [1,1000] nm");
    }
    if (acquisition.use_mirror_drive && acquisition.mirror_drive.empty()) {
        throw ValidationError("acquisition.mirror_drive must be set when use_mirror_drive is enabled");
    }
    if (acquisition.state_file.empty()) {
        throw ValidationError("acquisition.state_file must not be empty");
    }

    if (debris.max_number_sweeps < 0) {
        throw ValidationError("debris.max_number_sweeps must be >= 0");
    }
    if (debris.detection_method < 0 || debris.detection_method > 1) {
        throw ValidationError("debris.detection_method must be 0 (quadrant) or 1 (whole frame)");
    }

    if (stage.full_cut_duration < 0.0f) {
        throw ValidationError("stage.full_cut_duration must be >= 0");
    }
    if (stage.retry_delay < 0.0f || stage.stage_move_wait_interval < 0.0f) {
        throw ValidationError("stage.retry_delay and stage.stage_move_wait_interval must be >= 0");
    }
    if (stage.max_z_move <= 0.0f) {
        throw ValidationError("stage.max_z_move must be > 0");
    }
    if (stage.calibration_scale_x <= 0.0f || stage.calibration_scale_y <= 0.0f) {
        throw ValidationError("stage.calibration.scale_x/scale_y must be > 0");
    }
    if (std::abs(std::cos(stage.calibration_rotation_x - stage.calibration_rotation_y)) < 1e-6) {
        throw ValidationError("stage.calibration rotation_x and rotation_y describe degenerate axes");
    }

    if (imaging.beam_current <= 0.0f) {
        throw ValidationError("imaging.beam_current must be > 0");
    }
    if (imaging.magnification <= 0.0f) {
        throw ValidationError("imaging.magnification must be > 0");
    }

    if (autofocus.method != 0 && autofocus.method != 1) {
        throw ValidationError("autofocus.method must be 0 (hardware) or 1 (heuristic)");
    }
    if (autofocus.interval < 1) {
        throw ValidationError("autofocus.interval must be >= 1");
    }
    for (double d : autofocus.max_wd_stig_diff) {
        if (d <= 0.0) {
            throw ValidationError("autofocus.max_wd_stig_diff entries must be > 0");
        }
    }
    for (const auto& rt : autofocus.reference_tiles) {
        if (rt[0] < 0 || rt[0] >= static_cast<int>(grids.size())) {
            throw ValidationError("autofocus.reference_tiles refers to unknown grid " +
                                  std::to_string(rt[0]));
        }
        const auto& g = grids[static_cast<size_t>(rt[0])];
        if (rt[1] < 0 || rt[1] >= g.rows * g.cols) {
            throw ValidationError("autofocus.reference_tiles refers to unknown tile " +
                                  std::to_string(rt[0]) + "." + std::to_string(rt[1]));
        }
    }

    if (inspection.mean_lower_limit > inspection.mean_upper_limit) {
        throw ValidationError("inspection.mean_lower_limit must be <= mean_upper_limit");
    }
    if (inspection.stddev_lower_limit > inspection.stddev_upper_limit) {
        throw ValidationError("inspection.stddev_lower_limit must be <= stddev_upper_limit");
    }

    for (size_t gi = 0; gi < grids.size(); ++gi) {
        const auto& g = grids[gi];
        const std::string prefix = "grids[" + std::to_string(gi) + "].";
        if (g.rows < 1 || g.cols < 1) {
            throw ValidationError(prefix + "rows and cols must be >= 1");
        }
        if (g.tile_width < 1 || g.tile_height < 1) {
            throw ValidationError(prefix + "tile_width and tile_height must be >= 1");
        }
        if (g.overlap < 0 || g.overlap >= g.tile_width || g.overlap >= g.tile_height) {
            throw ValidationError(prefix + "overlap must be >= 0 and smaller than the tile size");
        }
        if (g.row_shift < 0) {
            throw ValidationError(prefix + "row_shift must be >= 0");
        }
        if (g.pixel_size <= 0.0 || g.dwell_time <= 0.0) {
            throw ValidationError(prefix + "pixel_size and dwell_time must be > 0");
        }
        if (g.acq_interval < 1 || g.acq_interval_offset < 0) {
            throw ValidationError(prefix + "acq_interval must be >= 1 and acq_interval_offset >= 0");
        }
        std::set<int> seen;
        for (int t : g.active_tiles) {
            if (t < 0 || t >= g.rows * g.cols) {
                throw ValidationError(prefix + "active_tiles contains out-of-range tile " +
                                      std::to_string(t));
            }
            if (!seen.insert(t).second) {
                throw ValidationError(prefix + "active_tiles contains duplicate tile " +
                                      std::to_string(t));
            }
        }
        for (int t : g.adaptive_focus_tiles) {
            if (t < -1 || t >= g.rows * g.cols) {
                throw ValidationError(prefix + "adaptive_focus_tiles must be -1 or valid tile indices");
            }
        }
    }

    for (size_t oi = 0; oi < overviews.size(); ++oi) {
        const auto& o = overviews[oi];
        const std::string prefix = "overviews[" + std::to_string(oi) + "].";
        if (o.width < 1 || o.height < 1) {
            throw ValidationError(prefix + "width and height must be >= 1");
        }
        if (o.pixel_size <= 0.0 || o.dwell_time <= 0.0) {
            throw ValidationError(prefix + "pixel_size and dwell_time must be > 0");
        }
        if (o.wd < 0.0) {
            throw ValidationError(prefix + "wd must be >= 0");
        }
        if (o.acq_interval < 1 || o.acq_interval_offset < 0) {
            throw ValidationError(prefix + "acq_interval must be >= 1 and acq_interval_offset >= 0");
        }
    }
}

fs::path Config::state_path() const {
    fs::path p(acquisition.state_file);
    if (p.is_absolute()) return p;
    return fs::path(acquisition.base_dir) / p;
}

std::string Config::resolved_stack_name() const {
    if (!acquisition.stack_name.empty()) return acquisition.stack_name;
    return core::stack_name_from_base_dir(acquisition.base_dir);
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "acquisition": {
      "type": "object",
      "properties": {
        "base_dir": {"type": "string"},
        "stack_name": {"type": "string"},
        "number_slices": {"type": "integer", "minimum": 0},
        "slice_thickness": {"type": "integer", "minimum": 1, "maximum": 1000},
        "take_overviews": {"type": "boolean"},
        "use_debris_detection": {"type": "boolean"},
        "ask_user": {"type": "boolean"},
        "monitor_images": {"type": "boolean"},
        "use_mirror_drive": {"type": "boolean"},
        "mirror_drive": {"type": "string"},
        "state_file": {"type": "string"},
        "echo_events": {"type": "boolean"}
      }
    },
    "debris": {
      "type": "object",
      "properties": {
        "max_number_sweeps": {"type": "integer", "minimum": 0},
        "continue_after_max_sweeps": {"type": "boolean"},
        "detection_method": {"type": "integer", "enum": [0, 1]}
      }
    },
    "stage": {
      "type": "object",
      "properties": {
        "full_cut_duration": {"type": "number", "minimum": 0},
        "sweep_distance": {"type": "number"},
        "stage_move_wait_interval": {"type": "number", "minimum": 0},
        "retry_delay": {"type": "number", "minimum": 0},
        "max_z_move": {"type": "number", "exclusiveMinimum": 0},
        "motor_time_tile": {"type": "number", "minimum": 0},
        "motor_time_overview": {"type": "number", "minimum": 0},
        "calibration": {
          "type": "object",
          "properties": {
            "scale_x": {"type": "number", "exclusiveMinimum": 0},
            "scale_y": {"type": "number", "exclusiveMinimum": 0},
            "rotation_x": {"type": "number"},
            "rotation_y": {"type": "number"}
          }
        }
      }
    },
    "imaging": {
      "type": "object",
      "properties": {
        "beam_current": {"type": "number", "exclusiveMinimum": 0},
        "eht": {"type": "number"},
        "magnification": {"type": "number", "exclusiveMinimum": 0},
        "working_distance": {"type": "number"},
        "stig_x": {"type": "number"},
        "stig_y": {"type": "number"}
      }
    },
    "autofocus": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "method": {"type": "integer", "enum": [0, 1]},
        "reference_tiles": {
          "type": "array",
          "items": {"type": "array", "items": {"type": "integer"}, "minItems": 2, "maxItems": 2}
        },
        "interval": {"type": "integer", "minimum": 1},
        "autostig_delay": {"type": "integer", "minimum": 0},
        "focus": {"type": "boolean"},
        "stig": {"type": "boolean"},
        "heuristic_deltas": {"type": "array", "items": {"type": "number"}, "minItems": 3, "maxItems": 3},
        "max_wd_stig_diff": {"type": "array", "items": {"type": "number"}, "minItems": 3, "maxItems": 3}
      }
    },
    "inspection": {
      "type": "object",
      "properties": {
        "mean_lower_limit": {"type": "number"},
        "mean_upper_limit": {"type": "number"},
        "stddev_lower_limit": {"type": "number"},
        "stddev_upper_limit": {"type": "number"},
        "slice_mean_threshold": {"type": "number"},
        "slice_stddev_threshold": {"type": "number"},
        "debris_mean_threshold": {"type": "number"},
        "debris_stddev_threshold": {"type": "number"}
      }
    },
    "grids": {
      "type": "array",
      "items": {
        "type": "object",
        "properties": {
          "origin": {"type": "array", "items": {"type": "number"}, "minItems": 2, "maxItems": 2},
          "rows": {"type": "integer", "minimum": 1},
          "cols": {"type": "integer", "minimum": 1},
          "tile_width": {"type": "integer", "minimum": 1},
          "tile_height": {"type": "integer", "minimum": 1},
          "tile_size_selector": {"type": "integer"},
          "pixel_size": {"type": "number", "exclusiveMinimum": 0},
          "dwell_time": {"type": "number", "exclusiveMinimum": 0},
          "dwell_time_selector": {"type": "integer"},
          "overlap": {"type": "integer", "minimum": 0},
          "row_shift": {"type": "integer", "minimum": 0},
          "rotation": {"type": "number"},
          "display_colour": {"type": "integer"},
          "active_tiles": {"type": "array", "items": {"type": "integer", "minimum": 0}},
          "adaptive_focus": {"type": "boolean"},
          "adaptive_focus_tiles": {"type": "array", "items": {"type": "integer", "minimum": -1}, "minItems": 3, "maxItems": 3},
          "adaptive_focus_gradient": {"type": "array", "items": {"type": "number"}, "minItems": 2, "maxItems": 2},
          "origin_wd": {"type": "number"},
          "acq_interval": {"type": "integer", "minimum": 1},
          "acq_interval_offset": {"type": "integer", "minimum": 0}
        }
      }
    },
    "overviews": {
      "type": "array",
      "items": {
        "type": "object",
        "properties": {
          "centre": {"type": "array", "items": {"type": "number"}, "minItems": 2, "maxItems": 2},
          "size_selector": {"type": "integer"},
          "width": {"type": "integer", "minimum": 1},
          "height": {"type": "integer", "minimum": 1},
          "pixel_size": {"type": "number", "exclusiveMinimum": 0},
          "dwell_time": {"type": "number", "exclusiveMinimum": 0},
          "wd": {"type": "number", "minimum": 0},
          "acq_interval": {"type": "integer", "minimum": 1},
          "acq_interval_offset": {"type": "integer", "minimum": 0}
        }
      }
    }
  }
})";
}

} // namespace sbem_stack::config
