#include "sbem_stack/acquisition/estimates.hpp"
#include "sbem_stack/acquisition/orchestrator.hpp"
#include "sbem_stack/acquisition/state.hpp"
#include "sbem_stack/config/configuration.hpp"
#include "sbem_stack/core/error_codes.hpp"
#include "sbem_stack/core/errors.hpp"
#include "sbem_stack/geometry/grid_manager.hpp"
#include "sbem_stack/geometry/overview_manager.hpp"
#include "sbem_stack/hardware/simulated.hpp"
#include "sbem_stack/inspection/image_inspector.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace acq = sbem_stack::acquisition;
namespace config = sbem_stack::config;
namespace core = sbem_stack::core;
namespace geometry = sbem_stack::geometry;
namespace hardware = sbem_stack::hardware;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static fs::path resolve_state_path(const config::Config* cfg, const std::string& state_arg) {
    if (!state_arg.empty()) return fs::path(state_arg);
    if (cfg) return cfg->state_path();
    return fs::path();
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// validate-config <path> [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["path"] = path;

    try {
        config::Config cfg = config::Config::load(path);
        cfg.validate();
        result["valid"] = true;
        result["stack_name"] = cfg.resolved_stack_name();
        result["grids"] = cfg.grids.size();
        result["overviews"] = cfg.overviews.size();
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// gridmap <config> <out.txt>
// ============================================================================
int cmd_gridmap(const std::string& config_path, const std::string& out_path) {
    config::Config cfg = config::Config::load(config_path);
    cfg.validate();
    geometry::GridManager grids(cfg.grids);
    grids.save_grid_map(out_path);

    json result;
    result["ok"] = true;
    result["path"] = out_path;
    json per_grid = json::array();
    for (int g = 0; g < grids.number_grids(); ++g) {
        const auto size = grids.grid_size(g);
        per_grid.push_back({
            {"grid", g},
            {"rows", size.rows},
            {"cols", size.cols},
            {"active_tiles", grids.active_tiles(g)},
        });
    }
    result["grids"] = per_grid;
    print_json(result);
    return 0;
}

// ============================================================================
// estimate <config> [--state <file>]
// ============================================================================
int cmd_estimate(const std::string& config_path, const std::string& state_arg) {
    config::Config cfg = config::Config::load(config_path);
    cfg.validate();
    const acq::AcquisitionState state = acq::AcquisitionState::load(resolve_state_path(&cfg, state_arg));

    geometry::GridManager grids(cfg.grids);
    geometry::OverviewManager overviews(cfg.overviews);
    const acq::Estimates est = acq::calculate_estimates(cfg, grids, overviews,
                                                        cfg.imaging.beam_current,
                                                        state.slice_counter);
    json result = est.to_json();
    result["slice_counter"] = state.slice_counter;
    result["number_slices"] = cfg.acquisition.number_slices;
    print_json(result);
    return 0;
}

// ============================================================================
// status --state <file> | status <config>
// ============================================================================
int cmd_status(const fs::path& state_path) {
    if (state_path.empty()) {
        std::cerr << "status requires --state or a config path\n";
        return 1;
    }
    const acq::AcquisitionState state = acq::AcquisitionState::load(state_path);
    json result = state.to_json();
    result["path"] = state_path.string();
    result["exists"] = fs::exists(state_path);
    result["error_description"] = core::error_description(state.error_state);
    print_json(result);
    return 0;
}

// ============================================================================
// reset --state <file> | reset <config>
// ============================================================================
int cmd_reset(const fs::path& state_path) {
    if (state_path.empty()) {
        std::cerr << "reset requires --state or a config path\n";
        return 1;
    }
    acq::AcquisitionState state = acq::AcquisitionState::load(state_path);
    state.reset();
    state.save(state_path);

    json result;
    result["ok"] = true;
    result["path"] = state_path.string();
    result["slice_counter"] = state.slice_counter;
    print_json(result);
    return 0;
}

// ============================================================================
// simulate <config> [--state <file>] [--max-slices N] [--auto-reply R]
// ============================================================================
namespace {

class CliObserver : public acq::AcquisitionObserver {
public:
    explicit CliObserver(acq::UserReply reply) : reply_(reply) {}

    void on_log(const std::string& message) override {
        std::cerr << "[SIM] " << message << std::endl;
    }
    void on_error(core::ErrorCode code, const std::string& description) override {
        std::cerr << "[SIM] error " << core::to_int(code) << ": " << description << std::endl;
    }
    void on_user_prompt_required(acq::PromptKind kind, acq::UserPromptChannel& channel) override {
        std::cerr << "[SIM] prompt " << acq::prompt_kind_to_string(kind) << " -> "
                  << acq::user_reply_to_string(reply_) << std::endl;
        channel.reply(reply_);
    }

private:
    acq::UserReply reply_;
};

bool parse_reply(const std::string& s, acq::UserReply& out) {
    if (s == "yes") out = acq::UserReply::Yes;
    else if (s == "no") out = acq::UserReply::No;
    else if (s == "abort") out = acq::UserReply::Abort;
    else return false;
    return true;
}

} // namespace

int cmd_simulate(const std::string& config_path, const std::string& state_arg,
                 int max_slices, acq::UserReply reply, int preview_scale) {
    config::Config cfg = config::Config::load(config_path);
    if (max_slices > 0) {
        const fs::path sp = resolve_state_path(&cfg, state_arg);
        const int start = acq::AcquisitionState::load(sp).slice_counter;
        const int limit = start + max_slices;
        if (cfg.acquisition.number_slices == 0 || cfg.acquisition.number_slices > limit) {
            cfg.acquisition.number_slices = limit;
        }
    }
    cfg.validate();

    const fs::path state_path = resolve_state_path(&cfg, state_arg);
    acq::AcquisitionState state = acq::AcquisitionState::load(state_path);

    hardware::SimulatedStage stage(cfg.stage, state.stage_z_position);
    hardware::SimulatedImaging imaging(cfg.imaging, preview_scale);
    sbem_stack::inspection::BasicImageInspector inspector(cfg.inspection);
    hardware::SimulatedAutofocus autofocus(cfg.autofocus, imaging);

    acq::AcquisitionOrchestrator orchestrator(cfg, stage, imaging, inspector, autofocus,
                                              state, state_path);
    CliObserver observer(reply);
    orchestrator.set_observer(&observer);

    const sbem_stack::RunState final_state = orchestrator.run();
    const acq::AcquisitionState end_state = orchestrator.state();

    json result;
    result["run_state"] = sbem_stack::run_state_to_string(final_state);
    result["slice_counter"] = end_state.slice_counter;
    result["total_z_diff"] = end_state.total_z_diff;
    result["error_state"] = core::to_int(end_state.error_state);
    result["error_description"] = core::error_description(end_state.error_state);
    result["frames_acquired"] = imaging.frames_acquired();
    result["cuts"] = stage.cuts();
    result["sweeps"] = stage.sweeps();
    result["state_path"] = state_path.string();
    print_json(result);
    return final_state == sbem_stack::RunState::ErrorPaused ? 2 : 0;
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: sbem_stack_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  get-schema                      Print JSON schema for config\n"
              << "  validate-config <path> [--strict-exit-codes]  Validate config\n"
              << "  gridmap <config> <out>          Export the grid map of all grids\n"
              << "  estimate <config> [--state F]   Dose, area, duration and data estimates\n"
              << "  status (<config> | --state F)   Print the acquisition state\n"
              << "  reset (<config> | --state F)    Reset the acquisition state to slice 0\n"
              << "  simulate <config> [--state F] [--max-slices N] [--auto-reply yes|no|abort]\n"
              << "           [--preview-scale S]    Run the stack with simulated devices\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    auto state_path_from_args = [&]() -> fs::path {
        const std::string state_arg = get_arg("--state");
        if (!state_arg.empty()) return fs::path(state_arg);
        const std::string cfg_path = get_positional(0);
        if (cfg_path.empty()) return fs::path();
        const config::Config cfg = config::Config::load(cfg_path);
        return resolve_state_path(&cfg, "");
    };

    try {
        if (command == "get-schema") {
            return cmd_get_schema();
        }

        if (command == "validate-config") {
            std::string path = get_positional(0);
            if (path.empty()) {
                std::cerr << "validate-config requires a path argument\n";
                return 1;
            }
            return cmd_validate_config(path, has_flag("--strict-exit-codes"));
        }

        if (command == "gridmap") {
            std::string cfg_path = get_positional(0);
            std::string out_path = get_positional(1);
            if (cfg_path.empty() || out_path.empty()) {
                std::cerr << "gridmap requires <config> and <out> arguments\n";
                return 1;
            }
            return cmd_gridmap(cfg_path, out_path);
        }

        if (command == "estimate") {
            std::string cfg_path = get_positional(0);
            if (cfg_path.empty()) {
                std::cerr << "estimate requires a config path\n";
                return 1;
            }
            return cmd_estimate(cfg_path, get_arg("--state"));
        }

        if (command == "status") {
            return cmd_status(state_path_from_args());
        }

        if (command == "reset") {
            return cmd_reset(state_path_from_args());
        }

        if (command == "simulate") {
            std::string cfg_path = get_positional(0);
            if (cfg_path.empty()) {
                std::cerr << "simulate requires a config path\n";
                return 1;
            }
            int max_slices = 0;
            std::string max_str = get_arg("--max-slices");
            if (!max_str.empty()) {
                max_slices = std::stoi(max_str);
            }
            int preview_scale = 8;
            std::string scale_str = get_arg("--preview-scale");
            if (!scale_str.empty()) {
                preview_scale = std::stoi(scale_str);
            }
            acq::UserReply reply = acq::UserReply::Yes;
            std::string reply_str = get_arg("--auto-reply");
            if (!reply_str.empty() && !parse_reply(reply_str, reply)) {
                std::cerr << "--auto-reply must be yes, no or abort\n";
                return 1;
            }
            return cmd_simulate(cfg_path, get_arg("--state"), max_slices, reply, preview_scale);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}
