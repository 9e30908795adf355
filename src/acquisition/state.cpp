#include "sbem_stack/acquisition/state.hpp"
#include "sbem_stack/core/errors.hpp"
#include "sbem_stack/core/utils.hpp"

#include <algorithm>
#include <fstream>

namespace sbem_stack::acquisition {

void AcquisitionState::reset() {
    slice_counter = 0;
    total_z_diff = 0.0;
    paused = false;
    pause_state = PauseState::None;
    error_state = core::ErrorCode::None;
    reset_interruption();
}

void AcquisitionState::reset_interruption() {
    interrupted = false;
    interrupted_at = TileRef{};
    tiles_acquired.clear();
    grids_acquired.clear();
}

void AcquisitionState::save_interruption_point(int grid, int tile) {
    interrupted = true;
    interrupted_at = TileRef{grid, tile};
}

bool AcquisitionState::is_tile_acquired(int grid, int tile) const {
    const std::string key = tile_key(grid, tile);
    return std::find(tiles_acquired.begin(), tiles_acquired.end(), key) != tiles_acquired.end();
}

bool AcquisitionState::is_grid_acquired(int grid) const {
    return std::find(grids_acquired.begin(), grids_acquired.end(), grid) != grids_acquired.end();
}

json AcquisitionState::to_json() const {
    json j;
    j["slice_counter"] = slice_counter;
    j["number_slices"] = number_slices;
    j["slice_thickness"] = slice_thickness;
    j["total_z_diff"] = total_z_diff;
    j["stage_z_position"] = stage_z_position;
    j["paused"] = paused;
    j["pause_state"] = pause_state_to_string(pause_state);
    j["error_state"] = core::to_int(error_state);
    j["interrupted"] = interrupted;
    if (interrupted_at.grid >= 0) {
        j["interrupted_at"] = {interrupted_at.grid, interrupted_at.tile};
    } else {
        j["interrupted_at"] = nullptr;
    }
    j["tiles_acquired"] = tiles_acquired;
    j["grids_acquired"] = grids_acquired;

    json grid_list = json::array();
    for (const auto& g : grids) {
        grid_list.push_back({
            {"active_tiles", g.active_tiles},
            {"adaptive_focus_tiles", g.adaptive_focus_tiles},
            {"adaptive_focus_gradient", g.adaptive_focus_gradient},
            {"origin_wd", g.origin_wd},
        });
    }
    j["grids"] = grid_list;

    j["target_wd"] = target_wd;
    j["target_stig_x"] = target_stig_x;
    j["target_stig_y"] = target_stig_y;
    j["last_update"] = last_update;
    return j;
}

namespace {

PauseState pause_state_from_json(const json& v) {
    if (v.is_number_integer()) {
        return int_to_pause_state(v.get<int>());
    }
    const std::string s = v.get<std::string>();
    if (s == "pause_after_image") return PauseState::PauseAfterImage;
    if (s == "pause_after_slice") return PauseState::PauseAfterSlice;
    if (s == "none") return PauseState::None;
    throw StateError("unknown pause_state '" + s + "'");
}

} // namespace

AcquisitionState AcquisitionState::from_json(const json& j) {
    if (!j.is_object()) {
        throw StateError("state must be a JSON object");
    }
    AcquisitionState st;
    try {
        st.slice_counter = j.value("slice_counter", 0);
        st.number_slices = j.value("number_slices", 0);
        st.slice_thickness = j.value("slice_thickness", 50);
        st.total_z_diff = j.value("total_z_diff", 0.0);
        st.stage_z_position = j.value("stage_z_position", 0.0);
        st.paused = j.value("paused", false);
        if (j.contains("pause_state")) {
            st.pause_state = pause_state_from_json(j["pause_state"]);
        }

        const int code = j.value("error_state", 0);
        auto ec = core::error_code_from_int(code);
        if (!ec) {
            throw StateError("unknown error_state " + std::to_string(code));
        }
        st.error_state = *ec;

        st.interrupted = j.value("interrupted", false);
        if (j.contains("interrupted_at") && !j["interrupted_at"].is_null()) {
            const auto& ia = j["interrupted_at"];
            if (!ia.is_array() || ia.size() != 2) {
                throw StateError("interrupted_at must be [grid, tile]");
            }
            st.interrupted_at = TileRef{ia[0].get<int>(), ia[1].get<int>()};
        }

        if (j.contains("tiles_acquired")) {
            st.tiles_acquired = j["tiles_acquired"].get<std::vector<std::string>>();
        }
        if (j.contains("grids_acquired")) {
            st.grids_acquired = j["grids_acquired"].get<std::vector<int>>();
        }
        if (j.contains("grids")) {
            for (const auto& gj : j["grids"]) {
                GridSnapshot g;
                g.active_tiles = gj.value("active_tiles", std::vector<int>{});
                if (gj.contains("adaptive_focus_tiles")) {
                    g.adaptive_focus_tiles = gj["adaptive_focus_tiles"].get<std::array<int, 3>>();
                }
                if (gj.contains("adaptive_focus_gradient")) {
                    g.adaptive_focus_gradient =
                        gj["adaptive_focus_gradient"].get<std::array<double, 2>>();
                }
                g.origin_wd = gj.value("origin_wd", 0.0);
                st.grids.push_back(std::move(g));
            }
        }

        st.target_wd = j.value("target_wd", 0.0);
        st.target_stig_x = j.value("target_stig_x", 0.0);
        st.target_stig_y = j.value("target_stig_y", 0.0);
        st.last_update = j.value("last_update", std::string());
    } catch (const json::exception& e) {
        throw StateError(std::string("malformed state: ") + e.what());
    }

    if (st.slice_counter < 0 || st.number_slices < 0) {
        throw StateError("slice counters must not be negative");
    }
    return st;
}

void AcquisitionState::save(const fs::path& path) const {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
    }
    core::write_text_atomic(path, to_json().dump(2) + "\n");
}

AcquisitionState AcquisitionState::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return AcquisitionState{};
    }
    json j;
    try {
        j = json::parse(core::read_text(path));
    } catch (const json::parse_error& e) {
        throw StateError("cannot parse " + path.string() + ": " + e.what());
    }
    return from_json(j);
}

} // namespace sbem_stack::acquisition
