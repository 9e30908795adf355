#include "sbem_stack/core/events.hpp"
#include "sbem_stack/core/utils.hpp"

namespace sbem_stack::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, RunState state, int slice_counter,
                           std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["status"] = run_state_to_string(state);
    event["success"] = (state != RunState::ErrorPaused);
    event["slice_counter"] = slice_counter;
    emit(event, out);
}

void EventEmitter::slice_start(const std::string& run_id, int slice_counter, double stage_z,
                               std::ostream& out) {
    json event = base_event("slice_start", run_id);
    event["slice_counter"] = slice_counter;
    event["stage_z"] = stage_z;
    emit(event, out);
}

void EventEmitter::phase_start(const std::string& run_id, RunState phase, const json& extra,
                               std::ostream& out) {
    json event = base_event("phase_start", run_id);
    event["phase"] = run_state_to_string(phase);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, RunState phase,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = base_event("phase_end", run_id);
    event["phase"] = run_state_to_string(phase);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::tile_acquired(const std::string& run_id, int grid, int tile, int slice,
                                 const std::string& path, std::ostream& out) {
    json event = base_event("tile_acquired", run_id);
    event["grid"] = grid;
    event["tile"] = tile;
    event["slice"] = slice;
    event["path"] = path;
    emit(event, out);
}

void EventEmitter::overview_acquired(const std::string& run_id, int ov, int slice, int sweeps,
                                     std::ostream& out) {
    json event = base_event("overview_acquired", run_id);
    event["overview"] = ov;
    event["slice"] = slice;
    event["sweeps"] = sweeps;
    emit(event, out);
}

void EventEmitter::debris_detected(const std::string& run_id, int ov, int slice, int sweep,
                                   const std::string& message, std::ostream& out) {
    json event = base_event("debris_detected", run_id);
    event["overview"] = ov;
    event["slice"] = slice;
    event["sweep"] = sweep;
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::debris_accepted_with_warning(const std::string& run_id, int ov, int slice,
                                                int sweeps, std::ostream& out) {
    json event = base_event("debris_accepted_with_warning", run_id);
    event["overview"] = ov;
    event["slice"] = slice;
    event["sweeps"] = sweeps;
    emit(event, out);
}

void EventEmitter::cut_completed(const std::string& run_id, int slice_counter,
                                 double total_z_diff, std::ostream& out) {
    json event = base_event("cut_completed", run_id);
    event["slice_counter"] = slice_counter;
    event["total_z_diff"] = total_z_diff;
    emit(event, out);
}

void EventEmitter::pause(const std::string& run_id, PauseState state, std::ostream& out) {
    json event = base_event("pause", run_id);
    event["pause_state"] = pause_state_to_string(state);
    emit(event, out);
}

void EventEmitter::user_prompt(const std::string& run_id, const std::string& kind,
                               std::ostream& out) {
    json event = base_event("user_prompt", run_id);
    event["kind"] = kind;
    emit(event, out);
}

void EventEmitter::focus_alert(const std::string& run_id, const std::string& message,
                               std::ostream& out) {
    json event = base_event("focus_alert", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, ErrorCode code, int slice_counter,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["code"] = to_int(code);
    event["category"] = error_category_name(error_category(code));
    event["message"] = error_description(code);
    event["slice_counter"] = slice_counter;
    emit(event, out);
}

} // namespace sbem_stack::core
