#pragma once

#include "error_codes.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace sbem_stack::core {

using json = nlohmann::json;

// JSON-lines event stream of an acquisition run. Every event carries
// "type", "run_id" and "ts".
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, RunState state, int slice_counter, std::ostream& out);

    void slice_start(const std::string& run_id, int slice_counter, double stage_z, std::ostream& out);
    void phase_start(const std::string& run_id, RunState phase, const json& extra, std::ostream& out);
    void phase_end(const std::string& run_id, RunState phase, const std::string& status,
                   const json& extra, std::ostream& out);

    void tile_acquired(const std::string& run_id, int grid, int tile, int slice,
                       const std::string& path, std::ostream& out);
    void overview_acquired(const std::string& run_id, int ov, int slice, int sweeps,
                           std::ostream& out);
    void debris_detected(const std::string& run_id, int ov, int slice, int sweep,
                         const std::string& message, std::ostream& out);
    void debris_accepted_with_warning(const std::string& run_id, int ov, int slice,
                                      int sweeps, std::ostream& out);
    void cut_completed(const std::string& run_id, int slice_counter, double total_z_diff,
                       std::ostream& out);

    void pause(const std::string& run_id, PauseState state, std::ostream& out);
    void user_prompt(const std::string& run_id, const std::string& kind, std::ostream& out);
    void focus_alert(const std::string& run_id, const std::string& message, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, ErrorCode code, int slice_counter, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

} // namespace sbem_stack::core
