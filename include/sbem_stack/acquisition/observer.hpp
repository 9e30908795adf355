#pragma once

#include "sbem_stack/core/error_codes.hpp"
#include "sbem_stack/core/types.hpp"
#include "user_prompt.hpp"

#include <string>

namespace sbem_stack::acquisition {

struct Progress {
    int slice_counter = 0;
    int number_slices = 0;
    int grid = -1;
    int tile = -1;
    int tiles_done = 0;      // in the current slice
    int tiles_total = 0;     // scheduled in the current slice
};

// Callbacks from the acquisition thread. All methods are invoked on that
// thread and must not block, except on_user_prompt_required which may
// answer later from any thread through the channel.
class AcquisitionObserver {
public:
    virtual ~AcquisitionObserver() = default;

    virtual void on_log(const std::string& /*message*/) {}
    virtual void on_progress(const Progress& /*progress*/) {}
    virtual void on_state_changed(RunState /*state*/) {}
    virtual void on_error(core::ErrorCode /*code*/, const std::string& /*description*/) {}
    virtual void on_focus_alert(const std::string& /*message*/) {}
    virtual void on_mag_alert(const std::string& /*message*/) {}
    virtual void on_completed() {}

    // Default answers immediately with default_reply(kind)
    virtual void on_user_prompt_required(PromptKind kind, UserPromptChannel& channel) {
        channel.reply(default_reply(kind));
    }
};

} // namespace sbem_stack::acquisition
