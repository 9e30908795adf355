#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace sbem_stack::acquisition {

enum class PromptKind {
    // First overview of a run: confirm that the surface is clean
    DebrisFirstOverview,
    // Debris detector fired: confirm before sweeping
    DebrisConfirmation
};

enum class UserReply {
    Yes,
    No,
    Abort
};

std::string prompt_kind_to_string(PromptKind kind);
std::string user_reply_to_string(UserReply reply);

// Reply used when nobody answers
UserReply default_reply(PromptKind kind);

// Hands a single question from the acquisition thread to the operator.
// The acquisition thread blocks in wait() until reply() or abort() is
// called from another thread.
class UserPromptChannel {
public:
    UserPromptChannel() = default;
    UserPromptChannel(const UserPromptChannel&) = delete;
    UserPromptChannel& operator=(const UserPromptChannel&) = delete;

    // Registers a pending question; a stale reply is discarded
    void open(PromptKind kind);
    UserReply wait();
    // Ignored if no question is pending
    void reply(UserReply answer);
    // Wakes a waiting thread with UserReply::Abort
    void abort();

    std::optional<PromptKind> pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<PromptKind> pending_;
    std::optional<UserReply> reply_;
};

} // namespace sbem_stack::acquisition
