#include "sbem_stack/acquisition/user_prompt.hpp"

namespace sbem_stack::acquisition {

std::string prompt_kind_to_string(PromptKind kind) {
    switch (kind) {
        case PromptKind::DebrisFirstOverview: return "debris_first_overview";
        case PromptKind::DebrisConfirmation: return "debris_confirmation";
        default: return "unknown";
    }
}

std::string user_reply_to_string(UserReply reply) {
    switch (reply) {
        case UserReply::Yes: return "yes";
        case UserReply::No: return "no";
        case UserReply::Abort: return "abort";
        default: return "unknown";
    }
}

UserReply default_reply(PromptKind kind) {
    switch (kind) {
        case PromptKind::DebrisFirstOverview: return UserReply::Yes;
        case PromptKind::DebrisConfirmation: return UserReply::Yes;
        default: return UserReply::Abort;
    }
}

void UserPromptChannel::open(PromptKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_ = kind;
    reply_.reset();
}

UserReply UserPromptChannel::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return reply_.has_value() || !pending_.has_value(); });
    UserReply answer = reply_.value_or(UserReply::Abort);
    pending_.reset();
    reply_.reset();
    return answer;
}

void UserPromptChannel::reply(UserReply answer) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_) return;
        reply_ = answer;
    }
    cv_.notify_all();
}

void UserPromptChannel::abort() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_) return;
        reply_ = UserReply::Abort;
    }
    cv_.notify_all();
}

std::optional<PromptKind> UserPromptChannel::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

} // namespace sbem_stack::acquisition
