#include "sbem_stack/acquisition/user_prompt.hpp"

#include <chrono>
#include <thread>

#include <catch2/catch_test_macros.hpp>

using namespace sbem_stack::acquisition;

namespace {

// Polls until the channel has a pending question
void wait_for_pending(const UserPromptChannel& channel) {
    for (int i = 0; i < 1000 && !channel.pending(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

} // namespace

TEST_CASE("reply_from_other_thread_wakes_waiter") {
    UserPromptChannel channel;
    channel.open(PromptKind::DebrisConfirmation);
    REQUIRE(channel.pending() == PromptKind::DebrisConfirmation);

    std::thread operator_thread([&channel] {
        wait_for_pending(channel);
        channel.reply(UserReply::No);
    });
    const UserReply answer = channel.wait();
    operator_thread.join();

    REQUIRE(answer == UserReply::No);
    REQUIRE_FALSE(channel.pending().has_value());
}

TEST_CASE("abort_wakes_waiter_with_abort") {
    UserPromptChannel channel;
    channel.open(PromptKind::DebrisFirstOverview);
    std::thread pauser([&channel] {
        wait_for_pending(channel);
        channel.abort();
    });
    REQUIRE(channel.wait() == UserReply::Abort);
    pauser.join();
}

TEST_CASE("reply_without_question_is_ignored") {
    UserPromptChannel channel;
    channel.reply(UserReply::Yes);
    channel.abort();
    REQUIRE_FALSE(channel.pending().has_value());
    // Nothing pending: wait returns immediately
    REQUIRE(channel.wait() == UserReply::Abort);
}

TEST_CASE("open_discards_stale_reply") {
    UserPromptChannel channel;
    channel.open(PromptKind::DebrisConfirmation);
    channel.reply(UserReply::No);
    channel.open(PromptKind::DebrisConfirmation);
    std::thread operator_thread([&channel] { channel.reply(UserReply::Yes); });
    operator_thread.join();
    REQUIRE(channel.wait() == UserReply::Yes);
}

TEST_CASE("default_replies_and_names") {
    REQUIRE(default_reply(PromptKind::DebrisFirstOverview) == UserReply::Yes);
    REQUIRE(default_reply(PromptKind::DebrisConfirmation) == UserReply::Yes);
    REQUIRE(prompt_kind_to_string(PromptKind::DebrisConfirmation) == "debris_confirmation");
    REQUIRE(user_reply_to_string(UserReply::Abort) == "abort");
}
