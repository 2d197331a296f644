#include <string>
#include <gtest/gtest.h>
#include "core/errors/askai_errors.hpp"
#include "session/request_tracker.hpp"

namespace {

using askai::core::errors::get_error;
using askai::core::errors::get_value;
using askai::core::errors::is_error;
using askai::session::RequestState;
using askai::session::RequestTracker;

TEST(RequestTrackerTest, BeginStartsInRendering) {
    RequestTracker tracker;
    auto begun = tracker.begin("improve");
    ASSERT_FALSE(is_error(begun));

    const std::string request_id = get_value(begun);
    EXPECT_EQ(request_id.rfind("req-", 0), 0u);
    EXPECT_EQ(request_id.size(), 12u);

    auto state = tracker.get_state(request_id);
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), RequestState::Rendering);
    EXPECT_EQ(tracker.in_flight_count(), 1u);
}

TEST(RequestTrackerTest, FollowsInvocationLifecycle) {
    RequestTracker tracker;
    const std::string request_id = get_value(tracker.begin("improve"));

    EXPECT_EQ(get_value(tracker.mark_resolving(request_id)), RequestState::Resolving);
    EXPECT_EQ(get_value(tracker.mark_invoking(request_id, "gemini")), RequestState::Invoking);
    EXPECT_EQ(get_value(tracker.mark_invoking(request_id, "claude")), RequestState::Invoking);
    EXPECT_EQ(get_value(tracker.mark_succeeded(request_id)), RequestState::Succeeded);
    EXPECT_EQ(tracker.in_flight_count(), 0u);

    tracker.finish(request_id);
    auto state = tracker.get_state(request_id);
    ASSERT_TRUE(is_error(state));
    EXPECT_EQ(get_error(state).code, "request_not_found");
}

TEST(RequestTrackerTest, TerminalStatesRejectTransitions) {
    RequestTracker tracker;
    const std::string request_id = get_value(tracker.begin("improve"));
    ASSERT_FALSE(is_error(tracker.mark_exhausted(request_id, "codex broke")));

    auto invoking = tracker.mark_invoking(request_id, "gemini");
    ASSERT_TRUE(is_error(invoking));
    EXPECT_EQ(get_error(invoking).code, "invalid_state_transition");

    auto cancel = tracker.cancel(request_id);
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "invalid_state_transition");
}

TEST(RequestTrackerTest, CancelSetsToken) {
    RequestTracker tracker;
    const std::string request_id = get_value(tracker.begin("improve"));
    auto token_result = tracker.get_cancel_token(request_id);
    ASSERT_FALSE(is_error(token_result));
    auto token = get_value(token_result);
    ASSERT_TRUE(token != nullptr);
    EXPECT_FALSE(token->load());

    auto cancel = tracker.cancel(request_id);
    ASSERT_FALSE(is_error(cancel));
    EXPECT_EQ(get_value(cancel), RequestState::Cancelled);
    EXPECT_TRUE(token->load());
}

TEST(RequestTrackerTest, CancelAllSignalsOnlyLiveRequests) {
    RequestTracker tracker;
    const std::string live = get_value(tracker.begin("improve"));
    const std::string done = get_value(tracker.begin("summarize"));
    ASSERT_FALSE(is_error(tracker.mark_rejected(done, "No text provided")));

    EXPECT_EQ(tracker.cancel_all(), 1u);
    EXPECT_TRUE(get_value(tracker.get_cancel_token(live))->load());
    EXPECT_FALSE(get_value(tracker.get_cancel_token(done))->load());
}

TEST(RequestTrackerTest, FinishKeepsLiveRequests) {
    RequestTracker tracker;
    const std::string request_id = get_value(tracker.begin("improve"));
    tracker.finish(request_id);
    EXPECT_FALSE(is_error(tracker.get_state(request_id)));
}

TEST(RequestTrackerTest, UnknownIdIsReported) {
    RequestTracker tracker;
    auto cancel = tracker.cancel("req-does-not-exist");
    ASSERT_TRUE(is_error(cancel));
    EXPECT_EQ(get_error(cancel).code, "request_not_found");

    auto token = tracker.get_cancel_token("req-does-not-exist");
    ASSERT_TRUE(is_error(token));
    EXPECT_EQ(get_error(token).code, "request_not_found");
}

TEST(RequestTrackerTest, StateNames) {
    EXPECT_EQ(RequestTracker::to_string(RequestState::Exhausted), "exhausted");
    EXPECT_TRUE(RequestTracker::is_terminal(RequestState::Rejected));
    EXPECT_FALSE(RequestTracker::is_terminal(RequestState::Invoking));
}

}  // namespace
