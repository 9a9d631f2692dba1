/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file authorization_tests.cpp
 * @brief Tests of the authorization state machine
 **/

#include "test_utils.hpp"

using namespace lanscout;

static const uint32_t TRACK_ID = 42;

TEST(AuthorizationTransitionTest, HappyPath)
{
    auto state = AuthorizationState::idle();
    state = transition(state, AuthorizationEvent::discovery_started());
    EXPECT_EQ(AuthorizationState::discovering(), state);

    state = transition(state, AuthorizationEvent::appliance_found());
    EXPECT_EQ(AuthorizationState::discovering(), state);

    state = transition(state, AuthorizationEvent::authorization_requested(TRACK_ID));
    EXPECT_EQ(AuthorizationState::authorizing(TRACK_ID), state);

    state = transition(state, AuthorizationEvent::track_status_received(TrackStatus::PENDING));
    EXPECT_EQ(AuthorizationState::authorizing(TRACK_ID), state);

    state = transition(state, AuthorizationEvent::track_status_received(TrackStatus::GRANTED));
    EXPECT_EQ(AuthorizationState::authorizing(TRACK_ID), state);

    state = transition(state, AuthorizationEvent::session_opened());
    EXPECT_EQ(AuthorizationState::authorized(), state);
}

TEST(AuthorizationTransitionTest, CachedTokenSkipsApproval)
{
    const auto discovering = AuthorizationState::discovering();
    EXPECT_EQ(AuthorizationState::authorized(), transition(discovering, AuthorizationEvent::session_opened()));
    EXPECT_EQ(discovering, transition(discovering, AuthorizationEvent::session_rejected()));
}

TEST(AuthorizationTransitionTest, TerminalTrackStatusesReachError)
{
    const auto authorizing = AuthorizationState::authorizing(TRACK_ID);
    EXPECT_EQ(AuthorizationState::error("denied"),
        transition(authorizing, AuthorizationEvent::track_status_received(TrackStatus::DENIED)));
    EXPECT_EQ(AuthorizationState::error("timeout"),
        transition(authorizing, AuthorizationEvent::track_status_received(TrackStatus::TIMEOUT)));
    EXPECT_TRUE(transition(authorizing, AuthorizationEvent::track_status_received(TrackStatus::UNKNOWN))
        .is(AuthorizationStateType::ERROR));
    EXPECT_EQ(AuthorizationState::error("session login rejected"),
        transition(authorizing, AuthorizationEvent::session_rejected()));
}

TEST(AuthorizationTransitionTest, ApplianceNotFoundKeepsMessage)
{
    EXPECT_EQ(AuthorizationState::error("no appliance answered"),
        transition(AuthorizationState::discovering(), AuthorizationEvent::appliance_not_found("no appliance answered")));
}

TEST(AuthorizationTransitionTest, ResetAndFailureApplyEverywhere)
{
    const AuthorizationState states[] = {
        AuthorizationState::idle(),
        AuthorizationState::discovering(),
        AuthorizationState::authorizing(TRACK_ID),
        AuthorizationState::authorized(),
        AuthorizationState::error("earlier"),
    };
    for (const auto &state : states) {
        EXPECT_EQ(AuthorizationState::idle(), transition(state, AuthorizationEvent::reset())) << to_string(state);
        EXPECT_EQ(AuthorizationState::error("broken"), transition(state, AuthorizationEvent::failure("broken")))
            << to_string(state);
    }
}

TEST(AuthorizationTransitionTest, AuthorizedSession)
{
    const auto authorized = AuthorizationState::authorized();
    EXPECT_EQ(AuthorizationState::error("session expired"),
        transition(authorized, AuthorizationEvent::session_rejected()));
    EXPECT_EQ(AuthorizationState::discovering(), transition(authorized, AuthorizationEvent::discovery_started()));
}

TEST(AuthorizationTransitionTest, ErrorKeepsReasonUntilRestart)
{
    const auto error = AuthorizationState::error("denied");
    EXPECT_EQ(error, transition(error, AuthorizationEvent::track_status_received(TrackStatus::GRANTED)));
    EXPECT_EQ(error, transition(error, AuthorizationEvent::session_opened()));
    EXPECT_EQ(AuthorizationState::discovering(), transition(error, AuthorizationEvent::discovery_started()));
}

TEST(AuthorizationTransitionTest, InvalidEventsNameTheTransition)
{
    auto state = transition(AuthorizationState::idle(), AuthorizationEvent::session_opened());
    EXPECT_EQ(AuthorizationState::error("invalid event SESSION_OPENED in state IDLE"), state);

    state = transition(AuthorizationState::authorizing(TRACK_ID), AuthorizationEvent::authorization_requested(7));
    EXPECT_EQ(AuthorizationState::error("invalid event AUTHORIZATION_REQUESTED in state AUTHORIZING"), state);

    state = transition(AuthorizationState::authorized(),
        AuthorizationEvent::track_status_received(TrackStatus::PENDING));
    EXPECT_TRUE(state.is(AuthorizationStateType::ERROR));
}

TEST(AuthorizationStateTest, EqualityComparesOnlyTheActivePayload)
{
    auto authorized = AuthorizationState::authorized();
    authorized.message = "ignored";
    EXPECT_EQ(AuthorizationState::authorized(), authorized);
    EXPECT_NE(AuthorizationState::authorizing(1), AuthorizationState::authorizing(2));
    EXPECT_NE(AuthorizationState::error("a"), AuthorizationState::error("b"));
}

TEST(AuthorizationStateTest, ToString)
{
    EXPECT_EQ("IDLE", to_string(AuthorizationState::idle()));
    EXPECT_EQ("AUTHORIZING(track_id=42)", to_string(AuthorizationState::authorizing(TRACK_ID)));
    EXPECT_EQ("ERROR(denied)", to_string(AuthorizationState::error("denied")));
    EXPECT_EQ("granted", to_string(TrackStatus::GRANTED));
}

TEST(AuthorizationTrackerTest, NotifiesOnlyRealChanges)
{
    AuthorizationTracker tracker;
    std::vector<std::pair<AuthorizationState, AuthorizationState>> changes;
    tracker.set_observer([&changes](const AuthorizationState &previous, const AuthorizationState &current) {
        changes.emplace_back(previous, current);
    });

    tracker.apply(AuthorizationEvent::discovery_started());
    tracker.apply(AuthorizationEvent::appliance_found());
    tracker.apply(AuthorizationEvent::authorization_requested(TRACK_ID));
    tracker.apply(AuthorizationEvent::track_status_received(TrackStatus::PENDING));
    const auto last = tracker.apply(AuthorizationEvent::session_opened());

    EXPECT_EQ(AuthorizationState::authorized(), last);
    EXPECT_EQ(last, tracker.current());
    ASSERT_EQ(3u, changes.size());
    EXPECT_EQ(AuthorizationState::idle(), changes[0].first);
    EXPECT_EQ(AuthorizationState::discovering(), changes[0].second);
    EXPECT_EQ(AuthorizationState::authorizing(TRACK_ID), changes[1].second);
    EXPECT_EQ(AuthorizationState::authorized(), changes[2].second);
}

TEST(AuthorizationTrackerTest, ConditionalApplyChecksTheCurrentState)
{
    AuthorizationTracker tracker;
    tracker.apply(AuthorizationEvent::discovery_started());
    tracker.apply(AuthorizationEvent::appliance_found());
    tracker.apply(AuthorizationEvent::authorization_requested(TRACK_ID));

    EXPECT_TRUE(tracker.apply_if(AuthorizationStateType::AUTHORIZING,
        AuthorizationEvent::track_status_received(TrackStatus::PENDING)));
    EXPECT_EQ(AuthorizationState::authorizing(TRACK_ID), tracker.current());

    tracker.apply(AuthorizationEvent::reset());
    EXPECT_FALSE(tracker.apply_if(AuthorizationStateType::AUTHORIZING,
        AuthorizationEvent::track_status_received(TrackStatus::GRANTED)));
    EXPECT_EQ(AuthorizationState::idle(), tracker.current());
}
