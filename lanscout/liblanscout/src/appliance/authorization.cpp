/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file authorization.cpp
 * @brief Authorization state machine implementation
 **/

#include "lanscout/authorization.hpp"

#include "common/utils.hpp"

namespace lanscout
{

static const std::string DENIED_MESSAGE = "denied";
static const std::string TIMEOUT_MESSAGE = "timeout";

AuthorizationState AuthorizationState::idle()
{
    return AuthorizationState{};
}

AuthorizationState AuthorizationState::discovering()
{
    AuthorizationState state{};
    state.type = AuthorizationStateType::DISCOVERING;
    return state;
}

AuthorizationState AuthorizationState::authorizing(uint32_t track_id)
{
    AuthorizationState state{};
    state.type = AuthorizationStateType::AUTHORIZING;
    state.track_id = track_id;
    return state;
}

AuthorizationState AuthorizationState::authorized()
{
    AuthorizationState state{};
    state.type = AuthorizationStateType::AUTHORIZED;
    return state;
}

AuthorizationState AuthorizationState::error(const std::string &message)
{
    AuthorizationState state{};
    state.type = AuthorizationStateType::ERROR;
    state.message = message;
    return state;
}

bool AuthorizationState::operator==(const AuthorizationState &other) const
{
    if (type != other.type) {
        return false;
    }
    switch (type) {
    case AuthorizationStateType::AUTHORIZING:
        return track_id == other.track_id;
    case AuthorizationStateType::ERROR:
        return message == other.message;
    case AuthorizationStateType::IDLE:
    case AuthorizationStateType::DISCOVERING:
    case AuthorizationStateType::AUTHORIZED:
        return true;
    }
    return false;
}

AuthorizationEvent AuthorizationEvent::discovery_started()
{
    AuthorizationEvent event{};
    event.type = AuthorizationEventType::DISCOVERY_STARTED;
    return event;
}

AuthorizationEvent AuthorizationEvent::appliance_found()
{
    AuthorizationEvent event{};
    event.type = AuthorizationEventType::APPLIANCE_FOUND;
    return event;
}

AuthorizationEvent AuthorizationEvent::appliance_not_found(const std::string &message)
{
    AuthorizationEvent event{};
    event.type = AuthorizationEventType::APPLIANCE_NOT_FOUND;
    event.message = message;
    return event;
}

AuthorizationEvent AuthorizationEvent::authorization_requested(uint32_t track_id)
{
    AuthorizationEvent event{};
    event.type = AuthorizationEventType::AUTHORIZATION_REQUESTED;
    event.track_id = track_id;
    return event;
}

AuthorizationEvent AuthorizationEvent::track_status_received(TrackStatus status)
{
    AuthorizationEvent event{};
    event.type = AuthorizationEventType::TRACK_STATUS;
    event.track_status = status;
    return event;
}

AuthorizationEvent AuthorizationEvent::session_opened()
{
    AuthorizationEvent event{};
    event.type = AuthorizationEventType::SESSION_OPENED;
    return event;
}

AuthorizationEvent AuthorizationEvent::session_rejected()
{
    AuthorizationEvent event{};
    event.type = AuthorizationEventType::SESSION_REJECTED;
    return event;
}

AuthorizationEvent AuthorizationEvent::failure(const std::string &message)
{
    AuthorizationEvent event{};
    event.type = AuthorizationEventType::FAILURE;
    event.message = message;
    return event;
}

AuthorizationEvent AuthorizationEvent::reset()
{
    AuthorizationEvent event{};
    event.type = AuthorizationEventType::RESET;
    return event;
}

static AuthorizationState invalid_transition(const AuthorizationState &state, const AuthorizationEvent &event)
{
    return AuthorizationState::error(fmt::format("invalid event {} in state {}", to_string(event.type),
        to_string(state.type)));
}

static AuthorizationState on_track_status(const AuthorizationState &state, TrackStatus status)
{
    switch (status) {
    case TrackStatus::PENDING:
    case TrackStatus::GRANTED:
        // Granted stays AUTHORIZING until the session login completes
        return state;
    case TrackStatus::DENIED:
        return AuthorizationState::error(DENIED_MESSAGE);
    case TrackStatus::TIMEOUT:
        return AuthorizationState::error(TIMEOUT_MESSAGE);
    case TrackStatus::UNKNOWN:
        return AuthorizationState::error("unknown track status");
    }
    return AuthorizationState::error("unknown track status");
}

static AuthorizationState from_idle(const AuthorizationState &state, const AuthorizationEvent &event)
{
    switch (event.type) {
    case AuthorizationEventType::DISCOVERY_STARTED:
        return AuthorizationState::discovering();
    case AuthorizationEventType::APPLIANCE_FOUND:
    case AuthorizationEventType::APPLIANCE_NOT_FOUND:
    case AuthorizationEventType::AUTHORIZATION_REQUESTED:
    case AuthorizationEventType::TRACK_STATUS:
    case AuthorizationEventType::SESSION_OPENED:
    case AuthorizationEventType::SESSION_REJECTED:
    case AuthorizationEventType::FAILURE:
    case AuthorizationEventType::RESET:
        break;
    }
    return invalid_transition(state, event);
}

static AuthorizationState from_discovering(const AuthorizationState &state, const AuthorizationEvent &event)
{
    switch (event.type) {
    case AuthorizationEventType::APPLIANCE_FOUND:
        return state;
    case AuthorizationEventType::APPLIANCE_NOT_FOUND:
        return AuthorizationState::error(event.message);
    case AuthorizationEventType::AUTHORIZATION_REQUESTED:
        return AuthorizationState::authorizing(event.track_id);
    case AuthorizationEventType::SESSION_OPENED:
        // Cached app token accepted, no approval needed
        return AuthorizationState::authorized();
    case AuthorizationEventType::SESSION_REJECTED:
        // Cached app token revoked, full authorization follows
        return state;
    case AuthorizationEventType::DISCOVERY_STARTED:
    case AuthorizationEventType::TRACK_STATUS:
    case AuthorizationEventType::FAILURE:
    case AuthorizationEventType::RESET:
        break;
    }
    return invalid_transition(state, event);
}

static AuthorizationState from_authorizing(const AuthorizationState &state, const AuthorizationEvent &event)
{
    switch (event.type) {
    case AuthorizationEventType::TRACK_STATUS:
        return on_track_status(state, event.track_status);
    case AuthorizationEventType::SESSION_OPENED:
        return AuthorizationState::authorized();
    case AuthorizationEventType::SESSION_REJECTED:
        return AuthorizationState::error("session login rejected");
    case AuthorizationEventType::DISCOVERY_STARTED:
    case AuthorizationEventType::APPLIANCE_FOUND:
    case AuthorizationEventType::APPLIANCE_NOT_FOUND:
    case AuthorizationEventType::AUTHORIZATION_REQUESTED:
    case AuthorizationEventType::FAILURE:
    case AuthorizationEventType::RESET:
        break;
    }
    return invalid_transition(state, event);
}

static AuthorizationState from_authorized(const AuthorizationState &state, const AuthorizationEvent &event)
{
    switch (event.type) {
    case AuthorizationEventType::DISCOVERY_STARTED:
        return AuthorizationState::discovering();
    case AuthorizationEventType::SESSION_REJECTED:
        return AuthorizationState::error("session expired");
    case AuthorizationEventType::APPLIANCE_FOUND:
    case AuthorizationEventType::APPLIANCE_NOT_FOUND:
    case AuthorizationEventType::AUTHORIZATION_REQUESTED:
    case AuthorizationEventType::TRACK_STATUS:
    case AuthorizationEventType::SESSION_OPENED:
    case AuthorizationEventType::FAILURE:
    case AuthorizationEventType::RESET:
        break;
    }
    return invalid_transition(state, event);
}

static AuthorizationState from_error(const AuthorizationState &state, const AuthorizationEvent &event)
{
    switch (event.type) {
    case AuthorizationEventType::DISCOVERY_STARTED:
        return AuthorizationState::discovering();
    case AuthorizationEventType::APPLIANCE_FOUND:
    case AuthorizationEventType::APPLIANCE_NOT_FOUND:
    case AuthorizationEventType::AUTHORIZATION_REQUESTED:
    case AuthorizationEventType::TRACK_STATUS:
    case AuthorizationEventType::SESSION_OPENED:
    case AuthorizationEventType::SESSION_REJECTED:
    case AuthorizationEventType::FAILURE:
    case AuthorizationEventType::RESET:
        break;
    }
    // Keep the original failure reason
    return state;
}

AuthorizationState transition(const AuthorizationState &state, const AuthorizationEvent &event)
{
    if (AuthorizationEventType::RESET == event.type) {
        return AuthorizationState::idle();
    }
    if (AuthorizationEventType::FAILURE == event.type) {
        return AuthorizationState::error(event.message);
    }

    switch (state.type) {
    case AuthorizationStateType::IDLE:
        return from_idle(state, event);
    case AuthorizationStateType::DISCOVERING:
        return from_discovering(state, event);
    case AuthorizationStateType::AUTHORIZING:
        return from_authorizing(state, event);
    case AuthorizationStateType::AUTHORIZED:
        return from_authorized(state, event);
    case AuthorizationStateType::ERROR:
        return from_error(state, event);
    }
    return invalid_transition(state, event);
}

std::string to_string(AuthorizationStateType type)
{
    switch (type) {
    case AuthorizationStateType::IDLE:
        return "IDLE";
    case AuthorizationStateType::DISCOVERING:
        return "DISCOVERING";
    case AuthorizationStateType::AUTHORIZING:
        return "AUTHORIZING";
    case AuthorizationStateType::AUTHORIZED:
        return "AUTHORIZED";
    case AuthorizationStateType::ERROR:
        return "ERROR";
    }
    return "UNKNOWN";
}

std::string to_string(AuthorizationEventType type)
{
    switch (type) {
    case AuthorizationEventType::DISCOVERY_STARTED:
        return "DISCOVERY_STARTED";
    case AuthorizationEventType::APPLIANCE_FOUND:
        return "APPLIANCE_FOUND";
    case AuthorizationEventType::APPLIANCE_NOT_FOUND:
        return "APPLIANCE_NOT_FOUND";
    case AuthorizationEventType::AUTHORIZATION_REQUESTED:
        return "AUTHORIZATION_REQUESTED";
    case AuthorizationEventType::TRACK_STATUS:
        return "TRACK_STATUS";
    case AuthorizationEventType::SESSION_OPENED:
        return "SESSION_OPENED";
    case AuthorizationEventType::SESSION_REJECTED:
        return "SESSION_REJECTED";
    case AuthorizationEventType::FAILURE:
        return "FAILURE";
    case AuthorizationEventType::RESET:
        return "RESET";
    }
    return "UNKNOWN";
}

std::string to_string(TrackStatus status)
{
    switch (status) {
    case TrackStatus::PENDING:
        return "pending";
    case TrackStatus::GRANTED:
        return "granted";
    case TrackStatus::DENIED:
        return "denied";
    case TrackStatus::TIMEOUT:
        return "timeout";
    case TrackStatus::UNKNOWN:
        return "unknown";
    }
    return "unknown";
}

std::string to_string(const AuthorizationState &state)
{
    switch (state.type) {
    case AuthorizationStateType::AUTHORIZING:
        return fmt::format("{}(track_id={})", to_string(state.type), state.track_id);
    case AuthorizationStateType::ERROR:
        return fmt::format("{}({})", to_string(state.type), state.message);
    case AuthorizationStateType::IDLE:
    case AuthorizationStateType::DISCOVERING:
    case AuthorizationStateType::AUTHORIZED:
        return to_string(state.type);
    }
    return to_string(state.type);
}

AuthorizationState AuthorizationTracker::current() const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_state;
}

static void publish(const AuthorizationEvent &event, const AuthorizationState &previous,
    const AuthorizationState &next, const AuthorizationTracker::Observer &observer)
{
    LOGGER__DEBUG("Authorization {} --{}--> {}", to_string(previous), to_string(event.type), to_string(next));
    if ((previous != next) && observer) {
        observer(previous, next);
    }
}

AuthorizationState AuthorizationTracker::apply(const AuthorizationEvent &event)
{
    AuthorizationState previous;
    AuthorizationState next;
    Observer observer;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        previous = m_state;
        next = transition(m_state, event);
        m_state = next;
        observer = m_observer;
    }

    publish(event, previous, next, observer);
    return next;
}

bool AuthorizationTracker::apply_if(AuthorizationStateType required, const AuthorizationEvent &event)
{
    AuthorizationState previous;
    AuthorizationState next;
    Observer observer;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_state.is(required)) {
            return false;
        }
        previous = m_state;
        next = transition(m_state, event);
        m_state = next;
        observer = m_observer;
    }

    publish(event, previous, next, observer);
    return true;
}

void AuthorizationTracker::set_observer(Observer observer)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_observer = std::move(observer);
}

} /* namespace lanscout */
