/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file authorization.hpp
 * @brief Appliance authorization state machine
 *
 * IDLE -> DISCOVERING -> AUTHORIZING(track_id) -> AUTHORIZED, with ERROR(message) reachable from every state.
 * States are plain values and transition() is a pure function, so the whole machine can be driven from tests.
 **/

#ifndef _LANSCOUT_AUTHORIZATION_HPP_
#define _LANSCOUT_AUTHORIZATION_HPP_

#include "lanscout/lanscout.h"

#include <functional>
#include <mutex>
#include <string>
#include <cstdint>

/** lanscout namespace */
namespace lanscout
{

enum class AuthorizationStateType
{
    IDLE,
    DISCOVERING,
    AUTHORIZING,
    AUTHORIZED,
    ERROR,
};

/** Approval status of a pending authorization request, as reported by the appliance */
enum class TrackStatus
{
    PENDING,
    GRANTED,
    DENIED,
    TIMEOUT,
    UNKNOWN,
};

/**
 * Tagged union of the authorization states. Only the payload matching @a type is meaningful:
 * @a track_id for AUTHORIZING and @a message for ERROR.
 */
struct LANSCOUTAPI AuthorizationState final
{
    AuthorizationStateType type = AuthorizationStateType::IDLE;
    uint32_t track_id = 0;
    std::string message;

    static AuthorizationState idle();
    static AuthorizationState discovering();
    static AuthorizationState authorizing(uint32_t track_id);
    static AuthorizationState authorized();
    static AuthorizationState error(const std::string &message);

    bool is(AuthorizationStateType state_type) const { return state_type == type; }

    bool operator==(const AuthorizationState &other) const;
    bool operator!=(const AuthorizationState &other) const { return !(*this == other); }
};

enum class AuthorizationEventType
{
    DISCOVERY_STARTED,
    APPLIANCE_FOUND,
    APPLIANCE_NOT_FOUND,
    AUTHORIZATION_REQUESTED,
    TRACK_STATUS,
    SESSION_OPENED,
    SESSION_REJECTED,
    FAILURE,
    RESET,
};

/** Inputs of the state machine. @a track_id, @a track_status and @a message are payloads of specific events. */
struct LANSCOUTAPI AuthorizationEvent final
{
    AuthorizationEventType type = AuthorizationEventType::RESET;
    uint32_t track_id = 0;
    TrackStatus track_status = TrackStatus::UNKNOWN;
    std::string message;

    static AuthorizationEvent discovery_started();
    static AuthorizationEvent appliance_found();
    static AuthorizationEvent appliance_not_found(const std::string &message);
    static AuthorizationEvent authorization_requested(uint32_t track_id);
    static AuthorizationEvent track_status_received(TrackStatus status);
    static AuthorizationEvent session_opened();
    static AuthorizationEvent session_rejected();
    static AuthorizationEvent failure(const std::string &message);
    static AuthorizationEvent reset();
};

/**
 * Pure transition function of the authorization state machine.
 *
 * RESET reaches IDLE and FAILURE reaches ERROR from every state. TRACK_STATUS keeps AUTHORIZING on pending and
 * granted (granted waits for SESSION_OPENED), and moves to ERROR("denied") or ERROR("timeout"). An event that is not
 * valid in the current state produces an ERROR naming the rejected transition.
 */
LANSCOUTAPI AuthorizationState transition(const AuthorizationState &state, const AuthorizationEvent &event);

LANSCOUTAPI std::string to_string(AuthorizationStateType type);
LANSCOUTAPI std::string to_string(AuthorizationEventType type);
LANSCOUTAPI std::string to_string(TrackStatus status);
LANSCOUTAPI std::string to_string(const AuthorizationState &state);

/**
 * Holds the current authorization state and publishes every change to an observer.
 * Thread safe; the observer is invoked outside of the internal lock.
 */
class LANSCOUTAPI AuthorizationTracker final
{
public:
    using Observer = std::function<void(const AuthorizationState &previous, const AuthorizationState &current)>;

    AuthorizationTracker() = default;
    AuthorizationTracker(const AuthorizationTracker &) = delete;
    AuthorizationTracker &operator=(const AuthorizationTracker &) = delete;

    AuthorizationState current() const;

    /** Applies @a event and returns the resulting state */
    AuthorizationState apply(const AuthorizationEvent &event);

    /** Applies @a event only while the state is of type @a required. Returns whether it was applied. */
    bool apply_if(AuthorizationStateType required, const AuthorizationEvent &event);

    void set_observer(Observer observer);

private:
    mutable std::mutex m_mutex;
    AuthorizationState m_state;
    Observer m_observer;
};

} /* namespace lanscout */

#endif /* _LANSCOUT_AUTHORIZATION_HPP_ */
