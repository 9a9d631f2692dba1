/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file appliance_client.cpp
 * @brief Appliance client implementation
 **/

#include "lanscout/appliance_client.hpp"

#include "common/utils.hpp"

#include <thread>

namespace lanscout
{

ApplianceSession::ApplianceSession(const ApplianceEndpoint &endpoint, std::shared_ptr<HttpTransport> transport) :
    m_endpoint(endpoint),
    m_api(endpoint.base_url(), std::move(transport))
{}

ApplianceClient::ApplianceClient(const ApplianceClientParams &params, std::shared_ptr<ServiceDiscovery> discovery,
    std::shared_ptr<HttpTransport> transport, std::shared_ptr<TokenStore> token_store, EventPtr shutdown_event,
    PollWaiter poll_waiter) :
    m_params(params),
    m_discovery(std::move(discovery)),
    m_transport(std::move(transport)),
    m_token_store(std::move(token_store)),
    m_shutdown_event(std::move(shutdown_event)),
    m_poll_waiter(std::move(poll_waiter))
{}

AuthorizationState ApplianceClient::state() const
{
    return m_tracker.current();
}

void ApplianceClient::set_state_observer(AuthorizationTracker::Observer observer)
{
    m_tracker.set_observer(std::move(observer));
}

lanscout_status ApplianceClient::fail(lanscout_status status, const std::string &message)
{
    m_tracker.apply(AuthorizationEvent::failure(message));
    return status;
}

lanscout_status ApplianceClient::wait_poll_interval()
{
    if (m_poll_waiter) {
        return m_poll_waiter(m_params.poll_interval);
    }

    if (nullptr == m_shutdown_event) {
        std::this_thread::sleep_for(m_params.poll_interval);
        return LANSCOUT_SUCCESS;
    }

    auto status = m_shutdown_event->wait(m_params.poll_interval);
    if (LANSCOUT_TIMEOUT == status) {
        return LANSCOUT_SUCCESS;
    }
    CHECK_SUCCESS(status);
    return LANSCOUT_SHUTDOWN_EVENT_SIGNALED;
}

lanscout_status ApplianceClient::start()
{
    std::unique_lock<std::mutex> lock(m_operation_mutex);

    const auto current = m_tracker.current();
    if (current.is(AuthorizationStateType::AUTHORIZED) && (nullptr != m_session) && m_session->has_session_token()) {
        LOGGER__DEBUG("Session with {} already open", m_session->endpoint().host);
        return LANSCOUT_SUCCESS;
    }
    if (current.is(AuthorizationStateType::DISCOVERING) || current.is(AuthorizationStateType::AUTHORIZING)) {
        // Leftover of an aborted cycle
        m_tracker.apply(AuthorizationEvent::reset());
    }

    m_tracker.apply(AuthorizationEvent::discovery_started());
    auto status = discover();
    if (LANSCOUT_SUCCESS != status) {
        return status;
    }

    status = login_with_cached_token();
    if ((LANSCOUT_SUCCESS == status) || (LANSCOUT_SHUTDOWN_EVENT_SIGNALED == status)) {
        return status;
    }

    return authorize();
}

lanscout_status ApplianceClient::discover()
{
    auto endpoint = m_discovery->discover(m_params.discovery_timeout);
    if (LANSCOUT_SHUTDOWN_EVENT_SIGNALED == endpoint.status()) {
        return fail(LANSCOUT_SHUTDOWN_EVENT_SIGNALED, "discovery aborted");
    }
    if (!endpoint) {
        LOGGER__WARNING("Appliance discovery failed with status {}", endpoint.status());
        m_tracker.apply(AuthorizationEvent::appliance_not_found("appliance not found"));
        return LANSCOUT_APPLIANCE_NOT_FOUND;
    }

    m_session = make_unique_nothrow<ApplianceSession>(endpoint.value(), m_transport);
    if (nullptr == m_session) {
        LOGGER__ERROR("Failed allocating appliance session");
        return fail(LANSCOUT_OUT_OF_HOST_MEMORY, "out of memory");
    }

    m_tracker.apply(AuthorizationEvent::appliance_found());
    LOGGER__INFO("Using appliance at {}", m_session->endpoint().base_url());
    return LANSCOUT_SUCCESS;
}

lanscout_status ApplianceClient::login_with_cached_token()
{
    auto app_token = m_token_store->load_app_token();
    if (LANSCOUT_NOT_FOUND == app_token.status()) {
        LOGGER__DEBUG("No stored app token");
        return LANSCOUT_NOT_FOUND;
    }
    if (!app_token) {
        LOGGER__WARNING("Failed loading the stored app token (status {}), requesting a new authorization",
            app_token.status());
        return app_token.status();
    }

    auto status = open_session(app_token.value());
    if (LANSCOUT_SUCCESS == status) {
        m_tracker.apply(AuthorizationEvent::session_opened());
        return LANSCOUT_SUCCESS;
    }
    if (LANSCOUT_SHUTDOWN_EVENT_SIGNALED == status) {
        return fail(status, "login aborted");
    }

    LOGGER__INFO("Stored app token was rejected, requesting a new authorization");
    m_tracker.apply(AuthorizationEvent::session_rejected());
    return status;
}

lanscout_status ApplianceClient::authorize()
{
    auto grant = m_session->api().request_authorization(m_params.identity);
    if (!grant) {
        return fail(grant.status(), "authorization request failed");
    }

    auto status = m_token_store->save_app_token(grant->app_token);
    if (LANSCOUT_SUCCESS != status) {
        return fail(status, "failed storing app token");
    }

    m_tracker.apply(AuthorizationEvent::authorization_requested(grant->track_id));
    LOGGER__WARNING("Confirm the access request on the appliance front panel (track id {})", grant->track_id);

    return poll_track_status(grant->track_id, grant->app_token);
}

lanscout_status ApplianceClient::poll_track_status(uint32_t track_id, const std::string &app_token)
{
    uint32_t attempts = 0;
    while (m_tracker.current().is(AuthorizationStateType::AUTHORIZING)) {
        if ((nullptr != m_shutdown_event) && m_shutdown_event->is_signalled()) {
            return fail(LANSCOUT_SHUTDOWN_EVENT_SIGNALED, "authorization aborted");
        }
        if ((0 != m_params.max_poll_attempts) && (attempts >= m_params.max_poll_attempts)) {
            LOGGER__WARNING("No answer after {} track status requests", attempts);
            m_tracker.apply(AuthorizationEvent::track_status_received(TrackStatus::TIMEOUT));
            clear_pending_token("unanswered");
            return LANSCOUT_AUTHORIZATION_TIMEOUT;
        }
        attempts++;

        auto reply = m_session->api().get_track_status(track_id);
        if (!reply) {
            return fail(reply.status(), "track status request failed");
        }
        // forget() may have withdrawn the request while it was in flight
        if (!m_tracker.apply_if(AuthorizationStateType::AUTHORIZING,
                AuthorizationEvent::track_status_received(reply->status))) {
            break;
        }

        lanscout_status status = LANSCOUT_UNINITIALIZED;
        switch (reply->status) {
        case TrackStatus::PENDING:
            status = wait_poll_interval();
            if (LANSCOUT_SUCCESS != status) {
                return fail(status, "authorization aborted");
            }
            break;
        case TrackStatus::GRANTED:
            status = open_session(app_token);
            if (LANSCOUT_SUCCESS != status) {
                m_tracker.apply(AuthorizationEvent::session_rejected());
                return (LANSCOUT_SHUTDOWN_EVENT_SIGNALED == status) ? status : LANSCOUT_SESSION_FAILURE;
            }
            m_tracker.apply(AuthorizationEvent::session_opened());
            LOGGER__INFO("Authorization granted");
            return LANSCOUT_SUCCESS;
        case TrackStatus::DENIED:
            LOGGER__WARNING("Authorization was denied on the appliance");
            clear_pending_token("denied");
            return LANSCOUT_AUTHORIZATION_DENIED;
        case TrackStatus::TIMEOUT:
            LOGGER__WARNING("Authorization request timed out on the appliance");
            clear_pending_token("expired");
            return LANSCOUT_AUTHORIZATION_TIMEOUT;
        case TrackStatus::UNKNOWN:
            return LANSCOUT_INVALID_APPLIANCE_RESPONSE;
        }
    }

    const auto current = m_tracker.current();
    if (current.is(AuthorizationStateType::IDLE)) {
        LOGGER__INFO("Authorization request withdrawn");
        return LANSCOUT_NOT_AUTHORIZED;
    }
    LOGGER__ERROR("Authorization polling left in state {}", to_string(current));
    return LANSCOUT_INVALID_OPERATION;
}

void ApplianceClient::clear_pending_token(const std::string &reason)
{
    auto status = m_token_store->clear_app_token();
    if (LANSCOUT_SUCCESS != status) {
        LOGGER__WARNING("Failed clearing the {} app token (status {})", reason, status);
    }
}

lanscout_status ApplianceClient::open_session(const std::string &app_token)
{
    auto challenge = m_session->api().get_login_challenge();
    if (!challenge) {
        LOGGER__WARNING("Failed fetching the login challenge (status {})", challenge.status());
        return LANSCOUT_SESSION_FAILURE;
    }

    auto password = compute_challenge_password(app_token, challenge.value());
    CHECK_EXPECTED_AS_STATUS(password);

    auto session_token = m_session->api().open_session(m_params.identity.app_id, password.value());
    if (!session_token) {
        LOGGER__WARNING("Session login rejected (status {})", session_token.status());
        return LANSCOUT_SESSION_FAILURE;
    }

    m_session->set_session_token(session_token.value());
    LOGGER__DEBUG("Session opened with {}", m_session->endpoint().host);
    return LANSCOUT_SUCCESS;
}

Expected<ScanResult> ApplianceClient::fetch_devices()
{
    std::unique_lock<std::mutex> lock(m_operation_mutex);

    CHECK_AS_EXPECTED(m_tracker.current().is(AuthorizationStateType::AUTHORIZED) && (nullptr != m_session) &&
        m_session->has_session_token(), LANSCOUT_NOT_AUTHORIZED, "Appliance session is not authorized");

    auto devices = m_session->api().get_lan_devices(m_session->session_token());
    if (LANSCOUT_NOT_AUTHORIZED == devices.status()) {
        LOGGER__WARNING("Appliance session expired");
        m_session->clear_session_token();
        m_tracker.apply(AuthorizationEvent::session_rejected());
        return make_unexpected(LANSCOUT_SESSION_FAILURE);
    }
    CHECK_EXPECTED(devices, "Failed fetching the appliance device list");

    LOGGER__INFO("Appliance reported {} devices", devices->size());
    return devices;
}

lanscout_status ApplianceClient::forget()
{
    // Leaving AUTHORIZING ends a track status polling loop, which holds the operation lock
    m_tracker.apply(AuthorizationEvent::reset());
    auto status = m_token_store->clear_app_token();

    std::unique_lock<std::mutex> lock(m_operation_mutex);
    m_session.reset();
    m_tracker.apply(AuthorizationEvent::reset());
    CHECK_SUCCESS(status, "Failed clearing the stored app token");

    LOGGER__INFO("Stored appliance authorization forgotten");
    return LANSCOUT_SUCCESS;
}

lanscout_status ApplianceClient::abort()
{
    CHECK_NOT_NULL(m_shutdown_event, LANSCOUT_INVALID_OPERATION);
    return m_shutdown_event->signal();
}

} /* namespace lanscout */
