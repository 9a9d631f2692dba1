/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file appliance_client.hpp
 * @brief Discovery, authorization and session handling against the router appliance
 **/

#ifndef _LANSCOUT_APPLIANCE_CLIENT_HPP_
#define _LANSCOUT_APPLIANCE_CLIENT_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"
#include "lanscout/event.hpp"
#include "lanscout/device.hpp"
#include "lanscout/authorization.hpp"
#include "lanscout/service_discovery.hpp"
#include "lanscout/http_transport.hpp"
#include "lanscout/appliance_api.hpp"
#include "lanscout/token_store.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

/** lanscout namespace */
namespace lanscout
{

/**
 * Context of one authorization/session cycle with a discovered appliance.
 * Created by the client when the appliance is found and released by ApplianceClient::forget() or the client
 * destructor.
 */
class LANSCOUTAPI ApplianceSession final
{
public:
    ApplianceSession(const ApplianceEndpoint &endpoint, std::shared_ptr<HttpTransport> transport);

    ApplianceSession(const ApplianceSession &) = delete;
    ApplianceSession &operator=(const ApplianceSession &) = delete;

    const ApplianceEndpoint &endpoint() const { return m_endpoint; }
    ApplianceApi &api() { return m_api; }

    bool has_session_token() const { return !m_session_token.empty(); }
    const std::string &session_token() const { return m_session_token; }
    void set_session_token(const std::string &session_token) { m_session_token = session_token; }
    void clear_session_token() { m_session_token.clear(); }

private:
    const ApplianceEndpoint m_endpoint;
    ApplianceApi m_api;
    std::string m_session_token;
};

struct LANSCOUTAPI ApplianceClientParams final
{
    AppIdentity identity;
    std::chrono::milliseconds discovery_timeout = std::chrono::milliseconds(LANSCOUT_DEFAULT_DISCOVERY_TIMEOUT_MS);
    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(LANSCOUT_DEFAULT_POLL_INTERVAL_MS);
    /** Upper bound of track status requests. 0 leaves the bound to the appliance, which times pending requests out. */
    uint32_t max_poll_attempts = 0;
};

class LANSCOUTAPI ApplianceClient final
{
public:
    /**
     * Waits one poll interval between two track status requests.
     * Returns ::LANSCOUT_SUCCESS when the interval elapsed, or ::LANSCOUT_SHUTDOWN_EVENT_SIGNALED when cancelled.
     */
    using PollWaiter = std::function<lanscout_status(std::chrono::milliseconds interval)>;

    /**
     * @param[in] params            Identity and timing.
     * @param[in] discovery         Locates the appliance.
     * @param[in] transport         Carries the REST requests.
     * @param[in] token_store       Persists the app token.
     * @param[in] shutdown_event    Signaled by abort(). May be shared with other components.
     * @param[in] poll_waiter       Optional. Defaults to a wait on @a shutdown_event.
     */
    ApplianceClient(const ApplianceClientParams &params, std::shared_ptr<ServiceDiscovery> discovery,
        std::shared_ptr<HttpTransport> transport, std::shared_ptr<TokenStore> token_store, EventPtr shutdown_event,
        PollWaiter poll_waiter = nullptr);

    ApplianceClient(const ApplianceClient &) = delete;
    ApplianceClient &operator=(const ApplianceClient &) = delete;

    /**
     * Runs discovery and authorization until a session is open.
     * Reuses a stored app token when the appliance still accepts it, otherwise requests a new authorization and
     * polls its track status until the user answers on the appliance.
     *
     * @return ::LANSCOUT_SUCCESS when authorized. Otherwise ::LANSCOUT_APPLIANCE_NOT_FOUND,
     *         ::LANSCOUT_AUTHORIZATION_DENIED, ::LANSCOUT_AUTHORIZATION_TIMEOUT, ::LANSCOUT_SESSION_FAILURE,
     *         ::LANSCOUT_SHUTDOWN_EVENT_SIGNALED, ::LANSCOUT_NOT_AUTHORIZED when forget() withdrew the pending
     *         request, or the transport failure.
     */
    lanscout_status start();

    /**
     * Fetches the appliance view of the LAN. Requires the AUTHORIZED state.
     * Returns Unexpected of ::LANSCOUT_NOT_AUTHORIZED before start() succeeded, and of ::LANSCOUT_SESSION_FAILURE
     * when the appliance no longer accepts the session.
     */
    Expected<ScanResult> fetch_devices();

    /**
     * Clears the stored app token and the session. The state returns to IDLE.
     * A start() polling the track status from another thread gives up at its next request.
     */
    lanscout_status forget();

    /**
     * Cancels discovery and polling in progress. The shutdown event stays signaled, so every later start() returns
     * ::LANSCOUT_SHUTDOWN_EVENT_SIGNALED as well.
     */
    lanscout_status abort();

    AuthorizationState state() const;
    void set_state_observer(AuthorizationTracker::Observer observer);

private:
    lanscout_status discover();
    lanscout_status login_with_cached_token();
    lanscout_status authorize();
    lanscout_status poll_track_status(uint32_t track_id, const std::string &app_token);
    lanscout_status open_session(const std::string &app_token);
    lanscout_status wait_poll_interval();
    lanscout_status fail(lanscout_status status, const std::string &message);
    void clear_pending_token(const std::string &reason);

    const ApplianceClientParams m_params;
    std::shared_ptr<ServiceDiscovery> m_discovery;
    std::shared_ptr<HttpTransport> m_transport;
    std::shared_ptr<TokenStore> m_token_store;
    EventPtr m_shutdown_event;
    PollWaiter m_poll_waiter;

    AuthorizationTracker m_tracker;
    // Serializes start(), fetch_devices() and forget()
    std::mutex m_operation_mutex;
    std::unique_ptr<ApplianceSession> m_session;
};

} /* namespace lanscout */

#endif /* _LANSCOUT_APPLIANCE_CLIENT_HPP_ */
