/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file appliance_api.hpp
 * @brief REST API of the router appliance (login, authorization tracking, LAN browser)
 *
 * Every reply uses the envelope {"success": bool, "result": ..., "msg": string, "error_code": string}.
 * A reply with success == false, a non 2xx status, or a body that does not match the expected shape fails with
 * ::LANSCOUT_INVALID_APPLIANCE_RESPONSE. Transport errors fail with ::LANSCOUT_HTTP_FAILURE.
 **/

#ifndef _LANSCOUT_APPLIANCE_API_HPP_
#define _LANSCOUT_APPLIANCE_API_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"
#include "lanscout/device.hpp"
#include "lanscout/authorization.hpp"
#include "lanscout/http_transport.hpp"

#include <memory>
#include <string>
#include <vector>

/** lanscout namespace */
namespace lanscout
{

#define LANSCOUT_APPLIANCE_AUTH_HEADER "X-Fbx-App-Auth"

/** Application identity presented when requesting authorization */
struct LANSCOUTAPI AppIdentity final
{
    std::string app_id = "com.example.lanscanner";
    std::string app_name = "LAN Scanner";
    std::string app_version = "1.0.0";
    std::string device_name;
};

struct LANSCOUTAPI AuthorizationGrant final
{
    std::string app_token;
    uint32_t track_id = 0;
};

struct LANSCOUTAPI TrackStatusReply final
{
    TrackStatus status = TrackStatus::UNKNOWN;
    std::string challenge;
};

/**
 * HMAC-SHA1 of @a challenge keyed by @a app_token, as lowercase hex. This is the session login password.
 *
 * @return Upon success, returns the 40 character digest. Otherwise, returns Unexpected of ::LANSCOUT_CRYPTO_FAILURE.
 */
LANSCOUTAPI Expected<std::string> compute_challenge_password(const std::string &app_token,
    const std::string &challenge);

/** Maps the literal track status of the appliance ("pending", "granted", "denied", "timeout") */
LANSCOUTAPI TrackStatus parse_track_status(const std::string &status);

class LANSCOUTAPI ApplianceApi final
{
public:
    ApplianceApi(const std::string &base_url, std::shared_ptr<HttpTransport> transport);

    /** POST /api/v4/login/authorize/ */
    Expected<AuthorizationGrant> request_authorization(const AppIdentity &identity);

    /** GET /api/v4/login/authorize/{track_id} */
    Expected<TrackStatusReply> get_track_status(uint32_t track_id);

    /** GET /api/v4/login/ */
    Expected<std::string> get_login_challenge();

    /** POST /api/v4/login/session/, returns the session token */
    Expected<std::string> open_session(const std::string &app_id, const std::string &password);

    /**
     * GET /api/v4/lan/browser/pub/ authenticated by @a session_token.
     * Returns only entries with an active layer 3 connectivity, each marked online.
     * Returns Unexpected of ::LANSCOUT_NOT_AUTHORIZED when the appliance rejects the session.
     */
    Expected<ScanResult> get_lan_devices(const std::string &session_token);

    const std::string &base_url() const { return m_base_url; }

    /* Reply decoders, shared with the tests */
    static Expected<AuthorizationGrant> parse_authorization_grant(const std::string &body);
    static Expected<TrackStatusReply> parse_track_status_reply(const std::string &body);
    static Expected<std::string> parse_login_challenge(const std::string &body);
    static Expected<std::string> parse_session_token(const std::string &body);
    static Expected<ScanResult> parse_lan_devices(const std::string &body);

private:
    Expected<std::string> checked_body(Expected<HttpResponse> response, const std::string &path);

    const std::string m_base_url;
    std::shared_ptr<HttpTransport> m_transport;
};

} /* namespace lanscout */

#endif /* _LANSCOUT_APPLIANCE_API_HPP_ */
