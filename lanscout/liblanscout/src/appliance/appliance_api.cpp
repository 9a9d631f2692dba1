/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file appliance_api.cpp
 * @brief Appliance REST requests and reply decoding
 **/

#include "lanscout/appliance_api.hpp"

#include "common/utils.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lanscout
{

static const std::string AUTHORIZE_PATH = "/api/v4/login/authorize/";
static const std::string LOGIN_PATH = "/api/v4/login/";
static const std::string SESSION_PATH = "/api/v4/login/session/";
static const std::string LAN_BROWSER_PATH = "/api/v4/lan/browser/pub/";

static const std::string MAC_ADDRESS_L2_TYPE = "mac_address";

// Error codes the appliance reports for a missing, expired or revoked session
static const std::vector<std::string> NOT_AUTHORIZED_ERROR_CODES = {
    "auth_required", "invalid_token", "invalid_session", "pending_token"
};

#define HTTP_STATUS_UNAUTHORIZED (401)
#define HTTP_STATUS_FORBIDDEN (403)

/**
 * Validates the reply envelope and extracts its "result" member (null when absent).
 */
static lanscout_status parse_envelope(const std::string &body, json &result)
{
    try {
        const auto reply = json::parse(body);
        CHECK(reply.is_object(), LANSCOUT_INVALID_APPLIANCE_RESPONSE, "Appliance reply is not a JSON object");

        const auto success = reply.find("success");
        CHECK((reply.end() != success) && success->is_boolean(), LANSCOUT_INVALID_APPLIANCE_RESPONSE,
            "Appliance reply has no success flag");

        if (!success->get<bool>()) {
            const auto error_code = reply.value("error_code", std::string());
            LOGGER__WARNING("Appliance reported failure: {} ({})", reply.value("msg", std::string()), error_code);
            if (contains(NOT_AUTHORIZED_ERROR_CODES, error_code)) {
                return LANSCOUT_NOT_AUTHORIZED;
            }
            return LANSCOUT_INVALID_APPLIANCE_RESPONSE;
        }

        const auto result_it = reply.find("result");
        result = (reply.end() != result_it) ? *result_it : json();
    } catch (const json::exception &e) {
        LOGGER__ERROR("Malformed appliance reply: {}", e.what());
        return LANSCOUT_INVALID_APPLIANCE_RESPONSE;
    }

    return LANSCOUT_SUCCESS;
}

static lanscout_status get_string_field(const json &object, const std::string &name, std::string &value)
{
    CHECK(object.is_object(), LANSCOUT_INVALID_APPLIANCE_RESPONSE, "Appliance result is not an object");
    const auto field = object.find(name);
    CHECK((object.end() != field) && field->is_string(), LANSCOUT_INVALID_APPLIANCE_RESPONSE,
        "Appliance result has no string field '{}'", name);
    value = field->get<std::string>();
    return LANSCOUT_SUCCESS;
}

TrackStatus parse_track_status(const std::string &status)
{
    if ("pending" == status) {
        return TrackStatus::PENDING;
    } else if ("granted" == status) {
        return TrackStatus::GRANTED;
    } else if ("denied" == status) {
        return TrackStatus::DENIED;
    } else if ("timeout" == status) {
        return TrackStatus::TIMEOUT;
    }
    return TrackStatus::UNKNOWN;
}

Expected<AuthorizationGrant> ApplianceApi::parse_authorization_grant(const std::string &body)
{
    json result;
    auto status = parse_envelope(body, result);
    CHECK_SUCCESS_AS_EXPECTED(status);

    AuthorizationGrant grant{};
    status = get_string_field(result, "app_token", grant.app_token);
    CHECK_SUCCESS_AS_EXPECTED(status);
    CHECK_AS_EXPECTED(!grant.app_token.empty(), LANSCOUT_INVALID_APPLIANCE_RESPONSE, "Empty app token");

    const auto track_id = result.find("track_id");
    CHECK_AS_EXPECTED((result.end() != track_id) && track_id->is_number_unsigned(),
        LANSCOUT_INVALID_APPLIANCE_RESPONSE, "Authorization reply has no track_id");
    CHECK_AS_EXPECTED(track_id->get<uint64_t>() <= UINT32_MAX, LANSCOUT_INVALID_APPLIANCE_RESPONSE,
        "track_id out of range");
    grant.track_id = track_id->get<uint32_t>();

    return grant;
}

Expected<TrackStatusReply> ApplianceApi::parse_track_status_reply(const std::string &body)
{
    json result;
    auto status = parse_envelope(body, result);
    CHECK_SUCCESS_AS_EXPECTED(status);

    std::string track_status;
    status = get_string_field(result, "status", track_status);
    CHECK_SUCCESS_AS_EXPECTED(status);

    TrackStatusReply reply{};
    reply.status = parse_track_status(track_status);
    if (TrackStatus::UNKNOWN == reply.status) {
        LOGGER__WARNING("Unknown authorization track status '{}'", track_status);
    }
    // The challenge is informative here, the login challenge is fetched separately
    reply.challenge = result.value("challenge", std::string());

    return reply;
}

Expected<std::string> ApplianceApi::parse_login_challenge(const std::string &body)
{
    json result;
    auto status = parse_envelope(body, result);
    CHECK_SUCCESS_AS_EXPECTED(status);

    std::string challenge;
    status = get_string_field(result, "challenge", challenge);
    CHECK_SUCCESS_AS_EXPECTED(status);
    CHECK_AS_EXPECTED(!challenge.empty(), LANSCOUT_INVALID_APPLIANCE_RESPONSE, "Empty login challenge");

    return challenge;
}

Expected<std::string> ApplianceApi::parse_session_token(const std::string &body)
{
    json result;
    auto status = parse_envelope(body, result);
    CHECK_SUCCESS_AS_EXPECTED(status);

    std::string session_token;
    status = get_string_field(result, "session_token", session_token);
    CHECK_SUCCESS_AS_EXPECTED(status);
    CHECK_AS_EXPECTED(!session_token.empty(), LANSCOUT_INVALID_APPLIANCE_RESPONSE, "Empty session token");

    return session_token;
}

static bool parse_lan_device(const json &entry, DeviceRecord &record)
{
    if (!entry.is_object()) {
        return false;
    }

    const auto connectivities = entry.find("l3connectivities");
    if ((entry.end() == connectivities) || !connectivities->is_array()) {
        return false;
    }

    // First active layer 3 address wins
    for (const auto &connectivity : *connectivities) {
        if (connectivity.is_object() && connectivity.value("active", false)) {
            record.address = connectivity.value("addr", std::string());
            break;
        }
    }
    if (record.address.empty()) {
        return false;
    }

    record.hostname = entry.value("primary_name", std::string());
    if (record.hostname.empty()) {
        record.hostname = UNRESOLVED_HOSTNAME;
    }

    const auto l2ident = entry.find("l2ident");
    if ((entry.end() != l2ident) && l2ident->is_object() &&
        (MAC_ADDRESS_L2_TYPE == l2ident->value("type", std::string()))) {
        record.hardware_address = StringUtils::to_lower(l2ident->value("id", std::string()));
    }

    record.online = true;
    return true;
}

Expected<ScanResult> ApplianceApi::parse_lan_devices(const std::string &body)
{
    json result;
    auto status = parse_envelope(body, result);
    CHECK_SUCCESS_AS_EXPECTED(status);

    ScanResult devices;
    // An empty LAN is reported without a result member
    if (result.is_null()) {
        return devices;
    }

    try {
        CHECK_AS_EXPECTED(result.is_array(), LANSCOUT_INVALID_APPLIANCE_RESPONSE, "LAN browser result is not a list");
        for (const auto &entry : result) {
            DeviceRecord record{};
            if (!parse_lan_device(entry, record)) {
                LOGGER__DEBUG("Dropping LAN entry without an active address: {}", entry.dump());
                continue;
            }
            devices.emplace_back(std::move(record));
        }
    } catch (const json::exception &e) {
        LOGGER__ERROR("Malformed LAN browser entry: {}", e.what());
        return make_unexpected(LANSCOUT_INVALID_APPLIANCE_RESPONSE);
    }

    return devices;
}

ApplianceApi::ApplianceApi(const std::string &base_url, std::shared_ptr<HttpTransport> transport) :
    m_base_url(base_url),
    m_transport(std::move(transport))
{}

Expected<std::string> ApplianceApi::checked_body(Expected<HttpResponse> response, const std::string &path)
{
    CHECK_EXPECTED(response, "Request {} failed", path);

    if (!response->is_success()) {
        LOGGER__WARNING("{} answered HTTP {}: {}", path, response->status_code, response->body);
        // The envelope of an error reply carries the more precise error code
        json unused;
        auto status = parse_envelope(response->body, unused);
        if ((LANSCOUT_NOT_AUTHORIZED == status) || (HTTP_STATUS_UNAUTHORIZED == response->status_code) ||
            (HTTP_STATUS_FORBIDDEN == response->status_code)) {
            return make_unexpected(LANSCOUT_NOT_AUTHORIZED);
        }
        return make_unexpected(LANSCOUT_INVALID_APPLIANCE_RESPONSE);
    }

    return std::move(response->body);
}

Expected<AuthorizationGrant> ApplianceApi::request_authorization(const AppIdentity &identity)
{
    CHECK_AS_EXPECTED(!identity.app_id.empty(), LANSCOUT_INVALID_ARGUMENT, "Empty app_id");

    const json request = {
        {"app_id", identity.app_id},
        {"app_name", identity.app_name},
        {"app_version", identity.app_version},
        {"device_name", identity.device_name},
    };

    TRY(const auto body, checked_body(m_transport->post_json(m_base_url + AUTHORIZE_PATH, request.dump(), {}),
        AUTHORIZE_PATH));
    return parse_authorization_grant(body);
}

Expected<TrackStatusReply> ApplianceApi::get_track_status(uint32_t track_id)
{
    const auto path = fmt::format("{}{}", AUTHORIZE_PATH, track_id);
    TRY(const auto body, checked_body(m_transport->get(m_base_url + path, {}), path));
    return parse_track_status_reply(body);
}

Expected<std::string> ApplianceApi::get_login_challenge()
{
    TRY(const auto body, checked_body(m_transport->get(m_base_url + LOGIN_PATH, {}), LOGIN_PATH));
    return parse_login_challenge(body);
}

Expected<std::string> ApplianceApi::open_session(const std::string &app_id, const std::string &password)
{
    const json request = {
        {"app_id", app_id},
        {"password", password},
    };

    TRY(const auto body, checked_body(m_transport->post_json(m_base_url + SESSION_PATH, request.dump(), {}),
        SESSION_PATH));
    return parse_session_token(body);
}

Expected<ScanResult> ApplianceApi::get_lan_devices(const std::string &session_token)
{
    CHECK_AS_EXPECTED(!session_token.empty(), LANSCOUT_NOT_AUTHORIZED, "No session token");

    const HttpHeaders headers = {
        {LANSCOUT_APPLIANCE_AUTH_HEADER, session_token},
    };
    TRY(const auto body, checked_body(m_transport->get(m_base_url + LAN_BROWSER_PATH, headers), LAN_BROWSER_PATH));
    return parse_lan_devices(body);
}

} /* namespace lanscout */
