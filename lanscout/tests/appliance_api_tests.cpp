/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file appliance_api_tests.cpp
 * @brief Tests of the appliance REST requests and reply decoding
 **/

#include "test_utils.hpp"

#include <nlohmann/json.hpp>

using namespace lanscout;
using namespace lanscout::test;

TEST(ChallengePasswordTest, MatchesHmacSha1)
{
    auto password = compute_challenge_password("secret", "abc");
    ASSERT_TRUE(password);
    EXPECT_EQ("694abd10842d161ddbc54df8a0d57cf64d0dbcc9", password.value());

    auto other = compute_challenge_password("secret", "abd");
    ASSERT_TRUE(other);
    EXPECT_EQ(40u, other->size());
    EXPECT_NE(password.value(), other.value());
}

TEST(ApplianceRepliesTest, TrackStatusLiterals)
{
    EXPECT_EQ(TrackStatus::PENDING, parse_track_status("pending"));
    EXPECT_EQ(TrackStatus::GRANTED, parse_track_status("granted"));
    EXPECT_EQ(TrackStatus::DENIED, parse_track_status("denied"));
    EXPECT_EQ(TrackStatus::TIMEOUT, parse_track_status("timeout"));
    EXPECT_EQ(TrackStatus::UNKNOWN, parse_track_status("GRANTED"));
}

TEST(ApplianceRepliesTest, AuthorizationGrant)
{
    auto grant = ApplianceApi::parse_authorization_grant(ok_reply("{\"app_token\": \"tok\", \"track_id\": 7}"));
    ASSERT_TRUE(grant);
    EXPECT_EQ("tok", grant->app_token);
    EXPECT_EQ(7u, grant->track_id);

    EXPECT_EQ(LANSCOUT_INVALID_APPLIANCE_RESPONSE,
        ApplianceApi::parse_authorization_grant(ok_reply("{\"app_token\": \"tok\"}")).status());
    EXPECT_EQ(LANSCOUT_INVALID_APPLIANCE_RESPONSE,
        ApplianceApi::parse_authorization_grant(ok_reply("{\"app_token\": \"\", \"track_id\": 7}")).status());
    EXPECT_EQ(LANSCOUT_INVALID_APPLIANCE_RESPONSE,
        ApplianceApi::parse_authorization_grant(ok_reply("{\"app_token\": \"tok\", \"track_id\": -1}")).status());
}

TEST(ApplianceRepliesTest, Envelope)
{
    EXPECT_EQ(LANSCOUT_INVALID_APPLIANCE_RESPONSE, ApplianceApi::parse_login_challenge("not json").status());
    EXPECT_EQ(LANSCOUT_INVALID_APPLIANCE_RESPONSE, ApplianceApi::parse_login_challenge("[]").status());
    EXPECT_EQ(LANSCOUT_INVALID_APPLIANCE_RESPONSE,
        ApplianceApi::parse_login_challenge("{\"result\": {\"challenge\": \"c\"}}").status());
    EXPECT_EQ(LANSCOUT_INVALID_APPLIANCE_RESPONSE,
        ApplianceApi::parse_login_challenge(error_reply("internal_error")).status());
    EXPECT_EQ(LANSCOUT_NOT_AUTHORIZED, ApplianceApi::parse_login_challenge(error_reply("invalid_token")).status());
    EXPECT_EQ(LANSCOUT_NOT_AUTHORIZED, ApplianceApi::parse_session_token(error_reply("auth_required")).status());
}

TEST(ApplianceRepliesTest, TrackStatusAndLogin)
{
    auto reply = ApplianceApi::parse_track_status_reply(ok_reply("{\"status\": \"granted\", \"challenge\": \"xyz\"}"));
    ASSERT_TRUE(reply);
    EXPECT_EQ(TrackStatus::GRANTED, reply->status);
    EXPECT_EQ("xyz", reply->challenge);

    auto challenge = ApplianceApi::parse_login_challenge(ok_reply("{\"logged_in\": false, \"challenge\": \"c1\"}"));
    ASSERT_TRUE(challenge);
    EXPECT_EQ("c1", challenge.value());

    auto session = ApplianceApi::parse_session_token(ok_reply("{\"session_token\": \"s1\"}"));
    ASSERT_TRUE(session);
    EXPECT_EQ("s1", session.value());
}

TEST(ApplianceRepliesTest, LanDevicesKeepOnlyActiveEntries)
{
    const std::string result = R"([
        {"primary_name": "nas", "l2ident": {"id": "AA:BB:CC:00:11:22", "type": "mac_address"},
         "l3connectivities": [{"addr": "fe80::1", "active": false}, {"addr": "192.168.1.20", "active": true}]},
        {"primary_name": "", "l2ident": {"id": "aa:bb:cc:00:11:33", "type": "mac_address"},
         "l3connectivities": [{"addr": "192.168.1.3", "active": true}]},
        {"primary_name": "gone", "l2ident": {"id": "aa:bb:cc:00:11:44", "type": "mac_address"},
         "l3connectivities": [{"addr": "192.168.1.4", "active": false}]},
        {"primary_name": "no-l3", "l2ident": {"id": "aa:bb:cc:00:11:55", "type": "mac_address"}}
    ])";

    auto devices = ApplianceApi::parse_lan_devices(ok_reply(result));
    ASSERT_TRUE(devices);
    ASSERT_EQ(2u, devices->size());

    EXPECT_EQ("192.168.1.20", devices->at(0).address);
    EXPECT_EQ("nas", devices->at(0).hostname);
    EXPECT_EQ("aa:bb:cc:00:11:22", devices->at(0).hardware_address);
    EXPECT_TRUE(devices->at(0).online);

    EXPECT_EQ("192.168.1.3", devices->at(1).address);
    EXPECT_EQ(UNRESOLVED_HOSTNAME, devices->at(1).hostname);

    auto empty = ApplianceApi::parse_lan_devices("{\"success\": true}");
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty->empty());

    EXPECT_EQ(LANSCOUT_INVALID_APPLIANCE_RESPONSE, ApplianceApi::parse_lan_devices(ok_reply("{}")).status());
}

TEST(ApplianceApiTest, SendsAuthenticatedLanRequest)
{
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->push("GET", "/api/v4/lan/browser/pub/", 200, ok_reply("[]"));
    ApplianceApi api(FAKE_BASE_URL, transport);

    auto devices = api.get_lan_devices("session-1");
    ASSERT_TRUE(devices);

    const auto requests = transport->requests();
    ASSERT_EQ(1u, requests.size());
    EXPECT_EQ("session-1", requests[0].headers.at(LANSCOUT_APPLIANCE_AUTH_HEADER));

    EXPECT_EQ(LANSCOUT_NOT_AUTHORIZED, api.get_lan_devices("").status());
}

TEST(ApplianceApiTest, MapsHttpErrors)
{
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->push("GET", "/api/v4/lan/browser/pub/", 403, error_reply("insufficient_rights"));
    transport->push("GET", "/api/v4/login/", 500, "oops");
    transport->push_failure("GET", "/api/v4/login/authorize/9");
    ApplianceApi api(FAKE_BASE_URL, transport);

    EXPECT_EQ(LANSCOUT_NOT_AUTHORIZED, api.get_lan_devices("s").status());
    EXPECT_EQ(LANSCOUT_INVALID_APPLIANCE_RESPONSE, api.get_login_challenge().status());
    EXPECT_EQ(LANSCOUT_HTTP_FAILURE, api.get_track_status(9).status());
}

TEST(ApplianceApiTest, AuthorizationRequestCarriesIdentity)
{
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->push("POST", "/api/v4/login/authorize/", 200, ok_reply("{\"app_token\": \"tok\", \"track_id\": 3}"));
    ApplianceApi api(FAKE_BASE_URL, transport);

    AppIdentity identity{};
    identity.device_name = "laptop";
    auto grant = api.request_authorization(identity);
    ASSERT_TRUE(grant);
    EXPECT_EQ(3u, grant->track_id);

    const auto requests = transport->requests();
    ASSERT_EQ(1u, requests.size());
    const auto body = nlohmann::json::parse(requests[0].body);
    EXPECT_EQ(identity.app_id, body.at("app_id").get<std::string>());
    EXPECT_EQ("laptop", body.at("device_name").get<std::string>());

    identity.app_id.clear();
    EXPECT_EQ(LANSCOUT_INVALID_ARGUMENT, api.request_authorization(identity).status());
}
