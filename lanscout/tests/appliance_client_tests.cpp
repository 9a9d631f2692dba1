/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file appliance_client_tests.cpp
 * @brief Tests of discovery, authorization and session handling against a fake appliance
 **/

#include "test_utils.hpp"

#include <future>
#include <thread>

using namespace lanscout;
using namespace lanscout::test;

static const std::string AUTHORIZE = "/api/v4/login/authorize/";
static const std::string TRACK = "/api/v4/login/authorize/7";
static const std::string LOGIN = "/api/v4/login/";
static const std::string SESSION = "/api/v4/login/session/";
static const std::string LAN = "/api/v4/lan/browser/pub/";

static const std::string GRANT_REPLY = "{\"app_token\": \"new-token\", \"track_id\": 7}";

static std::string track_reply(const std::string &status)
{
    return ok_reply("{\"status\": \"" + status + "\", \"challenge\": \"c0\"}");
}

class ApplianceClientTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_transport = std::make_shared<FakeHttpTransport>();
        m_discovery = std::make_shared<FakeServiceDiscovery>();
        m_token_store = std::make_shared<MemoryTokenStore>();
        m_transport->push("GET", LOGIN, 200, ok_reply("{\"logged_in\": false, \"challenge\": \"abc\"}"));
    }

    std::unique_ptr<ApplianceClient> make_client(uint32_t max_poll_attempts = 0, EventPtr shutdown_event = nullptr)
    {
        ApplianceClientParams params{};
        params.max_poll_attempts = max_poll_attempts;
        auto client = std::make_unique<ApplianceClient>(params, m_discovery, m_transport, m_token_store,
            shutdown_event, [this](std::chrono::milliseconds) {
                m_waits++;
                return LANSCOUT_SUCCESS;
            });
        client->set_state_observer([this](const AuthorizationState &, const AuthorizationState &current) {
            m_states.push_back(current);
        });
        return client;
    }

    void push_session(const std::string &session_token)
    {
        m_transport->push("POST", SESSION, 200, ok_reply("{\"session_token\": \"" + session_token + "\"}"));
    }

    std::shared_ptr<FakeHttpTransport> m_transport;
    std::shared_ptr<FakeServiceDiscovery> m_discovery;
    std::shared_ptr<MemoryTokenStore> m_token_store;
    size_t m_waits = 0;
    std::vector<AuthorizationState> m_states;
};

TEST_F(ApplianceClientTest, PollsUntilGranted)
{
    m_transport->push("POST", AUTHORIZE, 200, ok_reply(GRANT_REPLY));
    m_transport->push("GET", TRACK, 200, track_reply("pending"));
    m_transport->push("GET", TRACK, 200, track_reply("pending"));
    m_transport->push("GET", TRACK, 200, track_reply("granted"));
    push_session("session-1");

    auto client = make_client();
    EXPECT_EQ(LANSCOUT_SUCCESS, client->start());

    EXPECT_EQ(AuthorizationState::authorized(), client->state());
    EXPECT_EQ(2u, m_waits);
    EXPECT_EQ(3u, m_transport->count("GET", TRACK));

    auto stored = m_token_store->load_app_token();
    ASSERT_TRUE(stored);
    EXPECT_EQ("new-token", stored.value());

    // Session password is HMAC-SHA1("new-token", "abc")
    const auto requests = m_transport->requests();
    const auto login = std::find_if(requests.begin(), requests.end(),
        [](const FakeHttpTransport::Request &request) { return SESSION == request.path; });
    ASSERT_NE(requests.end(), login);
    auto password = compute_challenge_password("new-token", "abc");
    ASSERT_TRUE(password);
    EXPECT_NE(std::string::npos, login->body.find(password.value()));

    ASSERT_EQ(3u, m_states.size());
    EXPECT_EQ(AuthorizationState::discovering(), m_states[0]);
    EXPECT_EQ(AuthorizationState::authorizing(7), m_states[1]);
    EXPECT_EQ(AuthorizationState::authorized(), m_states[2]);
}

TEST_F(ApplianceClientTest, DeniedClearsTheToken)
{
    m_transport->push("POST", AUTHORIZE, 200, ok_reply(GRANT_REPLY));
    m_transport->push("GET", TRACK, 200, track_reply("denied"));

    auto client = make_client();
    EXPECT_EQ(LANSCOUT_AUTHORIZATION_DENIED, client->start());

    EXPECT_EQ(AuthorizationState::error("denied"), client->state());
    EXPECT_EQ(0u, m_waits);
    EXPECT_EQ(LANSCOUT_NOT_FOUND, m_token_store->load_app_token().status());
    EXPECT_EQ(0u, m_transport->count("POST", SESSION));
}

TEST_F(ApplianceClientTest, ApplianceTimeout)
{
    m_transport->push("POST", AUTHORIZE, 200, ok_reply(GRANT_REPLY));
    m_transport->push("GET", TRACK, 200, track_reply("pending"));
    m_transport->push("GET", TRACK, 200, track_reply("timeout"));

    auto client = make_client();
    EXPECT_EQ(LANSCOUT_AUTHORIZATION_TIMEOUT, client->start());
    EXPECT_EQ(AuthorizationState::error("timeout"), client->state());
    EXPECT_EQ(1u, m_waits);
}

TEST_F(ApplianceClientTest, GivesUpAfterMaxPollAttempts)
{
    m_transport->push("POST", AUTHORIZE, 200, ok_reply(GRANT_REPLY));
    m_transport->push("GET", TRACK, 200, track_reply("pending"));

    auto client = make_client(3);
    EXPECT_EQ(LANSCOUT_AUTHORIZATION_TIMEOUT, client->start());
    EXPECT_EQ(3u, m_transport->count("GET", TRACK));
    EXPECT_EQ(AuthorizationState::error("timeout"), client->state());
    EXPECT_EQ(LANSCOUT_NOT_FOUND, m_token_store->load_app_token().status());
}

TEST_F(ApplianceClientTest, CachedTokenSkipsAuthorization)
{
    ASSERT_EQ(LANSCOUT_SUCCESS, m_token_store->save_app_token("cached-token"));
    push_session("session-2");

    auto client = make_client();
    EXPECT_EQ(LANSCOUT_SUCCESS, client->start());

    EXPECT_EQ(AuthorizationState::authorized(), client->state());
    EXPECT_EQ(0u, m_transport->count("POST", AUTHORIZE));
    EXPECT_EQ(0u, m_waits);

    // A second start reuses the open session
    EXPECT_EQ(LANSCOUT_SUCCESS, client->start());
    EXPECT_EQ(1u, m_discovery->m_calls);
}

TEST_F(ApplianceClientTest, RejectedCachedTokenFallsBackToAuthorization)
{
    ASSERT_EQ(LANSCOUT_SUCCESS, m_token_store->save_app_token("revoked-token"));
    m_transport->push("POST", SESSION, 403, error_reply("invalid_token"));
    push_session("session-3");
    m_transport->push("POST", AUTHORIZE, 200, ok_reply(GRANT_REPLY));
    m_transport->push("GET", TRACK, 200, track_reply("granted"));

    auto client = make_client();
    EXPECT_EQ(LANSCOUT_SUCCESS, client->start());

    EXPECT_EQ(AuthorizationState::authorized(), client->state());
    EXPECT_EQ(1u, m_transport->count("POST", AUTHORIZE));
    EXPECT_EQ(2u, m_transport->count("POST", SESSION));
    auto stored = m_token_store->load_app_token();
    ASSERT_TRUE(stored);
    EXPECT_EQ("new-token", stored.value());
}

TEST_F(ApplianceClientTest, ApplianceNotFound)
{
    m_discovery->m_status = LANSCOUT_TIMEOUT;

    auto client = make_client();
    EXPECT_EQ(LANSCOUT_APPLIANCE_NOT_FOUND, client->start());
    EXPECT_EQ(AuthorizationState::error("appliance not found"), client->state());
    EXPECT_TRUE(m_transport->requests().empty());
}

TEST_F(ApplianceClientTest, ShutdownDuringDiscovery)
{
    m_discovery->m_status = LANSCOUT_SHUTDOWN_EVENT_SIGNALED;

    auto client = make_client();
    EXPECT_EQ(LANSCOUT_SHUTDOWN_EVENT_SIGNALED, client->start());
    EXPECT_TRUE(client->state().is(AuthorizationStateType::ERROR));
}

TEST_F(ApplianceClientTest, ShutdownWhilePolling)
{
    auto shutdown_event = Event::create_shared(Event::State::not_signalled);
    ASSERT_TRUE(shutdown_event);
    m_transport->push("POST", AUTHORIZE, 200, ok_reply(GRANT_REPLY));
    m_transport->push("GET", TRACK, 200, track_reply("pending"));

    ApplianceClientParams params{};
    auto event = shutdown_event.value();
    ApplianceClient client(params, m_discovery, m_transport, m_token_store, event,
        [event](std::chrono::milliseconds) {
            (void) event->signal();
            return LANSCOUT_SHUTDOWN_EVENT_SIGNALED;
        });

    EXPECT_EQ(LANSCOUT_SHUTDOWN_EVENT_SIGNALED, client.start());
    EXPECT_EQ(1u, m_transport->count("GET", TRACK));
}

TEST_F(ApplianceClientTest, FetchesDevicesWithSessionToken)
{
    ASSERT_EQ(LANSCOUT_SUCCESS, m_token_store->save_app_token("cached-token"));
    push_session("session-4");
    m_transport->push("GET", LAN, 200, ok_reply(R"([{"primary_name": "tv",
        "l2ident": {"id": "00:11:22:33:44:55", "type": "mac_address"},
        "l3connectivities": [{"addr": "192.168.1.30", "active": true}]}])"));

    auto client = make_client();
    EXPECT_EQ(LANSCOUT_NOT_AUTHORIZED, client->fetch_devices().status());

    ASSERT_EQ(LANSCOUT_SUCCESS, client->start());
    auto devices = client->fetch_devices();
    ASSERT_TRUE(devices);
    ASSERT_EQ(1u, devices->size());
    EXPECT_EQ("tv", devices->at(0).hostname);

    const auto requests = m_transport->requests();
    EXPECT_EQ("session-4", requests.back().headers.at(LANSCOUT_APPLIANCE_AUTH_HEADER));
}

TEST_F(ApplianceClientTest, ExpiredSessionIsReported)
{
    ASSERT_EQ(LANSCOUT_SUCCESS, m_token_store->save_app_token("cached-token"));
    push_session("session-5");
    m_transport->push("GET", LAN, 403, error_reply("auth_required"));

    auto client = make_client();
    ASSERT_EQ(LANSCOUT_SUCCESS, client->start());

    EXPECT_EQ(LANSCOUT_SESSION_FAILURE, client->fetch_devices().status());
    EXPECT_EQ(AuthorizationState::error("session expired"), client->state());

    // The stored app token survives, so the next start logs in again without approval
    EXPECT_EQ(LANSCOUT_SUCCESS, client->start());
    EXPECT_EQ(2u, m_transport->count("POST", SESSION));
    EXPECT_EQ(0u, m_transport->count("POST", AUTHORIZE));
}

TEST_F(ApplianceClientTest, ForgetClearsTokenAndState)
{
    ASSERT_EQ(LANSCOUT_SUCCESS, m_token_store->save_app_token("cached-token"));
    push_session("session-6");

    auto client = make_client();
    ASSERT_EQ(LANSCOUT_SUCCESS, client->start());
    EXPECT_EQ(LANSCOUT_SUCCESS, client->forget());

    EXPECT_EQ(AuthorizationState::idle(), client->state());
    EXPECT_EQ(LANSCOUT_NOT_FOUND, m_token_store->load_app_token().status());
    EXPECT_EQ(LANSCOUT_NOT_AUTHORIZED, client->fetch_devices().status());
}

TEST_F(ApplianceClientTest, AbortWithoutEventIsInvalid)
{
    auto client = make_client();
    EXPECT_EQ(LANSCOUT_INVALID_OPERATION, client->abort());
}

TEST_F(ApplianceClientTest, ForgetWithdrawsPendingAuthorization)
{
    m_transport->push("POST", AUTHORIZE, 200, ok_reply(GRANT_REPLY));
    m_transport->push("GET", TRACK, 200, track_reply("pending"));

    ApplianceClientParams params{};
    params.poll_interval = std::chrono::milliseconds(10);
    params.max_poll_attempts = 1000;
    ApplianceClient client(params, m_discovery, m_transport, m_token_store, nullptr);

    auto started = std::async(std::launch::async, [&client]() { return client.start(); });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while ((m_transport->count("GET", TRACK) < 2) && (std::chrono::steady_clock::now() < deadline)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ASSERT_TRUE(client.state().is(AuthorizationStateType::AUTHORIZING));

    const auto forget_start = std::chrono::steady_clock::now();
    EXPECT_EQ(LANSCOUT_SUCCESS, client.forget());
    EXPECT_LT(std::chrono::steady_clock::now() - forget_start, std::chrono::seconds(1));

    ASSERT_EQ(std::future_status::ready, started.wait_for(std::chrono::seconds(1)));
    EXPECT_EQ(LANSCOUT_NOT_AUTHORIZED, started.get());
    EXPECT_EQ(AuthorizationState::idle(), client.state());
    EXPECT_EQ(LANSCOUT_NOT_FOUND, m_token_store->load_app_token().status());
    EXPECT_EQ(0u, m_transport->count("POST", SESSION));
}

TEST_F(ApplianceClientTest, AbortStaysInEffectForLaterStarts)
{
    auto shutdown_event = Event::create_shared(Event::State::not_signalled);
    ASSERT_TRUE(shutdown_event);
    m_transport->push("POST", AUTHORIZE, 200, ok_reply(GRANT_REPLY));
    m_transport->push("GET", TRACK, 200, track_reply("pending"));
    auto client = make_client(0, shutdown_event.value());

    ASSERT_EQ(LANSCOUT_SUCCESS, client->abort());
    EXPECT_EQ(LANSCOUT_SHUTDOWN_EVENT_SIGNALED, client->start());
    EXPECT_EQ(LANSCOUT_SHUTDOWN_EVENT_SIGNALED, client->start());
    EXPECT_TRUE(client->state().is(AuthorizationStateType::ERROR));
    EXPECT_EQ(0u, m_transport->count("GET", TRACK));
}
