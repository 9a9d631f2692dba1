/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file test_utils.hpp
 * @brief Fakes and helpers shared by the lanscout tests
 **/

#ifndef _LANSCOUT_TEST_UTILS_HPP_
#define _LANSCOUT_TEST_UTILS_HPP_

#include "lanscout/lanscout.hpp"
#include "common/filesystem.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <cstdlib>
#include <unistd.h>

namespace lanscout
{
namespace test
{

static const std::string FAKE_APPLIANCE_HOST = "192.168.1.254";
static const std::string FAKE_BASE_URL = "https://192.168.1.254:443";

inline std::string ok_reply(const std::string &result_json)
{
    return "{\"success\": true, \"result\": " + result_json + "}";
}

inline std::string error_reply(const std::string &error_code)
{
    return "{\"success\": false, \"msg\": \"refused\", \"error_code\": \"" + error_code + "\"}";
}

/**
 * HttpTransport answering from per request queues keyed by "GET /path" or "POST /path".
 * The last queued response of a key is repeated once the others are consumed.
 */
class FakeHttpTransport final : public HttpTransport
{
public:
    struct Request
    {
        std::string method;
        std::string path;
        std::string body;
        HttpHeaders headers;
    };

    void push(const std::string &method, const std::string &path, long status_code, const std::string &body)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        HttpResponse response{};
        response.status_code = status_code;
        response.body = body;
        m_responses[method + " " + path].push_back(response);
    }

    void push_failure(const std::string &method, const std::string &path)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failures.insert(method + " " + path);
    }

    virtual Expected<HttpResponse> get(const std::string &url, const HttpHeaders &headers) override
    {
        return answer("GET", url, "", headers);
    }

    virtual Expected<HttpResponse> post_json(const std::string &url, const std::string &body,
        const HttpHeaders &headers) override
    {
        return answer("POST", url, body, headers);
    }

    std::vector<Request> requests() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

    size_t count(const std::string &method, const std::string &path) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t result = 0;
        for (const auto &request : m_requests) {
            if ((request.method == method) && (request.path == path)) {
                result++;
            }
        }
        return result;
    }

private:
    Expected<HttpResponse> answer(const std::string &method, const std::string &url, const std::string &body,
        const HttpHeaders &headers)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto path = (0 == url.find(FAKE_BASE_URL)) ? url.substr(FAKE_BASE_URL.size()) : url;
        m_requests.push_back(Request{method, path, body, headers});

        const auto key = method + " " + path;
        if (m_failures.count(key) > 0) {
            return make_unexpected(LANSCOUT_HTTP_FAILURE);
        }
        auto queue = m_responses.find(key);
        if ((m_responses.end() == queue) || queue->second.empty()) {
            HttpResponse not_found{};
            not_found.status_code = 404;
            not_found.body = "{\"success\": false, \"error_code\": \"invalid_request\"}";
            return not_found;
        }
        auto response = queue->second.front();
        if (queue->second.size() > 1) {
            queue->second.pop_front();
        }
        return response;
    }

    mutable std::mutex m_mutex;
    std::map<std::string, std::deque<HttpResponse>> m_responses;
    std::set<std::string> m_failures;
    std::vector<Request> m_requests;
};

class FakeServiceDiscovery final : public ServiceDiscovery
{
public:
    explicit FakeServiceDiscovery(lanscout_status status = LANSCOUT_SUCCESS) : m_status(status) {}

    virtual Expected<ApplianceEndpoint> discover(std::chrono::milliseconds /*timeout*/) override
    {
        m_calls++;
        if (LANSCOUT_SUCCESS != m_status) {
            return make_unexpected(m_status);
        }
        ApplianceEndpoint endpoint{};
        endpoint.instance_name = "Freebox Server._fbx-api._tcp.local";
        endpoint.host = FAKE_APPLIANCE_HOST;
        return endpoint;
    }

    lanscout_status m_status;
    size_t m_calls = 0;
};

class FakeNetworkState final : public NetworkStateProvider
{
public:
    FakeNetworkState(bool active, std::vector<std::string> addresses) :
        m_active(active), m_addresses(std::move(addresses))
    {}

    virtual bool has_active_network() override { return m_active; }
    virtual Expected<std::vector<std::string>> get_local_addresses() override
    {
        return std::vector<std::string>(m_addresses);
    }

private:
    bool m_active;
    std::vector<std::string> m_addresses;
};

/** HostProbe answering from a fixed set of alive addresses */
class FakeHostProbe final : public HostProbe
{
public:
    explicit FakeHostProbe(std::map<std::string, std::string> alive_hosts) : m_alive_hosts(std::move(alive_hosts)) {}

    virtual Expected<bool> probe(const std::string &address) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_probed.insert(address);
        if (m_failing.count(address) > 0) {
            return make_unexpected(LANSCOUT_ETH_FAILURE);
        }
        return (m_alive_hosts.count(address) > 0);
    }

    virtual std::string resolve_hostname(const std::string &address) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto name = m_alive_hosts.find(address);
        return ((m_alive_hosts.end() == name) || name->second.empty()) ? UNRESOLVED_HOSTNAME : name->second;
    }

    std::set<std::string> probed() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_probed;
    }

    std::set<std::string> m_failing;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_alive_hosts;
    std::set<std::string> m_probed;
};

inline DeviceRecord make_device(const std::string &address, const std::string &hostname, const std::string &mac,
    bool online = true, int64_t last_seen_ms = 0)
{
    DeviceRecord record{};
    record.address = address;
    record.hostname = hostname;
    record.hardware_address = mac;
    record.online = online;
    record.last_seen_ms = last_seen_ms;
    return record;
}

/** Unique scratch directory removed with its regular files on destruction */
class TempDirectory final
{
public:
    TempDirectory()
    {
        char pattern[] = "/tmp/lanscout_test_XXXXXX";
        const char *created = mkdtemp(pattern);
        m_path = (nullptr != created) ? created : "";
    }

    ~TempDirectory()
    {
        for (const auto &file : m_files) {
            (void) Filesystem::remove_file(file);
        }
        (void) rmdir(m_path.c_str());
    }

    std::string file(const std::string &name)
    {
        auto path = Filesystem::join(m_path, name);
        m_files.push_back(path);
        return path;
    }

    const std::string &path() const { return m_path; }

private:
    std::string m_path;
    std::vector<std::string> m_files;
};

} /* namespace test */
} /* namespace lanscout */

#endif /* _LANSCOUT_TEST_UTILS_HPP_ */
