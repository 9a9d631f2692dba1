/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file curl_http_transport.cpp
 * @brief HttpTransport over libcurl easy handles
 **/

#include "lanscout/http_transport.hpp"

#include "common/utils.hpp"

#include <curl/curl.h>

#include <mutex>

namespace lanscout
{

// curl_global_init is not thread safe, and must be balanced by curl_global_cleanup
static std::mutex g_curl_global_mutex;
static uint32_t g_curl_global_users = 0;

static lanscout_status acquire_curl_global()
{
    std::unique_lock<std::mutex> lock(g_curl_global_mutex);
    if (0 == g_curl_global_users) {
        auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        CHECK(CURLE_OK == rc, LANSCOUT_HTTP_FAILURE, "curl_global_init failed: {}", curl_easy_strerror(rc));
    }
    g_curl_global_users++;
    return LANSCOUT_SUCCESS;
}

static void release_curl_global()
{
    std::unique_lock<std::mutex> lock(g_curl_global_mutex);
    if (0 == g_curl_global_users) {
        return;
    }
    g_curl_global_users--;
    if (0 == g_curl_global_users) {
        curl_global_cleanup();
    }
}

static size_t write_callback(void *contents, size_t size, size_t nmemb, void *user_data)
{
    auto body = static_cast<std::string*>(user_data);
    body->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

struct CurlEasyDeleter
{
    void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter
{
    void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

#define CHECK_CURL_OPT(setopt_call)                                                                             \
    do {                                                                                                        \
        const CURLcode __curl_rc = (setopt_call);                                                               \
        CHECK_AS_EXPECTED(CURLE_OK == __curl_rc, LANSCOUT_HTTP_FAILURE, "{} failed: {}", #setopt_call,          \
            curl_easy_strerror(__curl_rc));                                                                     \
    } while (0)

Expected<std::shared_ptr<CurlHttpTransport>> CurlHttpTransport::create(const HttpTransportParams &params)
{
    CHECK_AS_EXPECTED(params.timeout.count() > 0, LANSCOUT_INVALID_ARGUMENT, "HTTP timeout must be positive");

    auto status = LANSCOUT_UNINITIALIZED;
    auto transport = make_shared_nothrow<CurlHttpTransport>(params, status);
    CHECK_NOT_NULL_AS_EXPECTED(transport, LANSCOUT_OUT_OF_HOST_MEMORY);
    CHECK_SUCCESS_AS_EXPECTED(status);

    return transport;
}

CurlHttpTransport::CurlHttpTransport(const HttpTransportParams &params, lanscout_status &status) :
    m_params(params),
    m_global_initialized(false)
{
    status = acquire_curl_global();
    if (LANSCOUT_SUCCESS != status) {
        return;
    }
    m_global_initialized = true;
}

CurlHttpTransport::~CurlHttpTransport()
{
    if (m_global_initialized) {
        release_curl_global();
    }
}

Expected<HttpResponse> CurlHttpTransport::get(const std::string &url, const HttpHeaders &headers)
{
    return perform(url, nullptr, headers);
}

Expected<HttpResponse> CurlHttpTransport::post_json(const std::string &url, const std::string &body,
    const HttpHeaders &headers)
{
    auto json_headers = headers;
    json_headers["Content-Type"] = "application/json";
    return perform(url, &body, json_headers);
}

Expected<HttpResponse> CurlHttpTransport::perform(const std::string &url, const std::string *post_body,
    const HttpHeaders &headers)
{
    CurlEasyPtr curl(curl_easy_init());
    CHECK_NOT_NULL_AS_EXPECTED(curl, LANSCOUT_HTTP_FAILURE);

    CurlSlistPtr header_list;
    for (const auto &header : headers) {
        const auto line = fmt::format("{}: {}", header.first, header.second);
        auto appended = curl_slist_append(header_list.get(), line.c_str());
        CHECK_NOT_NULL_AS_EXPECTED(appended, LANSCOUT_OUT_OF_HOST_MEMORY);
        // The list head stays the same after the first append
        header_list.release();
        header_list.reset(appended);
    }

    HttpResponse response{};
    char error_buffer[CURL_ERROR_SIZE] = {};

    CHECK_CURL_OPT(curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str()));
    CHECK_CURL_OPT(curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer));
    CHECK_CURL_OPT(curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L));
    CHECK_CURL_OPT(curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(m_params.timeout.count())));
    CHECK_CURL_OPT(curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback));
    CHECK_CURL_OPT(curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body));
    CHECK_CURL_OPT(curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, m_params.verify_tls ? 1L : 0L));
    CHECK_CURL_OPT(curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, m_params.verify_tls ? 2L : 0L));
    if (!m_params.ca_file.empty()) {
        CHECK_CURL_OPT(curl_easy_setopt(curl.get(), CURLOPT_CAINFO, m_params.ca_file.c_str()));
    }
    if (nullptr != header_list) {
        CHECK_CURL_OPT(curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get()));
    }
    if (nullptr != post_body) {
        CHECK_CURL_OPT(curl_easy_setopt(curl.get(), CURLOPT_POST, 1L));
        CHECK_CURL_OPT(curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, post_body->c_str()));
        CHECK_CURL_OPT(curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size())));
    }

    LOGGER__TRACE("{} {}", (nullptr != post_body) ? "POST" : "GET", url);
    auto rc = curl_easy_perform(curl.get());
    if (CURLE_OPERATION_TIMEDOUT == rc) {
        LOGGER__WARNING("Request to {} timed out", url);
        return make_unexpected(LANSCOUT_HTTP_FAILURE);
    }
    CHECK_AS_EXPECTED(CURLE_OK == rc, LANSCOUT_HTTP_FAILURE, "Request to {} failed: {}", url,
        (0 != error_buffer[0]) ? error_buffer : curl_easy_strerror(rc));

    rc = curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    CHECK_AS_EXPECTED(CURLE_OK == rc, LANSCOUT_HTTP_FAILURE, "Failed reading response code: {}",
        curl_easy_strerror(rc));

    LOGGER__TRACE("{} answered {} ({} bytes)", url, response.status_code, response.body.size());
    return response;
}

} /* namespace lanscout */
