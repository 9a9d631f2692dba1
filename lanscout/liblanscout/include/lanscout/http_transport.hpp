/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file http_transport.hpp
 * @brief HTTP(S) request transport used by the appliance REST client
 **/

#ifndef _LANSCOUT_HTTP_TRANSPORT_HPP_
#define _LANSCOUT_HTTP_TRANSPORT_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>

/** lanscout namespace */
namespace lanscout
{

using HttpHeaders = std::map<std::string, std::string>;

struct LANSCOUTAPI HttpResponse final
{
    long status_code = 0;
    std::string body;

    bool is_success() const { return (status_code >= 200) && (status_code < 300); }
};

class LANSCOUTAPI HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    /**
     * Performs a GET request.
     *
     * @return Upon success, returns the response, whatever its HTTP status. Otherwise, returns Unexpected of
     *         ::LANSCOUT_HTTP_FAILURE when no response was received.
     */
    virtual Expected<HttpResponse> get(const std::string &url, const HttpHeaders &headers) = 0;

    /** Performs a POST request with a JSON body. Same return semantics as get(). */
    virtual Expected<HttpResponse> post_json(const std::string &url, const std::string &body,
        const HttpHeaders &headers) = 0;
};

struct LANSCOUTAPI HttpTransportParams final
{
    std::chrono::milliseconds timeout = std::chrono::milliseconds(LANSCOUT_DEFAULT_HTTP_TIMEOUT_MS);
    /** The appliance certificate is signed by a private CA, so verification is off unless a CA file is given */
    bool verify_tls = false;
    /** PEM file with the appliance root CA. Empty means the system store. */
    std::string ca_file;
};

class LANSCOUTAPI CurlHttpTransport final : public HttpTransport
{
public:
    static Expected<std::shared_ptr<CurlHttpTransport>> create(const HttpTransportParams &params);

    virtual ~CurlHttpTransport();
    CurlHttpTransport(const CurlHttpTransport &) = delete;
    CurlHttpTransport &operator=(const CurlHttpTransport &) = delete;

    virtual Expected<HttpResponse> get(const std::string &url, const HttpHeaders &headers) override;
    virtual Expected<HttpResponse> post_json(const std::string &url, const std::string &body,
        const HttpHeaders &headers) override;

    CurlHttpTransport(const HttpTransportParams &params, lanscout_status &status);

private:
    Expected<HttpResponse> perform(const std::string &url, const std::string *post_body, const HttpHeaders &headers);

    const HttpTransportParams m_params;
    bool m_global_initialized;
};

} /* namespace lanscout */

#endif /* _LANSCOUT_HTTP_TRANSPORT_HPP_ */
