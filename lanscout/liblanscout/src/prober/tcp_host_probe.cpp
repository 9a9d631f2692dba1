/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file tcp_host_probe.cpp
 * @brief TCP connect liveness probe and reverse lookup
 **/

#include "lanscout/subnet_prober.hpp"

#include "common/utils.hpp"
#include "common/socket.hpp"

#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/in.h>

namespace lanscout
{

TcpHostProbe::TcpHostProbe(const ProbeParams &params, EventPtr shutdown_event) :
    m_params(params),
    m_shutdown_event(shutdown_event)
{}

Expected<bool> TcpHostProbe::probe(const std::string &address)
{
    struct sockaddr_in host_addr = {};
    host_addr.sin_family = AF_INET;
    host_addr.sin_port = htons(m_params.port);
    auto status = Socket::pton(AF_INET, address.c_str(), &host_addr.sin_addr);
    CHECK_SUCCESS_AS_EXPECTED(status, "Invalid probe address {}", address);

    // The socket is released on every return path
    TRY(auto socket, Socket::create(AF_INET, SOCK_STREAM, IPPROTO_TCP));

    status = socket.connect_with_timeout(reinterpret_cast<const sockaddr*>(&host_addr), sizeof(host_addr),
        m_params.timeout, m_shutdown_event);
    switch (status) {
    case LANSCOUT_SUCCESS:
        LOGGER__TRACE("{}:{} accepted the connection", address, m_params.port);
        return true;
    case LANSCOUT_CONNECTION_REFUSED:
        LOGGER__TRACE("{}:{} refused the connection", address, m_params.port);
        return bool(m_params.refused_counts_as_alive);
    case LANSCOUT_TIMEOUT:
    case LANSCOUT_ETH_FAILURE:
        return false;
    case LANSCOUT_SHUTDOWN_EVENT_SIGNALED:
        return make_unexpected(status);
    default:
        LOGGER__ERROR("Probing {} failed with status {}", address, status);
        return make_unexpected(status);
    }
}

std::string TcpHostProbe::resolve_hostname(const std::string &address)
{
    struct sockaddr_in host_addr = {};
    host_addr.sin_family = AF_INET;
    if (1 != inet_pton(AF_INET, address.c_str(), &host_addr.sin_addr)) {
        return UNRESOLVED_HOSTNAME;
    }

    char host_name[NI_MAXHOST] = {};
    auto rc = getnameinfo(reinterpret_cast<const sockaddr*>(&host_addr), sizeof(host_addr), host_name,
        sizeof(host_name), nullptr, 0, NI_NAMEREQD);
    if (0 != rc) {
        LOGGER__TRACE("Reverse lookup of {} failed: {}", address, gai_strerror(rc));
        return UNRESOLVED_HOSTNAME;
    }

    const std::string resolved(host_name);
    if (resolved.empty() || (resolved == address)) {
        return UNRESOLVED_HOSTNAME;
    }
    return resolved;
}

} /* namespace lanscout */
