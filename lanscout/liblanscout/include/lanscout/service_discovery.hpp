/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file service_discovery.hpp
 * @brief Location of the router appliance on the local network
 **/

#ifndef _LANSCOUT_SERVICE_DISCOVERY_HPP_
#define _LANSCOUT_SERVICE_DISCOVERY_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"
#include "lanscout/event.hpp"

#include <chrono>
#include <string>
#include <cstdint>

/** lanscout namespace */
namespace lanscout
{

/** A resolved appliance */
struct LANSCOUTAPI ApplianceEndpoint final
{
    /** Service instance name, e.g. "Freebox Server._fbx-api._tcp.local" */
    std::string instance_name;
    /** Dotted quad address of the appliance */
    std::string host;
    uint16_t https_port = LANSCOUT_DEFAULT_APPLIANCE_HTTPS_PORT;

    /** "https://{host}:{port}" */
    std::string base_url() const;
};

class LANSCOUTAPI ServiceDiscovery
{
public:
    virtual ~ServiceDiscovery() = default;

    /**
     * Blocks until the first appliance is resolved or @a timeout passes.
     *
     * @return Upon success, returns the endpoint. Otherwise, returns Unexpected of ::LANSCOUT_APPLIANCE_NOT_FOUND
     *         (also when the discovery mechanism itself is unavailable) or ::LANSCOUT_SHUTDOWN_EVENT_SIGNALED.
     */
    virtual Expected<ApplianceEndpoint> discover(std::chrono::milliseconds timeout) = 0;
};

struct LANSCOUTAPI MdnsDiscoveryParams final
{
    std::string service_type = LANSCOUT_DEFAULT_APPLIANCE_SERVICE_TYPE;
    /** Port of the resulting endpoint. The port advertised in the SRV record is not used. */
    uint16_t https_port = LANSCOUT_DEFAULT_APPLIANCE_HTTPS_PORT;
    /** Interface to browse on. Empty means every interface. */
    std::string interface_name;
};

/** A DNS-SD service type split the way the mDNS daemon expects it */
struct LANSCOUTAPI DnsSdServiceType final
{
    /** e.g. "_fbx-api._tcp" */
    std::string type;
    /** e.g. "local" */
    std::string domain;
};

/**
 * DNS-SD browse through the system mDNS daemon (avahi). The first instance of the service type that resolves to
 * an IPv4 address wins. Browser, resolvers and the daemon connection are released when discover() returns.
 */
class LANSCOUTAPI MdnsServiceDiscovery final : public ServiceDiscovery
{
public:
    MdnsServiceDiscovery(const MdnsDiscoveryParams &params, EventPtr shutdown_event);

    virtual Expected<ApplianceEndpoint> discover(std::chrono::milliseconds timeout) override;

    /**
     * Splits "_fbx-api._tcp.local" into type "_fbx-api._tcp" and domain "local". A missing domain means "local".
     *
     * @return Upon success, returns the split type. Otherwise, returns Unexpected of ::LANSCOUT_INVALID_ARGUMENT.
     */
    static Expected<DnsSdServiceType> split_service_type(const std::string &service_type);

private:
    const MdnsDiscoveryParams m_params;
    EventPtr m_shutdown_event;
};

/** Discovery bypass for a known appliance address */
class LANSCOUTAPI StaticServiceDiscovery final : public ServiceDiscovery
{
public:
    explicit StaticServiceDiscovery(const ApplianceEndpoint &endpoint);

    virtual Expected<ApplianceEndpoint> discover(std::chrono::milliseconds timeout) override;

private:
    const ApplianceEndpoint m_endpoint;
};

} /* namespace lanscout */

#endif /* _LANSCOUT_SERVICE_DISCOVERY_HPP_ */
