/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file mdns_discovery.cpp
 * @brief DNS-SD browse through the avahi daemon
 **/

#include "lanscout/service_discovery.hpp"

#include "common/utils.hpp"
#include "common/logger_macros.hpp"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/simple-watch.h>
#include <avahi-common/address.h>
#include <avahi-common/error.h>

#include <net/if.h>

namespace lanscout
{

/* Upper bound on a single event loop iteration, so the shutdown event is noticed */
#define AVAHI_POLL_SLICE_MS (50)
#define DEFAULT_DNS_SD_DOMAIN "local"

using AvahiSimplePollPtr = std::unique_ptr<AvahiSimplePoll, decltype(&avahi_simple_poll_free)>;
using AvahiClientPtr = std::unique_ptr<AvahiClient, decltype(&avahi_client_free)>;
using AvahiServiceBrowserPtr = std::unique_ptr<AvahiServiceBrowser, decltype(&avahi_service_browser_free)>;

namespace
{

struct BrowseContext final
{
    explicit BrowseContext(AvahiSimplePoll *poll) :
        poll(poll)
    {}

    void finish(lanscout_status final_status)
    {
        done = true;
        status = final_status;
        avahi_simple_poll_quit(poll);
    }

    AvahiSimplePoll *poll;
    bool done = false;
    lanscout_status status = LANSCOUT_APPLIANCE_NOT_FOUND;
    ApplianceEndpoint endpoint;
    uint16_t advertised_port = 0;
};

} /* namespace */

std::string ApplianceEndpoint::base_url() const
{
    return fmt::format("https://{}:{}", host, https_port);
}

static void on_client_state(AvahiClient *client, AvahiClientState state, void *userdata)
{
    auto context = static_cast<BrowseContext*>(userdata);
    if (AVAHI_CLIENT_FAILURE == state) {
        LOGGER__WARNING("Lost connection to the mDNS daemon: {}", avahi_strerror(avahi_client_errno(client)));
        context->finish(LANSCOUT_APPLIANCE_NOT_FOUND);
    }
}

static void on_service_resolved(AvahiServiceResolver *resolver, AvahiIfIndex /*interface*/,
    AvahiProtocol /*protocol*/, AvahiResolverEvent event, const char *name, const char *type, const char *domain,
    const char *host_name, const AvahiAddress *address, uint16_t port, AvahiStringList * /*txt*/,
    AvahiLookupResultFlags /*flags*/, void *userdata)
{
    auto context = static_cast<BrowseContext*>(userdata);
    if (AVAHI_RESOLVER_FAILURE == event) {
        LOGGER__DEBUG("Failed resolving {}: {}", name,
            avahi_strerror(avahi_client_errno(avahi_service_resolver_get_client(resolver))));
    } else if (!context->done && (nullptr != address) && (AVAHI_PROTO_INET == address->proto)) {
        char host[AVAHI_ADDRESS_STR_MAX] = {};
        avahi_address_snprint(host, sizeof(host), address);
        context->endpoint.instance_name = fmt::format("{}.{}.{}", name, type, domain);
        context->endpoint.host = host;
        context->advertised_port = port;
        LOGGER__DEBUG("Resolved {} to {} ({})", context->endpoint.instance_name, host, host_name);
        context->finish(LANSCOUT_SUCCESS);
    }
    avahi_service_resolver_free(resolver);
}

static void on_service_event(AvahiServiceBrowser *browser, AvahiIfIndex interface, AvahiProtocol protocol,
    AvahiBrowserEvent event, const char *name, const char *type, const char *domain,
    AvahiLookupResultFlags /*flags*/, void *userdata)
{
    auto context = static_cast<BrowseContext*>(userdata);
    auto client = avahi_service_browser_get_client(browser);
    switch (event) {
    case AVAHI_BROWSER_NEW:
        LOGGER__DEBUG("Found instance {} of {}", name, type);
        // The resolver frees itself from its callback, pending ones go away with the client
        if (nullptr == avahi_service_resolver_new(client, interface, protocol, name, type, domain, AVAHI_PROTO_INET,
                static_cast<AvahiLookupFlags>(0), on_service_resolved, userdata)) {
            LOGGER__WARNING("Failed resolving {}: {}", name, avahi_strerror(avahi_client_errno(client)));
        }
        break;
    case AVAHI_BROWSER_FAILURE:
        LOGGER__WARNING("Browsing {} failed: {}", type, avahi_strerror(avahi_client_errno(client)));
        context->finish(LANSCOUT_APPLIANCE_NOT_FOUND);
        break;
    case AVAHI_BROWSER_REMOVE:
    case AVAHI_BROWSER_CACHE_EXHAUSTED:
    case AVAHI_BROWSER_ALL_FOR_NOW:
        break;
    }
}

MdnsServiceDiscovery::MdnsServiceDiscovery(const MdnsDiscoveryParams &params, EventPtr shutdown_event) :
    m_params(params),
    m_shutdown_event(shutdown_event)
{}

Expected<DnsSdServiceType> MdnsServiceDiscovery::split_service_type(const std::string &service_type)
{
    static const std::vector<std::string> PROTOCOL_LABELS = {"._tcp", "._udp"};

    auto name = service_type;
    if (!name.empty() && ('.' == name.back())) {
        name.pop_back();
    }

    size_t protocol_end = std::string::npos;
    for (const auto &label : PROTOCOL_LABELS) {
        const auto position = name.find(label);
        if (std::string::npos != position) {
            protocol_end = position + label.size();
            break;
        }
    }
    CHECK_AS_EXPECTED((std::string::npos != protocol_end) && ('_' == name.front()), LANSCOUT_INVALID_ARGUMENT,
        "Invalid DNS-SD service type '{}'", service_type);

    DnsSdServiceType result{};
    result.type = name.substr(0, protocol_end);
    if (name.size() == protocol_end) {
        result.domain = DEFAULT_DNS_SD_DOMAIN;
    } else {
        CHECK_AS_EXPECTED(('.' == name[protocol_end]) && ((protocol_end + 1) < name.size()),
            LANSCOUT_INVALID_ARGUMENT, "Invalid DNS-SD service type '{}'", service_type);
        result.domain = name.substr(protocol_end + 1);
    }
    return result;
}

Expected<ApplianceEndpoint> MdnsServiceDiscovery::discover(std::chrono::milliseconds timeout)
{
    TRY(const auto service, split_service_type(m_params.service_type));

    if ((nullptr != m_shutdown_event) && m_shutdown_event->is_signalled()) {
        LOGGER__INFO("Appliance discovery aborted");
        return make_unexpected(LANSCOUT_SHUTDOWN_EVENT_SIGNALED);
    }

    AvahiIfIndex interface_index = AVAHI_IF_UNSPEC;
    if (!m_params.interface_name.empty()) {
        const auto index = if_nametoindex(m_params.interface_name.c_str());
        CHECK_AS_EXPECTED(0 != index, LANSCOUT_INVALID_ARGUMENT, "Unknown interface {}", m_params.interface_name);
        interface_index = static_cast<AvahiIfIndex>(index);
    }

    AvahiSimplePollPtr poll(avahi_simple_poll_new(), avahi_simple_poll_free);
    CHECK_NOT_NULL_AS_EXPECTED(poll, LANSCOUT_OUT_OF_HOST_MEMORY);

    // Declared before the client, the client callback may fire from within avahi_client_new
    BrowseContext context(poll.get());

    int error = 0;
    AvahiClientPtr client(avahi_client_new(avahi_simple_poll_get(poll.get()), static_cast<AvahiClientFlags>(0),
        on_client_state, &context, &error), avahi_client_free);
    if (nullptr == client) {
        LOGGER__WARNING("mDNS daemon unavailable: {}", avahi_strerror(error));
        return make_unexpected(LANSCOUT_APPLIANCE_NOT_FOUND);
    }

    AvahiServiceBrowserPtr browser(avahi_service_browser_new(client.get(), interface_index, AVAHI_PROTO_INET,
        service.type.c_str(), service.domain.c_str(), static_cast<AvahiLookupFlags>(0), on_service_event, &context),
        avahi_service_browser_free);
    if (nullptr == browser) {
        LOGGER__WARNING("Failed browsing {}: {}", m_params.service_type,
            avahi_strerror(avahi_client_errno(client.get())));
        return make_unexpected(LANSCOUT_APPLIANCE_NOT_FOUND);
    }

    LOGGER__DEBUG("Browsing {} in domain {} for {}ms", service.type, service.domain, timeout.count());
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!context.done) {
        if ((nullptr != m_shutdown_event) && m_shutdown_event->is_signalled()) {
            LOGGER__INFO("Appliance discovery aborted");
            return make_unexpected(LANSCOUT_SHUTDOWN_EVENT_SIGNALED);
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        const auto slice = std::min(remaining, std::chrono::milliseconds(AVAHI_POLL_SLICE_MS));
        const auto rc = avahi_simple_poll_iterate(poll.get(), static_cast<int>(slice.count()));
        if (0 > rc) {
            LOGGER__WARNING("mDNS event loop failed ({})", rc);
            return make_unexpected(LANSCOUT_APPLIANCE_NOT_FOUND);
        } else if (1 == rc) {
            break;
        }
    }

    if (!context.done) {
        LOGGER__WARNING("No {} instance resolved within {}ms", m_params.service_type, timeout.count());
        return make_unexpected(LANSCOUT_APPLIANCE_NOT_FOUND);
    }
    CHECK_SUCCESS_AS_EXPECTED(context.status);

    ApplianceEndpoint endpoint = context.endpoint;
    endpoint.https_port = m_params.https_port;
    LOGGER__INFO("Found appliance {} at {} (advertised port {}, using {})", endpoint.instance_name, endpoint.host,
        context.advertised_port, endpoint.https_port);
    return endpoint;
}

StaticServiceDiscovery::StaticServiceDiscovery(const ApplianceEndpoint &endpoint) :
    m_endpoint(endpoint)
{}

Expected<ApplianceEndpoint> StaticServiceDiscovery::discover(std::chrono::milliseconds /*timeout*/)
{
    CHECK_AS_EXPECTED(!m_endpoint.host.empty(), LANSCOUT_APPLIANCE_NOT_FOUND, "No appliance host configured");
    return ApplianceEndpoint(m_endpoint);
}

} /* namespace lanscout */
