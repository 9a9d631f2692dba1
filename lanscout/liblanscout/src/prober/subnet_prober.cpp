/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file subnet_prober.cpp
 * @brief Concurrent fan-out / fan-in probing of a /24 subnet
 **/

#include "lanscout/subnet_prober.hpp"

#include "common/utils.hpp"
#include "common/async_thread.hpp"

namespace lanscout
{

static const std::string PROBE_THREAD_NAME = "LS_PROBE";

Expected<std::unique_ptr<SubnetProber>> SubnetProber::create(const ProbeParams &params,
    const std::string &interface_name, EventPtr shutdown_event)
{
    CHECK_AS_EXPECTED(0 != params.port, LANSCOUT_INVALID_ARGUMENT, "Probe port must not be 0");
    CHECK_AS_EXPECTED(params.timeout.count() > 0, LANSCOUT_INVALID_ARGUMENT, "Probe timeout must be positive");

    auto network_state = make_shared_nothrow<SystemNetworkState>(interface_name);
    CHECK_NOT_NULL_AS_EXPECTED(network_state, LANSCOUT_OUT_OF_HOST_MEMORY);

    auto host_probe = make_shared_nothrow<TcpHostProbe>(params, shutdown_event);
    CHECK_NOT_NULL_AS_EXPECTED(host_probe, LANSCOUT_OUT_OF_HOST_MEMORY);

    auto prober = make_unique_nothrow<SubnetProber>(network_state, host_probe, params.resolve_hostnames,
        shutdown_event);
    CHECK_NOT_NULL_AS_EXPECTED(prober, LANSCOUT_OUT_OF_HOST_MEMORY);

    return prober;
}

SubnetProber::SubnetProber(std::shared_ptr<NetworkStateProvider> network_state,
    std::shared_ptr<HostProbe> host_probe, bool resolve_hostnames, EventPtr shutdown_event) :
    m_network_state(std::move(network_state)),
    m_host_probe(std::move(host_probe)),
    m_resolve_hostnames(resolve_hostnames),
    m_shutdown_event(std::move(shutdown_event))
{}

Expected<std::string> SubnetProber::derive_subnet_prefix(const std::vector<std::string> &addresses)
{
    for (const auto &address : addresses) {
        if (!Ipv4Address::is_valid(address) || Ipv4Address::is_loopback(address)) {
            continue;
        }
        return Ipv4Address::prefix_of(address);
    }

    LOGGER__ERROR("No non-loopback IPv4 address found, cannot derive subnet");
    return make_unexpected(LANSCOUT_NO_IPV4_INTERFACES_FOUND);
}

Expected<std::string> SubnetProber::derive_subnet_prefix()
{
    CHECK_AS_EXPECTED(m_network_state->has_active_network(), LANSCOUT_NO_IPV4_INTERFACES_FOUND,
        "No active network");

    TRY(const auto addresses, m_network_state->get_local_addresses());
    return derive_subnet_prefix(addresses);
}

Expected<ScanResult> SubnetProber::scan()
{
    TRY(const auto prefix, derive_subnet_prefix());
    return scan_prefix(prefix);
}

lanscout_status SubnetProber::probe_host(const std::string &address, int64_t scan_time_ms,
    std::mutex &results_mutex, ScanResult &results)
{
    auto alive = m_host_probe->probe(address);
    if (LANSCOUT_SHUTDOWN_EVENT_SIGNALED == alive.status()) {
        return LANSCOUT_SHUTDOWN_EVENT_SIGNALED;
    }
    if (!alive) {
        // One failed probe never affects the others
        LOGGER__DEBUG("Probe of {} failed with status {}, treating as absent", address, alive.status());
        return LANSCOUT_SUCCESS;
    }
    if (!alive.value()) {
        return LANSCOUT_SUCCESS;
    }

    DeviceRecord record{};
    record.address = address;
    record.hostname = m_resolve_hostnames ? m_host_probe->resolve_hostname(address) : UNRESOLVED_HOSTNAME;
    record.online = true;
    record.last_seen_ms = scan_time_ms;

    std::unique_lock<std::mutex> lock(results_mutex);
    results.emplace_back(std::move(record));
    return LANSCOUT_SUCCESS;
}

Expected<ScanResult> SubnetProber::scan_prefix(const std::string &prefix)
{
    CHECK_AS_EXPECTED(!prefix.empty(), LANSCOUT_INVALID_ARGUMENT, "Empty subnet prefix");
    CHECK_AS_EXPECTED(Ipv4Address::is_valid(prefix + ".0"), LANSCOUT_INVALID_ARGUMENT,
        "Subnet prefix {} is not three octets", prefix);

    LOGGER__INFO("Probing {}.{}-{}", prefix, LANSCOUT_FIRST_HOST_OCTET, LANSCOUT_LAST_HOST_OCTET);

    const auto scan_time_ms = current_epoch_millis();
    std::mutex results_mutex;
    ScanResult results;
    results.reserve(LANSCOUT_MAX_SUBNET_HOSTS);

    std::vector<AsyncThreadPtr<lanscout_status>> probes;
    probes.reserve(LANSCOUT_MAX_SUBNET_HOSTS);
    for (uint32_t host = LANSCOUT_FIRST_HOST_OCTET; host <= LANSCOUT_LAST_HOST_OCTET; host++) {
        const auto address = fmt::format("{}.{}", prefix, host);
        auto probe = make_unique_nothrow<AsyncThread<lanscout_status>>(PROBE_THREAD_NAME,
            [this, address, scan_time_ms, &results_mutex, &results]() {
                return probe_host(address, scan_time_ms, results_mutex, results);
            });
        if (nullptr == probe) {
            LOGGER__ERROR("Failed allocating probe of {}", address);
            // Threads already started are joined by their destructors
            return make_unexpected(LANSCOUT_OUT_OF_HOST_MEMORY);
        }
        probes.emplace_back(std::move(probe));
    }

    bool shutdown_signaled = false;
    for (auto &probe : probes) {
        if (LANSCOUT_SHUTDOWN_EVENT_SIGNALED == probe->get()) {
            shutdown_signaled = true;
        }
    }
    if (shutdown_signaled || ((nullptr != m_shutdown_event) && m_shutdown_event->is_signalled())) {
        LOGGER__INFO("Subnet scan of {} was aborted", prefix);
        return make_unexpected(LANSCOUT_SHUTDOWN_EVENT_SIGNALED);
    }

    Ipv4Address::sort_devices(results);
    LOGGER__INFO("Subnet scan of {} found {} hosts", prefix, results.size());
    return results;
}

} /* namespace lanscout */
