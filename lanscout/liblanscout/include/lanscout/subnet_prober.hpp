/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file subnet_prober.hpp
 * @brief Active discovery of the hosts of the local /24 subnet
 *
 * Every host address prefix.1 .. prefix.254 is probed concurrently with a short TCP connect. A host that accepts
 * or actively refuses the connection is alive; a host that stays silent until the timeout is absent.
 **/

#ifndef _LANSCOUT_SUBNET_PROBER_HPP_
#define _LANSCOUT_SUBNET_PROBER_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"
#include "lanscout/event.hpp"
#include "lanscout/device.hpp"
#include "lanscout/network_state.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/** lanscout namespace */
namespace lanscout
{

struct LANSCOUTAPI ProbeParams final
{
    uint16_t port = LANSCOUT_DEFAULT_PROBE_PORT;
    std::chrono::milliseconds timeout = std::chrono::milliseconds(LANSCOUT_DEFAULT_PROBE_TIMEOUT_MS);
    bool resolve_hostnames = true;
    // Whether a reset (port closed) marks the host alive. Otherwise it is treated like a timeout.
    bool refused_counts_as_alive = true;
};

/** Liveness check and reverse lookup of a single address */
class LANSCOUTAPI HostProbe
{
public:
    virtual ~HostProbe() = default;

    /**
     * Checks whether @a address answers.
     *
     * @return true when the host is alive, false when it is absent. Returns Unexpected of
     *         ::LANSCOUT_SHUTDOWN_EVENT_SIGNALED when the probe was cancelled, or another status when the probe could
     *         not be issued at all.
     */
    virtual Expected<bool> probe(const std::string &address) = 0;

    /**
     * Best effort reverse lookup. Never fails: returns ::UNRESOLVED_HOSTNAME when no name is found or when the
     * lookup only echoes the address back.
     */
    virtual std::string resolve_hostname(const std::string &address) = 0;
};

/** HostProbe issuing a non-blocking TCP connect to a fixed port */
class LANSCOUTAPI TcpHostProbe final : public HostProbe
{
public:
    /**
     * @param[in] params            Port and connect timeout.
     * @param[in] shutdown_event    Optional. When signaled, in-flight connects return immediately.
     */
    TcpHostProbe(const ProbeParams &params, EventPtr shutdown_event);

    virtual Expected<bool> probe(const std::string &address) override;
    virtual std::string resolve_hostname(const std::string &address) override;

private:
    const ProbeParams m_params;
    EventPtr m_shutdown_event;
};

class LANSCOUTAPI SubnetProber final
{
public:
    static Expected<std::unique_ptr<SubnetProber>> create(const ProbeParams &params, const std::string &interface_name,
        EventPtr shutdown_event);

    SubnetProber(std::shared_ptr<NetworkStateProvider> network_state, std::shared_ptr<HostProbe> host_probe,
        bool resolve_hostnames, EventPtr shutdown_event);

    SubnetProber(const SubnetProber &) = delete;
    SubnetProber &operator=(const SubnetProber &) = delete;

    /**
     * Picks the /24 prefix (text before the last dot) of the first non-loopback IPv4 address in @a addresses.
     *
     * @return Upon success, returns the prefix ("192.168.1"). Otherwise, returns Unexpected of
     *         ::LANSCOUT_NO_IPV4_INTERFACES_FOUND.
     */
    static Expected<std::string> derive_subnet_prefix(const std::vector<std::string> &addresses);

    /**
     * Derives the prefix from the network state accessor. Fails with ::LANSCOUT_NO_IPV4_INTERFACES_FOUND when the
     * host has no active network.
     */
    Expected<std::string> derive_subnet_prefix();

    /** Derives the local prefix and probes it */
    Expected<ScanResult> scan();

    /**
     * Probes prefix.1 .. prefix.254 concurrently and returns the hosts that answered, sorted numerically, each
     * online, seen now, and without hardware address.
     * Returns Unexpected of ::LANSCOUT_SHUTDOWN_EVENT_SIGNALED when the shutdown event was signaled during the scan.
     */
    Expected<ScanResult> scan_prefix(const std::string &prefix);

private:
    lanscout_status probe_host(const std::string &address, int64_t scan_time_ms, std::mutex &results_mutex,
        ScanResult &results);

    std::shared_ptr<NetworkStateProvider> m_network_state;
    std::shared_ptr<HostProbe> m_host_probe;
    const bool m_resolve_hostnames;
    EventPtr m_shutdown_event;
};

} /* namespace lanscout */

#endif /* _LANSCOUT_SUBNET_PROBER_HPP_ */
