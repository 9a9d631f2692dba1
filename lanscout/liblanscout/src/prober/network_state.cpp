/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file network_state.cpp
 * @brief SystemNetworkState implementation
 **/

#include "lanscout/network_state.hpp"

#include "common/utils.hpp"
#include "common/ethernet_utils.hpp"

namespace lanscout
{

SystemNetworkState::SystemNetworkState(const std::string &interface_name) :
    m_interface_name(interface_name)
{}

bool SystemNetworkState::has_active_network()
{
    auto interfaces = EthernetUtils::get_ipv4_interfaces();
    if (!interfaces) {
        LOGGER__WARNING("Failed querying network interfaces, status {}", interfaces.status());
        return false;
    }

    for (const auto &interface : interfaces.value()) {
        if (!m_interface_name.empty() && (m_interface_name != interface.name)) {
            continue;
        }
        if (interface.is_up && !interface.is_loopback) {
            return true;
        }
    }
    return false;
}

Expected<std::vector<std::string>> SystemNetworkState::get_local_addresses()
{
    TRY(const auto interfaces, EthernetUtils::get_ipv4_interfaces());

    std::vector<std::string> addresses;
    for (const auto &interface : interfaces) {
        if (!m_interface_name.empty() && (m_interface_name != interface.name)) {
            continue;
        }
        if (!interface.is_up) {
            continue;
        }
        addresses.push_back(interface.address);
    }

    if (!m_interface_name.empty() && addresses.empty()) {
        LOGGER__WARNING("Interface {} has no IPv4 address or is down", m_interface_name);
    }

    return addresses;
}

} /* namespace lanscout */
