/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file network_state.hpp
 * @brief Access to the host's network connectivity and local IPv4 addresses
 **/

#ifndef _LANSCOUT_NETWORK_STATE_HPP_
#define _LANSCOUT_NETWORK_STATE_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"

#include <memory>
#include <string>
#include <vector>

/** lanscout namespace */
namespace lanscout
{

/** Reports whether the host is connected and which IPv4 addresses it holds */
class LANSCOUTAPI NetworkStateProvider
{
public:
    virtual ~NetworkStateProvider() = default;

    virtual bool has_active_network() = 0;

    /**
     * Returns the local IPv4 addresses (dotted quads) of the active network, loopback addresses included.
     */
    virtual Expected<std::vector<std::string>> get_local_addresses() = 0;
};

/** NetworkStateProvider over the interfaces reported by the kernel */
class LANSCOUTAPI SystemNetworkState final : public NetworkStateProvider
{
public:
    /**
     * @param[in] interface_name    Restricts the addresses to this interface. Empty means every interface.
     */
    explicit SystemNetworkState(const std::string &interface_name = "");

    virtual bool has_active_network() override;
    virtual Expected<std::vector<std::string>> get_local_addresses() override;

private:
    const std::string m_interface_name;
};

} /* namespace lanscout */

#endif /* _LANSCOUT_NETWORK_STATE_HPP_ */
