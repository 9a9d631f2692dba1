/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file ethernet_utils.hpp
 * @brief Host network interface queries
 **/

#ifndef __OS_ETHERNET_UTILS_H__
#define __OS_ETHERNET_UTILS_H__

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"

#include <net/if.h>
#include <string>
#include <vector>

namespace lanscout
{

struct Ipv4Interface final
{
    std::string name;
    std::string address;
    bool is_up;
    bool is_loopback;
};

class EthernetUtils final
{
public:
    EthernetUtils() = delete;

    // Every interface carrying an IPv4 address, in the order the kernel reports them
    static Expected<std::vector<Ipv4Interface>> get_ipv4_interfaces();
};

} /* namespace lanscout */

#endif /* __OS_ETHERNET_UTILS_H__ */
