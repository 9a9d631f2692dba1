/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
#include <arpa/inet.h>
#include <netinet/in.h>
#include <ifaddrs.h>
#include <unistd.h>
#include <errno.h>

#include "lanscout/lanscout.h"
#include "common/utils.hpp"
#include "common/logger_macros.hpp"
#include "common/ethernet_utils.hpp"
#include "common/socket.hpp"

#include <memory>

namespace lanscout
{

Expected<std::vector<Ipv4Interface>> EthernetUtils::get_ipv4_interfaces()
{
    struct ifaddrs *raw_addresses = nullptr;
    auto posix_rc = getifaddrs(&raw_addresses);
    CHECK_AS_EXPECTED(0 == posix_rc, LANSCOUT_ETH_FAILURE, "getifaddrs failed. errno: {:#x}", errno);
    auto addresses = std::unique_ptr<struct ifaddrs, decltype(&freeifaddrs)>(raw_addresses, &freeifaddrs);

    std::vector<Ipv4Interface> interfaces;
    for (auto entry = addresses.get(); nullptr != entry; entry = entry->ifa_next) {
        if ((nullptr == entry->ifa_addr) || (AF_INET != entry->ifa_addr->sa_family)) {
            continue;
        }

        char address[IPV4_STRING_MAX_LENGTH] = {};
        auto status = Socket::ntop(AF_INET, &reinterpret_cast<struct sockaddr_in*>(entry->ifa_addr)->sin_addr,
            address, sizeof(address));
        CHECK_SUCCESS_AS_EXPECTED(status);

        Ipv4Interface interface{};
        interface.name = entry->ifa_name;
        interface.address = address;
        interface.is_up = (0 != (entry->ifa_flags & IFF_UP)) && (0 != (entry->ifa_flags & IFF_RUNNING));
        interface.is_loopback = (0 != (entry->ifa_flags & IFF_LOOPBACK));
        LOGGER__TRACE("Interface {} | IP: {} | up: {} | loopback: {}", interface.name, interface.address,
            interface.is_up, interface.is_loopback);
        interfaces.emplace_back(std::move(interface));
    }

    return interfaces;
}

} /* namespace lanscout */
