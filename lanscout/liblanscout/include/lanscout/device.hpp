/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device.hpp
 * @brief Device records produced by the subnet prober and the appliance client
 **/

#ifndef _LANSCOUT_DEVICE_HPP_
#define _LANSCOUT_DEVICE_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"

#include <array>
#include <string>
#include <vector>
#include <cstdint>

/** lanscout namespace */
namespace lanscout
{

/** Hostname reported when reverse lookup fails or only echoes the address back */
static const std::string UNRESOLVED_HOSTNAME = LANSCOUT_UNRESOLVED_HOSTNAME;

/** A host observed on the local network */
struct LANSCOUTAPI DeviceRecord final
{
    /** Dotted quad IPv4 address */
    std::string address;

    /** Resolved hostname, appliance display name, or ::UNRESOLVED_HOSTNAME */
    std::string hostname;

    /**
     * MAC address reported by the appliance. Empty when unknown (always empty on the probe path).
     * Once known it is the record's identity and never changes.
     */
    std::string hardware_address;

    bool online = false;

    /** Wall-clock time of the last observation, in milliseconds since the epoch */
    int64_t last_seen_ms = 0;

    bool has_hardware_address() const
    {
        return !hardware_address.empty();
    }

    bool operator==(const DeviceRecord &other) const
    {
        return (address == other.address) && (hostname == other.hostname) &&
            (hardware_address == other.hardware_address) && (online == other.online) &&
            (last_seen_ms == other.last_seen_ms);
    }
};

/** Ordered list of devices, always sorted by Ipv4Address::sort_key */
using ScanResult = std::vector<DeviceRecord>;

/** Selects which discovery path feeds the displayed device list */
enum class DeviceSource
{
    /** Persisted records written from the appliance device list */
    APPLIANCE,
    /** Transient result of the last subnet probe, never persisted */
    PROBE,
};

LANSCOUTAPI std::string to_string(DeviceSource source);

/** Helpers over dotted quad address strings */
class LANSCOUTAPI Ipv4Address final
{
public:
    Ipv4Address() = delete;

    static constexpr size_t OCTETS_COUNT = 4;
    using Octets = std::array<uint8_t, OCTETS_COUNT>;

    /**
     * Parses a strict dotted quad ("a.b.c.d", each part 0-255).
     *
     * @return Upon success, returns the four octets. Otherwise, returns Unexpected of ::LANSCOUT_INVALID_ARGUMENT.
     */
    static Expected<Octets> parse(const std::string &address);
    static bool is_valid(const std::string &address);

    /**
     * Numeric ordering key: the octets read as a base-1000 number (o0 * 10^9 + o1 * 10^6 + o2 * 10^3 + o3).
     * Parts that are missing or not numeric count as 0, so malformed addresses still sort deterministically.
     */
    static uint64_t sort_key(const std::string &address);

    /** Text before the last dot ("192.168.1.17" -> "192.168.1"), or an empty string when there is no dot */
    static std::string prefix_of(const std::string &address);

    static bool has_separator(const std::string &address);
    static bool is_loopback(const std::string &address);

    /** Stable numeric sort of @a devices by address */
    static void sort_devices(ScanResult &devices);
};

/** Current wall-clock time in milliseconds since the epoch */
LANSCOUTAPI int64_t current_epoch_millis();

} /* namespace lanscout */

#endif /* _LANSCOUT_DEVICE_HPP_ */
