/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device.cpp
 * @brief Device record and IPv4 address helpers
 **/

#include "lanscout/device.hpp"

#include "common/utils.hpp"
#include "common/os_utils.hpp"

#include <algorithm>
#include <cctype>

namespace lanscout
{

static const char ADDRESS_SEPARATOR = '.';
static const uint64_t SORT_KEY_RADIX = 1000;
static const uint8_t LOOPBACK_FIRST_OCTET = 127;

std::string to_string(DeviceSource source)
{
    switch (source) {
    case DeviceSource::APPLIANCE:
        return "appliance";
    case DeviceSource::PROBE:
        return "probe";
    }
    return "unknown";
}

static bool is_decimal(const std::string &str)
{
    return !str.empty() && std::all_of(str.begin(), str.end(), [](char ch) { return 0 != ::isdigit(static_cast<unsigned char>(ch)); });
}

Expected<Ipv4Address::Octets> Ipv4Address::parse(const std::string &address)
{
    const auto parts = StringUtils::split(address, ADDRESS_SEPARATOR);
    if (OCTETS_COUNT != parts.size()) {
        return make_unexpected(LANSCOUT_INVALID_ARGUMENT);
    }

    Octets octets{};
    for (size_t i = 0; i < OCTETS_COUNT; i++) {
        // At most 3 digits, so the value never overflows before the range check
        if (!is_decimal(parts[i]) || (parts[i].size() > 3)) {
            return make_unexpected(LANSCOUT_INVALID_ARGUMENT);
        }
        const auto value = std::stoul(parts[i]);
        if (value > UINT8_MAX) {
            return make_unexpected(LANSCOUT_INVALID_ARGUMENT);
        }
        octets[i] = static_cast<uint8_t>(value);
    }

    return octets;
}

bool Ipv4Address::is_valid(const std::string &address)
{
    return parse(address).has_value();
}

uint64_t Ipv4Address::sort_key(const std::string &address)
{
    const auto parts = StringUtils::split(address, ADDRESS_SEPARATOR);

    uint64_t key = 0;
    for (size_t i = 0; i < OCTETS_COUNT; i++) {
        uint64_t part_value = 0;
        if ((i < parts.size()) && is_decimal(parts[i]) && (parts[i].size() <= 3)) {
            part_value = std::stoul(parts[i]);
        }
        key = (key * SORT_KEY_RADIX) + part_value;
    }
    return key;
}

std::string Ipv4Address::prefix_of(const std::string &address)
{
    const auto last_separator = address.find_last_of(ADDRESS_SEPARATOR);
    if (std::string::npos == last_separator) {
        return "";
    }
    return address.substr(0, last_separator);
}

bool Ipv4Address::has_separator(const std::string &address)
{
    return std::string::npos != address.find(ADDRESS_SEPARATOR);
}

bool Ipv4Address::is_loopback(const std::string &address)
{
    auto octets = parse(address);
    return octets && (LOOPBACK_FIRST_OCTET == octets.value()[0]);
}

void Ipv4Address::sort_devices(ScanResult &devices)
{
    std::stable_sort(devices.begin(), devices.end(), [](const DeviceRecord &a, const DeviceRecord &b) {
        return sort_key(a.address) < sort_key(b.address);
    });
}

int64_t current_epoch_millis()
{
    return OsUtils::get_epoch_millis();
}

} /* namespace lanscout */
