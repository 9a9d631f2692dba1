/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file config.hpp
 * @brief lanscout configuration file
 *
 * Every key is optional, a missing key keeps its default:
 * @code
 * {
 *     "probe": { "port": 135, "timeout_ms": 50, "interface": "", "resolve_hostnames": true,
 *                "refused_counts_as_alive": true },
 *     "appliance": { "service_type": "_fbx-api._tcp.local", "host": "", "https_port": 443,
 *                    "discovery_timeout_ms": 3000, "poll_interval_ms": 1000, "max_poll_attempts": 0,
 *                    "http_timeout_ms": 5000, "verify_tls": false, "ca_file": "",
 *                    "app_id": "com.example.lanscanner", "app_name": "LAN Scanner", "app_version": "1.0.0",
 *                    "device_name": "" },
 *     "storage": { "directory": "~/.lanscout", "device_store": "devices.json", "token_store": "app_token.json",
 *                  "vendor_database": "" },
 *     "policy": { "fallback_to_probe": true }
 * }
 * @endcode
 **/

#ifndef _LANSCOUT_CONFIG_HPP_
#define _LANSCOUT_CONFIG_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"
#include "lanscout/subnet_prober.hpp"
#include "lanscout/service_discovery.hpp"
#include "lanscout/http_transport.hpp"
#include "lanscout/appliance_client.hpp"

#include <string>

/** lanscout namespace */
namespace lanscout
{

struct LANSCOUTAPI ProbeConfig final
{
    ProbeParams params;
    /** Restricts subnet derivation to one interface. Empty means any interface that is up. */
    std::string interface_name;
};

struct LANSCOUTAPI ApplianceConfig final
{
    MdnsDiscoveryParams discovery;
    /** Known appliance address. When set, mDNS discovery is skipped. */
    std::string host;
    HttpTransportParams http;
    ApplianceClientParams client;
};

struct LANSCOUTAPI StorageConfig final
{
    std::string directory = "~/.lanscout";
    std::string device_store = "devices.json";
    std::string token_store = "app_token.json";
    /** OUI database. Empty disables vendor names. */
    std::string vendor_database;

    /** @a file_name inside the expanded storage directory */
    std::string path_of(const std::string &file_name) const;
};

struct LANSCOUTAPI PolicyConfig final
{
    /** Probe the subnet when the appliance path fails */
    bool fallback_to_probe = true;
};

struct LANSCOUTAPI LanscoutConfig final
{
    ProbeConfig probe;
    ApplianceConfig appliance;
    StorageConfig storage;
    PolicyConfig policy;

    /** Defaults, with the device name set to the host name */
    static LanscoutConfig defaults();

    /**
     * Parses a configuration document over the defaults.
     * Returns Unexpected of ::LANSCOUT_INVALID_CONFIG on malformed JSON, wrong value types or out of range values.
     */
    static Expected<LanscoutConfig> parse(const std::string &content);

    static Expected<LanscoutConfig> load_file(const std::string &file_path);

    /**
     * Loads @a explicit_path when given, else $LANSCOUT_CONFIG_PATH, else ~/.lanscout/config.json.
     * A missing default file yields the defaults; a missing explicit file is an error.
     */
    static Expected<LanscoutConfig> load(const std::string &explicit_path);
};

} /* namespace lanscout */

#endif /* _LANSCOUT_CONFIG_HPP_ */
