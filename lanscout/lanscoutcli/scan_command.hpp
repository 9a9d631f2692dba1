/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file scan_command.hpp
 * @brief Refreshes the device list, through the appliance or the subnet probe
 **/

#ifndef _LANSCOUT_SCAN_COMMAND_HPP_
#define _LANSCOUT_SCAN_COMMAND_HPP_

#include "lanscoutcli.hpp"
#include "command.hpp"
#include "CLI/CLI.hpp"


class ScanSubcommand final : public ConfiguredCommand {
public:
    explicit ScanSubcommand(CLI::App &parent_app);

protected:
    virtual lanscout_status execute_with_config(const LanscoutConfig &config, EventPtr shutdown_event) override;

private:
    bool m_no_appliance;
    bool m_no_fallback;
};

// Probes the local subnet only, never touches the device history
class ProbeSubcommand final : public ConfiguredCommand {
public:
    explicit ProbeSubcommand(CLI::App &parent_app);

protected:
    virtual lanscout_status execute_with_config(const LanscoutConfig &config, EventPtr shutdown_event) override;

private:
    uint16_t m_port;
    uint32_t m_timeout_ms;
    std::string m_prefix;
};

#endif /* _LANSCOUT_SCAN_COMMAND_HPP_ */
