/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file scan_command.cpp
 * @brief Refreshes the device list, through the appliance or the subnet probe
 **/
#include "scan_command.hpp"
#include "device_table.hpp"

#include <iostream>


ScanSubcommand::ScanSubcommand(CLI::App &parent_app) :
    ConfiguredCommand(parent_app.add_subcommand("scan", "Refreshes and shows the devices of the local network")),
    m_no_appliance(false),
    m_no_fallback(false)
{
    m_app->add_flag("--no-appliance", m_no_appliance, "Skip the appliance and probe the local subnet");
    m_app->add_flag("--no-fallback", m_no_fallback, "Fail instead of probing when the appliance is unavailable");
}

lanscout_status ScanSubcommand::execute_with_config(const LanscoutConfig &config, EventPtr shutdown_event)
{
    auto scan_config = config;
    if (m_no_fallback) {
        scan_config.policy.fallback_to_probe = false;
    }

    TRY(auto coordinator, ScanCoordinator::create(scan_config, !m_no_appliance, shutdown_event));
    auto client = coordinator->appliance_client();
    if (nullptr != client) {
        client->set_state_observer([](const AuthorizationState &previous, const AuthorizationState &current) {
            (void)previous;
            if (current.is(AuthorizationStateType::AUTHORIZING)) {
                std::cout << "Please confirm the authorization request on the appliance front panel..." << std::endl;
            }
        });
    }

    auto view = coordinator->scan();
    if (LANSCOUT_SHUTDOWN_EVENT_SIGNALED == view.status()) {
        std::cout << "Scan aborted" << std::endl;
        return LANSCOUT_SHUTDOWN_EVENT_SIGNALED;
    }
    CHECK_EXPECTED_AS_STATUS(view, "Scan failed");

    DeviceTablePrinter printer(DeviceTablePrinter::load_vendor_lookup(config));
    printer.print(view.value(), std::cout);
    return LANSCOUT_SUCCESS;
}

ProbeSubcommand::ProbeSubcommand(CLI::App &parent_app) :
    ConfiguredCommand(parent_app.add_subcommand("probe", "Probes every host of the local /24 subnet")),
    m_port(0),
    m_timeout_ms(0)
{
    m_app->add_option("--port", m_port, "TCP port to connect to (default from configuration)")
        ->check(CLI::Range(1, UINT16_MAX));
    m_app->add_option("--timeout-ms", m_timeout_ms, "Connect timeout per host in milliseconds")
        ->check(CLI::PositiveNumber);
    m_app->add_option("--prefix", m_prefix, "Subnet prefix to probe, e.g. 192.168.1 (default derived from the host)")
        ->check([](const std::string &prefix) {
            return Ipv4Address::is_valid(prefix + ".1") ? std::string() : std::string("Invalid prefix " + prefix);
        });
}

lanscout_status ProbeSubcommand::execute_with_config(const LanscoutConfig &config, EventPtr shutdown_event)
{
    auto params = config.probe.params;
    if (0 != m_port) {
        params.port = m_port;
    }
    if (0 != m_timeout_ms) {
        params.timeout = std::chrono::milliseconds(m_timeout_ms);
    }

    TRY(auto prober, SubnetProber::create(params, config.probe.interface_name, shutdown_event));

    std::string prefix = m_prefix;
    if (prefix.empty()) {
        TRY(prefix, prober->derive_subnet_prefix(), "Failed finding the local subnet");
    }
    std::cout << "Probing " << prefix << ".1-254 on port " << params.port << "..." << std::endl;

    auto result = prober->scan_prefix(prefix);
    if (LANSCOUT_SHUTDOWN_EVENT_SIGNALED == result.status()) {
        std::cout << "Probe aborted" << std::endl;
        return LANSCOUT_SHUTDOWN_EVENT_SIGNALED;
    }
    CHECK_EXPECTED_AS_STATUS(result, "Probe failed");

    DeviceView view{};
    view.source = DeviceSource::PROBE;
    view.devices = DeviceReconciler::merge(DeviceSource::PROBE, {}, result.value());

    DeviceTablePrinter printer(nullptr);
    printer.print(view, std::cout);
    return LANSCOUT_SUCCESS;
}
