/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file devices_command.cpp
 * @brief Shows the stored device history
 **/
#include "devices_command.hpp"
#include "device_table.hpp"

#include <algorithm>
#include <iostream>


DevicesSubcommand::DevicesSubcommand(CLI::App &parent_app) :
    ConfiguredCommand(parent_app.add_subcommand("devices",
        "Shows the devices recorded from the appliance, without network access")),
    m_online_only(false)
{
    m_app->add_flag("--online", m_online_only, "Show only the devices seen online in the last scan");
}

lanscout_status DevicesSubcommand::execute_with_config(const LanscoutConfig &config, EventPtr shutdown_event)
{
    TRY(auto coordinator, ScanCoordinator::create(config, true, shutdown_event));
    auto view = coordinator->current_view();
    if (m_online_only) {
        view.devices.erase(std::remove_if(view.devices.begin(), view.devices.end(),
            [](const DeviceRecord &device) { return !device.online; }), view.devices.end());
    }

    DeviceTablePrinter printer(DeviceTablePrinter::load_vendor_lookup(config));
    printer.print(view, std::cout);
    return LANSCOUT_SUCCESS;
}
