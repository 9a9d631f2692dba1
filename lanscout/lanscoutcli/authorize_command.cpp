/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file authorize_command.cpp
 * @brief Appliance authorization commands
 **/
#include "authorize_command.hpp"

#include <iostream>


AuthorizeSubcommand::AuthorizeSubcommand(CLI::App &parent_app) :
    ConfiguredCommand(parent_app.add_subcommand("authorize",
        "Registers lanscout on the network appliance (requires confirmation on the appliance)"))
{
    m_app->add_option("--host", m_host, "Appliance address, skips mDNS discovery")
        ->check(CLI::ValidIPV4);
}

lanscout_status AuthorizeSubcommand::execute_with_config(const LanscoutConfig &config, EventPtr shutdown_event)
{
    auto authorize_config = config;
    if (!m_host.empty()) {
        authorize_config.appliance.host = m_host;
    }

    TRY(auto coordinator, ScanCoordinator::create(authorize_config, true, shutdown_event));
    auto client = coordinator->appliance_client();
    CHECK_NOT_NULL(client, LANSCOUT_INTERNAL_FAILURE);

    client->set_state_observer([](const AuthorizationState &previous, const AuthorizationState &current) {
        std::cout << "[" << to_string(previous) << "] -> [" << to_string(current) << "]" << std::endl;
        if (current.is(AuthorizationStateType::AUTHORIZING)) {
            std::cout << "Please confirm the authorization request on the appliance front panel..." << std::endl;
        }
    });

    auto status = client->start();
    if (LANSCOUT_SHUTDOWN_EVENT_SIGNALED == status) {
        std::cout << "Authorization aborted" << std::endl;
        return status;
    }
    CHECK_SUCCESS(status, "Authorization failed");

    std::cout << "Authorized" << std::endl;
    return LANSCOUT_SUCCESS;
}

ForgetSubcommand::ForgetSubcommand(CLI::App &parent_app) :
    ConfiguredCommand(parent_app.add_subcommand("forget",
        "Forgets the appliance authorization and clears the device history"))
{}

lanscout_status ForgetSubcommand::execute_with_config(const LanscoutConfig &config, EventPtr shutdown_event)
{
    TRY(auto coordinator, ScanCoordinator::create(config, true, shutdown_event));
    auto status = coordinator->forget();
    CHECK_SUCCESS(status);

    std::cout << "Appliance authorization and device history cleared" << std::endl;
    return LANSCOUT_SUCCESS;
}
