/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file lanscoutcli.cpp
 * @brief lanscout CLI.
 *
 * lanscout command line interface.
 **/
#include "lanscoutcli.hpp"
#include "command.hpp"
#include "scan_command.hpp"
#include "authorize_command.hpp"
#include "devices_command.hpp"

#include "lanscout/lanscout.h"

#include "CLI/CLI.hpp"

#include <sys/eventfd.h>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <memory>


static volatile std::sig_atomic_t shutdown_event_fd = -1;

static void shutdown_signal_handler(int /*signal_number*/)
{
    if (-1 != shutdown_event_fd) {
        (void) eventfd_write(static_cast<int>(shutdown_event_fd), 1);
    }
}

Expected<EventPtr> get_shutdown_event()
{
    static EventPtr shutdown_event = nullptr;
    if (nullptr == shutdown_event) {
        TRY(shutdown_event, Event::create_shared(Event::State::not_signalled));
        shutdown_event_fd = shutdown_event->get_underlying_handle();

        // The handlers stay installed until exit, the event outlives every command
        struct sigaction action = {};
        action.sa_handler = shutdown_signal_handler;
        sigemptyset(&action.sa_mask);
        CHECK_AS_EXPECTED(0 == sigaction(SIGINT, &action, nullptr), LANSCOUT_INTERNAL_FAILURE,
            "Failed installing SIGINT handler, errno = {}", errno);
        CHECK_AS_EXPECTED(0 == sigaction(SIGTERM, &action, nullptr), LANSCOUT_INTERNAL_FAILURE,
            "Failed installing SIGTERM handler, errno = {}", errno);
    }
    return EventPtr(shutdown_event);
}

void add_config_options(CLI::App *app, lanscout_config_params &config_params)
{
    auto group = app->add_option_group("Configuration Options");
    group->add_option("-c,--config", config_params.config_path,
        "Configuration file (default: $LANSCOUT_CONFIG_PATH, then ~/.lanscout/config.json)")
        ->check(CLI::ExistingFile);
    group->add_option("-i,--interface", config_params.interface_name,
        "Network interface used for probing and discovery");
}

Expected<LanscoutConfig> load_config(const lanscout_config_params &config_params)
{
    TRY(auto config, LanscoutConfig::load(config_params.config_path), "Failed loading configuration");
    if (!config_params.interface_name.empty()) {
        config.probe.interface_name = config_params.interface_name;
        config.appliance.discovery.interface_name = config_params.interface_name;
    }
    return config;
}

static bool do_versions_match()
{
    lanscout_version_t liblanscout_version = {};
    auto status = lanscout_get_library_version(&liblanscout_version);
    if (LANSCOUT_SUCCESS != status) {
        std::cerr << "Failed to get liblanscout version" << std::endl;
        return false;
    }

    bool versions_match = ((LANSCOUT_MAJOR_VERSION == liblanscout_version.major) &&
        (LANSCOUT_MINOR_VERSION == liblanscout_version.minor) &&
        (LANSCOUT_REVISION_VERSION == liblanscout_version.revision));
    if (!versions_match) {
        std::cerr << "liblanscout version (" <<
            liblanscout_version.major << "." << liblanscout_version.minor << "." << liblanscout_version.revision <<
            ") does not match lanscout CLI version (" <<
            LANSCOUT_MAJOR_VERSION << "." << LANSCOUT_MINOR_VERSION << "." << LANSCOUT_REVISION_VERSION << ")" << std::endl;
        return false;
    }
    return true;
}

class LanscoutCLI : public ContainerCommand {
public:
    LanscoutCLI(CLI::App *app) : ContainerCommand(app)
    {
        m_app->set_version_flag("-v,--version", fmt::format("lanscout CLI version {}.{}.{}", LANSCOUT_MAJOR_VERSION,
            LANSCOUT_MINOR_VERSION, LANSCOUT_REVISION_VERSION));

        add_subcommand<ScanSubcommand>();
        add_subcommand<ProbeSubcommand>();
        add_subcommand<AuthorizeSubcommand>();
        add_subcommand<DevicesSubcommand>();
        add_subcommand<ForgetSubcommand>();
    }

    int parse_and_execute(int argc, char **argv)
    {
        CLI11_PARSE(*m_app, argc, argv);
        return execute();
    }

};

int main(int argc, char** argv) {
    if (!do_versions_match()) {
        return -1;
    }

    CLI::App app{"lanscout CLI"};
    LanscoutCLI cli(&app);
    return cli.parse_and_execute(argc, argv);
}
