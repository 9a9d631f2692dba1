/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file devices_command.hpp
 * @brief Shows the stored device history
 **/

#ifndef _LANSCOUT_DEVICES_COMMAND_HPP_
#define _LANSCOUT_DEVICES_COMMAND_HPP_

#include "lanscoutcli.hpp"
#include "command.hpp"
#include "CLI/CLI.hpp"


class DevicesSubcommand final : public ConfiguredCommand {
public:
    explicit DevicesSubcommand(CLI::App &parent_app);

protected:
    virtual lanscout_status execute_with_config(const LanscoutConfig &config, EventPtr shutdown_event) override;

private:
    bool m_online_only;
};

#endif /* _LANSCOUT_DEVICES_COMMAND_HPP_ */
