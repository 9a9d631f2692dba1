/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file authorize_command.hpp
 * @brief Appliance authorization commands
 **/

#ifndef _LANSCOUT_AUTHORIZE_COMMAND_HPP_
#define _LANSCOUT_AUTHORIZE_COMMAND_HPP_

#include "lanscoutcli.hpp"
#include "command.hpp"
#include "CLI/CLI.hpp"


class AuthorizeSubcommand final : public ConfiguredCommand {
public:
    explicit AuthorizeSubcommand(CLI::App &parent_app);

protected:
    virtual lanscout_status execute_with_config(const LanscoutConfig &config, EventPtr shutdown_event) override;

private:
    std::string m_host;
};

class ForgetSubcommand final : public ConfiguredCommand {
public:
    explicit ForgetSubcommand(CLI::App &parent_app);

protected:
    virtual lanscout_status execute_with_config(const LanscoutConfig &config, EventPtr shutdown_event) override;
};

#endif /* _LANSCOUT_AUTHORIZE_COMMAND_HPP_ */
