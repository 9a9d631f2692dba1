/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file command.hpp
 * @brief Base classes for lanscoutcli commands.
 **/

#ifndef _LANSCOUT_COMMAND_HPP_
#define _LANSCOUT_COMMAND_HPP_

#include "lanscoutcli.hpp"
#include "CLI/CLI.hpp"

#include <memory>
#include <vector>


class Command {
public:
    explicit Command(CLI::App *app);
    virtual ~Command() = default;

    virtual lanscout_status execute() = 0;

    bool parsed() const
    {
        return m_app->parsed();
    }

protected:
    CLI::App *m_app;
};

// Dispatches to exactly one of its subcommands
class ContainerCommand : public Command {
public:
    explicit ContainerCommand(CLI::App *app);
    virtual lanscout_status execute() override final;

protected:
    template<typename CommandType>
    CommandType &add_subcommand()
    {
        auto command = std::make_shared<CommandType>(*m_app);
        m_subcommands.push_back(command);
        return *command;
    }

private:
    std::vector<std::shared_ptr<Command>> m_subcommands;
};

// Loads the configuration and the shutdown event, then runs execute_with_config()
class ConfiguredCommand : public Command {
public:
    explicit ConfiguredCommand(CLI::App *app);
    virtual lanscout_status execute() override final;

protected:
    lanscout_config_params m_config_params;

    virtual lanscout_status execute_with_config(const LanscoutConfig &config, EventPtr shutdown_event) = 0;
};

#endif /* _LANSCOUT_COMMAND_HPP_ */
