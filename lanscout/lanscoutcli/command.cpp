/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file command.cpp
 * @brief Base classes for lanscoutcli commands.
 **/

#include "command.hpp"

#include <algorithm>

Command::Command(CLI::App *app) :
    m_app(app)
{
}

ContainerCommand::ContainerCommand(CLI::App *app) :
    Command(app)
{
    m_app->require_subcommand(1);
}

lanscout_status ContainerCommand::execute()
{
    auto selected = std::find_if(m_subcommands.begin(), m_subcommands.end(),
        [](const std::shared_ptr<Command> &command) { return command->parsed(); });
    CHECK(m_subcommands.end() != selected, LANSCOUT_NOT_FOUND, "No subcommand was selected");
    return (*selected)->execute();
}

ConfiguredCommand::ConfiguredCommand(CLI::App *app) :
    Command(app)
{
    add_config_options(m_app, m_config_params);
}

lanscout_status ConfiguredCommand::execute()
{
    TRY(const auto config, load_config(m_config_params));
    TRY(auto shutdown_event, get_shutdown_event());
    return execute_with_config(config, shutdown_event);
}
