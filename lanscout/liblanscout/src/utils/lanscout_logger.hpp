/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file lanscout_logger.hpp
 * @brief Declares the logger used by liblanscout.
 **/

#ifndef _LANSCOUT_LOGGER_HPP_
#define _LANSCOUT_LOGGER_HPP_

#include "lanscout/lanscout.h"
#include "common/logger_macros.hpp"
#include "common/utils.hpp"
#include "common/env_vars.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace lanscout
{

class LanscoutLogger {
public:
#ifdef NDEBUG
    static std::unique_ptr<LanscoutLogger> &get_instance(spdlog::level::level_enum console_level = spdlog::level::warn,
        spdlog::level::level_enum file_level = spdlog::level::info, spdlog::level::level_enum flush_level = spdlog::level::warn)
#else
    static std::unique_ptr<LanscoutLogger> &get_instance(spdlog::level::level_enum console_level = spdlog::level::warn,
        spdlog::level::level_enum file_level = spdlog::level::debug, spdlog::level::level_enum flush_level = spdlog::level::debug)
#endif
    {
        static std::unique_ptr<LanscoutLogger> instance = nullptr;
        auto user_console_logger_level = get_env_variable(LANSCOUT_CONSOLE_LOGGER_LEVEL_ENV_VAR);
        if (user_console_logger_level) {
            auto expected_console_level = get_console_logger_level_from_string(user_console_logger_level.value());
            if (expected_console_level) {
                console_level = expected_console_level.release();
            } else {
                LOGGER__WARNING("Failed to parse console logger level from environment variable: {}, status: {}",
                    user_console_logger_level.value(), expected_console_level.status());
            }
        }
        if (nullptr == instance) {
            instance = make_unique_nothrow<LanscoutLogger>(console_level, file_level, flush_level);
        }
        return instance;
    }

    LanscoutLogger(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level,
        spdlog::level::level_enum flush_level);
    ~LanscoutLogger() = default;
    LanscoutLogger(LanscoutLogger const&) = delete;
    void operator=(LanscoutLogger const&) = delete;

    static std::string get_log_path(const std::string &path_env_var);
    static std::string get_main_log_path();
    static std::shared_ptr<spdlog::sinks::sink> create_file_sink(const std::string &dir_path,
        const std::string &filename);
    static Expected<spdlog::level::level_enum> get_console_logger_level_from_string(
        const std::string &user_console_logger_level)
    {
        static const std::unordered_map<std::string, spdlog::level::level_enum> log_level_map = {
            {"trace", spdlog::level::trace},
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warning", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"critical", spdlog::level::critical}
        };
        if (log_level_map.find(user_console_logger_level) != log_level_map.end()) {
            return Expected<spdlog::level::level_enum>(log_level_map.at(user_console_logger_level));
        }
        return make_unexpected(LANSCOUT_INVALID_ARGUMENT);
    }

private:
    static std::string parse_log_path(const std::string &log_path);
    void set_levels(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level,
        spdlog::level::level_enum flush_level);

    std::shared_ptr<spdlog::sinks::sink> m_console_sink;

    // The main log is written to ~/.lanscout, the local log to $LANSCOUT_LOGGER_PATH
    std::shared_ptr<spdlog::sinks::sink> m_main_log_file_sink;
    std::shared_ptr<spdlog::sinks::sink> m_local_log_file_sink;
    std::shared_ptr<spdlog::logger> m_lanscout_logger;
};

} /* namespace lanscout */

#endif /* _LANSCOUT_LOGGER_HPP_ */
