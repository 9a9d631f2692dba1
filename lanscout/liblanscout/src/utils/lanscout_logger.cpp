/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file lanscout_logger.cpp
 * @brief Implements the logger used by liblanscout.
 **/

#include "common/utils.hpp"
#include "common/filesystem.hpp"
#include "common/env_vars.hpp"

#include "utils/lanscout_logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/null_sink.h>
#include <unistd.h>
#include <iostream>
#include <vector>


namespace lanscout
{

#define MAX_LOG_FILE_SIZE (1024 * 1024) // 1MB

#define LANSCOUT_NAME ("lanscout")
#define LANSCOUT_LOGGER_FILENAME ("lanscout.log")
#define LANSCOUT_MAIN_LOG_DIR_NAME (".lanscout")
#define LANSCOUT_MAX_NUMBER_OF_LOG_FILES (1) // There will be 2 log files - 1 spare
#ifdef NDEBUG
#define LANSCOUT_CONSOLE_LOGGER_PATTERN ("[%n] [%^%l%$] %v") // Console logger will print: [lanscout] [log level] msg
#else
#define LANSCOUT_CONSOLE_LOGGER_PATTERN ("[%Y-%m-%d %X.%e] [%P] [%t] [%n] [%^%l%$] [%s:%#] [%!] %v")
#endif
#define LANSCOUT_MAIN_FILE_LOGGER_PATTERN ("[%Y-%m-%d %X.%e] [%P] [%t] [%n] [%l] [%s:%#] [%!] %v")
#define LANSCOUT_LOCAL_FILE_LOGGER_PATTERN ("[%Y-%m-%d %X.%e] [%t] [%n] [%l] [%s:%#] [%!] %v")

#define PERIODIC_FLUSH_INTERVAL_IN_SECONDS (5)


std::string LanscoutLogger::parse_log_path(const std::string &log_path)
{
    if (log_path.empty()) {
        return ".";
    }
    if ("NONE" == log_path) {
        return "";
    }
    return log_path;
}

std::string LanscoutLogger::get_log_path(const std::string &path_env_var)
{
    auto log_path = get_env_variable(path_env_var);
    return parse_log_path(log_path ? log_path.value() : "");
}

std::string LanscoutLogger::get_main_log_path()
{
    // Disabling the local log disables the main log as well
    if (get_log_path(LANSCOUT_LOGGER_PATH_ENV_VAR).empty()) {
        return "";
    }

    const auto full_path = Filesystem::join(Filesystem::get_home_directory(), LANSCOUT_MAIN_LOG_DIR_NAME);
    auto status = Filesystem::create_directory(full_path);
    if (LANSCOUT_SUCCESS != status) {
        std::cerr << "Cannot create directory at path " << full_path << std::endl;
        return "";
    }
    return full_path;
}

// Logging is not set up yet, so sink problems go straight to stderr
static std::shared_ptr<spdlog::sinks::sink> file_sink_unavailable(const std::string &filename, const std::string &reason)
{
    std::cerr << "lanscout warning: Cannot create log file " << filename << "! " << reason << std::endl;
    return make_shared_nothrow<spdlog::sinks::null_sink_st>();
}

std::shared_ptr<spdlog::sinks::sink> LanscoutLogger::create_file_sink(const std::string &dir_path,
    const std::string &filename)
{
    if (dir_path.empty()) {
        return make_shared_nothrow<spdlog::sinks::null_sink_st>();
    }

    auto is_dir = Filesystem::is_directory(dir_path);
    if (!is_dir || (!is_dir.value() && (LANSCOUT_SUCCESS != Filesystem::create_directory(dir_path)))) {
        return file_sink_unavailable(filename, "Path " + dir_path + " is not valid.");
    }
    if (0 != access(dir_path.c_str(), W_OK)) {
        return file_sink_unavailable(filename, "Please check the directory " + dir_path + " write permissions.");
    }

    const auto file_path = Filesystem::join(dir_path, filename);
    if (Filesystem::does_file_exists(file_path) && (0 != access(file_path.c_str(), W_OK))) {
        return file_sink_unavailable(filename, "Please check the file " + file_path + " write permissions.");
    }

    return make_shared_nothrow<spdlog::sinks::rotating_file_sink_mt>(file_path, MAX_LOG_FILE_SIZE,
        LANSCOUT_MAX_NUMBER_OF_LOG_FILES);
}

LanscoutLogger::LanscoutLogger(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level,
    spdlog::level::level_enum flush_level) :
    m_console_sink(make_shared_nothrow<spdlog::sinks::stderr_color_sink_mt>()),
    m_main_log_file_sink(create_file_sink(get_main_log_path(), LANSCOUT_LOGGER_FILENAME)),
    m_local_log_file_sink(create_file_sink(get_log_path(LANSCOUT_LOGGER_PATH_ENV_VAR), LANSCOUT_LOGGER_FILENAME))
{
    if ((nullptr == m_console_sink) || (nullptr == m_main_log_file_sink) || (nullptr == m_local_log_file_sink)) {
        std::cerr << "Allocating memory on heap for logger sinks has failed! Logging is disabled." << std::endl;
        return;
    }

    m_console_sink->set_pattern(LANSCOUT_CONSOLE_LOGGER_PATTERN);
    m_main_log_file_sink->set_pattern(LANSCOUT_MAIN_FILE_LOGGER_PATTERN);
    m_local_log_file_sink->set_pattern(LANSCOUT_LOCAL_FILE_LOGGER_PATTERN);

    std::vector<std::shared_ptr<spdlog::sinks::sink>> sink_vector = { m_console_sink, m_main_log_file_sink,
        m_local_log_file_sink };
    m_lanscout_logger = make_shared_nothrow<spdlog::logger>(LANSCOUT_NAME, sink_vector.begin(), sink_vector.end());
    if (nullptr == m_lanscout_logger) {
        std::cerr << "Allocating memory on heap for lanscout logger has failed! Logging is disabled." << std::endl;
        return;
    }

    set_levels(console_level, file_level, flush_level);
    spdlog::set_default_logger(m_lanscout_logger);
}

void LanscoutLogger::set_levels(spdlog::level::level_enum console_level, spdlog::level::level_enum file_level,
    spdlog::level::level_enum flush_level)
{
    m_console_sink->set_level(console_level);
    m_main_log_file_sink->set_level(file_level);
    m_local_log_file_sink->set_level(file_level);
    m_lanscout_logger->flush_on(flush_level);

    // Setting logger level to min active level, as traces will only show if the sink level is set to their level
    m_lanscout_logger->set_level(static_cast<spdlog::level::level_enum>(SPDLOG_ACTIVE_LEVEL));
    spdlog::flush_every(std::chrono::seconds(PERIODIC_FLUSH_INTERVAL_IN_SECONDS));
}

} /* namespace lanscout */
