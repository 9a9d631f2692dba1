/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file logger_macros.hpp
 * @brief LOGGER__X macros used across lanscout. They write to the spdlog default logger, which
 *        liblanscout replaces with its own on load.
 **/

#ifndef _LOGGER_MACROS_HPP_
#define _LOGGER_MACROS_HPP_

#include "lanscout/lanscout.h"

#define SPDLOG_NO_EXCEPTIONS

/* Release builds compile out TRACE */
#ifndef SPDLOG_ACTIVE_LEVEL
#ifndef NDEBUG
#define SPDLOG_ACTIVE_LEVEL (SPDLOG_LEVEL_TRACE)
#else
#define SPDLOG_ACTIVE_LEVEL (SPDLOG_LEVEL_DEBUG)
#endif
#endif

#if defined(__linux__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif
#include <spdlog/spdlog.h>
#if defined(__linux__)
#pragma GCC diagnostic pop
#endif

/* Formats a status as "LANSCOUT_TIMEOUT(4)" */
template <> struct fmt::formatter<lanscout_status> : fmt::formatter<fmt::string_view> {
    template <typename FormatContext>
    auto format(lanscout_status status, FormatContext &ctx) const -> decltype(ctx.out())
    {
        const char *name = lanscout_get_status_message(status);
        return fmt::format_to(ctx.out(), "{}({})", (nullptr != name) ? name : "<Invalid>", static_cast<int>(status));
    }
};

namespace lanscout
{

// Log strings use fmtlib braces. A '%' followed by a letter is rejected at compile time.
constexpr bool string_not_printf_format(char const *str)
{
    for (int i = 0; str[i] != '\0'; i++) {
        const char next = str[i + 1];
        if ((str[i] == '%') && (((next >= 'a') && (next <= 'z')) || ((next >= 'A') && (next <= 'Z')))) {
            return false;
        }
    }
    return true;
}

#define EXPAND(x) x
#define ASSERT_NOT_PRINTF_FORMAT(fmt, ...) \
    static_assert(string_not_printf_format(fmt), "Log string must use fmtlib braces, not printf conversions")

#define LOGGER_TO_SPDLOG(level, ...)\
do{\
    EXPAND(ASSERT_NOT_PRINTF_FORMAT(__VA_ARGS__));\
    level(__VA_ARGS__);\
} while(0) // NOLINT

#define LOGGER__TRACE(...)  LOGGER_TO_SPDLOG(SPDLOG_TRACE, __VA_ARGS__)
#define LOGGER__DEBUG(...)  LOGGER_TO_SPDLOG(SPDLOG_DEBUG, __VA_ARGS__)
#define LOGGER__INFO(...)  LOGGER_TO_SPDLOG(SPDLOG_INFO, __VA_ARGS__)
#define LOGGER__WARNING(...)  LOGGER_TO_SPDLOG(SPDLOG_WARN, __VA_ARGS__)
#define LOGGER__ERROR(...)  LOGGER_TO_SPDLOG(SPDLOG_ERROR, __VA_ARGS__)

} /* namespace lanscout */

#endif /* _LOGGER_MACROS_HPP_ */
