/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file utils.hpp
 * @brief Status checking macros and small helpers shared by every lanscout component
 **/

#ifndef LANSCOUT_UTILS_H_
#define LANSCOUT_UTILS_H_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"

#include "common/logger_macros.hpp"
#include <spdlog/fmt/fmt.h>

#include <map>
#include <string>
#include <vector>
#include <memory>
#include <new>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <algorithm>


namespace lanscout
{

template <typename T>
static inline bool contains(const std::vector<T> &container, const T &value)
{
    return std::find(container.begin(), container.end(), value) != container.end();
}

template <typename T, typename Q>
static inline bool contains(const std::map<Q, T> &container, const Q &key)
{
    return (container.find(key) != container.end());
}

// Allocation failure yields nullptr instead of std::bad_alloc, callers CHECK_NOT_NULL the result
template <class T, class... Args>
static inline std::unique_ptr<T> make_unique_nothrow(Args&&... args)
{
    auto ptr = std::unique_ptr<T>(new (std::nothrow) T(std::forward<Args>(args)...));
    if (nullptr == ptr) {
        LOGGER__ERROR("Failed allocating object of {} bytes", sizeof(T));
    }
    return ptr;
}

template <class T, class... Args>
static inline std::shared_ptr<T> make_shared_nothrow(Args&&... args)
{
    auto ptr = std::shared_ptr<T>(new (std::nothrow) T(std::forward<Args>(args)...));
    if (nullptr == ptr) {
        LOGGER__ERROR("Failed allocating object of {} bytes", sizeof(T));
    }
    return ptr;
}

#define _CLOSE(var, invalid_var_value, func, invalid_func_result, status)                                       \
    do {                                                                                                        \
        if ((invalid_var_value) != (var)) {                                                                     \
            if ((invalid_func_result) == func(var)) {                                                           \
                LOGGER__ERROR("CLOSE failed");                                                                  \
                if (LANSCOUT_SUCCESS == (status)) {                                                             \
                    status = LANSCOUT_CLOSE_FAILURE;                                                            \
                }                                                                                               \
                else {                                                                                          \
                    LOGGER__ERROR("Not setting status to LANSCOUT_CLOSE_FAILURE since it is not LANSCOUT_SUCCESS"); \
                }                                                                                               \
            }                                                                                                   \
            var = (invalid_var_value);                                                                          \
        }                                                                                                       \
    } while(0)

#define CLOSE(fd, status) _CLOSE(fd, -1, close, -1, status)


// Detect empty macro arguments
// https://gustedt.wordpress.com/2010/06/08/detect-empty-macro-arguments/
#define _ARG16(_0, _1, _2, _3, _4, _5, _6, _7, _8, _9, _10, _11, _12, _13, _14, _15, ...) _15
#define HAS_COMMA(...) _ARG16(__VA_ARGS__, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 0)
#define _TRIGGER_PARENTHESIS_(...) ,

#define ISEMPTY(...)                                                    \
_ISEMPTY(                                                               \
          /* test if there is just one argument, eventually an empty    \
             one */                                                     \
          HAS_COMMA(__VA_ARGS__),                                       \
          /* test if _TRIGGER_PARENTHESIS_ together with the argument   \
             adds a comma */                                            \
          HAS_COMMA(_TRIGGER_PARENTHESIS_ __VA_ARGS__),                 \
          /* test if the argument together with a parenthesis           \
             adds a comma */                                            \
          HAS_COMMA(__VA_ARGS__ (/*empty*/)),                           \
          /* test if placing it between _TRIGGER_PARENTHESIS_ and the   \
             parenthesis adds a comma */                                \
          HAS_COMMA(_TRIGGER_PARENTHESIS_ __VA_ARGS__ (/*empty*/))      \
          )

#define PASTE5(_0, _1, _2, _3, _4) _0 ## _1 ## _2 ## _3 ## _4
#define _ISEMPTY(_0, _1, _2, _3) HAS_COMMA(PASTE5(_IS_EMPTY_CASE_, _0, _1, _2, _3))
#define _IS_EMPTY_CASE_0001 ,
//

#define __CONSTRUCT_MSG_1(dft_fmt, usr_fmt, ...) dft_fmt, ##__VA_ARGS__
#define __CONSTRUCT_MSG_0(dft_fmt, usr_fmt, ...) dft_fmt " - " usr_fmt, ##__VA_ARGS__
#define __CONSTRUCT_MSG(is_dft, dft_fmt, usr_fmt, ...) __CONSTRUCT_MSG_##is_dft(dft_fmt, usr_fmt, ##__VA_ARGS__)
#define _CONSTRUCT_MSG(is_dft, dft_fmt, usr_fmt, ...) __CONSTRUCT_MSG(is_dft, dft_fmt, usr_fmt, ##__VA_ARGS__)
#define CONSTRUCT_MSG(dft_fmt, ...) _CONSTRUCT_MSG(ISEMPTY(__VA_ARGS__), dft_fmt, "" __VA_ARGS__)


inline lanscout_status get_status(lanscout_status status)
{
    return status;
}

template<typename T>
inline lanscout_status get_status(const Expected<T> &exp)
{
    return exp.status();
}

#define _CHECK(cond, ret_val, ...)      \
    do {                                \
        if (!(cond)) {                  \
            LOGGER__ERROR(__VA_ARGS__); \
            return (ret_val);           \
        }                               \
    } while(0)

/** Returns ret_val when cond is false */
#define CHECK(cond, ret_val, ...) \
    _CHECK((cond), make_unexpected(ret_val), CONSTRUCT_MSG("CHECK failed", ##__VA_ARGS__))
#define CHECK_AS_EXPECTED CHECK

#define CHECK_ARG_NOT_NULL(arg) _CHECK(nullptr != (arg), make_unexpected(LANSCOUT_INVALID_ARGUMENT), "CHECK_ARG_NOT_NULL for {} failed", #arg)

#define CHECK_NOT_NULL(arg, status) _CHECK(nullptr != (arg), make_unexpected(status), "CHECK_NOT_NULL for {} failed", #arg)
#define CHECK_NOT_NULL_AS_EXPECTED CHECK_NOT_NULL

#define _CHECK_SUCCESS(res, is_default, fmt, ...)                                                                               \
    do {                                                                                                                        \
        const auto &__check_success_status = get_status(res);                                                                   \
        _CHECK(                                                                                                                 \
            (LANSCOUT_SUCCESS == __check_success_status),                                                                       \
            make_unexpected(__check_success_status),                                                                            \
            _CONSTRUCT_MSG(is_default, "CHECK_SUCCESS failed with status={}", fmt, __check_success_status, ##__VA_ARGS__)       \
        );                                                                                                                      \
    } while(0)
#define CHECK_SUCCESS(status, ...) _CHECK_SUCCESS(status, ISEMPTY(__VA_ARGS__), "" __VA_ARGS__)
#define CHECK_SUCCESS_AS_EXPECTED CHECK_SUCCESS

#define _CHECK_EXPECTED _CHECK_SUCCESS
#define CHECK_EXPECTED(obj, ...) _CHECK_EXPECTED(obj, ISEMPTY(__VA_ARGS__), "" __VA_ARGS__)
#define CHECK_EXPECTED_AS_STATUS CHECK_EXPECTED


#define __LANSCOUT_CONCAT(x, y) x ## y
#define _LANSCOUT_CONCAT(x, y) __LANSCOUT_CONCAT(x, y)

#define _TRY(expected_var_name, var_decl, expr, ...) \
    auto expected_var_name = (expr); \
    CHECK_EXPECTED(expected_var_name, __VA_ARGS__); \
    var_decl = expected_var_name.release()

/**
 * TRY(var_decl, expr, ...) evaluates expr, an Expected<T>. On success var_decl is initialized with the released value.
 * On failure the optional message is logged and the enclosing function returns the failed status.
 *
 *     TRY(auto prefix, SubnetProber::derive_subnet_prefix(addresses), "No active network");
 */
#define TRY(var_decl, expr, ...) _TRY(_LANSCOUT_CONCAT(__expected, __COUNTER__), var_decl, expr, __VA_ARGS__)

static inline Expected<std::string> get_env_variable(const std::string &env_var_name)
{
    const auto env_var = std::getenv(env_var_name.c_str());
    // An unset variable is a normal outcome, nothing is logged
    if (nullptr == env_var) {
        return make_unexpected(LANSCOUT_NOT_FOUND);
    }

    const auto result = std::string(env_var);
    if (result.empty()) {
        return make_unexpected(LANSCOUT_NOT_FOUND);
    }

    return Expected<std::string>(result);
}

class StringUtils final
{
public:
    StringUtils() = delete;

    static std::string to_lower(const std::string &str)
    {
        std::string lower_str = str;
        std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
            [](auto ch) { return static_cast<char>(::tolower(ch)); });
        return lower_str;
    }

    static std::string to_upper(const std::string &str)
    {
        std::string upper_str = str;
        std::transform(upper_str.begin(), upper_str.end(), upper_str.begin(),
            [](auto ch) { return static_cast<char>(::toupper(ch)); });
        return upper_str;
    }

    static std::string to_hex_string(const uint8_t *array, size_t size, bool uppercase, const std::string &delimiter="");

    // Empty tokens are kept, "a..b" split by '.' gives {"a", "", "b"}
    static std::vector<std::string> split(const std::string &str, char delimiter);
};

} /* namespace lanscout */

#endif /* LANSCOUT_UTILS_H_ */
