/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file expected.hpp
 * @brief Expected<T> is either a T or the ::lanscout_status preventing T to be created.
 *
 * Examples:
 *
 * *** Example #1 - Construct a new object ***
 *
 * class Probe {
 * private:
 *     Probe(uint16_t port, lanscout_status &status)
 *     {
 *         status = (0 != port) ? LANSCOUT_SUCCESS : LANSCOUT_INVALID_ARGUMENT;
 *     }
 *
 * public:
 *     static Expected<Probe> create(uint16_t port)
 *     {
 *         lanscout_status status = LANSCOUT_UNINITIALIZED;
 *         Probe object(port, status);
 *         if (LANSCOUT_SUCCESS != status) {
 *             LOGGER__ERROR("Failed creating Probe");
 *             return make_unexpected(status);
 *         }
 *         return std::move(object);
 *     }
 * };
 *
 * Note that the constructor must be private since we are using Probe::create to construct a new object safely.
 *
 *
 * *** Example #2 - Parse a number  ***
 *
 * static Expected<uint8_t> parse_octet(int value)
 * {
 *     if ((value < 0) || (value > 255)) {
 *         LOGGER__ERROR("Octet {} out of range", value);
 *         return make_unexpected(LANSCOUT_INVALID_ARGUMENT);
 *     }
 *     return static_cast<uint8_t>(value);
 * }
 *
 **/

#ifndef _LANSCOUT_EXPECTED_HPP_
#define _LANSCOUT_EXPECTED_HPP_

#include "lanscout/lanscout.h"

#include <assert.h>
#include <utility>
#include <type_traits>

/** lanscout namespace */
namespace lanscout
{

/*! Carries a failure ::lanscout_status into an Expected<T> of any T. */
class Unexpected final
{
public:
    explicit Unexpected(lanscout_status status) :
        m_status(status)
    {}

    operator lanscout_status() { return m_status; }

    lanscout_status m_status;
};

inline Unexpected make_unexpected(lanscout_status status)
{
    return Unexpected(status);
}

/*! Expected<T> holds a T on success, or the ::lanscout_status of the failure. */
template<typename T>
class Expected final
{
public:
    template<class U>
    friend class Expected;

    // A failure status, never LANSCOUT_SUCCESS
    Expected(Unexpected unexpected) :
        m_status(unexpected.m_status)
    {
        assert(unexpected.m_status != LANSCOUT_SUCCESS);
    }

    explicit Expected(const Expected<T> &other) :
        m_status(other.m_status)
    {
        if (other.has_value()) {
            construct(&m_value, other.m_value);
        }
    }

    // Converting copy, e.g. Expected<std::shared_ptr<Derived>> into Expected<std::shared_ptr<Base>>
    template <typename U>
    Expected(const Expected<U> &other) :
        m_status(other.m_status)
    {
        if (other.has_value()) {
            construct(&m_value, other.m_value);
        }
    }

    // other keeps its status; its value is left moved-from
    Expected(Expected<T> &&other) :
        m_status(other.m_status)
    {
        if (other.has_value()) {
            construct(&m_value, std::move(other.m_value));
        }
    }

    Expected(T &&value) :
        m_value(std::move(value)),
        m_status(LANSCOUT_SUCCESS)
    {}

    // Returning a bare status must go through make_unexpected()
    Expected(lanscout_status status) = delete;

    template <typename... Args, std::enable_if_t<std::is_constructible<T, Args...>::value, int> = 0>
    explicit Expected(Args &&...args) :
        m_value(std::forward<Args>(args)...),
        m_status(LANSCOUT_SUCCESS)
    {}

    Expected<T>& operator=(const Expected<T> &other) = delete;
    Expected<T>& operator=(Expected<T> &&other) noexcept = delete;
    Expected<T>& operator=(const T &other) = delete;
    Expected<T>& operator=(T &&other) noexcept = delete;
    Expected<T>& operator=(lanscout_status status) = delete;

    ~Expected()
    {
        reset(LANSCOUT_UNINITIALIZED);
    }

    bool has_value() const
    {
        return (LANSCOUT_SUCCESS == m_status);
    }

    lanscout_status status() const
    {
        return m_status;
    }

    // Must only be called when has_value()
    T& value() &
    {
        assert(has_value());
        return m_value;
    }

    const T& value() const&
    {
        assert(has_value());
        return m_value;
    }

    // Moves the value out. Afterwards the object holds LANSCOUT_UNINITIALIZED.
    T release()
    {
        assert(has_value());
        T tmp = std::move(m_value);
        reset(LANSCOUT_UNINITIALIZED);
        return tmp;
    }

    T* operator->()
    {
        return &(value());
    }

    const T* operator->() const
    {
        return &(value());
    }

    T& operator*() &
    {
        return value();
    }

    const T& operator*() const&
    {
        return value();
    }

    explicit operator bool() const
    {
        return has_value();
    }

private:
    template<typename... Args>
    static void construct(T *value, Args &&...args)
    {
        new ((void*)value) T(std::forward<Args>(args)...);
    }

    void reset(lanscout_status status)
    {
        if (has_value()) {
            m_value.~T();
        }
        m_status = status;
    }

    union {
        T m_value;
    };
    lanscout_status m_status;
};

} /* namespace lanscout */

#endif  // _LANSCOUT_EXPECTED_HPP_
