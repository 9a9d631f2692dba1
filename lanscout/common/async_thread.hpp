/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file async_thread.hpp
 * @brief Runs one task on its own named thread and hands back its result
 **/

#ifndef _ASYNC_THREAD_HPP_
#define _ASYNC_THREAD_HPP_

#include <functional>
#include <thread>
#include <memory>
#include <string>

#include "common/os_utils.hpp"

namespace lanscout
{

/**
 * Each AsyncThread owns a dedicated std::thread, so a batch of them runs fully in parallel.
 * The result is collected with get(). The destructor joins, so an abandoned task still finishes before its
 * captured state goes away.
 */
template<typename T>
class AsyncThread final {
public:
    AsyncThread(const std::string &thread_name, std::function<T(void)> task) :
        m_result(),
        m_thread([this, thread_name, task]() {
            OsUtils::set_current_thread_name(thread_name);
            m_result = task();
        })
    {}

    ~AsyncThread()
    {
        join();
    }

    // The thread captures this, so the object stays put. Hold it through AsyncThreadPtr to store it.
    AsyncThread(const AsyncThread<T> &) = delete;
    AsyncThread(AsyncThread<T> &&other) = delete;
    AsyncThread<T>& operator=(const AsyncThread<T>&) = delete;
    AsyncThread<T>& operator=(AsyncThread<T> &&) = delete;

    // Blocks until the task returns
    T get()
    {
        join();
        return std::move(m_result);
    }

private:
    void join()
    {
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    T m_result;
    std::thread m_thread;
};

template<typename T>
using AsyncThreadPtr = std::unique_ptr<AsyncThread<T>>;

} /* namespace lanscout */

#endif /* _ASYNC_THREAD_HPP_ */
