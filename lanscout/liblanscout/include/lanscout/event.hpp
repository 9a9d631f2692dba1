/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file event.hpp
 * @brief One-shot event used to signal shutdown to blocking waits
 **/

#ifndef _LANSCOUT_EVENT_HPP_
#define _LANSCOUT_EVENT_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"

#include <memory>
#include <chrono>

namespace lanscout
{

class Event;
using EventPtr = std::shared_ptr<Event>;

// Event backed by an eventfd, it stays signaled once set. The fd may be added to a poll set next to a socket.
class LANSCOUTAPI Event final
{
public:
    enum class State
    {
        signalled,
        not_signalled
    };

    explicit Event(underlying_handle_t handle);
    ~Event();
    Event(Event &&other);

    Event(const Event &) = delete;
    Event &operator=(const Event &) = delete;
    Event &operator=(Event &&) = delete;

    static Expected<Event> create(const State &initial_state);
    static Expected<EventPtr> create_shared(const State &initial_state);

    // Blocks the current thread until the event is signaled
    lanscout_status wait(std::chrono::milliseconds timeout);
    lanscout_status signal();
    bool is_signalled();

    underlying_handle_t get_underlying_handle() const { return m_handle; }

private:
    static underlying_handle_t open_event_handle(const State &initial_state);

    static lanscout_status eventfd_poll(underlying_handle_t fd, std::chrono::milliseconds timeout);
    static lanscout_status eventfd_write(underlying_handle_t fd);

    underlying_handle_t m_handle;
};

} /* namespace lanscout */

#endif /* _LANSCOUT_EVENT_HPP_ */
