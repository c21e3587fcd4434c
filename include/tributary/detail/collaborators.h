// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

// Interfaces of the parts of the runtime that event contexts interact with but do not own:
// the component that received a unit of work, the event model, the exception handling policy
// and the flow that processes the work.

#include "deferred_signal.h"

#include <exception>
#include <memory>
#include <ostream>
#include <string>

namespace tributary {

class Event_context;


// Identifies a component within its root container (usually a flow).
class Component_location
{
public:
    Component_location(std::string root_container_name, std::string location)
        : m_root_container_name(std::move(root_container_name))
        , m_location(std::move(location))
    {}

    const std::string& root_container_name() const noexcept { return m_root_container_name; }

    // Full path of the component, e.g. "orders/processors/2".
    const std::string& location() const noexcept { return m_location; }

private:
    std::string m_root_container_name;
    std::string m_location;
};

using Location_ptr = std::shared_ptr<const Component_location>;

inline Location_ptr make_location(std::string root_container_name, std::string location)
{
    return std::make_shared<const Component_location>(
        std::move(root_container_name), std::move(location));
}

inline std::ostream& operator<<(std::ostream& os, const Component_location& location)
{
    return os << location.location();
}


// Result of processing a unit of work. Contexts carry results around but never look inside.
class Event
{
public:
    virtual ~Event() = default;
};

using Event_ptr = std::shared_ptr<const Event>;


///\brief Policy applied to a context that completes with an error.
///
/// handle() is called exactly once per effective error() call. It may do its work
/// synchronously and return a resolved signal, or return a signal it resolves later from any
/// thread. A failure, whether thrown from handle() or delivered through the signal, is reported
/// to the caller of error() as a handler_failure.
class Exception_handler
{
public:
    virtual ~Exception_handler() = default;

    virtual Deferred_signal handle(std::exception_ptr error, Event_context& context) = 0;
};

using Exception_handler_ptr = std::shared_ptr<Exception_handler>;


// The engine that processes the work of a context. Only the parts a context needs at creation
// time are visible here.
class Flow
{
public:
    virtual ~Flow() = default;

    virtual const std::string& name() const = 0;

    virtual Exception_handler_ptr exception_handler() const = 0;

    // When true, contexts created for this flow collect processing time.
    virtual bool statistics_enabled() const { return false; }
};

} // namespace tributary
