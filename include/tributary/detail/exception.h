// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/type_index.hpp>

namespace tributary {

// Thrown when an operation is valid in general but not in the current state of the context,
// e.g. registering a child with a context whose completion has already fired.
class illegal_state_error : public std::logic_error {
public:
    explicit illegal_state_error(const std::string& what_arg)
        : std::logic_error(what_arg)
    {}
};


// "<demangled type>: <what()>" for a captured exception, for diagnostics only.
inline std::string describe_exception(const std::exception_ptr& ep)
{
    if (!ep) {
        return "<no exception>";
    }
    try {
        std::rethrow_exception(ep);
    }
    catch (const std::exception& e) {
        std::ostringstream oss;
        oss << boost::typeindex::type_id_runtime(e).pretty_name() << ": " << e.what();
        return oss.str();
    }
    catch (...) {
        return "<exception not derived from std::exception>";
    }
}


// Delivered through the signal returned by Event_context::error() when the exception handler
// fails while processing the error, either by throwing from handle(), by returning no signal,
// or by resolving its signal with a failure.
class handler_failure : public std::runtime_error {
public:
    handler_failure(
        std::string context_id,
        std::exception_ptr original_error,
        std::exception_ptr handler_error)
        : std::runtime_error(build_message(context_id, original_error, handler_error))
        , m_context_id(std::move(context_id))
        , m_original_error(std::move(original_error))
        , m_handler_error(std::move(handler_error))
    {}

    const std::string& context_id() const { return m_context_id; }

    // The error the context was completed with.
    const std::exception_ptr& original_error() const { return m_original_error; }

    // What the handler raised. Null if the handler returned no signal at all.
    const std::exception_ptr& handler_error() const { return m_handler_error; }

private:
    static std::string build_message(
        const std::string& context_id,
        const std::exception_ptr& original_error,
        const std::exception_ptr& handler_error)
    {
        std::ostringstream oss;
        oss << "exception handler failed for context " << context_id
            << " while handling [" << describe_exception(original_error) << "]";
        if (handler_error) {
            oss << ": " << describe_exception(handler_error);
        }
        else {
            oss << ": handler returned no signal";
        }
        return oss.str();
    }

    std::string         m_context_id;
    std::exception_ptr  m_original_error;
    std::exception_ptr  m_handler_error;
};

} // namespace tributary
