// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "notification_channel.h"

#include <exception>
#include <memory>

namespace tributary {

// Outcome of an asynchronous step with no value of its own: exception handling of an error()
// call, or the acknowledgement behind an external completion link.
struct Signal_result
{
    std::exception_ptr  failure;

    // Set on the signal returned by an error() call that lost against an earlier terminal call.
    // No handler was invoked for it.
    bool                already_completed = false;

    bool succeeded() const noexcept { return !failure; }

    void rethrow_if_failed() const
    {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }
};

using Signal          = Notification_channel<Signal_result>;
using Deferred_signal = std::shared_ptr<Signal>;


inline Deferred_signal make_deferred_signal()
{
    return std::make_shared<Signal>();
}

inline Deferred_signal make_resolved_signal(bool already_completed = false)
{
    auto signal = make_deferred_signal();
    Signal_result result;
    result.already_completed = already_completed;
    signal->fire(std::move(result));
    return signal;
}

inline Deferred_signal make_failed_signal(std::exception_ptr failure)
{
    auto signal = make_deferred_signal();
    Signal_result result;
    result.failure = std::move(failure);
    signal->fire(std::move(result));
    return signal;
}

} // namespace tributary
