// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "config.h"
#include "delay_fuzzer.h"
#include "exception.h"

#include <atomic>
#include <cstdint>

namespace tributary {

///\brief Fan-in barrier whose participant count grows while it is in use.
///
/// The counter starts with the slots its owner holds for itself. Participants register with
/// try_add() and leave with release(). Exactly one release() observes the transition to zero
/// and reports it; from that point on the counter is closed and try_add() fails, so a count
/// that has reached zero can never be revived by a late registration.
///
/// As long as the owner has not released its own slot, releases of other participants cannot
/// reach zero, no matter in which order they arrive.
class Completion_counter
{
public:
    explicit Completion_counter(int32_t initial_slots = own_processing_slots) noexcept
        : m_pending(initial_slots)
    {}

    Completion_counter(const Completion_counter&) = delete;
    Completion_counter& operator=(const Completion_counter&) = delete;

    // Registers one more participant. Fails if zero has already been reached.
    bool try_add() noexcept
    {
        int32_t current = m_pending.load(std::memory_order_acquire);
        while (current > 0) {
            TRIBUTARY_DELAY_FUZZ();
            if (m_pending.compare_exchange_weak(
                    current, current + 1,
                    std::memory_order_acq_rel,
                    std::memory_order_acquire))
            {
                return true;
            }
        }
        return false;
    }

    // Releases one participant. Returns true for the single release that reached zero.
    bool release()
    {
        int32_t current = m_pending.load(std::memory_order_acquire);
        while (true) {
            if (current <= 0) {
                throw illegal_state_error("completion counter released more often than registered");
            }
            TRIBUTARY_DELAY_FUZZ();
            if (m_pending.compare_exchange_weak(
                    current, current - 1,
                    std::memory_order_acq_rel,
                    std::memory_order_acquire))
            {
                return current == 1;
            }
        }
    }

    int32_t pending() const noexcept
    {
        return m_pending.load(std::memory_order_acquire);
    }

    bool reached_zero() const noexcept
    {
        return pending() == 0;
    }

private:
    alignas(assumed_cache_line_size) std::atomic<int32_t> m_pending;
};

} // namespace tributary
