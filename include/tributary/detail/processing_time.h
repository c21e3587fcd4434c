// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "time_utils.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace tributary {

///\brief Time spent processing the events of one context tree, so far.
///
/// Every branch of execution (the root's own processing and each child scope) reports its
/// elapsed time when it ends; branches may end concurrently.
class Processing_time
{
public:
    explicit Processing_time(std::string flow_name)
        : m_flow_name(std::move(flow_name))
    {}

    Processing_time(const Processing_time&) = delete;
    Processing_time& operator=(const Processing_time&) = delete;

    // branch_start_ns is a monotonic_now_ns() value taken when the branch started.
    void add_branch_time(uint64_t branch_start_ns) noexcept
    {
        add_ns(elapsed_since_ns(branch_start_ns));
    }

    template <typename Rep, typename Period>
    void add(const std::chrono::duration<Rep, Period>& elapsed) noexcept
    {
        const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();
        add_ns(ns > 0 ? static_cast<uint64_t>(ns) : 0);
    }

    std::chrono::nanoseconds total() const noexcept
    {
        return std::chrono::nanoseconds(m_total_ns.load(std::memory_order_acquire));
    }

    uint64_t branch_count() const noexcept
    {
        return m_branches.load(std::memory_order_acquire);
    }

    const std::string& flow_name() const noexcept { return m_flow_name; }

private:
    void add_ns(uint64_t ns) noexcept
    {
        m_total_ns.fetch_add(ns, std::memory_order_acq_rel);
        m_branches.fetch_add(1, std::memory_order_acq_rel);
    }

    const std::string       m_flow_name;
    std::atomic<uint64_t>   m_total_ns{0};
    std::atomic<uint64_t>   m_branches{0};
};

} // namespace tributary
