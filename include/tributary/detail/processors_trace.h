// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "spinlock.h"

#include <string>
#include <vector>

namespace tributary {

// Paths of the processors a context went through, in the order they were recorded. Appends
// from concurrent branches are all kept; their relative order is whatever the lock yields.
// A disabled trace ignores appends and stays empty.
class Processors_trace
{
public:
    explicit Processors_trace(bool enabled = false)
        : m_enabled(enabled)
    {}

    Processors_trace(const Processors_trace&) = delete;
    Processors_trace& operator=(const Processors_trace&) = delete;

    bool enabled() const noexcept { return m_enabled; }

    void add_executed_processor(std::string processor_path)
    {
        if (!m_enabled) {
            return;
        }
        spinlock::locker l(m_sl);
        m_executed.push_back(std::move(processor_path));
    }

    std::vector<std::string> executed_processors() const
    {
        if (!m_enabled) {
            return {};
        }
        spinlock::locker l(m_sl);
        return m_executed;
    }

    size_t size() const
    {
        if (!m_enabled) {
            return 0;
        }
        spinlock::locker l(m_sl);
        return m_executed.size();
    }

private:
    const bool                  m_enabled;
    mutable spinlock            m_sl;
    std::vector<std::string>    m_executed;
};

} // namespace tributary
