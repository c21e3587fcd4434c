// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tributary {

// One-shot gate. Any number of threads may wait; the first release() opens it for good.
class Latch
{
public:
    Latch() = default;
    Latch(const Latch&) = delete;
    Latch& operator=(const Latch&) = delete;

    void release()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_released = true;
        }
        m_condition.notify_all();
    }

    bool is_released() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_released;
    }

    void await()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait(lock, [this] { return m_released; });
    }

    // Returns false on timeout.
    template <typename Rep, typename Period>
    bool await_for(const std::chrono::duration<Rep, Period>& timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_condition.wait_for(lock, timeout, [this] { return m_released; });
    }

private:
    mutable std::mutex          m_mutex;
    std::condition_variable     m_condition;
    bool                        m_released = false;
};

} // namespace tributary
