// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include <atomic>
#include <cstddef>
#include <thread>

namespace tributary {

// Guards short critical sections (subscriber lists, trace appends, the context registry).
// Nothing that may block or call back into user code is ever executed while one is held.
class spinlock
{
public:
    class locker
    {
    public:
        explicit locker(spinlock& sl): m_sl(sl) { m_sl.lock(); }
        ~locker() { m_sl.unlock(); }

        locker(const locker&) = delete;
        locker& operator=(const locker&) = delete;

    private:
        spinlock& m_sl;
    };

    void lock() noexcept
    {
        size_t spins = 0;
        while (m_locked.exchange(true, std::memory_order_acquire)) {
            // wait on a plain load, the exchange would keep stealing the cache line
            while (m_locked.load(std::memory_order_relaxed)) {
                if ((++spins % k_spins_before_yield) == 0) {
                    std::this_thread::yield();
                }
            }
        }
    }

    void unlock() noexcept { m_locked.store(false, std::memory_order_release); }

private:
    static constexpr size_t k_spins_before_yield = 1024;

    std::atomic<bool> m_locked{false};
};

} // namespace tributary
