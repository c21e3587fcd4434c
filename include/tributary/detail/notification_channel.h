// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include "delay_fuzzer.h"
#include "latch.h"
#include "logging.h"
#include "spinlock.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace tributary {

///\brief Single-shot broadcast with replay for late subscribers.
///
/// The channel is either waiting or fired(value). fire() stores the value and delivers it to
/// every observer registered at that point; observers registered afterwards receive the stored
/// value immediately, on the subscribing thread. Every observer is invoked exactly once, also
/// when subscribe() races with fire(): registration and the fired transition are serialized by
/// the same lock, and whichever side comes second performs the delivery.
///
/// Observers are never invoked while the internal lock is held, so they may subscribe to this
/// or other channels, or fire other channels.
template <typename T>
class Notification_channel
{
public:
    using value_type    = T;
    using observer_type = std::function<void(const T&)>;

    Notification_channel()
        : m_state(std::make_shared<State>())
    {}

    Notification_channel(const Notification_channel&) = delete;
    Notification_channel& operator=(const Notification_channel&) = delete;

    ///\brief Register an observer.
    ///
    /// Returns a function that removes the observer again. Calling it after delivery, or after
    /// the channel was destroyed, does nothing.
    std::function<void()> subscribe(observer_type observer)
    {
        // the observer may destroy the channel, the state must outlive its delivery
        const auto state = m_state;
        {
            spinlock::locker l(state->sl);
            if (!state->fired) {
                const uint64_t id = state->next_observer_id++;
                state->observers.emplace_back(id, std::move(observer));
                std::weak_ptr<State> weak_state = state;
                return [weak_state, id]() {
                    if (auto locked = weak_state.lock()) {
                        locked->remove(id);
                    }
                };
            }
        }
        deliver(observer, *state->value);
        return [] {};
    }

    ///\brief Fire the channel. Only the first call has an effect; it returns true.
    bool fire(T value)
    {
        // an observer may release the last owner of the channel while later ones still wait
        const auto state = m_state;

        std::vector<std::pair<uint64_t, observer_type>> observers;
        {
            spinlock::locker l(state->sl);
            if (state->fired) {
                return false;
            }
            state->value.emplace(std::move(value));
            state->fired = true;
            state->fired_flag.store(true, std::memory_order_release);
            observers.swap(state->observers);
        }

        TRIBUTARY_DELAY_FUZZ();

        // once fired, the stored value is never written again
        const T& stored = *state->value;
        for (auto& entry : observers) {
            deliver(entry.second, stored);
        }
        return true;
    }

    bool fired() const noexcept
    {
        return m_state->fired_flag.load(std::memory_order_acquire);
    }

    std::optional<T> value() const
    {
        spinlock::locker l(m_state->sl);
        return m_state->value;
    }

    size_t observer_count() const
    {
        spinlock::locker l(m_state->sl);
        return m_state->observers.size();
    }

    ///\brief Block the calling thread until the channel fires, then return the value.
    T wait()
    {
        auto latch = std::make_shared<Latch>();
        subscribe([latch](const T&) { latch->release(); });
        latch->await();
        return *m_state->value;
    }

    ///\brief Block until the channel fires or the timeout expires. Returns fired().
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout)
    {
        auto latch = std::make_shared<Latch>();
        auto unsubscribe = subscribe([latch](const T&) { latch->release(); });
        if (latch->await_for(timeout)) {
            return true;
        }
        unsubscribe();
        return fired();
    }

private:
    struct State
    {
        mutable spinlock                                    sl;
        bool                                                fired = false;
        std::atomic<bool>                                   fired_flag{false};
        std::optional<T>                                    value;
        std::vector<std::pair<uint64_t, observer_type>>     observers;
        uint64_t                                            next_observer_id = 1;

        void remove(uint64_t id)
        {
            // the observer is destroyed outside the lock, it may own arbitrary state
            observer_type removed;
            {
                spinlock::locker l(sl);
                for (auto it = observers.begin(); it != observers.end(); ++it) {
                    if (it->first == id) {
                        removed = std::move(it->second);
                        observers.erase(it);
                        break;
                    }
                }
            }
        }
    };

    static void deliver(const observer_type& observer, const T& value)
    {
        if (!observer) {
            return;
        }
        // one failing observer must not deprive the others of their delivery
        try {
            observer(value);
        }
        catch (const std::exception& e) {
            ls_error() << "notification observer threw: " << e.what();
        }
        catch (...) {
            ls_error() << "notification observer threw an exception not derived from std::exception";
        }
    }

    std::shared_ptr<State> m_state;
};

} // namespace tributary
