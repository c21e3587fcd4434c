// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>
#include <thread>

// Randomized, seed-reproducible sleeps at the points where completion bookkeeping races:
// slot registration and release, terminal-state transitions and channel delivery.
// Disabled by default; the check costs one relaxed load.

namespace tributary {
namespace detail {

class delay_fuzzer {
public:
    static void set_enabled(bool enabled) noexcept
    {
        s_enabled.store(enabled, std::memory_order_release);
    }

    static bool enabled() noexcept
    {
        return s_enabled.load(std::memory_order_relaxed);
    }

    static void set_seed(std::uint64_t seed) noexcept
    {
        s_seed.store(seed, std::memory_order_release);
        s_generation.fetch_add(1, std::memory_order_acq_rel);
    }

    static void set_delay_bounds(std::uint32_t min_delay_us, std::uint32_t max_delay_us) noexcept
    {
        if (max_delay_us < min_delay_us) {
            max_delay_us = min_delay_us;
        }
        s_min_delay.store(min_delay_us, std::memory_order_release);
        s_max_delay.store(max_delay_us, std::memory_order_release);
    }

    // One in `rate` eligible points sleeps.
    static void set_injection_rate(unsigned rate) noexcept
    {
        s_injection_rate.store(rate == 0U ? 1U : rate, std::memory_order_release);
    }

    static std::uint64_t injections() noexcept
    {
        return s_injections.load(std::memory_order_acquire);
    }

    static void maybe_inject_delay() noexcept
    {
        if (!enabled()) {
            return;
        }

        auto& state = thread_state();
        const std::uint64_t generation = s_generation.load(std::memory_order_acquire);
        if (state.generation != generation) {
            reseed(state, generation);
        }

        const unsigned rate = s_injection_rate.load(std::memory_order_acquire);
        if (rate > 1U && (state.prng() % rate) != 0U) {
            return;
        }

        const std::uint32_t min_delay_us = s_min_delay.load(std::memory_order_acquire);
        const std::uint32_t max_delay_us = s_max_delay.load(std::memory_order_acquire);
        // the bounds are read one at a time, a concurrent set_delay_bounds() may mix them
        const std::uint32_t span = (max_delay_us >= min_delay_us) ? max_delay_us - min_delay_us : 0U;
        std::uint32_t delay_us = min_delay_us;
        if (span > 0U) {
            delay_us += static_cast<std::uint32_t>(state.prng() % (static_cast<std::uint64_t>(span) + 1U));
        }

        s_injections.fetch_add(1, std::memory_order_relaxed);
        if (delay_us == 0U) {
            std::this_thread::yield();
            return;
        }
        std::this_thread::sleep_for(std::chrono::microseconds(delay_us));
    }

private:
    struct thread_state_data {
        std::mt19937_64 prng{};
        std::uint64_t   generation = 0;
        std::uint64_t   thread_index = 0;
        bool            has_thread_index = false;
    };

    static thread_state_data& thread_state() noexcept
    {
        thread_local thread_state_data state{};
        return state;
    }

    static void reseed(thread_state_data& state, std::uint64_t generation) noexcept
    {
        state.generation = generation;
        if (!state.has_thread_index) {
            state.thread_index = s_thread_counter.fetch_add(1, std::memory_order_relaxed);
            state.has_thread_index = true;
        }

        const std::uint64_t base_seed = s_seed.load(std::memory_order_acquire);
        std::seed_seq sequence{
            static_cast<std::uint32_t>(base_seed & 0xFFFF'FFFFULL),
            static_cast<std::uint32_t>((base_seed >> 32) & 0xFFFF'FFFFULL),
            static_cast<std::uint32_t>(state.thread_index & 0xFFFF'FFFFULL),
            static_cast<std::uint32_t>(generation & 0xFFFF'FFFFULL)
        };
        state.prng.seed(sequence);
    }

    static inline std::atomic<bool>           s_enabled{false};
    static inline std::atomic<std::uint64_t>  s_seed{0};
    static inline std::atomic<std::uint64_t>  s_generation{1};
    static inline std::atomic<std::uint32_t>  s_min_delay{0};
    static inline std::atomic<std::uint32_t>  s_max_delay{50};
    static inline std::atomic<unsigned>       s_injection_rate{1};
    static inline std::atomic<std::uint64_t>  s_thread_counter{0};
    static inline std::atomic<std::uint64_t>  s_injections{0};
};

} // namespace detail

inline void set_delay_fuzzing_enabled(bool enabled) noexcept
{
    detail::delay_fuzzer::set_enabled(enabled);
}

inline void set_delay_fuzzing_seed(std::uint64_t seed) noexcept
{
    detail::delay_fuzzer::set_seed(seed);
}

inline void set_delay_fuzzing_bounds(std::uint32_t min_delay_us, std::uint32_t max_delay_us) noexcept
{
    detail::delay_fuzzer::set_delay_bounds(min_delay_us, max_delay_us);
}

inline void set_delay_fuzzing_injection_rate(unsigned rate) noexcept
{
    detail::delay_fuzzer::set_injection_rate(rate);
}

namespace detail {

struct delay_fuzz_scope {
    delay_fuzz_scope(std::uint64_t seed, std::uint32_t min_delay_us, std::uint32_t max_delay_us) noexcept
        : m_previous(delay_fuzzer::enabled())
    {
        delay_fuzzer::set_seed(seed);
        delay_fuzzer::set_delay_bounds(min_delay_us, max_delay_us);
        delay_fuzzer::set_enabled(true);
    }

    ~delay_fuzz_scope() noexcept
    {
        delay_fuzzer::set_enabled(m_previous);
    }

    delay_fuzz_scope(const delay_fuzz_scope&) = delete;
    delay_fuzz_scope& operator=(const delay_fuzz_scope&) = delete;

private:
    bool m_previous;
};

} // namespace detail

} // namespace tributary

#define TRIBUTARY_DELAY_FUZZ() ::tributary::detail::delay_fuzzer::maybe_inject_delay()
