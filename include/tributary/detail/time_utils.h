// Copyright (c) 2025, Ioannis Makris
// Licensed under the BSD 2-Clause License, see LICENSE.md file for details.

#pragma once

// Monotonic timestamps for processing-time accounting. Branch start times are taken with
// monotonic_now_ns() and handed back to Processing_time::add_branch_time(), possibly on another
// thread, so every caller must read the same clock.

#include <chrono>
#include <cstdint>

#if defined(__unix__) || defined(__APPLE__)
  #include <time.h>
#endif

namespace tributary {

inline uint64_t monotonic_now_ns() noexcept
{
#if defined(CLOCK_MONOTONIC)
    struct timespec ts;
    if (::clock_gettime(CLOCK_MONOTONIC, &ts) == 0) {
        return static_cast<uint64_t>(ts.tv_sec) * 1000000000ull +
               static_cast<uint64_t>(ts.tv_nsec);
    }
#endif
    const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
}

// Clamped at zero, a start taken on another clock must not wrap around.
inline uint64_t elapsed_since_ns(uint64_t start_ns) noexcept
{
    const uint64_t now = monotonic_now_ns();
    return now > start_ns ? now - start_ns : 0;
}

} // namespace tributary
