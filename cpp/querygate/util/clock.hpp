/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#if defined(__linux__)
#include <time.h>
#endif

namespace querygate {

/// Nanoseconds since epoch
using timestamp = int64_t;

constexpr timestamp ONE_MILLISECOND = 1'000'000;

} // namespace querygate

namespace querygate::util {

class SysClock {
  public:
    static timestamp nanos_since_epoch() {
        auto now = std::chrono::system_clock::now();
        auto now_ns = std::chrono::time_point_cast<std::chrono::nanoseconds>(now);
        return now_ns.time_since_epoch().count();
    }
    static timestamp coarse_nanos_since_epoch() {
#if defined(__linux__)
        timespec ts;
        clock_gettime(CLOCK_REALTIME_COARSE, &ts);
        return static_cast<timestamp>(ts.tv_sec) * 1000000000LL + ts.tv_nsec;
#else
        return nanos_since_epoch();
#endif
    }
};

struct ManualClock {
    inline static std::atomic<timestamp> time_{0};

    static timestamp nanos_since_epoch() { return time_.load(); }
    static timestamp coarse_nanos_since_epoch() { return time_.load(); }
};

using NowFunction = timestamp (*)();

} // namespace querygate::util
