// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_UTIL_TIME_H
#define PROXIGRAPH_UTIL_TIME_H

#include <chrono>
#include <cstdint>

/** Wall clock in milliseconds since the epoch (snapshot timestamps) */
inline uint64_t GetTimeMillis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

#endif // PROXIGRAPH_UTIL_TIME_H
