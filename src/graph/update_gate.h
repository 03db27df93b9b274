// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_GRAPH_UPDATE_GATE_H
#define PROXIGRAPH_GRAPH_UPDATE_GATE_H

#include <graph/graph_errors.h>

#include <cstdint>

/**
 * CUpdateGate - node update rate limiter.
 *
 * A record may advance to a new snapshot only when at least
 * MIN_INTERVAL_MS has passed since the timestamp of its current one.
 * The boundary is inclusive: exactly MIN_INTERVAL_MS is allowed.
 *
 * The clock is trusted input. A reading earlier than the last recorded
 * timestamp is reported as CLOCK_REGRESSION and never wraps around into
 * an "allowed" result.
 *
 * Stateless: all methods are static.
 */
class CUpdateGate {
public:
    // Policy constant. Not configurable.
    static constexpr uint64_t MIN_INTERVAL_MS = 10000;

    /**
     * Decide whether an update at `now` may follow one at `lastTimestamp`.
     *
     * @return OK, UPDATE_TOO_SOON or CLOCK_REGRESSION
     */
    static GraphError Check(uint64_t now, uint64_t lastTimestamp);

    /** Boolean form of Check() */
    static bool IsAllowed(uint64_t now, uint64_t lastTimestamp);

    /**
     * Earliest time at which an update following `lastTimestamp` passes
     * the gate (saturates at UINT64_MAX).
     */
    static uint64_t NextAllowedTime(uint64_t lastTimestamp);
};

#endif // PROXIGRAPH_GRAPH_UPDATE_GATE_H
