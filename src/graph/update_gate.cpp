// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <graph/update_gate.h>

#include <limits>

GraphError CUpdateGate::Check(uint64_t now, uint64_t lastTimestamp)
{
    if (now < lastTimestamp)
        return GraphError::CLOCK_REGRESSION;

    // now >= lastTimestamp, so the subtraction cannot wrap.
    if (now - lastTimestamp < MIN_INTERVAL_MS)
        return GraphError::UPDATE_TOO_SOON;

    return GraphError::OK;
}

bool CUpdateGate::IsAllowed(uint64_t now, uint64_t lastTimestamp)
{
    return Check(now, lastTimestamp) == GraphError::OK;
}

uint64_t CUpdateGate::NextAllowedTime(uint64_t lastTimestamp)
{
    if (lastTimestamp > std::numeric_limits<uint64_t>::max() - MIN_INTERVAL_MS)
        return std::numeric_limits<uint64_t>::max();
    return lastTimestamp + MIN_INTERVAL_MS;
}
