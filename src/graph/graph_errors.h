// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_GRAPH_GRAPH_ERRORS_H
#define PROXIGRAPH_GRAPH_GRAPH_ERRORS_H

#include <ostream>
#include <string>

/**
 * Graph operation result codes
 *
 * Every state-changing graph operation returns one of these. Any value
 * other than OK means the operation was aborted with no effect on the
 * registry, the records, the snapshot chain or the store.
 */
enum class GraphError {
    OK,
    ALREADY_REGISTERED,    // Identity already present in the registry
    NOT_OWNER,             // Caller does not own the record
    UPDATE_TOO_SOON,       // Less than MIN_INTERVAL_MS since the last update
    CAPABILITY_MISMATCH,   // Caller is not the holder of this graph's dev capability
    CLOCK_REGRESSION,      // Supplied clock is earlier than the last recorded timestamp
    UNKNOWN_OBJECT,        // Registry or record id does not exist
    NOT_INITIALIZED,       // Graph has not been bootstrapped
    ALREADY_INITIALIZED,   // Bootstrap called twice
    INVALID_IDENTITY,      // Null identity supplied as caller or owner
    STORE_FAILURE          // Persistence layer rejected the transaction
};

/** Short identifier ("ALREADY_REGISTERED") */
const char* GraphErrorName(GraphError error);

/** Human-readable description */
std::string GraphErrorString(GraphError error);

std::ostream& operator<<(std::ostream& os, GraphError error);

#endif // PROXIGRAPH_GRAPH_GRAPH_ERRORS_H
