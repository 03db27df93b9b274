// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <graph/graph_errors.h>
#include <graph/update_gate.h>

const char* GraphErrorName(GraphError error) {
    switch (error) {
        case GraphError::OK: return "OK";
        case GraphError::ALREADY_REGISTERED: return "ALREADY_REGISTERED";
        case GraphError::NOT_OWNER: return "NOT_OWNER";
        case GraphError::UPDATE_TOO_SOON: return "UPDATE_TOO_SOON";
        case GraphError::CAPABILITY_MISMATCH: return "CAPABILITY_MISMATCH";
        case GraphError::CLOCK_REGRESSION: return "CLOCK_REGRESSION";
        case GraphError::UNKNOWN_OBJECT: return "UNKNOWN_OBJECT";
        case GraphError::NOT_INITIALIZED: return "NOT_INITIALIZED";
        case GraphError::ALREADY_INITIALIZED: return "ALREADY_INITIALIZED";
        case GraphError::INVALID_IDENTITY: return "INVALID_IDENTITY";
        case GraphError::STORE_FAILURE: return "STORE_FAILURE";
    }
    return "UNKNOWN";
}

std::string GraphErrorString(GraphError error) {
    switch (error) {
        case GraphError::OK:
            return "Success";
        case GraphError::ALREADY_REGISTERED:
            return "Identity is already registered";
        case GraphError::NOT_OWNER:
            return "Caller does not own this record";
        case GraphError::UPDATE_TOO_SOON:
            return "Update rejected: less than " + std::to_string(CUpdateGate::MIN_INTERVAL_MS) +
                   " ms since the last update";
        case GraphError::CAPABILITY_MISMATCH:
            return "Caller does not hold the dev capability";
        case GraphError::CLOCK_REGRESSION:
            return "Supplied time is earlier than the last recorded update";
        case GraphError::UNKNOWN_OBJECT:
            return "No such object";
        case GraphError::NOT_INITIALIZED:
            return "Graph has not been initialized";
        case GraphError::ALREADY_INITIALIZED:
            return "Graph is already initialized";
        case GraphError::INVALID_IDENTITY:
            return "Null identity is not allowed";
        case GraphError::STORE_FAILURE:
            return "Storage commit failed (see log)";
    }
    return "Unknown error";
}

std::ostream& operator<<(std::ostream& os, GraphError error) {
    return os << GraphErrorName(error);
}
