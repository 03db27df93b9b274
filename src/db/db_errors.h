// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_DB_DB_ERRORS_H
#define PROXIGRAPH_DB_DB_ERRORS_H

#include <leveldb/status.h>
#include <string>

/**
 * Database error classification
 *
 * Maps LevelDB statuses onto a small set of categories so the graph
 * database can log a useful message and decide whether a failed commit
 * leaves the data directory usable.
 */

/**
 * Database error types
 */
enum class DBErrorType {
    OK,                    // No error
    CORRUPTION,            // Data corruption detected
    IO_ERROR,              // I/O error (disk full, permission denied, etc.)
    NOT_FOUND,             // Key not found (normal for some operations)
    INVALID_ARGUMENT,      // Invalid argument passed to DB operation
    NOT_SUPPORTED,         // Operation not supported
    UNKNOWN                // Unknown error type
};

/**
 * Classify LevelDB status into error type
 */
DBErrorType ClassifyDBError(const leveldb::Status& status);

/**
 * Check if the store remains usable after this error
 *
 * A failed commit with a recoverable error left no partial writes and
 * the next transaction may be attempted.
 */
bool IsRecoverableError(DBErrorType error_type);

/**
 * Get human-readable error message
 *
 * @param status LevelDB status
 * @param error_type Classified error type
 */
std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type);

/** Short name of an error type ("CORRUPTION") */
const char* DBErrorTypeName(DBErrorType error_type);

#endif // PROXIGRAPH_DB_DB_ERRORS_H
