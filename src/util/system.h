// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_UTIL_SYSTEM_H
#define PROXIGRAPH_UTIL_SYSTEM_H

#include <string>

/**
 * Get the default data directory
 *
 * Returns ~/.proxigraph, or the PROXIGRAPH_DATADIR environment variable
 * when it is set.
 */
std::string GetDataDir();

/**
 * Ensure data directory exists, creating it if necessary
 *
 * Symlinks and non-directories are rejected.
 *
 * @param path Directory path to create
 * @return true if directory exists or was created successfully
 */
bool EnsureDataDirExists(const std::string& path);

/** Join a directory and a file name with a single separator */
std::string JoinPath(const std::string& dir, const std::string& name);

#endif // PROXIGRAPH_UTIL_SYSTEM_H
