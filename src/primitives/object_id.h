// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_PRIMITIVES_OBJECT_ID_H
#define PROXIGRAPH_PRIMITIVES_OBJECT_ID_H

#include <cstdint>

/**
 * Object identifier
 *
 * Every persisted object (registry, dev capability, user records and node
 * snapshots) draws its id from one monotonic per-graph counter. An object
 * created later always has a larger id than any object created before it.
 */
typedef uint64_t ObjectId;

/** Null object id ("no object") */
static constexpr ObjectId NULL_OBJECT_ID = 0;

/** First id handed out by a fresh graph */
static constexpr ObjectId FIRST_OBJECT_ID = 1;

#endif // PROXIGRAPH_PRIMITIVES_OBJECT_ID_H
