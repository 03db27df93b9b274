// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_PRIMITIVES_SNAPSHOT_H
#define PROXIGRAPH_PRIMITIVES_SNAPSHOT_H

#include <primitives/identity.h>
#include <primitives/object_id.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/** Ordered neighbor list as supplied by the owner */
typedef std::vector<CIdentity> NeighborList;

/**
 * Contents of a snapshot: the neighbor set and when it was published
 */
struct NodeContents {
    NeighborList neighbors;
    uint64_t timestamp{0};  // milliseconds

    NodeContents() = default;
    NodeContents(NeighborList neighborsIn, uint64_t timestampIn)
        : neighbors(std::move(neighborsIn)), timestamp(timestampIn) {}

    bool operator==(const NodeContents& other) const {
        return timestamp == other.timestamp && neighbors == other.neighbors;
    }
    bool operator!=(const NodeContents& other) const { return !(*this == other); }
};

/**
 * CNodeSnapshot - immutable neighbor-set snapshot
 *
 * Snapshots form a backward-linked chain per owner: `previous` names an
 * older snapshot of the same chain (or NULL_OBJECT_ID for the root). All
 * fields are fixed at construction; once published a snapshot is shared
 * read-only through CSnapshotRef and may be read from any thread.
 */
class CNodeSnapshot
{
public:
    CNodeSnapshot(ObjectId id, const CIdentity& owner, NeighborList neighbors,
                  uint64_t timestamp, ObjectId previous);

    ObjectId GetId() const { return m_id; }
    const CIdentity& GetOwner() const { return m_owner; }
    const NeighborList& GetNeighbors() const { return m_contents.neighbors; }
    uint64_t GetTimestamp() const { return m_contents.timestamp; }
    ObjectId GetPrevious() const { return m_previous; }
    const NodeContents& GetContents() const { return m_contents; }

    /** True for the first snapshot of a chain */
    bool IsRoot() const { return m_previous == NULL_OBJECT_ID; }

    std::string ToString() const;

private:
    const ObjectId m_id;
    const CIdentity m_owner;
    const NodeContents m_contents;
    const ObjectId m_previous;
};

typedef std::shared_ptr<const CNodeSnapshot> CSnapshotRef;

#endif // PROXIGRAPH_PRIMITIVES_SNAPSHOT_H
