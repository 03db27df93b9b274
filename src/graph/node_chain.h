// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_GRAPH_NODE_CHAIN_H
#define PROXIGRAPH_GRAPH_NODE_CHAIN_H

#include <primitives/snapshot.h>

#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * Node Chain Arena
 *
 * Append-only store of every published snapshot, keyed by object id.
 * Each owner's snapshots form a backward-linked list through
 * CNodeSnapshot::GetPrevious(); there are no forward links, so history
 * is walked from a live head towards the root.
 *
 * Link rules enforced on append:
 *   - the id is new and larger than the predecessor's id
 *   - the predecessor exists, has the same owner and a strictly smaller
 *     timestamp
 * Together with monotonic id assignment these make every chain acyclic.
 *
 * Thread-safe: the map is protected by an internal mutex. Snapshots
 * themselves are immutable and are handed out as shared const pointers.
 */
class CNodeChain
{
private:
    std::map<ObjectId, CSnapshotRef> mapSnapshots;
    mutable std::mutex cs_chain;

    bool CheckLinkLocked(const CNodeSnapshot& snapshot, std::string& error) const;

public:
    CNodeChain() = default;

    CNodeChain(const CNodeChain&) = delete;
    CNodeChain& operator=(const CNodeChain&) = delete;

    /**
     * Validate that `snapshot` could be appended
     *
     * @param snapshot Candidate snapshot
     * @param error Reason on failure
     * @return true if Append() would accept it
     */
    bool CheckLink(const CNodeSnapshot& snapshot, std::string& error) const;

    /**
     * Publish a snapshot
     *
     * @param snapshot Snapshot to publish (becomes globally readable)
     * @param error Reason on failure
     * @return false if the link rules are violated (arena unchanged)
     */
    bool Append(CSnapshotRef snapshot, std::string& error);

    /** Snapshot by id, or nullptr */
    CSnapshotRef Get(ObjectId id) const;

    bool Contains(ObjectId id) const;

    /**
     * Walk a chain from `head` back to its root
     *
     * @return snapshots ordered newest first; empty if `head` is unknown
     */
    std::vector<CSnapshotRef> GetHistory(ObjectId head) const;

    /** Number of snapshots reachable from `head` (0 if unknown) */
    size_t GetChainLength(ObjectId head) const;

    /**
     * Snapshot `steps` links behind `head`, or nullptr
     *
     * Zero-based: 0 is the head itself, 1 its predecessor. The N-th snapshot
     * of a history counted from the head is GetAncestor(head, N - 1).
     */
    CSnapshotRef GetAncestor(ObjectId head, size_t steps) const;

    /** Total number of published snapshots */
    size_t Size() const;
};

#endif // PROXIGRAPH_GRAPH_NODE_CHAIN_H
