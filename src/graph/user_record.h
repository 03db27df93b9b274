// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_GRAPH_USER_RECORD_H
#define PROXIGRAPH_GRAPH_USER_RECORD_H

#include <primitives/identity.h>
#include <primitives/object_id.h>
#include <primitives/snapshot.h>

#include <memory>
#include <mutex>
#include <string>

class CProximityGraph;

/**
 * Point-in-time copy of a user record
 */
struct UserRecordState {
    ObjectId id{NULL_OBJECT_ID};
    CIdentity owner;
    ObjectId head{NULL_OBJECT_ID};
    NodeContents current;
    bool synthetic{false};
};

/**
 * CUserRecord - mutable head pointer of one owner's snapshot chain
 *
 * Holds the id of the latest snapshot plus a cached copy of its contents.
 * The cache is only ever written together with the head, under the
 * record's mutex, so readers always see a matching pair.
 *
 * Records are only mutated by CProximityGraph, which holds m_mutex for the
 * whole update transaction. Updates to different records never contend.
 */
class CUserRecord
{
public:
    CUserRecord(ObjectId id, const CIdentity& owner, const CNodeSnapshot& head, bool synthetic);

    CUserRecord(const CUserRecord&) = delete;
    CUserRecord& operator=(const CUserRecord&) = delete;

    ObjectId GetId() const { return m_id; }
    const CIdentity& GetOwner() const { return m_owner; }

    /** True for records minted through the dev capability */
    bool IsSynthetic() const { return m_synthetic; }

    ObjectId GetHead() const;
    NodeContents GetCurrent() const;

    /** Consistent copy of head and cached contents */
    UserRecordState GetState() const;

    /** True if the cached contents equal `snapshot`'s and it is the head */
    bool IsInSyncWith(const CNodeSnapshot& snapshot) const;

    std::string ToString() const;

private:
    friend class CProximityGraph;

    /** Repoint to a new head. Caller must hold m_mutex. */
    void SetHeadLocked(const CNodeSnapshot& snapshot);

    const ObjectId m_id;
    const CIdentity m_owner;
    const bool m_synthetic;

    ObjectId m_head;
    NodeContents m_current;

    mutable std::mutex m_mutex;
};

typedef std::shared_ptr<CUserRecord> CUserRecordRef;

#endif // PROXIGRAPH_GRAPH_USER_RECORD_H
