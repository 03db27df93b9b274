// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_DB_GRAPH_STORE_H
#define PROXIGRAPH_DB_GRAPH_STORE_H

/**
 * Graph persistence interface
 *
 * The graph hands each successful transaction to the store as one write
 * set. A store must apply a write set entirely or not at all. On startup
 * the graph loads the full image back and rebuilds its in-memory state.
 *
 * Key layout (shared by every key/value backend):
 *   "m:registry"            -> registry id, creator
 *   "m:devcap"              -> capability id, owner
 *   "m:nextid"              -> next object id
 *   "r:" + be64(sequence)   -> registered identity (registration order)
 *   "s:" + be64(id)         -> snapshot
 *   "u:" + be64(id)         -> user record
 */

#include <primitives/identity.h>
#include <primitives/object_id.h>
#include <primitives/snapshot.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

/** Registry header as persisted */
struct StoredRegistry {
    ObjectId id{NULL_OBJECT_ID};
    CIdentity creator;
};

/** Dev capability as persisted */
struct StoredDevCapability {
    ObjectId id{NULL_OBJECT_ID};
    CIdentity owner;
};

/** User record as persisted */
struct StoredUserRecord {
    ObjectId id{NULL_OBJECT_ID};
    CIdentity owner;
    ObjectId head{NULL_OBJECT_ID};
    NodeContents current;
    bool synthetic{false};
};

/**
 * Everything one transaction writes
 */
struct CGraphWriteSet {
    bool hasRegistry{false};
    StoredRegistry registry;

    bool hasDevCapability{false};
    StoredDevCapability devCapability;

    /** (sequence, identity) pairs appended to the registry */
    std::vector<std::pair<uint64_t, CIdentity>> registrations;

    /** Newly published snapshots */
    std::vector<CSnapshotRef> snapshots;

    /** Created or repointed user records */
    std::vector<StoredUserRecord> users;

    /** Next object id after this transaction (NULL_OBJECT_ID = unchanged) */
    ObjectId nextObjectId{NULL_OBJECT_ID};

    bool IsEmpty() const;
};

/**
 * Full persisted state
 */
struct CGraphImage {
    bool hasRegistry{false};
    StoredRegistry registry;

    bool hasDevCapability{false};
    StoredDevCapability devCapability;

    /** Registered identities in registration order */
    std::vector<CIdentity> registrations;

    /** All snapshots, ascending id */
    std::vector<CSnapshotRef> snapshots;

    /** All user records, ascending id */
    std::vector<StoredUserRecord> users;

    ObjectId nextObjectId{FIRST_OBJECT_ID};
};

/**
 * Record encoding shared by the key/value stores
 */
namespace GraphStoreCodec {

extern const std::string KEY_REGISTRY;
extern const std::string KEY_DEVCAP;
extern const std::string KEY_NEXTID;
extern const std::string PREFIX_REGISTRATION;
extern const std::string PREFIX_SNAPSHOT;
extern const std::string PREFIX_USER;

std::string EncodeSnapshot(const CNodeSnapshot& snapshot);
CSnapshotRef DecodeSnapshot(const std::string& value);

std::string EncodeUserRecord(const StoredUserRecord& record);
StoredUserRecord DecodeUserRecord(const std::string& value);

/** Flatten a write set into key/value puts */
std::vector<std::pair<std::string, std::string>> EncodeWriteSet(const CGraphWriteSet& writes);

/**
 * Decode one stored entry into `image`
 *
 * Entries must be fed in ascending key order.
 *
 * @return false with `error` set if the entry is malformed or unknown
 */
bool DecodeEntry(const std::string& key, const std::string& value, CGraphImage& image, std::string& error);

} // namespace GraphStoreCodec

/**
 * Abstract graph store
 */
class IGraphStore {
public:
    virtual ~IGraphStore() = default;

    /**
     * Apply one transaction atomically
     *
     * @param writes Records to persist
     * @param error Reason on failure
     * @return true if every record was persisted; false if none was
     */
    virtual bool Commit(const CGraphWriteSet& writes, std::string& error) = 0;

    /**
     * Read the full persisted state
     *
     * @param[out] image Decoded state
     * @param error Reason on failure (corruption, I/O)
     */
    virtual bool Load(CGraphImage& image, std::string& error) const = 0;

    /** True if nothing has ever been committed */
    virtual bool IsEmpty() const = 0;
};

/**
 * In-process key/value store
 *
 * Same encoding and key order as CGraphDB, without touching disk. Supports
 * failure injection so callers can exercise the all-or-nothing path.
 *
 * Thread-safe: Protected by internal mutex.
 */
class CMemoryGraphStore : public IGraphStore {
public:
    CMemoryGraphStore() = default;

    CMemoryGraphStore(const CMemoryGraphStore&) = delete;
    CMemoryGraphStore& operator=(const CMemoryGraphStore&) = delete;

    bool Commit(const CGraphWriteSet& writes, std::string& error) override;
    bool Load(CGraphImage& image, std::string& error) const override;
    bool IsEmpty() const override;

    /** Reject the next `count` commits */
    void FailNextCommits(size_t count);

    /** Number of committed write sets */
    size_t GetCommitCount() const;

    /** Raw access for corruption tests */
    void PutRaw(const std::string& key, const std::string& value);
    void EraseRaw(const std::string& key);

private:
    std::map<std::string, std::string> m_data;
    size_t m_failCommits{0};
    size_t m_commitCount{0};
    mutable std::mutex m_mutex;
};

#endif // PROXIGRAPH_DB_GRAPH_STORE_H
