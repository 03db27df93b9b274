// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_GRAPH_PROXIMITY_GRAPH_H
#define PROXIGRAPH_GRAPH_PROXIMITY_GRAPH_H

#include <graph/dev_capability.h>
#include <graph/events.h>
#include <graph/graph_errors.h>
#include <graph/node_chain.h>
#include <graph/registry.h>
#include <graph/user_record.h>
#include <primitives/snapshot.h>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class IGraphStore;
struct CGraphImage;
struct CGraphWriteSet;

/**
 * Handles returned by CProximityGraph::Bootstrap()
 *
 * The registry id is passed to every registration. The dev capability is
 * delivered to the deployer only and stays with whoever holds this
 * unique_ptr; it cannot be copied.
 */
struct GraphHandles {
    ObjectId registryId{NULL_OBJECT_ID};
    std::unique_ptr<CDevCapability> devCapability;
};

/**
 * Proximity Graph
 *
 * Transaction layer over the identity registry, the snapshot arena and the
 * user records. Every state-changing call:
 *   1. checks its preconditions (first failure is returned)
 *   2. builds the complete write set
 *   3. commits it to the store, if one is attached
 *   4. applies it to memory
 *   5. notifies listeners
 * A call that fails at any step leaves no trace.
 *
 * Locking:
 *   - cs_registryTx serializes bootstrap and registrations
 *   - each CUserRecord's own mutex serializes updates to that record
 *   - cs_users guards the record map only for lookups and inserts
 * Snapshots are immutable and shared without locks.
 */
class CProximityGraph
{
public:
    /**
     * @param store Persistence layer, or nullptr for a memory-only graph.
     *              Not owned; must outlive the graph.
     */
    explicit CProximityGraph(IGraphStore* store = nullptr);
    ~CProximityGraph();

    CProximityGraph(const CProximityGraph&) = delete;
    CProximityGraph& operator=(const CProximityGraph&) = delete;

    /** Add an event listener. Not thread-safe against concurrent operations. */
    void AddListener(std::shared_ptr<IGraphEventListener> listener);

    // =========================================================================
    // Bootstrap
    // =========================================================================

    /**
     * Create the registry and mint the dev capability
     *
     * Happens once per graph. Emits RegistryCreated.
     *
     * @param deployer Identity that receives the dev capability
     * @param[out] handles Registry id and the capability
     * @return OK, INVALID_IDENTITY, ALREADY_INITIALIZED or STORE_FAILURE
     */
    GraphError Bootstrap(const CIdentity& deployer, GraphHandles& handles);

    /**
     * Rebuild in-memory state from the attached store
     *
     * Must be called on a fresh graph. Every invariant is re-checked; an
     * image that violates one is rejected and the graph stays empty.
     *
     * @param error Reason on failure
     * @return true if loaded (an empty store loads as an uninitialized graph)
     */
    bool LoadFromStore(std::string& error);

    /**
     * Hand the persisted dev capability back to its owner after a reload
     *
     * Only the bound owner may reopen it, and only if no capability object
     * has been delivered by this graph instance yet.
     *
     * @return OK, NOT_INITIALIZED or CAPABILITY_MISMATCH
     */
    GraphError ReopenDevCapability(const CIdentity& caller, std::unique_ptr<CDevCapability>& capability);

    bool IsInitialized() const { return m_initialized.load(std::memory_order_acquire); }
    ObjectId GetRegistryId() const;

    // =========================================================================
    // Normal path
    // =========================================================================

    /**
     * Register the caller and publish its first snapshot
     *
     * Emits NewUser then NodeUpdate.
     *
     * @param registryId Registry handle from Bootstrap()
     * @param caller Authenticated identity registering itself
     * @param neighbors Initial neighbor list (may be empty)
     * @param now Current time in milliseconds
     * @param[out] userId Id of the new user record
     * @return OK, NOT_INITIALIZED, UNKNOWN_OBJECT, INVALID_IDENTITY,
     *         ALREADY_REGISTERED or STORE_FAILURE
     */
    GraphError RegisterUser(ObjectId registryId, const CIdentity& caller, const NeighborList& neighbors,
                            uint64_t now, ObjectId& userId);

    /**
     * Publish a new snapshot for a record the caller owns
     *
     * Emits NodeUpdate.
     *
     * @param[out] snapshotId Id of the new head (optional)
     * @return OK, UNKNOWN_OBJECT, NOT_OWNER, CLOCK_REGRESSION,
     *         UPDATE_TOO_SOON or STORE_FAILURE
     */
    GraphError UpdateNode(ObjectId userId, const CIdentity& caller, const NeighborList& neighbors,
                          uint64_t now, ObjectId* snapshotId = nullptr);

    // =========================================================================
    // Dev capability path
    // =========================================================================

    /**
     * Create a record for any identity without touching the registry
     *
     * The target may later register normally. Emits NewUser then NodeUpdate.
     *
     * @return OK, CAPABILITY_MISMATCH, INVALID_IDENTITY or STORE_FAILURE
     */
    GraphError SpawnSyntheticUser(const CDevCapability& capability, const CIdentity& caller,
                                  const CIdentity& target, const NeighborList& neighbors,
                                  uint64_t now, ObjectId& userId);

    /**
     * Advance any record without the ownership check
     *
     * The update gate still applies.
     *
     * @return OK, CAPABILITY_MISMATCH, UNKNOWN_OBJECT, CLOCK_REGRESSION,
     *         UPDATE_TOO_SOON or STORE_FAILURE
     */
    GraphError SyntheticUpdate(const CDevCapability& capability, const CIdentity& caller,
                               ObjectId userId, const NeighborList& neighbors, uint64_t now,
                               ObjectId* snapshotId = nullptr);

    // =========================================================================
    // Queries
    // =========================================================================

    /** Registry, or nullptr before bootstrap */
    const CIdentityRegistry* GetRegistry() const;

    bool IsRegistered(const CIdentity& identity) const;

    CUserRecordRef GetUserRecord(ObjectId userId) const;

    /** All records owned by `owner` (registered and synthetic), oldest first */
    std::vector<ObjectId> FindUserRecords(const CIdentity& owner) const;

    /** The record created by `owner`'s registration, or NULL_OBJECT_ID */
    ObjectId FindRegisteredRecord(const CIdentity& owner) const;

    CSnapshotRef GetSnapshot(ObjectId snapshotId) const;

    /** Snapshots of a record from head back to root */
    std::vector<CSnapshotRef> GetHistory(ObjectId userId) const;

    size_t GetChainLength(ObjectId userId) const;

    size_t GetUserCount() const;
    size_t GetSnapshotCount() const;

    const CNodeChain& GetNodeChain() const { return *m_chain; }

private:
    /** Publish a record and its root snapshot (shared by both creation paths) */
    GraphError CreateRecord(const CIdentity& owner, const NeighborList& neighbors, uint64_t now,
                            bool synthetic, ObjectId& userId);

    /** Advance a record after ownership/capability has been checked */
    GraphError AdvanceRecord(CUserRecord& record, const NeighborList& neighbors, uint64_t now,
                             ObjectId* snapshotId);

    GraphError CheckCapability(const CDevCapability& capability, const CIdentity& caller) const;

    bool CommitWrites(CGraphWriteSet& writes);

    ObjectId AllocateObjectId();

    void InsertRecord(CUserRecordRef record);

    bool ApplyImage(const CGraphImage& image, std::string& error);

    void EmitRegistryCreated(const RegistryCreatedEvent& event);
    void EmitNewUser(const NewUserEvent& event);
    void EmitNodeUpdate(const NodeUpdateEvent& event);

    IGraphStore* m_store;

    std::unique_ptr<CIdentityRegistry> m_registry;
    std::unique_ptr<CNodeChain> m_chain;

    std::map<ObjectId, CUserRecordRef> mapUsers;
    std::multimap<CIdentity, ObjectId> mapOwnerRecords;
    mutable std::mutex cs_users;

    mutable std::mutex cs_registryTx;

    std::atomic<bool> m_initialized{false};
    std::atomic<ObjectId> m_nextObjectId{FIRST_OBJECT_ID};

    ObjectId m_devCapId{NULL_OBJECT_ID};
    CIdentity m_devCapOwner;
    bool m_devCapDelivered{false};

    std::vector<std::shared_ptr<IGraphEventListener>> m_listeners;
};

#endif // PROXIGRAPH_GRAPH_PROXIMITY_GRAPH_H
