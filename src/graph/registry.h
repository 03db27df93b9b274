// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_GRAPH_REGISTRY_H
#define PROXIGRAPH_GRAPH_REGISTRY_H

/**
 * Identity Registry
 *
 * Records every identity that has registered through the normal path,
 * in registration order, and enforces at most one registration per
 * identity. Synthetic identities minted with the dev capability never
 * enter the registry.
 *
 * Membership is answered from a hash set, the ordered vector is kept
 * for consumers that rely on registration order.
 *
 * Thread-safe: Protected by internal mutex.
 */

#include <graph/graph_errors.h>
#include <primitives/identity.h>
#include <primitives/object_id.h>

#include <mutex>
#include <unordered_set>
#include <vector>

class CIdentityRegistry {
private:
    /** Registry object id */
    const ObjectId m_id;

    /** Identity that bootstrapped the graph */
    const CIdentity m_creator;

    /** Registered identities, in registration order */
    std::vector<CIdentity> m_users;

    /** Membership index over m_users */
    std::unordered_set<CIdentity, CIdentityHasher> m_index;

    /** Mutex for thread safety */
    mutable std::mutex m_mutex;

public:
    CIdentityRegistry(ObjectId id, const CIdentity& creator);

    // Prevent copying
    CIdentityRegistry(const CIdentityRegistry&) = delete;
    CIdentityRegistry& operator=(const CIdentityRegistry&) = delete;

    ObjectId GetId() const { return m_id; }
    const CIdentity& GetCreator() const { return m_creator; }

    /**
     * Register an identity
     *
     * The membership check and the append happen under one lock, so of
     * several concurrent attempts for the same identity exactly one wins.
     *
     * @param identity Identity to register
     * @return OK, or ALREADY_REGISTERED (registry unchanged)
     */
    GraphError Register(const CIdentity& identity);

    /** Check whether an identity has registered */
    bool Contains(const CIdentity& identity) const;

    /** Number of registered identities */
    size_t Size() const;

    /** Copy of the registered identities in registration order */
    std::vector<CIdentity> GetRegisteredUsers() const;
};

#endif // PROXIGRAPH_GRAPH_REGISTRY_H
