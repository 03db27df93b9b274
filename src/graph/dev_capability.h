// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_GRAPH_DEV_CAPABILITY_H
#define PROXIGRAPH_GRAPH_DEV_CAPABILITY_H

#include <primitives/identity.h>
#include <primitives/object_id.h>

#include <string>

class CProximityGraph;

/**
 * CDevCapability - privileged token for synthetic users and updates
 *
 * Minted once, when the graph is bootstrapped, and bound to the deploying
 * identity. Only CProximityGraph can construct one, and the token can be
 * neither copied nor moved: the holder keeps the unique_ptr it was given.
 *
 * Holding the object is not sufficient on its own. Every privileged call
 * also checks that the caller is the bound owner and that the token was
 * issued by the graph it is presented to.
 */
class CDevCapability
{
public:
    CDevCapability(const CDevCapability&) = delete;
    CDevCapability& operator=(const CDevCapability&) = delete;
    CDevCapability(CDevCapability&&) = delete;
    CDevCapability& operator=(CDevCapability&&) = delete;

    ObjectId GetId() const { return m_id; }
    const CIdentity& GetOwner() const { return m_owner; }

    /** True if `caller` is the bound owner */
    bool IsHeldBy(const CIdentity& caller) const { return caller == m_owner; }

    std::string ToString() const;

private:
    friend class CProximityGraph;

    CDevCapability(ObjectId id, const CIdentity& owner, const CProximityGraph* issuer)
        : m_id(id), m_owner(owner), m_issuer(issuer) {}

    const ObjectId m_id;
    const CIdentity m_owner;
    const CProximityGraph* const m_issuer;
};

#endif // PROXIGRAPH_GRAPH_DEV_CAPABILITY_H
