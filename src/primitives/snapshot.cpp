// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <primitives/snapshot.h>

#include <sstream>

CNodeSnapshot::CNodeSnapshot(ObjectId id, const CIdentity& owner, NeighborList neighbors,
                             uint64_t timestamp, ObjectId previous)
    : m_id(id),
      m_owner(owner),
      m_contents(std::move(neighbors), timestamp),
      m_previous(previous)
{
}

std::string CNodeSnapshot::ToString() const
{
    std::ostringstream oss;
    oss << "CNodeSnapshot(id=" << m_id
        << ", owner=" << m_owner.ToShortString()
        << ", timestamp=" << m_contents.timestamp
        << ", neighbors=" << m_contents.neighbors.size()
        << ", previous=" << m_previous << ")";
    return oss.str();
}
