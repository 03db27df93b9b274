// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <graph/user_record.h>

#include <sstream>

CUserRecord::CUserRecord(ObjectId id, const CIdentity& owner, const CNodeSnapshot& head, bool synthetic)
    : m_id(id),
      m_owner(owner),
      m_synthetic(synthetic),
      m_head(head.GetId()),
      m_current(head.GetContents())
{
}

ObjectId CUserRecord::GetHead() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_head;
}

NodeContents CUserRecord::GetCurrent() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current;
}

UserRecordState CUserRecord::GetState() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    UserRecordState state;
    state.id = m_id;
    state.owner = m_owner;
    state.head = m_head;
    state.current = m_current;
    state.synthetic = m_synthetic;
    return state;
}

bool CUserRecord::IsInSyncWith(const CNodeSnapshot& snapshot) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_head == snapshot.GetId() && m_current == snapshot.GetContents();
}

void CUserRecord::SetHeadLocked(const CNodeSnapshot& snapshot)
{
    m_head = snapshot.GetId();
    m_current = snapshot.GetContents();
}

std::string CUserRecord::ToString() const
{
    UserRecordState state = GetState();
    std::ostringstream oss;
    oss << "CUserRecord(id=" << state.id
        << ", owner=" << state.owner.ToShortString()
        << ", head=" << state.head
        << ", timestamp=" << state.current.timestamp
        << ", neighbors=" << state.current.neighbors.size()
        << (state.synthetic ? ", synthetic" : "") << ")";
    return oss.str();
}
