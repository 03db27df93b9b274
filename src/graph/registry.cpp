// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <graph/registry.h>
#include <util/logging.h>

CIdentityRegistry::CIdentityRegistry(ObjectId id, const CIdentity& creator)
    : m_id(id), m_creator(creator) {}

GraphError CIdentityRegistry::Register(const CIdentity& identity) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_index.insert(identity).second) {
        return GraphError::ALREADY_REGISTERED;
    }
    m_users.push_back(identity);

    LogPrintRegistry(DEBUG, "Registered %s (registry %llu, size %zu)",
                     identity.ToShortString().c_str(),
                     static_cast<unsigned long long>(m_id), m_users.size());
    return GraphError::OK;
}

bool CIdentityRegistry::Contains(const CIdentity& identity) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.count(identity) != 0;
}

size_t CIdentityRegistry::Size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_users.size();
}

std::vector<CIdentity> CIdentityRegistry::GetRegisteredUsers() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_users;
}
