// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <graph/events.h>
#include <util/logging.h>

#include <algorithm>

std::string CGraphEventRecorder::Entry::ToString() const {
    switch (kind) {
        case Kind::REGISTRY_CREATED:
            return "RegistryCreated{registry_id=" + std::to_string(registry_created.registry_id) +
                   ", creator=" + registry_created.creator.GetHex() + "}";
        case Kind::NEW_USER:
            return "NewUser{owner=" + new_user.owner.GetHex() +
                   ", user_id=" + std::to_string(new_user.user_id) + "}";
        case Kind::NODE_UPDATE:
            return "NodeUpdate{user_id=" + std::to_string(node_update.user_id) +
                   ", current_node=" + std::to_string(node_update.current_node) + "}";
    }
    return "";
}

void CGraphEventRecorder::OnRegistryCreated(const RegistryCreatedEvent& event) {
    Entry entry;
    entry.kind = Kind::REGISTRY_CREATED;
    entry.registry_created = event;
    Record(entry);
}

void CGraphEventRecorder::OnNewUser(const NewUserEvent& event) {
    Entry entry;
    entry.kind = Kind::NEW_USER;
    entry.new_user = event;
    Record(entry);
}

void CGraphEventRecorder::OnNodeUpdate(const NodeUpdateEvent& event) {
    Entry entry;
    entry.kind = Kind::NODE_UPDATE;
    entry.node_update = event;
    Record(entry);
}

void CGraphEventRecorder::Record(const Entry& entry) {
    LogPrintGraph(DEBUG, "Event %s", entry.ToString().c_str());

    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.push_back(entry);
}

std::vector<CGraphEventRecorder::Entry> CGraphEventRecorder::GetEvents() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events;
}

size_t CGraphEventRecorder::Count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

size_t CGraphEventRecorder::Count(Kind kind) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_events.begin(), m_events.end(),
                                             [kind](const Entry& e) { return e.kind == kind; }));
}

void CGraphEventRecorder::Clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.clear();
}
