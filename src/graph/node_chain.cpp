// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <graph/node_chain.h>
#include <util/logging.h>

bool CNodeChain::CheckLinkLocked(const CNodeSnapshot& snapshot, std::string& error) const
{
    if (snapshot.GetId() == NULL_OBJECT_ID) {
        error = "snapshot has null id";
        return false;
    }
    if (mapSnapshots.count(snapshot.GetId()) != 0) {
        error = "snapshot " + std::to_string(snapshot.GetId()) + " already published";
        return false;
    }
    if (snapshot.IsRoot()) {
        return true;
    }

    auto it = mapSnapshots.find(snapshot.GetPrevious());
    if (it == mapSnapshots.end()) {
        error = "previous snapshot " + std::to_string(snapshot.GetPrevious()) + " not found";
        return false;
    }
    const CNodeSnapshot& prev = *it->second;
    if (prev.GetId() >= snapshot.GetId()) {
        error = "previous snapshot id is not older";
        return false;
    }
    if (prev.GetOwner() != snapshot.GetOwner()) {
        error = "previous snapshot belongs to another owner";
        return false;
    }
    if (prev.GetTimestamp() >= snapshot.GetTimestamp()) {
        error = "previous snapshot timestamp is not earlier";
        return false;
    }
    return true;
}

bool CNodeChain::CheckLink(const CNodeSnapshot& snapshot, std::string& error) const
{
    std::lock_guard<std::mutex> lock(cs_chain);
    return CheckLinkLocked(snapshot, error);
}

bool CNodeChain::Append(CSnapshotRef snapshot, std::string& error)
{
    if (!snapshot) {
        error = "null snapshot";
        return false;
    }

    std::lock_guard<std::mutex> lock(cs_chain);
    if (!CheckLinkLocked(*snapshot, error)) {
        LogPrintGraph(ERROR, "Rejected snapshot %llu: %s",
                      static_cast<unsigned long long>(snapshot->GetId()), error.c_str());
        return false;
    }

    ObjectId id = snapshot->GetId();
    mapSnapshots.emplace(id, std::move(snapshot));
    return true;
}

CSnapshotRef CNodeChain::Get(ObjectId id) const
{
    std::lock_guard<std::mutex> lock(cs_chain);
    auto it = mapSnapshots.find(id);
    if (it == mapSnapshots.end()) {
        return nullptr;
    }
    return it->second;
}

bool CNodeChain::Contains(ObjectId id) const
{
    std::lock_guard<std::mutex> lock(cs_chain);
    return mapSnapshots.count(id) != 0;
}

std::vector<CSnapshotRef> CNodeChain::GetHistory(ObjectId head) const
{
    std::vector<CSnapshotRef> history;

    std::lock_guard<std::mutex> lock(cs_chain);
    ObjectId cursor = head;
    while (cursor != NULL_OBJECT_ID) {
        auto it = mapSnapshots.find(cursor);
        if (it == mapSnapshots.end()) {
            break;
        }
        history.push_back(it->second);
        cursor = it->second->GetPrevious();
    }
    return history;
}

size_t CNodeChain::GetChainLength(ObjectId head) const
{
    std::lock_guard<std::mutex> lock(cs_chain);
    size_t length = 0;
    ObjectId cursor = head;
    while (cursor != NULL_OBJECT_ID) {
        auto it = mapSnapshots.find(cursor);
        if (it == mapSnapshots.end()) {
            break;
        }
        length++;
        cursor = it->second->GetPrevious();
    }
    return length;
}

CSnapshotRef CNodeChain::GetAncestor(ObjectId head, size_t steps) const
{
    std::lock_guard<std::mutex> lock(cs_chain);
    ObjectId cursor = head;
    for (size_t i = 0; cursor != NULL_OBJECT_ID; i++) {
        auto it = mapSnapshots.find(cursor);
        if (it == mapSnapshots.end()) {
            return nullptr;
        }
        if (i == steps) {
            return it->second;
        }
        cursor = it->second->GetPrevious();
    }
    return nullptr;
}

size_t CNodeChain::Size() const
{
    std::lock_guard<std::mutex> lock(cs_chain);
    return mapSnapshots.size();
}
