// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <graph/proximity_graph.h>
#include <graph/update_gate.h>
#include <db/graph_store.h>
#include <util/logging.h>

#include <algorithm>
#include <set>
#include <stdexcept>

CProximityGraph::CProximityGraph(IGraphStore* store)
    : m_store(store),
      m_chain(new CNodeChain())
{
}

CProximityGraph::~CProximityGraph() = default;

void CProximityGraph::AddListener(std::shared_ptr<IGraphEventListener> listener)
{
    if (listener) {
        m_listeners.push_back(std::move(listener));
    }
}

ObjectId CProximityGraph::AllocateObjectId()
{
    return m_nextObjectId.fetch_add(1);
}

bool CProximityGraph::CommitWrites(CGraphWriteSet& writes)
{
    if (!m_store) {
        return true;
    }

    writes.nextObjectId = m_nextObjectId.load();

    std::string error;
    if (!m_store->Commit(writes, error)) {
        LogPrintGraph(ERROR, "Store commit failed, transaction discarded: %s", error.c_str());
        return false;
    }
    return true;
}

void CProximityGraph::InsertRecord(CUserRecordRef record)
{
    std::lock_guard<std::mutex> lock(cs_users);
    mapOwnerRecords.emplace(record->GetOwner(), record->GetId());
    mapUsers.emplace(record->GetId(), std::move(record));
}

GraphError CProximityGraph::CheckCapability(const CDevCapability& capability, const CIdentity& caller) const
{
    if (!IsInitialized()) {
        return GraphError::NOT_INITIALIZED;
    }

    if (capability.m_issuer != this || capability.GetId() != m_devCapId) {
        LogPrintDev(WARN, "Rejected foreign capability %s", capability.ToString().c_str());
        return GraphError::CAPABILITY_MISMATCH;
    }

    if (!capability.IsHeldBy(caller)) {
        LogPrintDev(WARN, "Capability %s presented by %s", capability.ToString().c_str(),
                    caller.ToShortString().c_str());
        return GraphError::CAPABILITY_MISMATCH;
    }

    return GraphError::OK;
}

// =========================================================================
// Bootstrap
// =========================================================================

GraphError CProximityGraph::Bootstrap(const CIdentity& deployer, GraphHandles& handles)
{
    if (deployer.IsNull()) {
        return GraphError::INVALID_IDENTITY;
    }

    std::lock_guard<std::mutex> lock(cs_registryTx);

    if (IsInitialized()) {
        return GraphError::ALREADY_INITIALIZED;
    }

    // A populated store that was never loaded already holds a graph
    if (m_store && !m_store->IsEmpty()) {
        LogPrintGraph(ERROR, "Bootstrap refused: store is not empty (load it instead)");
        return GraphError::ALREADY_INITIALIZED;
    }

    ObjectId registryId = AllocateObjectId();
    ObjectId capId = AllocateObjectId();

    CGraphWriteSet writes;
    writes.hasRegistry = true;
    writes.registry.id = registryId;
    writes.registry.creator = deployer;
    writes.hasDevCapability = true;
    writes.devCapability.id = capId;
    writes.devCapability.owner = deployer;

    if (!CommitWrites(writes)) {
        return GraphError::STORE_FAILURE;
    }

    m_registry.reset(new CIdentityRegistry(registryId, deployer));
    m_devCapId = capId;
    m_devCapOwner = deployer;
    m_devCapDelivered = true;
    m_initialized.store(true, std::memory_order_release);

    handles.registryId = registryId;
    handles.devCapability = std::unique_ptr<CDevCapability>(new CDevCapability(capId, deployer, this));

    LogPrintGraph(INFO, "Registry %llu created by %s", (unsigned long long)registryId,
                  deployer.ToShortString().c_str());
    LogPrintDev(INFO, "Dev capability %llu delivered to %s", (unsigned long long)capId,
                deployer.ToShortString().c_str());

    EmitRegistryCreated(RegistryCreatedEvent{registryId, deployer});
    return GraphError::OK;
}

GraphError CProximityGraph::ReopenDevCapability(const CIdentity& caller, std::unique_ptr<CDevCapability>& capability)
{
    std::lock_guard<std::mutex> lock(cs_registryTx);

    if (!IsInitialized()) {
        return GraphError::NOT_INITIALIZED;
    }

    if (caller != m_devCapOwner) {
        LogPrintDev(WARN, "Reopen of dev capability refused for %s", caller.ToShortString().c_str());
        return GraphError::CAPABILITY_MISMATCH;
    }

    if (m_devCapDelivered) {
        LogPrintDev(WARN, "Dev capability %llu was already delivered", (unsigned long long)m_devCapId);
        return GraphError::CAPABILITY_MISMATCH;
    }

    capability = std::unique_ptr<CDevCapability>(new CDevCapability(m_devCapId, m_devCapOwner, this));
    m_devCapDelivered = true;

    LogPrintDev(INFO, "Dev capability %llu reopened for %s", (unsigned long long)m_devCapId,
                caller.ToShortString().c_str());
    return GraphError::OK;
}

ObjectId CProximityGraph::GetRegistryId() const
{
    const CIdentityRegistry* registry = GetRegistry();
    return registry ? registry->GetId() : NULL_OBJECT_ID;
}

// =========================================================================
// Record creation and advancement
// =========================================================================

GraphError CProximityGraph::CreateRecord(const CIdentity& owner, const NeighborList& neighbors, uint64_t now,
                                         bool synthetic, ObjectId& userId)
{
    ObjectId snapshotId = AllocateObjectId();
    ObjectId recordId = AllocateObjectId();

    CSnapshotRef root = std::make_shared<const CNodeSnapshot>(snapshotId, owner, neighbors, now, NULL_OBJECT_ID);

    std::string error;
    if (!m_chain->CheckLink(*root, error)) {
        throw std::logic_error("root snapshot rejected: " + error);
    }

    CGraphWriteSet writes;
    if (!synthetic) {
        writes.registrations.emplace_back(m_registry->Size(), owner);
    }
    writes.snapshots.push_back(root);

    StoredUserRecord stored;
    stored.id = recordId;
    stored.owner = owner;
    stored.head = snapshotId;
    stored.current = root->GetContents();
    stored.synthetic = synthetic;
    writes.users.push_back(stored);

    if (!CommitWrites(writes)) {
        return GraphError::STORE_FAILURE;
    }

    if (!synthetic && m_registry->Register(owner) != GraphError::OK) {
        throw std::logic_error("registry rejected a checked identity");
    }
    if (!m_chain->Append(root, error)) {
        throw std::logic_error("node chain rejected a checked snapshot: " + error);
    }

    CUserRecordRef record = std::make_shared<CUserRecord>(recordId, owner, *root, synthetic);
    InsertRecord(record);

    userId = recordId;

    EmitNewUser(NewUserEvent{owner, recordId});
    EmitNodeUpdate(NodeUpdateEvent{recordId, snapshotId});
    return GraphError::OK;
}

GraphError CProximityGraph::AdvanceRecord(CUserRecord& record, const NeighborList& neighbors, uint64_t now,
                                          ObjectId* snapshotId)
{
    // Held through commit and apply so updates to one record are serialized
    std::lock_guard<std::mutex> lock(record.m_mutex);

    GraphError gate = CUpdateGate::Check(now, record.m_current.timestamp);
    if (gate != GraphError::OK) {
        LogPrintGraph(DEBUG, "Update of record %llu rejected: %s (last=%llu, now=%llu)",
                      (unsigned long long)record.GetId(), GraphErrorName(gate),
                      (unsigned long long)record.m_current.timestamp, (unsigned long long)now);
        return gate;
    }

    ObjectId newId = AllocateObjectId();
    CSnapshotRef snapshot = std::make_shared<const CNodeSnapshot>(newId, record.GetOwner(), neighbors, now,
                                                                  record.m_head);

    std::string error;
    if (!m_chain->CheckLink(*snapshot, error)) {
        throw std::logic_error("snapshot rejected by node chain: " + error);
    }

    CGraphWriteSet writes;
    writes.snapshots.push_back(snapshot);

    StoredUserRecord stored;
    stored.id = record.GetId();
    stored.owner = record.GetOwner();
    stored.head = newId;
    stored.current = snapshot->GetContents();
    stored.synthetic = record.IsSynthetic();
    writes.users.push_back(stored);

    if (!CommitWrites(writes)) {
        return GraphError::STORE_FAILURE;
    }

    if (!m_chain->Append(snapshot, error)) {
        throw std::logic_error("node chain rejected a checked snapshot: " + error);
    }
    record.SetHeadLocked(*snapshot);

    if (snapshotId) {
        *snapshotId = newId;
    }

    LogPrintGraph(DEBUG, "Record %llu advanced to snapshot %llu", (unsigned long long)record.GetId(),
                  (unsigned long long)newId);

    EmitNodeUpdate(NodeUpdateEvent{record.GetId(), newId});
    return GraphError::OK;
}

// =========================================================================
// Normal path
// =========================================================================

GraphError CProximityGraph::RegisterUser(ObjectId registryId, const CIdentity& caller, const NeighborList& neighbors,
                                         uint64_t now, ObjectId& userId)
{
    if (!IsInitialized()) {
        return GraphError::NOT_INITIALIZED;
    }

    if (registryId != m_registry->GetId()) {
        return GraphError::UNKNOWN_OBJECT;
    }

    if (caller.IsNull()) {
        return GraphError::INVALID_IDENTITY;
    }

    std::lock_guard<std::mutex> lock(cs_registryTx);

    if (m_registry->Contains(caller)) {
        LogPrintRegistry(DEBUG, "Registration rejected, %s already registered", caller.ToShortString().c_str());
        return GraphError::ALREADY_REGISTERED;
    }

    GraphError result = CreateRecord(caller, neighbors, now, false, userId);
    if (result == GraphError::OK) {
        LogPrintRegistry(INFO, "Registered %s as record %llu", caller.ToShortString().c_str(),
                         (unsigned long long)userId);
    }
    return result;
}

GraphError CProximityGraph::UpdateNode(ObjectId userId, const CIdentity& caller, const NeighborList& neighbors,
                                       uint64_t now, ObjectId* snapshotId)
{
    CUserRecordRef record = GetUserRecord(userId);
    if (!record) {
        return GraphError::UNKNOWN_OBJECT;
    }

    if (record->GetOwner() != caller) {
        LogPrintGraph(DEBUG, "Update of record %llu by %s rejected: not owner", (unsigned long long)userId,
                      caller.ToShortString().c_str());
        return GraphError::NOT_OWNER;
    }

    return AdvanceRecord(*record, neighbors, now, snapshotId);
}

// =========================================================================
// Dev capability path
// =========================================================================

GraphError CProximityGraph::SpawnSyntheticUser(const CDevCapability& capability, const CIdentity& caller,
                                               const CIdentity& target, const NeighborList& neighbors,
                                               uint64_t now, ObjectId& userId)
{
    GraphError check = CheckCapability(capability, caller);
    if (check != GraphError::OK) {
        return check;
    }

    if (target.IsNull()) {
        return GraphError::INVALID_IDENTITY;
    }

    GraphError result = CreateRecord(target, neighbors, now, true, userId);
    if (result == GraphError::OK) {
        LogPrintDev(INFO, "Spawned synthetic record %llu for %s", (unsigned long long)userId,
                    target.ToShortString().c_str());
    }
    return result;
}

GraphError CProximityGraph::SyntheticUpdate(const CDevCapability& capability, const CIdentity& caller,
                                            ObjectId userId, const NeighborList& neighbors, uint64_t now,
                                            ObjectId* snapshotId)
{
    GraphError check = CheckCapability(capability, caller);
    if (check != GraphError::OK) {
        return check;
    }

    CUserRecordRef record = GetUserRecord(userId);
    if (!record) {
        return GraphError::UNKNOWN_OBJECT;
    }

    GraphError result = AdvanceRecord(*record, neighbors, now, snapshotId);
    if (result == GraphError::OK) {
        LogPrintDev(INFO, "Synthetic update of record %llu owned by %s", (unsigned long long)userId,
                    record->GetOwner().ToShortString().c_str());
    }
    return result;
}

// =========================================================================
// Reload
// =========================================================================

bool CProximityGraph::LoadFromStore(std::string& error)
{
    if (!m_store) {
        error = "no store attached";
        return false;
    }

    std::lock_guard<std::mutex> lock(cs_registryTx);

    if (IsInitialized() || m_chain->Size() > 0) {
        error = "graph already holds state";
        return false;
    }

    CGraphImage image;
    if (!m_store->Load(image, error)) {
        return false;
    }

    if (!ApplyImage(image, error)) {
        LogPrintGraph(ERROR, "Stored graph rejected: %s", error.c_str());
        return false;
    }
    return true;
}

bool CProximityGraph::ApplyImage(const CGraphImage& image, std::string& error)
{
    if (!image.hasRegistry) {
        if (image.hasDevCapability || !image.registrations.empty() || !image.snapshots.empty() ||
            !image.users.empty()) {
            error = "graph data present without a registry";
            return false;
        }
        LogPrintGraph(INFO, "Store is empty, graph awaits bootstrap");
        return true;
    }

    if (!image.hasDevCapability) {
        error = "registry present without a dev capability";
        return false;
    }

    if (image.registry.creator.IsNull() || image.devCapability.owner.IsNull()) {
        error = "null creator or capability owner";
        return false;
    }

    ObjectId maxId = std::max(image.registry.id, image.devCapability.id);

    // Registry
    std::unique_ptr<CIdentityRegistry> registry(new CIdentityRegistry(image.registry.id, image.registry.creator));
    for (const CIdentity& identity : image.registrations) {
        if (identity.IsNull() || registry->Register(identity) != GraphError::OK) {
            error = "invalid or duplicate registration " + identity.GetHex();
            return false;
        }
    }

    // Snapshot arena; ascending ids put every predecessor first
    std::unique_ptr<CNodeChain> chain(new CNodeChain());
    std::vector<CSnapshotRef> snapshots = image.snapshots;
    std::sort(snapshots.begin(), snapshots.end(),
              [](const CSnapshotRef& a, const CSnapshotRef& b) { return a->GetId() < b->GetId(); });

    std::map<ObjectId, size_t> references;
    for (const CSnapshotRef& snapshot : snapshots) {
        if (!chain->Append(snapshot, error)) {
            return false;
        }
        references[snapshot->GetId()] = 0;
        if (!snapshot->IsRoot()) {
            references[snapshot->GetPrevious()]++;
        }
        maxId = std::max(maxId, snapshot->GetId());
    }

    // User records
    std::vector<CUserRecordRef> records;
    std::set<ObjectId> recordIds;
    std::map<CIdentity, size_t> registeredRecords;
    for (const StoredUserRecord& stored : image.users) {
        if (!recordIds.insert(stored.id).second || chain->Contains(stored.id)) {
            error = "duplicate object id " + std::to_string(stored.id);
            return false;
        }

        CSnapshotRef head = chain->Get(stored.head);
        if (!head) {
            error = "record " + std::to_string(stored.id) + " has unknown head " + std::to_string(stored.head);
            return false;
        }
        if (head->GetOwner() != stored.owner) {
            error = "record " + std::to_string(stored.id) + " head has a different owner";
            return false;
        }
        if (head->GetContents() != stored.current) {
            error = "record " + std::to_string(stored.id) + " is out of sync with its head";
            return false;
        }
        if (!stored.synthetic) {
            if (!registry->Contains(stored.owner)) {
                error = "record " + std::to_string(stored.id) + " owner is not registered";
                return false;
            }
            registeredRecords[stored.owner]++;
        }

        references[stored.head]++;
        maxId = std::max(maxId, stored.id);
        records.push_back(std::make_shared<CUserRecord>(stored.id, stored.owner, *head, stored.synthetic));
    }

    // Every snapshot is either one record's head or one snapshot's predecessor
    for (const auto& entry : references) {
        if (entry.second != 1) {
            error = "snapshot " + std::to_string(entry.first) + " referenced " + std::to_string(entry.second) +
                    " times";
            return false;
        }
    }

    if (registeredRecords.size() != registry->Size()) {
        error = "registered identity without a user record";
        return false;
    }
    for (const auto& entry : registeredRecords) {
        if (entry.second != 1) {
            error = "identity " + entry.first.ToShortString() + " has several registered records";
            return false;
        }
    }

    // Ids from failed commits may leave gaps but are never reused
    ObjectId nextId = std::max(image.nextObjectId, maxId + 1);

    m_registry = std::move(registry);
    m_chain = std::move(chain);
    for (CUserRecordRef& record : records) {
        InsertRecord(std::move(record));
    }
    m_devCapId = image.devCapability.id;
    m_devCapOwner = image.devCapability.owner;
    m_devCapDelivered = false;
    m_nextObjectId.store(nextId);
    m_initialized.store(true, std::memory_order_release);

    LogPrintGraph(INFO, "Graph loaded: registry %llu, %zu registered, %zu records, %zu snapshots",
                  (unsigned long long)m_registry->GetId(), m_registry->Size(), records.size(), m_chain->Size());
    return true;
}

// =========================================================================
// Queries
// =========================================================================

const CIdentityRegistry* CProximityGraph::GetRegistry() const
{
    return IsInitialized() ? m_registry.get() : nullptr;
}

bool CProximityGraph::IsRegistered(const CIdentity& identity) const
{
    const CIdentityRegistry* registry = GetRegistry();
    return registry && registry->Contains(identity);
}

CUserRecordRef CProximityGraph::GetUserRecord(ObjectId userId) const
{
    std::lock_guard<std::mutex> lock(cs_users);
    auto it = mapUsers.find(userId);
    return it == mapUsers.end() ? CUserRecordRef() : it->second;
}

std::vector<ObjectId> CProximityGraph::FindUserRecords(const CIdentity& owner) const
{
    std::lock_guard<std::mutex> lock(cs_users);
    std::vector<ObjectId> result;
    auto range = mapOwnerRecords.equal_range(owner);
    for (auto it = range.first; it != range.second; ++it) {
        result.push_back(it->second);
    }
    std::sort(result.begin(), result.end());
    return result;
}

ObjectId CProximityGraph::FindRegisteredRecord(const CIdentity& owner) const
{
    for (ObjectId id : FindUserRecords(owner)) {
        CUserRecordRef record = GetUserRecord(id);
        if (record && !record->IsSynthetic()) {
            return id;
        }
    }
    return NULL_OBJECT_ID;
}

CSnapshotRef CProximityGraph::GetSnapshot(ObjectId snapshotId) const
{
    return m_chain->Get(snapshotId);
}

std::vector<CSnapshotRef> CProximityGraph::GetHistory(ObjectId userId) const
{
    CUserRecordRef record = GetUserRecord(userId);
    if (!record) {
        return {};
    }
    return m_chain->GetHistory(record->GetHead());
}

size_t CProximityGraph::GetChainLength(ObjectId userId) const
{
    CUserRecordRef record = GetUserRecord(userId);
    if (!record) {
        return 0;
    }
    return m_chain->GetChainLength(record->GetHead());
}

size_t CProximityGraph::GetUserCount() const
{
    std::lock_guard<std::mutex> lock(cs_users);
    return mapUsers.size();
}

size_t CProximityGraph::GetSnapshotCount() const
{
    return m_chain->Size();
}

// =========================================================================
// Events
// =========================================================================

void CProximityGraph::EmitRegistryCreated(const RegistryCreatedEvent& event)
{
    for (const auto& listener : m_listeners) {
        listener->OnRegistryCreated(event);
    }
}

void CProximityGraph::EmitNewUser(const NewUserEvent& event)
{
    for (const auto& listener : m_listeners) {
        listener->OnNewUser(event);
    }
}

void CProximityGraph::EmitNodeUpdate(const NodeUpdateEvent& event)
{
    for (const auto& listener : m_listeners) {
        listener->OnNodeUpdate(event);
    }
}
