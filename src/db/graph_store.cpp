// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <db/graph_store.h>
#include <db/serialize.h>
#include <util/logging.h>

#include <memory>
#include <stdexcept>

namespace GraphStoreCodec {

const std::string KEY_REGISTRY = "m:registry";
const std::string KEY_DEVCAP = "m:devcap";
const std::string KEY_NEXTID = "m:nextid";
const std::string PREFIX_REGISTRATION = "r:";
const std::string PREFIX_SNAPSHOT = "s:";
const std::string PREFIX_USER = "u:";

// Record format version byte
static const uint8_t RECORD_VERSION = 1;

static bool HasPrefix(const std::string& key, const std::string& prefix) {
    return key.size() == prefix.size() + 8 && key.compare(0, prefix.size(), prefix) == 0;
}

static void ExpectEnd(const CDataStream& stream) {
    if (!stream.eof()) {
        throw std::runtime_error("trailing bytes in record");
    }
}

static void ExpectVersion(CDataStream& stream) {
    uint8_t version = stream.ReadUint8();
    if (version != RECORD_VERSION) {
        throw std::runtime_error("unsupported record version " + std::to_string(version));
    }
}

std::string EncodeSnapshot(const CNodeSnapshot& snapshot) {
    CDataStream stream;
    stream.WriteUint8(RECORD_VERSION);
    stream.WriteUint64(snapshot.GetId());
    stream.WriteIdentity(snapshot.GetOwner());
    stream.WriteIdentityList(snapshot.GetNeighbors());
    stream.WriteUint64(snapshot.GetTimestamp());
    stream.WriteUint64(snapshot.GetPrevious());
    return stream.str();
}

CSnapshotRef DecodeSnapshot(const std::string& value) {
    CDataStream stream(value);
    ExpectVersion(stream);
    ObjectId id = stream.ReadUint64();
    CIdentity owner = stream.ReadIdentity();
    NeighborList neighbors = stream.ReadIdentityList();
    uint64_t timestamp = stream.ReadUint64();
    ObjectId previous = stream.ReadUint64();
    ExpectEnd(stream);
    return std::make_shared<const CNodeSnapshot>(id, owner, std::move(neighbors), timestamp, previous);
}

std::string EncodeUserRecord(const StoredUserRecord& record) {
    CDataStream stream;
    stream.WriteUint8(RECORD_VERSION);
    stream.WriteUint64(record.id);
    stream.WriteIdentity(record.owner);
    stream.WriteUint64(record.head);
    stream.WriteIdentityList(record.current.neighbors);
    stream.WriteUint64(record.current.timestamp);
    stream.WriteBool(record.synthetic);
    return stream.str();
}

StoredUserRecord DecodeUserRecord(const std::string& value) {
    CDataStream stream(value);
    ExpectVersion(stream);
    StoredUserRecord record;
    record.id = stream.ReadUint64();
    record.owner = stream.ReadIdentity();
    record.head = stream.ReadUint64();
    record.current.neighbors = stream.ReadIdentityList();
    record.current.timestamp = stream.ReadUint64();
    record.synthetic = stream.ReadBool();
    ExpectEnd(stream);
    return record;
}

static std::string EncodeIdAndIdentity(ObjectId id, const CIdentity& identity) {
    CDataStream stream;
    stream.WriteUint64(id);
    stream.WriteIdentity(identity);
    return stream.str();
}

std::vector<std::pair<std::string, std::string>> EncodeWriteSet(const CGraphWriteSet& writes) {
    std::vector<std::pair<std::string, std::string>> puts;

    if (writes.hasRegistry) {
        puts.emplace_back(KEY_REGISTRY, EncodeIdAndIdentity(writes.registry.id, writes.registry.creator));
    }
    if (writes.hasDevCapability) {
        puts.emplace_back(KEY_DEVCAP, EncodeIdAndIdentity(writes.devCapability.id, writes.devCapability.owner));
    }
    for (const auto& reg : writes.registrations) {
        CDataStream stream;
        stream.WriteIdentity(reg.second);
        puts.emplace_back(PREFIX_REGISTRATION + EncodeKeyUint64(reg.first), stream.str());
    }
    for (const CSnapshotRef& snapshot : writes.snapshots) {
        puts.emplace_back(PREFIX_SNAPSHOT + EncodeKeyUint64(snapshot->GetId()), EncodeSnapshot(*snapshot));
    }
    for (const StoredUserRecord& user : writes.users) {
        puts.emplace_back(PREFIX_USER + EncodeKeyUint64(user.id), EncodeUserRecord(user));
    }
    if (writes.nextObjectId != NULL_OBJECT_ID) {
        CDataStream stream;
        stream.WriteUint64(writes.nextObjectId);
        puts.emplace_back(KEY_NEXTID, stream.str());
    }
    return puts;
}

bool DecodeEntry(const std::string& key, const std::string& value, CGraphImage& image, std::string& error) {
    try {
        if (key == KEY_REGISTRY || key == KEY_DEVCAP) {
            CDataStream stream(value);
            ObjectId id = stream.ReadUint64();
            CIdentity identity = stream.ReadIdentity();
            ExpectEnd(stream);
            if (key == KEY_REGISTRY) {
                image.hasRegistry = true;
                image.registry.id = id;
                image.registry.creator = identity;
            } else {
                image.hasDevCapability = true;
                image.devCapability.id = id;
                image.devCapability.owner = identity;
            }
        } else if (key == KEY_NEXTID) {
            CDataStream stream(value);
            image.nextObjectId = stream.ReadUint64();
            ExpectEnd(stream);
        } else if (HasPrefix(key, PREFIX_REGISTRATION)) {
            uint64_t seq = DecodeKeyUint64(key.substr(PREFIX_REGISTRATION.size()));
            if (seq != image.registrations.size()) {
                error = "registration sequence gap at " + std::to_string(seq);
                return false;
            }
            CDataStream stream(value);
            image.registrations.push_back(stream.ReadIdentity());
            ExpectEnd(stream);
        } else if (HasPrefix(key, PREFIX_SNAPSHOT)) {
            ObjectId keyId = DecodeKeyUint64(key.substr(PREFIX_SNAPSHOT.size()));
            CSnapshotRef snapshot = DecodeSnapshot(value);
            if (snapshot->GetId() != keyId) {
                error = "snapshot key/id mismatch at " + std::to_string(keyId);
                return false;
            }
            image.snapshots.push_back(std::move(snapshot));
        } else if (HasPrefix(key, PREFIX_USER)) {
            ObjectId keyId = DecodeKeyUint64(key.substr(PREFIX_USER.size()));
            StoredUserRecord record = DecodeUserRecord(value);
            if (record.id != keyId) {
                error = "user record key/id mismatch at " + std::to_string(keyId);
                return false;
            }
            image.users.push_back(std::move(record));
        } else {
            error = "unknown key in graph store";
            return false;
        }
    } catch (const std::exception& e) {
        error = std::string("corrupt record: ") + e.what();
        return false;
    }
    return true;
}

} // namespace GraphStoreCodec

bool CGraphWriteSet::IsEmpty() const {
    return !hasRegistry && !hasDevCapability && registrations.empty() &&
           snapshots.empty() && users.empty() && nextObjectId == NULL_OBJECT_ID;
}

bool CMemoryGraphStore::Commit(const CGraphWriteSet& writes, std::string& error) {
    std::vector<std::pair<std::string, std::string>> puts = GraphStoreCodec::EncodeWriteSet(writes);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_failCommits > 0) {
        m_failCommits--;
        error = "injected commit failure";
        LogPrintDB(WARN, "Memory store: %s", error.c_str());
        return false;
    }

    for (auto& put : puts) {
        m_data[put.first] = std::move(put.second);
    }
    m_commitCount++;
    return true;
}

bool CMemoryGraphStore::Load(CGraphImage& image, std::string& error) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    CGraphImage loaded;
    for (const auto& entry : m_data) {
        if (!GraphStoreCodec::DecodeEntry(entry.first, entry.second, loaded, error)) {
            return false;
        }
    }
    image = std::move(loaded);
    return true;
}

bool CMemoryGraphStore::IsEmpty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_data.empty();
}

void CMemoryGraphStore::FailNextCommits(size_t count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failCommits = count;
}

size_t CMemoryGraphStore::GetCommitCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_commitCount;
}

void CMemoryGraphStore::PutRaw(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_data[key] = value;
}

void CMemoryGraphStore::EraseRaw(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_data.erase(key);
}
