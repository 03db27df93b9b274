// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <db/graph_db.h>
#include <db/db_errors.h>
#include <util/logging.h>

#include <leveldb/write_batch.h>

CGraphDB::CGraphDB() : m_db(nullptr) {}

CGraphDB::~CGraphDB() {
    Close();
}

bool CGraphDB::Open(const std::string& path, const Options& opts) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_db) {
        return true;  // Already open
    }

    m_path = path;
    m_syncWrites = opts.syncWrites;

    leveldb::Options options;
    options.create_if_missing = true;
    options.write_buffer_size = opts.writeBufferSize;
    options.max_open_files = 100;

    leveldb::DB* db = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, path, &db);

    if (!status.ok()) {
        DBErrorType type = ClassifyDBError(status);
        LogPrintDB(ERROR, "Failed to open graph database %s: %s",
                   path.c_str(), GetDBErrorMessage(status, type).c_str());
        return false;
    }

    m_db.reset(db);
    LogPrintDB(INFO, "Graph database opened: %s", path.c_str());
    return true;
}

void CGraphDB::Close() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_db) {
        m_db.reset();
        LogPrintDB(INFO, "Graph database closed: %s", m_path.c_str());
    }
}

bool CGraphDB::IsOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_db != nullptr;
}

std::string CGraphDB::GetPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_path;
}

bool CGraphDB::Commit(const CGraphWriteSet& writes, std::string& error) {
    std::vector<std::pair<std::string, std::string>> puts = GraphStoreCodec::EncodeWriteSet(writes);

    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        error = "graph database is not open";
        return false;
    }

    leveldb::WriteBatch batch;
    for (const auto& put : puts) {
        batch.Put(put.first, put.second);
    }

    leveldb::WriteOptions writeOpts;
    writeOpts.sync = m_syncWrites;

    leveldb::Status status = m_db->Write(writeOpts, &batch);
    if (!status.ok()) {
        DBErrorType type = ClassifyDBError(status);
        error = GetDBErrorMessage(status, type);
        LogPrintDB(ERROR, "Commit of %zu records failed [%s]: %s%s", puts.size(),
                   DBErrorTypeName(type), error.c_str(),
                   IsRecoverableError(type) ? "" : " (database unusable)");
        return false;
    }

    LogPrintDB(DEBUG, "Committed %zu records", puts.size());
    return true;
}

bool CGraphDB::Load(CGraphImage& image, std::string& error) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        error = "graph database is not open";
        return false;
    }

    CGraphImage loaded;
    leveldb::ReadOptions readOpts;
    readOpts.verify_checksums = true;
    std::unique_ptr<leveldb::Iterator> it(m_db->NewIterator(readOpts));

    size_t count = 0;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        if (!GraphStoreCodec::DecodeEntry(it->key().ToString(), it->value().ToString(), loaded, error)) {
            LogPrintDB(ERROR, "Graph database %s: %s", m_path.c_str(), error.c_str());
            return false;
        }
        count++;
    }

    leveldb::Status status = it->status();
    if (!status.ok()) {
        error = GetDBErrorMessage(status, ClassifyDBError(status));
        LogPrintDB(ERROR, "Graph database scan failed: %s", error.c_str());
        return false;
    }

    LogPrintDB(INFO, "Loaded %zu records (%zu snapshots, %zu users, %zu registrations)",
               count, loaded.snapshots.size(), loaded.users.size(), loaded.registrations.size());
    image = std::move(loaded);
    return true;
}

bool CGraphDB::IsEmpty() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        return true;
    }

    std::unique_ptr<leveldb::Iterator> it(m_db->NewIterator(leveldb::ReadOptions()));
    it->SeekToFirst();
    return !it->Valid();
}
