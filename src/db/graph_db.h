// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_DB_GRAPH_DB_H
#define PROXIGRAPH_DB_GRAPH_DB_H

/**
 * Graph Database
 *
 * LevelDB-backed IGraphStore. Each transaction becomes one WriteBatch,
 * so a commit is all-or-nothing on disk as well as in memory.
 *
 * Thread-safe: Protected by internal mutex.
 */

#include <db/graph_store.h>
#include <leveldb/db.h>

#include <memory>
#include <mutex>
#include <string>

class CGraphDB : public IGraphStore {
public:
    struct Options {
        /** LevelDB write buffer in bytes */
        size_t writeBufferSize{4 * 1024 * 1024};
        /** fsync every commit */
        bool syncWrites{true};
    };

    CGraphDB();
    ~CGraphDB() override;

    // Prevent copying
    CGraphDB(const CGraphDB&) = delete;
    CGraphDB& operator=(const CGraphDB&) = delete;

    /**
     * Open the graph database
     *
     * @param path Directory path for database files
     * @param options Tuning options
     * @return true if opened successfully
     */
    bool Open(const std::string& path, const Options& options);
    bool Open(const std::string& path) { return Open(path, Options()); }

    /** Close the database */
    void Close();

    /** Check if database is open */
    bool IsOpen() const;

    std::string GetPath() const;

    // --- IGraphStore implementation ---

    bool Commit(const CGraphWriteSet& writes, std::string& error) override;
    bool Load(CGraphImage& image, std::string& error) const override;
    bool IsEmpty() const override;

private:
    /** LevelDB database handle */
    std::unique_ptr<leveldb::DB> m_db;

    /** Mutex for thread safety */
    mutable std::mutex m_mutex;

    /** Database path */
    std::string m_path;

    bool m_syncWrites{true};
};

#endif // PROXIGRAPH_DB_GRAPH_DB_H
