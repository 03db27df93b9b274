// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_GRAPH_EVENTS_H
#define PROXIGRAPH_GRAPH_EVENTS_H

#include <primitives/identity.h>
#include <primitives/object_id.h>

#include <mutex>
#include <string>
#include <vector>

/** Registry was created at bootstrap */
struct RegistryCreatedEvent {
    ObjectId registry_id{NULL_OBJECT_ID};
    CIdentity creator;
};

/** A user record was created (normal registration or synthetic spawn) */
struct NewUserEvent {
    CIdentity owner;
    ObjectId user_id{NULL_OBJECT_ID};
};

/** A user record now points at a new snapshot */
struct NodeUpdateEvent {
    ObjectId user_id{NULL_OBJECT_ID};
    ObjectId current_node{NULL_OBJECT_ID};
};

/**
 * Graph event listener interface
 *
 * Listeners are called synchronously after a transaction has committed,
 * in emission order. A listener must not call back into the graph.
 */
class IGraphEventListener {
public:
    virtual ~IGraphEventListener() = default;

    virtual void OnRegistryCreated(const RegistryCreatedEvent& event) = 0;
    virtual void OnNewUser(const NewUserEvent& event) = 0;
    virtual void OnNodeUpdate(const NodeUpdateEvent& event) = 0;
};

/**
 * Listener that logs every event and keeps them in order
 *
 * Used by the CLI for output and by tests for assertions.
 *
 * Thread-safe: Protected by internal mutex.
 */
class CGraphEventRecorder : public IGraphEventListener {
public:
    enum class Kind {
        REGISTRY_CREATED,
        NEW_USER,
        NODE_UPDATE
    };

    struct Entry {
        Kind kind;
        RegistryCreatedEvent registry_created;
        NewUserEvent new_user;
        NodeUpdateEvent node_update;

        std::string ToString() const;
    };

    void OnRegistryCreated(const RegistryCreatedEvent& event) override;
    void OnNewUser(const NewUserEvent& event) override;
    void OnNodeUpdate(const NodeUpdateEvent& event) override;

    std::vector<Entry> GetEvents() const;
    size_t Count() const;
    size_t Count(Kind kind) const;
    void Clear();

private:
    void Record(const Entry& entry);

    mutable std::mutex m_mutex;
    std::vector<Entry> m_events;
};

#endif // PROXIGRAPH_GRAPH_EVENTS_H
