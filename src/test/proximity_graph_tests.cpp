// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

/**
 * Proximity Graph Tests
 *
 * Registration, owner updates, history and events on a bootstrapped
 * memory-only graph.
 */

#include <boost/test/unit_test.hpp>

#include <graph/proximity_graph.h>
#include <graph/update_gate.h>
#include <test/util/setup_common.h>

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

BOOST_AUTO_TEST_SUITE(proximity_graph_tests)

// ============================================================================
// Bootstrap
// ============================================================================

BOOST_AUTO_TEST_CASE(bootstrap_creates_registry_and_capability) {
    CProximityGraph graph;
    auto events = std::make_shared<CGraphEventRecorder>();
    graph.AddListener(events);

    BOOST_CHECK(!graph.IsInitialized());
    BOOST_CHECK(graph.GetRegistry() == nullptr);

    GraphHandles handles;
    const CIdentity deployer = MakeIdentity(0xDD);
    BOOST_REQUIRE_EQUAL(graph.Bootstrap(deployer, handles), GraphError::OK);

    BOOST_CHECK(graph.IsInitialized());
    BOOST_CHECK(handles.registryId != NULL_OBJECT_ID);
    BOOST_CHECK_EQUAL(graph.GetRegistryId(), handles.registryId);
    BOOST_REQUIRE(handles.devCapability);
    BOOST_CHECK(handles.devCapability->GetOwner() == deployer);
    BOOST_CHECK(handles.devCapability->GetId() != handles.registryId);

    const CIdentityRegistry* registry = graph.GetRegistry();
    BOOST_REQUIRE(registry != nullptr);
    BOOST_CHECK_EQUAL(registry->Size(), 0U);
    BOOST_CHECK(registry->GetCreator() == deployer);

    std::vector<CGraphEventRecorder::Entry> log = events->GetEvents();
    BOOST_REQUIRE_EQUAL(log.size(), 1U);
    BOOST_CHECK(log[0].kind == CGraphEventRecorder::Kind::REGISTRY_CREATED);
    BOOST_CHECK_EQUAL(log[0].registry_created.registry_id, handles.registryId);
    BOOST_CHECK(log[0].registry_created.creator == deployer);
}

BOOST_AUTO_TEST_CASE(bootstrap_happens_once) {
    CProximityGraph graph;
    GraphHandles first, second;
    BOOST_REQUIRE_EQUAL(graph.Bootstrap(MakeIdentity(1), first), GraphError::OK);
    BOOST_CHECK_EQUAL(graph.Bootstrap(MakeIdentity(2), second), GraphError::ALREADY_INITIALIZED);
    BOOST_CHECK(!second.devCapability);
    BOOST_CHECK(graph.GetRegistry()->GetCreator() == MakeIdentity(1));
}

BOOST_AUTO_TEST_CASE(bootstrap_rejects_null_deployer) {
    CProximityGraph graph;
    GraphHandles handles;
    BOOST_CHECK_EQUAL(graph.Bootstrap(CIdentity(), handles), GraphError::INVALID_IDENTITY);
    BOOST_CHECK(!graph.IsInitialized());
}

BOOST_AUTO_TEST_CASE(register_before_bootstrap) {
    CProximityGraph graph;
    ObjectId id = NULL_OBJECT_ID;
    BOOST_CHECK_EQUAL(graph.RegisterUser(1, MakeIdentity(1), {}, 0, id), GraphError::NOT_INITIALIZED);
    BOOST_CHECK_EQUAL(id, NULL_OBJECT_ID);
}

// ============================================================================
// Scenarios
// ============================================================================

BOOST_FIXTURE_TEST_CASE(scenario_walkthrough, GraphTestingSetup) {
    // 1. register(A, [], t=0)
    ObjectId recA = Register(A, {}, 0);
    CUserRecordRef record = graph.GetUserRecord(recA);
    BOOST_REQUIRE(record);
    BOOST_CHECK(record->GetCurrent() == NodeContents({}, 0));
    BOOST_CHECK(record->GetOwner() == A);
    BOOST_CHECK(!record->IsSynthetic());
    std::vector<CIdentity> users = graph.GetRegistry()->GetRegisteredUsers();
    BOOST_REQUIRE_EQUAL(users.size(), 1U);
    BOOST_CHECK(users[0] == A);
    BOOST_CHECK_EQUAL(graph.GetChainLength(recA), 1U);

    // 2. update(A, [B], t=5000) fails
    BOOST_CHECK_EQUAL(graph.UpdateNode(recA, A, {B}, 5000), GraphError::UPDATE_TOO_SOON);
    BOOST_CHECK_EQUAL(graph.GetChainLength(recA), 1U);

    // 3. update(A, [B], t=10000) succeeds at the boundary
    ObjectId snap = NULL_OBJECT_ID;
    BOOST_CHECK_EQUAL(graph.UpdateNode(recA, A, {B}, 10000, &snap), GraphError::OK);
    BOOST_CHECK(record->GetCurrent() == NodeContents({B}, 10000));
    BOOST_CHECK_EQUAL(record->GetHead(), snap);
    BOOST_CHECK_EQUAL(graph.GetChainLength(recA), 2U);

    // 4. two more updates
    BOOST_CHECK_EQUAL(graph.UpdateNode(recA, A, {B, C}, 20001), GraphError::OK);
    BOOST_CHECK_EQUAL(graph.UpdateNode(recA, A, {D}, 30002), GraphError::OK);
    BOOST_CHECK_EQUAL(graph.GetChainLength(recA), 4U);
    // Second snapshot counting the head as the first: one step behind it
    CSnapshotRef second = graph.GetNodeChain().GetAncestor(record->GetHead(), 1);
    BOOST_REQUIRE(second);
    BOOST_CHECK_EQUAL(second->GetTimestamp(), 20001U);
    BOOST_REQUIRE_EQUAL(second->GetNeighbors().size(), 2U);
    BOOST_CHECK(second->GetNeighbors()[0] == B);
    BOOST_CHECK(second->GetNeighbors()[1] == C);
    std::vector<CSnapshotRef> history = graph.GetHistory(recA);
    BOOST_REQUIRE_EQUAL(history.size(), 4U);
    BOOST_CHECK_EQUAL(history[1]->GetId(), second->GetId());

    // 5. D cannot update A's record
    UserRecordState before = record->GetState();
    BOOST_CHECK_EQUAL(graph.UpdateNode(recA, D, {D}, 99999), GraphError::NOT_OWNER);
    UserRecordState after = record->GetState();
    BOOST_CHECK_EQUAL(after.head, before.head);
    BOOST_CHECK(after.current == before.current);
    BOOST_CHECK_EQUAL(graph.GetChainLength(recA), 4U);

    // 6. spawn by a non-holder fails and changes nothing
    size_t snapshots = graph.GetSnapshotCount();
    ObjectId spawned = NULL_OBJECT_ID;
    BOOST_CHECK_EQUAL(graph.SpawnSyntheticUser(*handles.devCapability, D, C, {}, 40000, spawned),
                      GraphError::CAPABILITY_MISMATCH);
    BOOST_CHECK_EQUAL(spawned, NULL_OBJECT_ID);
    BOOST_CHECK_EQUAL(graph.GetRegistry()->Size(), 1U);
    BOOST_CHECK_EQUAL(graph.GetSnapshotCount(), snapshots);
    BOOST_CHECK_EQUAL(graph.GetUserCount(), 1U);
}

// ============================================================================
// Properties
// ============================================================================

BOOST_FIXTURE_TEST_CASE(double_registration_fails, GraphTestingSetup) {
    Register(A, {B}, 0);
    size_t snapshots = graph.GetSnapshotCount();
    events->Clear();

    ObjectId second = NULL_OBJECT_ID;
    BOOST_CHECK_EQUAL(graph.RegisterUser(handles.registryId, A, {C}, 50000, second), GraphError::ALREADY_REGISTERED);
    BOOST_CHECK_EQUAL(second, NULL_OBJECT_ID);
    BOOST_CHECK_EQUAL(graph.GetRegistry()->Size(), 1U);
    BOOST_CHECK_EQUAL(graph.GetSnapshotCount(), snapshots);
    BOOST_CHECK_EQUAL(graph.GetUserCount(), 1U);
    BOOST_CHECK_EQUAL(events->Count(), 0U);
}

BOOST_FIXTURE_TEST_CASE(register_validates_inputs, GraphTestingSetup) {
    ObjectId id = NULL_OBJECT_ID;
    BOOST_CHECK_EQUAL(graph.RegisterUser(handles.registryId + 1000, A, {}, 0, id), GraphError::UNKNOWN_OBJECT);
    BOOST_CHECK_EQUAL(graph.RegisterUser(handles.registryId, CIdentity(), {}, 0, id), GraphError::INVALID_IDENTITY);
    BOOST_CHECK_EQUAL(graph.GetUserCount(), 0U);
}

BOOST_FIXTURE_TEST_CASE(update_links_to_previous_head, GraphTestingSetup) {
    ObjectId rec = Register(A, {}, 1000);
    CUserRecordRef record = graph.GetUserRecord(rec);
    ObjectId oldHead = record->GetHead();

    ObjectId newHead = NULL_OBJECT_ID;
    BOOST_REQUIRE_EQUAL(graph.UpdateNode(rec, A, {B, C}, 11000, &newHead), GraphError::OK);

    CSnapshotRef snapshot = graph.GetSnapshot(newHead);
    BOOST_REQUIRE(snapshot);
    BOOST_CHECK_EQUAL(snapshot->GetPrevious(), oldHead);
    BOOST_CHECK(snapshot->GetOwner() == A);
    BOOST_CHECK(record->GetCurrent() == NodeContents({B, C}, 11000));
    BOOST_CHECK(record->IsInSyncWith(*snapshot));

    // The old head stays readable and unchanged
    CSnapshotRef old = graph.GetSnapshot(oldHead);
    BOOST_REQUIRE(old);
    BOOST_CHECK(old->GetNeighbors().empty());
    BOOST_CHECK_EQUAL(old->GetTimestamp(), 1000U);
}

BOOST_FIXTURE_TEST_CASE(history_is_strictly_decreasing, GraphTestingSetup) {
    ObjectId rec = Register(A, {}, 0);
    const size_t N = 12;
    uint64_t now = 0;
    for (size_t i = 0; i < N; ++i) {
        now += CUpdateGate::MIN_INTERVAL_MS + i;
        BOOST_REQUIRE_EQUAL(graph.UpdateNode(rec, A, {MakeIdentity(static_cast<uint8_t>(i + 1))}, now), GraphError::OK);
    }

    std::vector<CSnapshotRef> history = graph.GetHistory(rec);
    BOOST_REQUIRE_EQUAL(history.size(), N + 1);
    BOOST_CHECK_EQUAL(graph.GetChainLength(rec), N + 1);
    BOOST_CHECK_EQUAL(history.front()->GetId(), graph.GetUserRecord(rec)->GetHead());
    BOOST_CHECK(history.back()->IsRoot());
    for (size_t i = 1; i < history.size(); ++i) {
        BOOST_CHECK_GT(history[i - 1]->GetTimestamp(), history[i]->GetTimestamp());
        BOOST_CHECK_GT(history[i - 1]->GetId(), history[i]->GetId());
        BOOST_CHECK_EQUAL(history[i - 1]->GetPrevious(), history[i]->GetId());
    }
}

BOOST_FIXTURE_TEST_CASE(not_owner_regardless_of_neighbors, GraphTestingSetup) {
    ObjectId rec = Register(A, {}, 0);
    BOOST_CHECK_EQUAL(graph.UpdateNode(rec, B, {}, 20000), GraphError::NOT_OWNER);
    BOOST_CHECK_EQUAL(graph.UpdateNode(rec, B, {A}, 20000), GraphError::NOT_OWNER);
    BOOST_CHECK_EQUAL(graph.UpdateNode(rec, DEPLOYER, {A, B}, 20000), GraphError::NOT_OWNER);
    BOOST_CHECK_EQUAL(graph.GetChainLength(rec), 1U);
}

BOOST_FIXTURE_TEST_CASE(empty_neighbors_are_valid, GraphTestingSetup) {
    ObjectId rec = Register(A, {}, 0);
    BOOST_CHECK_EQUAL(graph.UpdateNode(rec, A, {}, 10000), GraphError::OK);
    BOOST_CHECK(graph.GetUserRecord(rec)->GetCurrent().neighbors.empty());
}

BOOST_FIXTURE_TEST_CASE(clock_regression_on_update, GraphTestingSetup) {
    ObjectId rec = Register(A, {}, 50000);
    BOOST_CHECK_EQUAL(graph.UpdateNode(rec, A, {B}, 100), GraphError::CLOCK_REGRESSION);
    BOOST_CHECK_EQUAL(graph.GetChainLength(rec), 1U);
    BOOST_CHECK_EQUAL(graph.GetUserRecord(rec)->GetCurrent().timestamp, 50000U);
}

BOOST_FIXTURE_TEST_CASE(unknown_record, GraphTestingSetup) {
    BOOST_CHECK_EQUAL(graph.UpdateNode(12345, A, {}, 0), GraphError::UNKNOWN_OBJECT);
    BOOST_CHECK(!graph.GetUserRecord(12345));
    BOOST_CHECK(graph.GetHistory(12345).empty());
    BOOST_CHECK_EQUAL(graph.GetChainLength(12345), 0U);
}

BOOST_FIXTURE_TEST_CASE(object_ids_are_unique, GraphTestingSetup) {
    ObjectId recA = Register(A, {}, 0);
    ObjectId recB = Register(B, {}, 0);
    ObjectId snapA = graph.GetUserRecord(recA)->GetHead();
    ObjectId snapB = graph.GetUserRecord(recB)->GetHead();

    std::vector<ObjectId> ids = {handles.registryId, handles.devCapability->GetId(), recA, recB, snapA, snapB};
    std::sort(ids.begin(), ids.end());
    BOOST_CHECK(std::adjacent_find(ids.begin(), ids.end()) == ids.end());
}

BOOST_FIXTURE_TEST_CASE(lookup_by_owner, GraphTestingSetup) {
    ObjectId recA = Register(A, {}, 0);
    Register(B, {}, 0);

    std::vector<ObjectId> owned = graph.FindUserRecords(A);
    BOOST_REQUIRE_EQUAL(owned.size(), 1U);
    BOOST_CHECK_EQUAL(owned[0], recA);
    BOOST_CHECK_EQUAL(graph.FindRegisteredRecord(A), recA);
    BOOST_CHECK_EQUAL(graph.FindRegisteredRecord(C), NULL_OBJECT_ID);
    BOOST_CHECK(graph.IsRegistered(A));
    BOOST_CHECK(!graph.IsRegistered(C));
}

// ============================================================================
// Events
// ============================================================================

BOOST_FIXTURE_TEST_CASE(registration_and_update_events, GraphTestingSetup) {
    ObjectId rec = Register(A, {B}, 0);
    ObjectId head0 = graph.GetUserRecord(rec)->GetHead();
    ObjectId head1 = NULL_OBJECT_ID;
    BOOST_REQUIRE_EQUAL(graph.UpdateNode(rec, A, {C}, 10000, &head1), GraphError::OK);

    // Failed operations emit nothing
    BOOST_CHECK_EQUAL(graph.UpdateNode(rec, A, {C}, 10001), GraphError::UPDATE_TOO_SOON);

    std::vector<CGraphEventRecorder::Entry> log = events->GetEvents();
    BOOST_REQUIRE_EQUAL(log.size(), 3U);

    BOOST_CHECK(log[0].kind == CGraphEventRecorder::Kind::NEW_USER);
    BOOST_CHECK(log[0].new_user.owner == A);
    BOOST_CHECK_EQUAL(log[0].new_user.user_id, rec);

    BOOST_CHECK(log[1].kind == CGraphEventRecorder::Kind::NODE_UPDATE);
    BOOST_CHECK_EQUAL(log[1].node_update.user_id, rec);
    BOOST_CHECK_EQUAL(log[1].node_update.current_node, head0);

    BOOST_CHECK(log[2].kind == CGraphEventRecorder::Kind::NODE_UPDATE);
    BOOST_CHECK_EQUAL(log[2].node_update.current_node, head1);

    BOOST_CHECK_EQUAL(events->Count(CGraphEventRecorder::Kind::NODE_UPDATE), 2U);
    BOOST_CHECK_EQUAL(events->Count(CGraphEventRecorder::Kind::REGISTRY_CREATED), 0U);
}

// ============================================================================
// Concurrency
// ============================================================================

BOOST_FIXTURE_TEST_CASE(concurrent_registration_same_identity, GraphTestingSetup) {
    std::atomic<int> ok{0};
    std::atomic<int> duplicate{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            ObjectId id = NULL_OBJECT_ID;
            GraphError result = graph.RegisterUser(handles.registryId, A, {}, 0, id);
            if (result == GraphError::OK) ok++;
            if (result == GraphError::ALREADY_REGISTERED) duplicate++;
        });
    }
    for (auto& t : threads) t.join();

    BOOST_CHECK_EQUAL(ok.load(), 1);
    BOOST_CHECK_EQUAL(duplicate.load(), 15);
    BOOST_CHECK_EQUAL(graph.GetRegistry()->Size(), 1U);
    BOOST_CHECK_EQUAL(graph.GetUserCount(), 1U);
    BOOST_CHECK_EQUAL(graph.GetSnapshotCount(), 1U);
    BOOST_CHECK_EQUAL(events->Count(CGraphEventRecorder::Kind::NEW_USER), 1U);
}

BOOST_FIXTURE_TEST_CASE(concurrent_updates_to_distinct_records, GraphTestingSetup) {
    const int USERS = 8;
    const int ROUNDS = 5;
    std::vector<CIdentity> owners;
    std::vector<ObjectId> records;
    for (int i = 0; i < USERS; ++i) {
        owners.push_back(MakeIdentity(static_cast<uint8_t>(0x10 + i)));
        records.push_back(Register(owners.back(), {}, 0));
    }

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < USERS; ++i) {
        threads.emplace_back([&, i]() {
            for (int r = 1; r <= ROUNDS; ++r) {
                uint64_t now = static_cast<uint64_t>(r) * CUpdateGate::MIN_INTERVAL_MS;
                if (graph.UpdateNode(records[i], owners[i], {owners[(i + r) % USERS]}, now) != GraphError::OK) {
                    failures++;
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    BOOST_CHECK_EQUAL(failures.load(), 0);
    for (ObjectId rec : records) {
        BOOST_CHECK_EQUAL(graph.GetChainLength(rec), static_cast<size_t>(ROUNDS + 1));
    }
    BOOST_CHECK_EQUAL(graph.GetSnapshotCount(), static_cast<size_t>(USERS * (ROUNDS + 1)));
}

BOOST_FIXTURE_TEST_CASE(concurrent_updates_to_one_record, GraphTestingSetup) {
    ObjectId rec = Register(A, {}, 0);

    // Same timestamp from every thread: exactly one passes the gate
    std::atomic<int> ok{0};
    std::atomic<int> tooSoon{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            GraphError result = graph.UpdateNode(rec, A, {B}, 10000);
            if (result == GraphError::OK) ok++;
            if (result == GraphError::UPDATE_TOO_SOON) tooSoon++;
        });
    }
    for (auto& t : threads) t.join();

    BOOST_CHECK_EQUAL(ok.load(), 1);
    BOOST_CHECK_EQUAL(tooSoon.load(), 7);
    BOOST_CHECK_EQUAL(graph.GetChainLength(rec), 2U);
}

BOOST_AUTO_TEST_SUITE_END()
