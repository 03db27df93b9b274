// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

/**
 * Identity Registry Tests
 *
 * Uniqueness, insertion order and concurrent registration.
 */

#include <boost/test/unit_test.hpp>

#include <graph/registry.h>
#include <test/util/setup_common.h>

#include <atomic>
#include <thread>
#include <vector>

BOOST_AUTO_TEST_SUITE(registry_tests)

BOOST_AUTO_TEST_CASE(new_registry_is_empty) {
    CIdentityRegistry registry(1, MakeIdentity(0xDD));
    BOOST_CHECK_EQUAL(registry.GetId(), 1U);
    BOOST_CHECK(registry.GetCreator() == MakeIdentity(0xDD));
    BOOST_CHECK_EQUAL(registry.Size(), 0U);
    BOOST_CHECK(registry.GetRegisteredUsers().empty());
    // The creator is not registered implicitly
    BOOST_CHECK(!registry.Contains(MakeIdentity(0xDD)));
}

BOOST_AUTO_TEST_CASE(duplicate_registration_fails) {
    CIdentityRegistry registry(1, MakeIdentity(0xDD));
    BOOST_CHECK_EQUAL(registry.Register(MakeIdentity(1)), GraphError::OK);
    BOOST_CHECK_EQUAL(registry.Register(MakeIdentity(1)), GraphError::ALREADY_REGISTERED);
    BOOST_CHECK_EQUAL(registry.Size(), 1U);
    BOOST_CHECK(registry.Contains(MakeIdentity(1)));
}

BOOST_AUTO_TEST_CASE(insertion_order_is_kept) {
    CIdentityRegistry registry(1, MakeIdentity(0xDD));
    const uint8_t seeds[] = {9, 3, 7, 1};
    for (uint8_t seed : seeds) {
        BOOST_REQUIRE_EQUAL(registry.Register(MakeIdentity(seed)), GraphError::OK);
    }

    std::vector<CIdentity> users = registry.GetRegisteredUsers();
    BOOST_REQUIRE_EQUAL(users.size(), 4U);
    for (size_t i = 0; i < users.size(); ++i) {
        BOOST_CHECK(users[i] == MakeIdentity(seeds[i]));
    }
}

BOOST_AUTO_TEST_CASE(concurrent_same_identity_single_winner) {
    CIdentityRegistry registry(1, MakeIdentity(0xDD));
    const CIdentity contested = MakeIdentity(0x42);

    std::atomic<int> ok{0};
    std::atomic<int> duplicate{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            GraphError result = registry.Register(contested);
            if (result == GraphError::OK) ok++;
            if (result == GraphError::ALREADY_REGISTERED) duplicate++;
        });
    }
    for (auto& t : threads) t.join();

    BOOST_CHECK_EQUAL(ok.load(), 1);
    BOOST_CHECK_EQUAL(duplicate.load(), 15);
    BOOST_CHECK_EQUAL(registry.Size(), 1U);
}

BOOST_AUTO_TEST_CASE(concurrent_distinct_identities_never_conflict) {
    CIdentityRegistry registry(1, MakeIdentity(0xDD));

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 1; i <= 32; ++i) {
        threads.emplace_back([&, i]() {
            if (registry.Register(MakeIdentity(static_cast<uint8_t>(i))) != GraphError::OK) {
                failures++;
            }
        });
    }
    for (auto& t : threads) t.join();

    BOOST_CHECK_EQUAL(failures.load(), 0);
    BOOST_CHECK_EQUAL(registry.Size(), 32U);
}

BOOST_AUTO_TEST_SUITE_END()
