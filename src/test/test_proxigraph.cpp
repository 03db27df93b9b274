// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

/**
 * Main test entry point for the Proxigraph test suite
 *
 * This file initializes the Boost Unit Test Framework for all tests.
 */

#define BOOST_TEST_MODULE Proxigraph Test Suite
#include <boost/test/included/unit_test.hpp>

#include <util/logging.h>

#include <iostream>

/**
 * Global test suite setup
 */
struct ProxigraphTestSetup {
    ProxigraphTestSetup() {
        std::cout << "Proxigraph Test Suite Starting..." << std::endl;
        std::cout << "Using Boost.Test version "
                  << BOOST_VERSION / 100000 << "."
                  << BOOST_VERSION / 100 % 1000 << "."
                  << BOOST_VERSION % 100 << std::endl;

        // Keep test output readable; failures are reported by Boost
        CLoggingConfig::GetInstance().SetConsoleLogging(false);
        CLoggingConfig::GetInstance().SetLogLevel(LogLevel::LVL_DEBUG);
    }

    ~ProxigraphTestSetup() {
        std::cout << "Proxigraph Test Suite Complete" << std::endl;
    }
};

BOOST_GLOBAL_FIXTURE(ProxigraphTestSetup);

/**
 * Basic sanity check test
 */
BOOST_AUTO_TEST_SUITE(sanity_tests)

BOOST_AUTO_TEST_CASE(basic_sanity) {
    BOOST_CHECK_EQUAL(1 + 1, 2);
    BOOST_CHECK(true);
}

BOOST_AUTO_TEST_SUITE_END()
