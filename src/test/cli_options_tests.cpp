// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

/**
 * CLI Option Tests
 *
 * Command line parsing for proxigraph-cli and the logging settings it
 * derives from proxigraph.conf, including log rotation.
 */

#include <boost/test/unit_test.hpp>

#include <test/util/setup_common.h>
#include <tools/cli_options.h>
#include <util/config.h>
#include <util/logging.h>

#include <filesystem>
#include <string>
#include <vector>

namespace {

bool Parse(CliOptions& cli, const std::vector<const char*>& argv) {
    return cli.ParseArgs(static_cast<int>(argv.size()), argv.data());
}

/** Puts the shared logging configuration back the way the test runner set it */
struct LoggingRestore {
    ~LoggingRestore() {
        CLoggingConfig& config = CLoggingConfig::GetInstance();
        config.SetLogFile("");
        config.SetMaxLogSize(10 * 1024 * 1024);
        config.SetMaxLogFiles(10);
        config.SetConsoleLogging(false);
        config.SetLogLevel(LogLevel::LVL_DEBUG);
        config.EnableCategory(LogCategory::ALL);
    }
};

} // namespace

BOOST_AUTO_TEST_SUITE(cli_options_tests)

BOOST_AUTO_TEST_CASE(parse_command_and_options) {
    CliOptions cli;
    BOOST_REQUIRE(Parse(cli, {"proxigraph-cli", "--datadir=/tmp/pg", "-debug=graph", "register", "0xA1", "b2,c3"}));
    BOOST_CHECK_EQUAL(cli.datadir, "/tmp/pg");
    BOOST_CHECK(cli.debug);
    BOOST_CHECK_EQUAL(cli.debug_category, "graph");
    BOOST_CHECK_EQUAL(cli.command, "register");
    BOOST_REQUIRE_EQUAL(cli.args.size(), 2U);
    BOOST_CHECK_EQUAL(cli.args[1], "b2,c3");
    BOOST_CHECK(!cli.now);
}

BOOST_AUTO_TEST_CASE(now_zero_is_a_real_time) {
    CliOptions cli;
    BOOST_REQUIRE(Parse(cli, {"proxigraph-cli", "-now=0", "register", "a1"}));
    BOOST_REQUIRE(cli.now);
    BOOST_CHECK_EQUAL(*cli.now, 0U);
    BOOST_CHECK_EQUAL(cli.ResolveTime(), 0U);

    CliOptions later;
    BOOST_REQUIRE(Parse(later, {"proxigraph-cli", "-now=10000", "update", "a1", "4"}));
    BOOST_CHECK_EQUAL(later.ResolveTime(), 10000U);
}

BOOST_AUTO_TEST_CASE(wall_clock_without_now) {
    CliOptions cli;
    BOOST_REQUIRE(Parse(cli, {"proxigraph-cli", "registry"}));
    BOOST_CHECK(!cli.now);
    BOOST_CHECK_GT(cli.ResolveTime(), 0U);
}

BOOST_AUTO_TEST_CASE(reject_bad_arguments) {
    CliOptions missing;
    BOOST_CHECK(!Parse(missing, {"proxigraph-cli", "-debug"}));

    CliOptions badNow;
    BOOST_CHECK(!Parse(badNow, {"proxigraph-cli", "-now=-1", "registry"}));

    CliOptions unknown;
    BOOST_CHECK(!Parse(unknown, {"proxigraph-cli", "-rpcport=1", "registry"}));

    CliOptions help;
    BOOST_CHECK(!Parse(help, {"proxigraph-cli", "--help"}));
}

BOOST_AUTO_TEST_CASE(rotation_settings_from_config) {
    LoggingRestore restore;
    CliOptions cli;
    CConfigParser config;
    config.Set("maxlogsize", "3");
    config.Set("maxlogfiles", "4");
    config.Set("logfile", "/tmp/proxigraph-test.log");

    ConfigureLogging(cli, config, "/unused");

    CLoggingConfig& logging = CLoggingConfig::GetInstance();
    BOOST_CHECK_EQUAL(logging.GetMaxLogSize(), 3U * 1024 * 1024);
    BOOST_CHECK_EQUAL(logging.GetMaxLogFiles(), 4U);
    BOOST_CHECK_EQUAL(logging.GetLogFile(), "/tmp/proxigraph-test.log");
    BOOST_CHECK(!logging.IsConsoleLoggingEnabled());
}

BOOST_AUTO_TEST_CASE(rotation_defaults_and_invalid_values) {
    LoggingRestore restore;
    CliOptions cli;
    CConfigParser config;
    config.Set("maxlogsize", "0");
    config.Set("maxlogfiles", "many");

    CLoggingConfig& logging = CLoggingConfig::GetInstance();
    logging.SetMaxLogSize(1234);
    logging.SetMaxLogFiles(2);
    ConfigureLogging(cli, config, "/var/lib/proxigraph");

    // Non-positive size leaves the current limit; a malformed count falls back to 10
    BOOST_CHECK_EQUAL(logging.GetMaxLogSize(), 1234U);
    BOOST_CHECK_EQUAL(logging.GetMaxLogFiles(), 10U);
    BOOST_CHECK_EQUAL(logging.GetLogFile(), "/var/lib/proxigraph/debug.log");
}

BOOST_AUTO_TEST_CASE(log_file_rotates_at_limit) {
    LoggingRestore restore;
    TempDir dir("log_rotation");
    const std::string logPath = dir.Path() + "/debug.log";

    CLoggingConfig& logging = CLoggingConfig::GetInstance();
    logging.EnableCategory(LogCategory::ALL);
    logging.SetLogFile(logPath);
    logging.SetMaxLogSize(200);
    logging.SetMaxLogFiles(2);

    BOOST_REQUIRE(CLogger::GetInstance().Initialize(""));
    for (int i = 0; i < 20; i++) {
        LogPrintGraph(INFO, "rotation line %d with some padding to fill the file", i);
    }
    CLogger::GetInstance().Shutdown();

    BOOST_CHECK(std::filesystem::exists(logPath));
    BOOST_CHECK(std::filesystem::exists(logPath + ".1"));
    BOOST_CHECK(std::filesystem::exists(logPath + ".2"));
    BOOST_CHECK(!std::filesystem::exists(logPath + ".3"));
    BOOST_CHECK_LE(std::filesystem::file_size(logPath), 200U + 128U);
}

BOOST_AUTO_TEST_SUITE_END()
