// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <boost/test/unit_test.hpp>

#include <test/util/setup_common.h>
#include <util/config.h>

#include <cstdlib>
#include <fstream>
#include <string>

namespace {

std::string WriteConfig(const TempDir& dir, const std::string& contents) {
    std::string path = dir.Path() + "/proxigraph.conf";
    std::ofstream file(path, std::ios::trunc);
    file << contents;
    return path;
}

/** Sets an environment variable for the lifetime of the object */
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::string& value) : m_name(name) {
        setenv(m_name.c_str(), value.c_str(), 1);
    }
    ~ScopedEnv() { unsetenv(m_name.c_str()); }

private:
    std::string m_name;
};

} // namespace

BOOST_AUTO_TEST_SUITE(config_tests)

BOOST_AUTO_TEST_CASE(missing_file_uses_defaults) {
    TempDir dir("config_missing");
    CConfigParser config;
    BOOST_CHECK(config.LoadConfigFile(dir.Path() + "/nope.conf"));
    BOOST_CHECK(config.IsLoaded());
    BOOST_CHECK_EQUAL(config.GetString("logfile", "fallback"), "fallback");
    BOOST_CHECK_EQUAL(config.GetInt64("dbcache", 4), 4);
    BOOST_CHECK(config.GetBool("dbsync", true));
}

BOOST_AUTO_TEST_CASE(parses_file) {
    TempDir dir("config_parse");
    std::string path = WriteConfig(dir,
        "# proxigraph settings\n"
        "[main]\n"
        "dbcache = 16\n"
        "DBSync=no ; trailing comment\n"
        "logfile=\"/tmp/graph.log\"\n"
        "not a setting\n"
        "=orphan\n"
        "\n");

    CConfigParser config;
    BOOST_REQUIRE(config.LoadConfigFile(path));
    BOOST_CHECK_EQUAL(config.GetConfigFilePath(), path);
    BOOST_CHECK_EQUAL(config.GetAllSettings().size(), 3U);
    BOOST_CHECK_EQUAL(config.GetInt64("dbcache", 4), 16);
    BOOST_CHECK(!config.GetBool("dbsync", true));
    BOOST_CHECK_EQUAL(config.GetString("logfile"), "/tmp/graph.log");
}

BOOST_AUTO_TEST_CASE(environment_overrides_file) {
    TempDir dir("config_env");
    std::string path = WriteConfig(dir, "debug=graph\nprinttoconsole=0\n");

    CConfigParser config;
    BOOST_REQUIRE(config.LoadConfigFile(path));
    BOOST_CHECK_EQUAL(config.GetString("debug"), "graph");
    {
        ScopedEnv env("PROXIGRAPH_DEBUG", "dev");
        BOOST_CHECK_EQUAL(config.GetString("debug"), "dev");
    }
    BOOST_CHECK_EQUAL(config.GetString("debug"), "graph");
    {
        ScopedEnv env("PROXIGRAPH_PRINTTOCONSOLE", "on");
        BOOST_CHECK(config.GetBool("printtoconsole", false));
    }
}

BOOST_AUTO_TEST_CASE(set_overrides_file_but_not_environment) {
    CConfigParser config;
    config.Set("DbCache", "32");
    BOOST_CHECK_EQUAL(config.GetInt64("dbcache", 4), 32);

    ScopedEnv env("PROXIGRAPH_DBCACHE", "64");
    BOOST_CHECK_EQUAL(config.GetInt64("dbcache", 4), 64);
}

BOOST_AUTO_TEST_CASE(malformed_values_fall_back) {
    CConfigParser config;
    config.Set("dbcache", "12abc");
    config.Set("dbsync", "maybe");
    config.Set("maxlogsize", "");
    BOOST_CHECK_EQUAL(config.GetInt64("dbcache", 4), 4);
    BOOST_CHECK(config.GetBool("dbsync", true));
    BOOST_CHECK(!config.GetBool("dbsync", false));
    BOOST_CHECK_EQUAL(config.GetInt64("maxlogsize", 7), 7);

    config.Set("dbcache", "-3");
    BOOST_CHECK_EQUAL(config.GetInt64("dbcache", 4), -3);
}

BOOST_AUTO_TEST_CASE(default_config_path) {
    BOOST_CHECK_EQUAL(GetConfigFilePath("/var/lib/proxigraph"), "/var/lib/proxigraph/proxigraph.conf");
    BOOST_CHECK_EQUAL(GetConfigFilePath("/var/lib/proxigraph/"), "/var/lib/proxigraph/proxigraph.conf");

    ScopedEnv env("PROXIGRAPH_DATADIR", "/srv/graph");
    BOOST_CHECK_EQUAL(GetConfigFilePath(), "/srv/graph/proxigraph.conf");
}

BOOST_AUTO_TEST_SUITE_END()
