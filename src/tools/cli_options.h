// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_TOOLS_CLI_OPTIONS_H
#define PROXIGRAPH_TOOLS_CLI_OPTIONS_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class CConfigParser;

/**
 * proxigraph-cli command line
 *
 * Options come first (-opt or --opt); the first non-option argument is the
 * command and everything after it belongs to the command.
 */
struct CliOptions {
    std::string datadir;
    std::string conf;
    /** -now=<ms>; unset means the wall clock */
    std::optional<uint64_t> now;
    bool debug = false;
    std::string debug_category;    // empty = all
    std::string command;
    std::vector<std::string> args;

    bool ParseArgs(int argc, const char* const argv[]);

    void PrintUsage(const char* program) const;

    /** Timestamp for this invocation in milliseconds */
    uint64_t ResolveTime() const;
};

/**
 * Apply logging settings from the command line and proxigraph.conf
 *
 * Keys: debug, printtoconsole, logfile, maxlogsize (MiB), maxlogfiles.
 */
void ConfigureLogging(const CliOptions& cli, const CConfigParser& config, const std::string& datadir);

#endif // PROXIGRAPH_TOOLS_CLI_OPTIONS_H
