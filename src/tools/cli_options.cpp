// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <tools/cli_options.h>

#include <util/config.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <util/system.h>
#include <util/time.h>

#include <iostream>

bool CliOptions::ParseArgs(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (!command.empty() || arg.empty() || arg[0] != '-') {
            if (command.empty()) {
                command = arg;
            } else {
                args.push_back(arg);
            }
            continue;
        }

        // Accept -opt and --opt
        if (arg.compare(0, 2, "--") == 0) {
            arg = arg.substr(1);
        }

        if (arg.find("-datadir=") == 0) {
            datadir = arg.substr(9);
        }
        else if (arg.find("-conf=") == 0) {
            conf = arg.substr(6);
        }
        else if (arg.find("-now=") == 0) {
            uint64_t value = 0;
            if (!ParseUInt64(arg.substr(5), value)) {
                std::cerr << "Error: Invalid -now value (milliseconds expected): " << arg << std::endl;
                return false;
            }
            now = value;
        }
        else if (arg == "-debug") {
            debug = true;
        }
        else if (arg.find("-debug=") == 0) {
            debug = true;
            debug_category = arg.substr(7);
        }
        else if (arg == "-help" || arg == "-h") {
            return false;
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        }
    }

    if (command.empty()) {
        std::cerr << "Error: No command given" << std::endl;
        return false;
    }
    return true;
}

void CliOptions::PrintUsage(const char* program) const {
    std::cout << "Proxigraph CLI - Proximity graph of registered identities" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <command> [args...]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -datadir=<path>      Data directory (default: ~/.proxigraph)" << std::endl;
    std::cout << "  -conf=<file>         Configuration file (default: <datadir>/proxigraph.conf)" << std::endl;
    std::cout << "  -now=<ms>            Use this time in milliseconds instead of the wall clock" << std::endl;
    std::cout << "  -debug[=<category>]  Debug logging (registry, graph, dev, db, config, all)" << std::endl;
    std::cout << "  -help, -h            Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  init <deployer>                         Create the registry and the dev capability" << std::endl;
    std::cout << "  register <caller> [peer...]             Register caller with initial neighbors" << std::endl;
    std::cout << "  update <caller> <record-id> [peer...]   Publish a new snapshot for caller's record" << std::endl;
    std::cout << "  spawn <caller> <target> [peer...]       Create a synthetic record (dev capability)" << std::endl;
    std::cout << "  devupdate <caller> <record-id> [peer...] Advance any record (dev capability)" << std::endl;
    std::cout << "  show <record-id>                        Print a user record" << std::endl;
    std::cout << "  history <record-id>                     Print a record's snapshots, newest first" << std::endl;
    std::cout << "  registry                                Print the registry" << std::endl;
    std::cout << std::endl;
    std::cout << "Identities are hex (up to 64 digits, optional 0x prefix)." << std::endl;
    std::cout << "Configuration: proxigraph.conf keys datadir, logfile, debug, printtoconsole," << std::endl;
    std::cout << "  maxlogsize (MiB), maxlogfiles, dbcache, dbsync; environment variables" << std::endl;
    std::cout << "  PROXIGRAPH_* override the file." << std::endl;
}

uint64_t CliOptions::ResolveTime() const {
    return now ? *now : GetTimeMillis();
}

void ConfigureLogging(const CliOptions& cli, const CConfigParser& config, const std::string& datadir) {
    CLoggingConfig& logging = CLoggingConfig::GetInstance();

    std::string debug = cli.debug ? cli.debug_category : config.GetString("debug");
    if (cli.debug || (!debug.empty() && debug != "0")) {
        logging.SetLogLevel(LogLevel::LVL_DEBUG);
        LogCategory category;
        if (!debug.empty() && debug != "1" && ParseLogCategory(debug, category)) {
            logging.DisableCategory(LogCategory::ALL);
            logging.EnableCategory(category);
        }
    }

    logging.SetConsoleLogging(config.GetBool("printtoconsole", cli.debug));
    logging.SetLogFile(config.GetString("logfile", JoinPath(datadir, "debug.log")));

    int64_t maxLogSize = config.GetInt64("maxlogsize", 10);
    if (maxLogSize > 0) {
        logging.SetMaxLogSize(static_cast<size_t>(maxLogSize) * 1024 * 1024);
    }
    int64_t maxLogFiles = config.GetInt64("maxlogfiles", 10);
    if (maxLogFiles > 0) {
        logging.SetMaxLogFiles(static_cast<size_t>(maxLogFiles));
    }
}
