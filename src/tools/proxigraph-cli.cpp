// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license
// Command-line front end for a persistent proximity graph

#include <db/graph_db.h>
#include <graph/proximity_graph.h>
#include <tools/cli_options.h>
#include <util/config.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <util/system.h>

#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

bool ParseIdentityArg(const std::string& arg, CIdentity& identity) {
    if (!ParseIdentity(arg, identity)) {
        std::cerr << "Error: Invalid identity: " << arg << std::endl;
        return false;
    }
    return true;
}

bool ParseNeighbors(const std::vector<std::string>& args, size_t first, NeighborList& neighbors) {
    for (size_t i = first; i < args.size(); ++i) {
        // Each argument may hold a comma-separated list
        for (const std::string& item : SplitString(args[i], ',')) {
            CIdentity peer;
            if (!ParseIdentityArg(item, peer)) {
                return false;
            }
            neighbors.push_back(peer);
        }
    }
    return true;
}

bool ParseObjectIdArg(const std::string& arg, ObjectId& id) {
    if (!ParseUInt64(arg, id) || id == NULL_OBJECT_ID) {
        std::cerr << "Error: Invalid object id: " << arg << std::endl;
        return false;
    }
    return true;
}

bool CheckArgCount(const CliOptions& cli, size_t min, size_t max) {
    if (cli.args.size() < min || cli.args.size() > max) {
        std::cerr << "Error: Wrong number of arguments for '" << cli.command << "'" << std::endl;
        return false;
    }
    return true;
}

int Fail(GraphError error) {
    std::cerr << "Error: " << GraphErrorString(error) << " (" << GraphErrorName(error) << ")" << std::endl;
    return 1;
}

void PrintSnapshot(const CNodeSnapshot& snapshot) {
    std::cout << "snapshot " << snapshot.GetId()
              << " timestamp " << snapshot.GetTimestamp()
              << " previous " << snapshot.GetPrevious() << std::endl;
    for (const CIdentity& peer : snapshot.GetNeighbors()) {
        std::cout << "  neighbor " << peer.GetHex() << std::endl;
    }
}

/**
 * Run one command against a loaded graph
 *
 * @return process exit code
 */
int RunCommand(const CliOptions& cli, CProximityGraph& graph) {
    const uint64_t now = cli.ResolveTime();
    const std::string& cmd = cli.command;

    if (cmd == "init") {
        CIdentity deployer;
        if (!CheckArgCount(cli, 1, 1) || !ParseIdentityArg(cli.args[0], deployer)) return 1;

        GraphHandles handles;
        GraphError result = graph.Bootstrap(deployer, handles);
        if (result != GraphError::OK) return Fail(result);

        std::cout << "registry " << handles.registryId << std::endl;
        std::cout << "devcap " << handles.devCapability->GetId()
                  << " owner " << handles.devCapability->GetOwner().GetHex() << std::endl;
        return 0;
    }

    if (cmd == "register") {
        CIdentity caller;
        NeighborList neighbors;
        if (!CheckArgCount(cli, 1, SIZE_MAX) || !ParseIdentityArg(cli.args[0], caller) ||
            !ParseNeighbors(cli.args, 1, neighbors)) return 1;

        ObjectId userId = NULL_OBJECT_ID;
        GraphError result = graph.RegisterUser(graph.GetRegistryId(), caller, neighbors, now, userId);
        if (result != GraphError::OK) return Fail(result);

        std::cout << "record " << userId << std::endl;
        return 0;
    }

    if (cmd == "update" || cmd == "devupdate") {
        CIdentity caller;
        ObjectId userId = NULL_OBJECT_ID;
        NeighborList neighbors;
        if (!CheckArgCount(cli, 2, SIZE_MAX) || !ParseIdentityArg(cli.args[0], caller) ||
            !ParseObjectIdArg(cli.args[1], userId) || !ParseNeighbors(cli.args, 2, neighbors)) return 1;

        ObjectId snapshotId = NULL_OBJECT_ID;
        GraphError result;
        if (cmd == "update") {
            result = graph.UpdateNode(userId, caller, neighbors, now, &snapshotId);
        } else {
            std::unique_ptr<CDevCapability> capability;
            result = graph.ReopenDevCapability(caller, capability);
            if (result == GraphError::OK) {
                result = graph.SyntheticUpdate(*capability, caller, userId, neighbors, now, &snapshotId);
            }
        }
        if (result != GraphError::OK) return Fail(result);

        std::cout << "snapshot " << snapshotId << std::endl;
        return 0;
    }

    if (cmd == "spawn") {
        CIdentity caller;
        CIdentity target;
        NeighborList neighbors;
        if (!CheckArgCount(cli, 2, SIZE_MAX) || !ParseIdentityArg(cli.args[0], caller) ||
            !ParseIdentityArg(cli.args[1], target) || !ParseNeighbors(cli.args, 2, neighbors)) return 1;

        std::unique_ptr<CDevCapability> capability;
        GraphError result = graph.ReopenDevCapability(caller, capability);
        if (result != GraphError::OK) return Fail(result);

        ObjectId userId = NULL_OBJECT_ID;
        result = graph.SpawnSyntheticUser(*capability, caller, target, neighbors, now, userId);
        if (result != GraphError::OK) return Fail(result);

        std::cout << "record " << userId << std::endl;
        return 0;
    }

    if (cmd == "show" || cmd == "history") {
        ObjectId userId = NULL_OBJECT_ID;
        if (!CheckArgCount(cli, 1, 1) || !ParseObjectIdArg(cli.args[0], userId)) return 1;

        CUserRecordRef record = graph.GetUserRecord(userId);
        if (!record) return Fail(GraphError::UNKNOWN_OBJECT);

        if (cmd == "show") {
            UserRecordState state = record->GetState();
            std::cout << "record " << state.id << std::endl;
            std::cout << "owner " << state.owner.GetHex() << std::endl;
            std::cout << "synthetic " << (state.synthetic ? "yes" : "no") << std::endl;
            std::cout << "head " << state.head << std::endl;
            std::cout << "timestamp " << state.current.timestamp << std::endl;
            std::cout << "chain-length " << graph.GetChainLength(userId) << std::endl;
            for (const CIdentity& peer : state.current.neighbors) {
                std::cout << "  neighbor " << peer.GetHex() << std::endl;
            }
        } else {
            for (const CSnapshotRef& snapshot : graph.GetHistory(userId)) {
                PrintSnapshot(*snapshot);
            }
        }
        return 0;
    }

    if (cmd == "registry") {
        if (!CheckArgCount(cli, 0, 0)) return 1;

        const CIdentityRegistry* registry = graph.GetRegistry();
        if (!registry) return Fail(GraphError::NOT_INITIALIZED);

        std::cout << "registry " << registry->GetId() << std::endl;
        std::cout << "creator " << registry->GetCreator().GetHex() << std::endl;
        std::cout << "users " << registry->Size() << std::endl;
        std::cout << "records " << graph.GetUserCount() << std::endl;
        std::cout << "snapshots " << graph.GetSnapshotCount() << std::endl;
        for (const CIdentity& identity : registry->GetRegisteredUsers()) {
            std::cout << "  " << identity.GetHex() << " record " << graph.FindRegisteredRecord(identity) << std::endl;
        }
        return 0;
    }

    std::cerr << "Error: Unknown command: " << cmd << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions cli;
    if (!cli.ParseArgs(argc, argv)) {
        cli.PrintUsage(argv[0]);
        return 1;
    }

    try {
        CConfigParser config;
        std::string confPath = cli.conf.empty() ? GetConfigFilePath(cli.datadir) : cli.conf;
        if (!config.LoadConfigFile(confPath)) {
            std::cerr << "Error: Failed to read configuration file: " << confPath << std::endl;
            return 1;
        }

        std::string datadir = !cli.datadir.empty() ? cli.datadir : config.GetString("datadir", GetDataDir());
        if (!EnsureDataDirExists(datadir)) {
            std::cerr << "Error: Cannot use data directory: " << datadir << std::endl;
            return 1;
        }

        ConfigureLogging(cli, config, datadir);
        if (!CLogger::GetInstance().Initialize(datadir)) {
            std::cerr << "Warning: File logging disabled" << std::endl;
        }

        CGraphDB::Options options;
        int64_t dbcache = config.GetInt64("dbcache", 4);
        if (dbcache > 0) {
            options.writeBufferSize = static_cast<size_t>(dbcache) * 1024 * 1024;
        }
        options.syncWrites = config.GetBool("dbsync", true);

        CGraphDB db;
        std::string dbPath = JoinPath(datadir, "graph");
        if (!db.Open(dbPath, options)) {
            std::cerr << "Error: Failed to open graph database at: " << dbPath << std::endl;
            return 1;
        }

        CProximityGraph graph(&db);
        auto recorder = std::make_shared<CGraphEventRecorder>();
        graph.AddListener(recorder);

        std::string error;
        if (!graph.LoadFromStore(error)) {
            std::cerr << "Error: Failed to load graph: " << error << std::endl;
            return 1;
        }

        int ret = RunCommand(cli, graph);

        for (const CGraphEventRecorder::Entry& entry : recorder->GetEvents()) {
            std::cout << "event " << entry.ToString() << std::endl;
        }

        CLogger::GetInstance().Shutdown();
        return ret;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
