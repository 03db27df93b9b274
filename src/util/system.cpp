// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <util/system.h>
#include <util/logging.h>
#include <cstdlib>
#include <sys/stat.h>

#include <unistd.h>
#include <pwd.h>
#include <errno.h>
#include <cstring>

/**
 * Get home directory
 */
static std::string GetHomeDir() {
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home);
    }

    // Fallback: Get from passwd database
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }

    return "/tmp";
}

std::string GetDataDir() {
    // Check for environment variable override
    const char* env_datadir = std::getenv("PROXIGRAPH_DATADIR");
    if (env_datadir && env_datadir[0] != '\0') {
        return std::string(env_datadir);
    }

    return JoinPath(GetHomeDir(), ".proxigraph");
}

bool EnsureDataDirExists(const std::string& path) {
    // Create first, then inspect, so nothing can be swapped in between
    int mkdir_result = mkdir(path.c_str(), 0700);
    bool created = (mkdir_result == 0);

    if (mkdir_result != 0 && errno != EEXIST) {
        LogPrintConfig(ERROR, "Failed to create directory: %s (%s)", path.c_str(), strerror(errno));
        return false;
    }

    // lstat does not follow symlinks
    struct stat info;
    if (lstat(path.c_str(), &info) != 0) {
        LogPrintConfig(ERROR, "Cannot access directory: %s", path.c_str());
        return false;
    }

    if (S_ISLNK(info.st_mode)) {
        LogPrintConfig(ERROR, "%s is a symlink - not allowed as data directory", path.c_str());
        return false;
    }

    if (!S_ISDIR(info.st_mode)) {
        LogPrintConfig(ERROR, "%s exists but is not a directory", path.c_str());
        return false;
    }

    if (created) {
        LogPrintConfig(INFO, "Created data directory: %s", path.c_str());
    }
    return true;
}

std::string JoinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}
