// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#ifndef PROXIGRAPH_UTIL_LOGGING_H
#define PROXIGRAPH_UTIL_LOGGING_H

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <vector>
#include <memory>
#include <cstdint>

/**
 * Category/level logging
 *
 * Features:
 * - Log categories (REGISTRY, GRAPH, DEV, DB, CONFIG)
 * - Log levels (ERROR, WARN, INFO, DEBUG)
 * - Thread-safe logging
 * - File and console output
 * - Log rotation
 */

/**
 * Log categories
 */
enum class LogCategory : uint32_t {
    NONE = 0,
    REGISTRY = (1 << 0),      // Identity registry
    GRAPH = (1 << 1),         // Snapshots, user records, transactions
    DEV = (1 << 2),           // Dev capability path
    DB = (1 << 3),            // Graph store
    CONFIG = (1 << 4),        // Configuration loading
    ALL = 0xFFFFFFFF          // All categories
};

/**
 * Log levels
 * Note: Using LVL_ prefix to avoid conflicts with Windows ERROR macro
 */
enum class LogLevel {
    LVL_ERROR = 0,
    LVL_WARN = 1,
    LVL_INFO = 2,
    LVL_DEBUG = 3
};

/** Lower-case category name ("graph"), "all" or "" */
std::string LogCategoryName(LogCategory category);

/**
 * Parse a category name as given to -debug=<category>
 *
 * Accepts "all" and "1" for every category. Case-insensitive.
 */
bool ParseLogCategory(const std::string& name, LogCategory& category);

/**
 * Logging configuration
 */
class CLoggingConfig {
public:
    static CLoggingConfig& GetInstance();

    // Enable/disable categories
    void EnableCategory(LogCategory category);
    void DisableCategory(LogCategory category);
    bool IsCategoryEnabled(LogCategory category) const;

    // Set log level
    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel() const;

    // File logging
    void SetLogFile(const std::string& path);
    std::string GetLogFile() const;

    // Console logging
    void SetConsoleLogging(bool enable);
    bool IsConsoleLoggingEnabled() const { return m_consoleLogging; }

    // Log rotation
    void SetMaxLogSize(size_t maxSize);
    size_t GetMaxLogSize() const;
    void SetMaxLogFiles(size_t maxFiles);
    size_t GetMaxLogFiles() const;

private:
    CLoggingConfig();
    ~CLoggingConfig() = default;

    std::atomic<uint32_t> m_enabledCategories{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<LogLevel> m_logLevel{LogLevel::LVL_INFO};
    std::string m_logFile;
    std::atomic<bool> m_consoleLogging{true};
    size_t m_maxLogSize{10 * 1024 * 1024};  // 10 MB default
    size_t m_maxLogFiles{10};
    mutable std::mutex m_configMutex;
};

/**
 * Main logging class
 */
class CLogger {
public:
    static CLogger& GetInstance();

    /**
     * Open the log file
     *
     * Uses the configured log file, or <datadir>/debug.log when none is set
     * and datadir is non-empty. Console-only when both are empty.
     */
    bool Initialize(const std::string& datadir);

    // Shutdown logging system
    void Shutdown();

    // Log a message
    void Log(LogCategory category, LogLevel level, const std::string& message);

    void LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 4, 5)))
#endif
        ;

private:
    CLogger();
    ~CLogger();

    // Rotate log file if needed
    void RotateLogIfNeeded();

    // Write to file
    void WriteToFile(const std::string& message);

    // Write to console
    void WriteToConsole(LogLevel level, const std::string& message);

    // Format log message (not FormatMessage to avoid Windows API conflict)
    std::string FormatLogMsg(LogCategory category, LogLevel level, const std::string& message);

    std::unique_ptr<std::ofstream> m_logFile;
    std::string m_logPath;
    std::mutex m_logMutex;
    std::atomic<bool> m_initialized{false};
    size_t m_currentLogSize{0};
};

// Convenience macros
// Note: Using LVL_ prefix internally to avoid Windows ERROR macro conflict
#define LogPrintf(category, level, format, ...) \
    CLogger::GetInstance().LogPrintFormat(LogCategory::category, LogLevel::LVL_##level, format, ##__VA_ARGS__)

// Category-specific macros (with format string)
#define LogPrintRegistry(level, format, ...) LogPrintf(REGISTRY, level, format, ##__VA_ARGS__)
#define LogPrintGraph(level, format, ...) LogPrintf(GRAPH, level, format, ##__VA_ARGS__)
#define LogPrintDev(level, format, ...) LogPrintf(DEV, level, format, ##__VA_ARGS__)
#define LogPrintDB(level, format, ...) LogPrintf(DB, level, format, ##__VA_ARGS__)
#define LogPrintConfig(level, format, ...) LogPrintf(CONFIG, level, format, ##__VA_ARGS__)

#endif // PROXIGRAPH_UTIL_LOGGING_H
