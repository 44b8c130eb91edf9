/**
 * @file app_config.hpp
 * @brief Application configuration for SiteMover.
 *
 * Settings are loaded from a JSON file. Every key is optional; missing keys fall
 * back to the defaults documented on each member.
 *
 * @note Paths may be relative; they are resolved against the working directory.
 */

#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include <string>
#include <chrono>
#include <json/json.h>

/**
 * @brief Configuration class for the migration planner.
 */
class AppConfig {
public:
    /**
     * @brief Constructs a configuration with built-in defaults.
     */
    AppConfig();

    /**
     * @brief Constructs a configuration from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is missing, unparsable or holds out-of-range values.
     */
    explicit AppConfig(const std::string& configFile);

    /**
     * @brief Applies the keys of a parsed JSON document on top of the current values.
     *
     * @param configJson Parsed configuration document.
     * @throws std::runtime_error If a value is out of range.
     */
    void apply(const Json::Value& configJson);

    std::string dataDir;                         ///< Base directory for logs and history ("./sitemover-data/").
    std::string logFile;                         ///< Path to the log file.
    std::string errorLogFile;                    ///< Path to the error log file.
    std::string historyFile;                     ///< Path to the JSON history store.
    int historyLimit;                            ///< Number of history entries kept (100).

    std::chrono::hours jobRetention;             ///< Terminal jobs older than this are removed (24h).
    std::chrono::minutes cleanupInterval;        ///< Period of the cleanup task (60 min).

    std::chrono::milliseconds dialTimeout;       ///< TCP dial timeout for probes (5 s).
    std::chrono::milliseconds loginTimeout;      ///< Handshake + login timeout (10 s).
    std::size_t speedTestBytes;                  ///< Throughput sample size (100 KiB).

    int scanMaxDepth;                            ///< Default scan depth limit, 0 = unlimited.
    int scanMaxFiles;                            ///< Default scan file limit, 0 = unlimited.
    int progressEveryDirs;                       ///< Scan progress cadence in directories (10).

    int parallelConnections;                     ///< Connection pairs used by the multi-connection client (4).
    std::size_t bufferSize;                      ///< Copy buffer size (32 KiB).
};

#endif // APP_CONFIG_HPP
