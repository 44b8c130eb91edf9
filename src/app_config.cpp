#include "app_config.hpp"
#include "scanner.hpp"
#include <cstdint>
#include <format>
#include <fstream>
#include <limits>
#include <stdexcept>

AppConfig::AppConfig()
    : dataDir("./sitemover-data/"),
      logFile(dataDir + "sitemover.log"),
      errorLogFile(dataDir + "errors.log"),
      historyFile(dataDir + "history.json"),
      historyLimit(100),
      jobRetention(24),
      cleanupInterval(60),
      dialTimeout(5000),
      loginTimeout(10000),
      speedTestBytes(100 * 1024),
      scanMaxDepth(0),
      scanMaxFiles(0),
      progressEveryDirs(10),
      parallelConnections(4),
      bufferSize(32 * 1024) {}

AppConfig::AppConfig(const std::string& configFile) : AppConfig() {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw std::runtime_error(std::format("Failed to parse config file: {}", configFile));
    }
    apply(configJson);
}

namespace {

constexpr std::int64_t kMaxSpeedTestBytes = 64LL * 1024 * 1024;
constexpr std::int64_t kMaxBufferSize = 16LL * 1024 * 1024;

// Reads an integer setting, keeping the fallback when the key is absent.
std::int64_t readInteger(const Json::Value& section, const char* key, std::int64_t fallback, std::int64_t min, std::int64_t max) {
    const Json::Value& value = section[key];
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isInt64()) {
        throw std::runtime_error(std::format("{} must be an integer", key));
    }
    std::int64_t number = value.asInt64();
    if (number < min || number > max) {
        throw std::runtime_error(std::format("{} must be between {} and {}, got {}", key, min, max, number));
    }
    return number;
}

std::string readText(const Json::Value& section, const char* key, const std::string& fallback) {
    const Json::Value& value = section[key];
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isString()) {
        throw std::runtime_error(std::format("{} must be a string", key));
    }
    return value.asString();
}

const Json::Value& readSection(const Json::Value& configJson, const char* key) {
    static const Json::Value empty(Json::objectValue);
    const Json::Value& section = configJson[key];
    if (section.isNull()) {
        return empty;
    }
    if (!section.isObject()) {
        throw std::runtime_error(std::format("{} must be an object", key));
    }
    return section;
}

} // namespace

void AppConfig::apply(const Json::Value& configJson) {
    if (!configJson.isObject()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }
    constexpr std::int64_t kIntMax = std::numeric_limits<int>::max();

    if (configJson.isMember("data_dir")) {
        dataDir = readText(configJson, "data_dir", dataDir);
        if (!dataDir.empty() && dataDir.back() != '/') {
            dataDir += '/';
        }
        logFile = dataDir + "sitemover.log";
        errorLogFile = dataDir + "errors.log";
        historyFile = dataDir + "history.json";
    }
    logFile = readText(configJson, "log_file", logFile);
    errorLogFile = readText(configJson, "error_log_file", errorLogFile);
    historyFile = readText(configJson, "history_file", historyFile);
    historyLimit = static_cast<int>(readInteger(configJson, "history_limit", historyLimit, 1, 100000));

    jobRetention = std::chrono::hours(readInteger(configJson, "job_retention_hours", jobRetention.count(), 1, 24 * 365));
    cleanupInterval = std::chrono::minutes(readInteger(configJson, "cleanup_interval_minutes", cleanupInterval.count(), 1, 24 * 60));

    const Json::Value& probe = readSection(configJson, "probe");
    dialTimeout = std::chrono::milliseconds(readInteger(probe, "dial_timeout_ms", dialTimeout.count(), 1, 600000));
    loginTimeout = std::chrono::milliseconds(readInteger(probe, "login_timeout_ms", loginTimeout.count(), 1, 600000));
    speedTestBytes = static_cast<std::size_t>(
        readInteger(probe, "speed_test_bytes", static_cast<std::int64_t>(speedTestBytes), 1, kMaxSpeedTestBytes));

    const Json::Value& scan = readSection(configJson, "scan");
    scanMaxDepth = static_cast<int>(readInteger(scan, "max_depth", scanMaxDepth, 0, ScanLimits::kMaxDepth));
    scanMaxFiles = static_cast<int>(readInteger(scan, "max_files", scanMaxFiles, 0, ScanLimits::kMaxFiles));
    progressEveryDirs = static_cast<int>(readInteger(scan, "progress_every_dirs", progressEveryDirs, 1, kIntMax));

    const Json::Value& transfer = readSection(configJson, "transfer");
    parallelConnections = static_cast<int>(readInteger(transfer, "parallel_connections", parallelConnections, 1, 16));
    bufferSize = static_cast<std::size_t>(
        readInteger(transfer, "buffer_size", static_cast<std::int64_t>(bufferSize), 1, kMaxBufferSize));
}
