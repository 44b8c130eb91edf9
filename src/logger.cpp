#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNow{};
    localtime_r(&timeT, &tmNow);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);
    return timeBuf;
}

} // namespace

Logger::Logger(std::string logFile, std::string errorLogFile, bool console)
    : logFile_(std::move(logFile)), errorLogFile_(std::move(errorLogFile)), console_(console) {}

void Logger::logMessage(const std::string& message) const {
    std::string logEntry = std::format("[{}] {}", timestamp(), message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (console_) {
        std::println("{}", logEntry);
    }
    write(logFile_, logEntry);
}

void Logger::logError(const std::string& message) const {
    std::string logEntry = std::format("[{}] ERROR: {}", timestamp(), message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (console_) {
        std::println(stderr, "{}", logEntry);
    }
    write(errorLogFile_, logEntry);
}

Logger& Logger::quiet() {
    static Logger logger({}, {}, false);
    return logger;
}

void Logger::write(const std::string& file, const std::string& entry) const {
    if (file.empty()) {
        return;
    }
    fs::path logPath(file);
    if (logPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(logPath.parent_path(), ec);
    }
    std::ofstream log(file, std::ios::app);
    if (log.is_open()) {
        log << entry << '\n';
        log.flush();
    } else if (console_) {
        std::println(stderr, "Error: Cannot write to log file: {}", file);
    }
}
