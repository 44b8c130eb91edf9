/**
 * @file logger.hpp
 * @brief Timestamped logging for SiteMover.
 *
 * Messages are echoed to the console and appended to a log file; errors go to
 * stderr and to a separate error log file. Either file may be left empty to
 * log to the console only. Safe to share between job worker threads.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <mutex>

/**
 * @brief Console + file logger used by every component.
 */
class Logger {
public:
    /**
     * @brief Constructs a logger.
     *
     * @param logFile Path to the log file, or empty for console only.
     * @param errorLogFile Path to the error log file, or empty for console only.
     * @param console If false, nothing is printed to stdout/stderr.
     * @note Parent directories of the log files are created on first write.
     */
    Logger(std::string logFile = {}, std::string errorLogFile = {}, bool console = true);

    /**
     * @brief Logs an informational message.
     *
     * @param message Message to log.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error message.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    /**
     * @brief Returns a logger that discards everything. Used by tests and quiet CLI modes.
     */
    static Logger& quiet();

private:
    void write(const std::string& file, const std::string& entry) const;

    std::string logFile_;
    std::string errorLogFile_;
    bool console_;
    mutable std::mutex mutex_;
};

#endif // LOGGER_HPP
