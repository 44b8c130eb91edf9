/**
 * @file history_store.hpp
 * @brief Audit trail of finished jobs.
 */

#ifndef HISTORY_STORE_HPP
#define HISTORY_STORE_HPP

#include <string>
#include <vector>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <optional>
#include <expected>
#include "errors.hpp"
#include "job.hpp"
#include "logger.hpp"

/**
 * @brief Summary of one job that reached a terminal state.
 */
struct HistoryEntry {
    std::string id;
    JobType type = JobType::Scan;
    std::string method;
    JobStatus status = JobStatus::Completed;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;
    double durationSeconds = 0;
    std::uint64_t totalFiles = 0;
    std::uint64_t totalBytes = 0;
    std::string sourceHost;
    std::string destHost;
    std::string errorMessage;
};

/**
 * @brief Interface for history persistence.
 */
class HistoryStore {
public:
    virtual ~HistoryStore() = default;

    /**
     * @brief Records a finished job.
     *
     * @param entry Summary of the job.
     * @return Nothing, or the storage error.
     */
    virtual std::expected<void, ErrorInfo> append(const HistoryEntry& entry) = 0;

    /**
     * @brief Returns the stored entries, newest first.
     */
    virtual std::expected<std::vector<HistoryEntry>, ErrorInfo> load() const = 0;
};

/**
 * @brief History kept as a JSON array in a single file.
 *
 * Only the newest limit entries are kept. The file and its parent directory are
 * created on the first append.
 */
class JsonHistoryStore : public HistoryStore {
public:
    JsonHistoryStore(std::string historyFile, int limit, const Logger& logger);

    std::expected<void, ErrorInfo> append(const HistoryEntry& entry) override;
    std::expected<std::vector<HistoryEntry>, ErrorInfo> load() const override;

    /**
     * @brief Looks up one entry by job id.
     */
    std::expected<std::optional<HistoryEntry>, ErrorInfo> find(const std::string& id) const;

    /**
     * @brief Removes every entry.
     */
    std::expected<void, ErrorInfo> clear();

private:
    std::expected<std::vector<HistoryEntry>, ErrorInfo> read() const;
    std::expected<void, ErrorInfo> write(const std::vector<HistoryEntry>& entries) const;

    std::string historyFile_;
    std::size_t limit_;
    const Logger& logger_;
    mutable std::mutex mutex_;
};

#endif // HISTORY_STORE_HPP
