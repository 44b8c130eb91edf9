/**
 * @file job_orchestrator.hpp
 * @brief Owner of every scan, plan and transfer job.
 *
 * The job table is guarded by one shared mutex. Each job's work runs on its own
 * std::jthread owned by the orchestrator; cancellation is cooperative through
 * the job's stop token. A cleanup thread drops terminal jobs past the retention
 * window. Construct one orchestrator per process and pass it by reference.
 */

#ifndef JOB_ORCHESTRATOR_HPP
#define JOB_ORCHESTRATOR_HPP

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <expected>
#include <map>
#include <shared_mutex>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <stop_token>
#include <chrono>
#include <cstdint>
#include "app_config.hpp"
#include "errors.hpp"
#include "history_store.hpp"
#include "job.hpp"
#include "job_events.hpp"
#include "logger.hpp"

/**
 * @brief Background work of a job: returns the typed result or an error message.
 */
using JobWork = std::function<std::expected<JobResult, std::string>(std::stop_token)>;

class JobOrchestrator {
public:
    /**
     * @brief Constructs the orchestrator and starts its cleanup thread.
     *
     * @param config Retention window and cleanup interval.
     * @param logger Logger for lifecycle events.
     * @param history Store receiving finished-job summaries, or nullptr.
     */
    JobOrchestrator(const AppConfig& config, const Logger& logger, HistoryStore* history = nullptr);
    ~JobOrchestrator();

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    /**
     * @brief Stores a new pending job. Credentials are stripped from the stored configs.
     *
     * @return The fresh job id, or invalid_job_transition once shutdown() has been called.
     */
    std::expected<std::string, ErrorInfo> create(JobType type,
                       const ConnectionConfig& source,
                       const std::optional<ConnectionConfig>& dest = std::nullopt,
                       std::string method = {});

    std::expected<Job, ErrorInfo> get(const std::string& id) const;

    /**
     * @brief Moves a job to a new status.
     *
     * Invalid transitions fail with InvalidJobTransition. A terminal status stamps
     * completedAt and closes the job's event channels.
     */
    std::expected<void, ErrorInfo> updateStatus(const std::string& id, JobStatus status);

    /**
     * @brief Replaces the progress snapshot. Does not change status.
     *
     * @return ValidationError if the payload does not fit the job type,
     *         InvalidJobTransition if the job is already terminal.
     */
    std::expected<void, ErrorInfo> updateProgress(const std::string& id, JobProgress progress);

    /**
     * @brief Attaches the final result, clearing any error. Does not change status.
     */
    std::expected<void, ErrorInfo> setResult(const std::string& id, JobResult result);

    /**
     * @brief Attaches an error message, clearing any result. Does not change status.
     */
    std::expected<void, ErrorInfo> setError(const std::string& id, std::string message);

    /**
     * @brief Cancels a non-terminal job and asks its worker to stop.
     */
    std::expected<void, ErrorInfo> cancel(const std::string& id);

    /**
     * @brief Removes a terminal job. Active jobs are rejected.
     */
    std::expected<void, ErrorInfo> deleteJob(const std::string& id);

    std::expected<void, ErrorInfo> pause(const std::string& id);
    std::expected<void, ErrorInfo> resume(const std::string& id);

    /**
     * @brief Lists jobs oldest first, optionally restricted to one status.
     */
    std::vector<Job> list(std::optional<JobStatus> status = std::nullopt) const;

    /**
     * @brief Lists pending, running and paused jobs.
     */
    std::vector<Job> listActive() const;

    /**
     * @brief Removes terminal jobs completed more than the retention window before now.
     *
     * @return Number of removed jobs.
     */
    std::size_t cleanup(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /**
     * @brief Opens an event channel for a job. Closed once the job completes or is deleted.
     */
    std::expected<std::shared_ptr<EventChannel>, ErrorInfo> subscribe(const std::string& id, std::size_t capacity = 256);

    /**
     * @brief Publishes a raw output line to the job's subscribers.
     */
    void appendOutput(const std::string& id, const std::string& line);

    /**
     * @brief Marks the job running and executes work on a background thread.
     *
     * The outcome of work completes the job unless it already reached a terminal
     * state (cancel). A stop requested by shutdown cancels the job.
     */
    std::expected<void, ErrorInfo> runInBackground(const std::string& id, JobWork work);

    /**
     * @brief Waits until the job is terminal and its worker has returned.
     *
     * @return false on timeout or unknown job.
     */
    bool waitFor(const std::string& id, std::chrono::milliseconds timeout) const;

    bool isPaused(const std::string& id) const;

    /**
     * @brief Stops every worker, joins them and stops the cleanup thread. Idempotent.
     */
    void shutdown();

private:
    struct Entry {
        Job job;
        std::uint64_t sequence = 0;
        std::optional<std::chrono::system_clock::time_point> startedAt;
        std::stop_source stop;
        std::vector<std::shared_ptr<EventChannel>> subscribers;
        std::jthread worker;
        bool workerActive = false;
    };

    using Table = std::map<std::string, Entry>;

    static bool canTransition(const Job& job, JobStatus next);
    std::expected<Table::iterator, ErrorInfo> find(const std::string& id);
    std::expected<Table::const_iterator, ErrorInfo> find(const std::string& id) const;
    std::string newId() const;

    /// Applies a terminal status; caller holds the lock. Moves the job's channels into closing.
    HistoryEntry finishLocked(Entry& entry, JobStatus status, std::vector<std::shared_ptr<EventChannel>>& closing);
    void publishCompletion(const HistoryEntry& summary, const JobEvent& event, const std::vector<std::shared_ptr<EventChannel>>& closing);
    JobEvent completionEvent(const Job& job) const;
    void runWorker(const std::string& id, JobWork work, std::stop_token stop);
    void cleanupLoop(std::stop_token stop);

    const AppConfig& config_;
    const Logger& logger_;
    HistoryStore* history_;

    Table jobs_;
    mutable std::shared_mutex mutex_;
    mutable std::condition_variable_any changed_;
    std::uint64_t nextSequence_ = 0;
    bool stopping_ = false;

    std::mutex cleanupMutex_;
    std::condition_variable_any cleanupWake_;
    std::jthread cleanupThread_;
};

#endif // JOB_ORCHESTRATOR_HPP
